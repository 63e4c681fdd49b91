//
// RefSTR - Reference Short Tandem Repeat Scanner
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#pragma once

#include "common/Program.hh"


/// report the STR period and repeat length of every reference position
struct GetReferenceSTRs : public refstr::Program
{
    const char*
    name() const override
    {
        return "GetReferenceSTRs";
    }

    void
    runInternal(int argc, char* argv[]) const override;
};
