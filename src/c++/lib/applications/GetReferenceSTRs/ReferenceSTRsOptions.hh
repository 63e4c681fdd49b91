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

#include <string>
#include <vector>


struct ReferenceSTRsOptions
{
    std::string referenceFilename;

    /// samtools-style region strings, an empty list scans every contig
    std::vector<std::string> regions;

    /// empty for stdout
    std::string outputFilename;

    /// empty to skip the STR context summary
    std::string summaryFilename;

    int maxPeriod = 8;
    int maxRepeatLength = 20;
    bool isVerbose = false;
};
