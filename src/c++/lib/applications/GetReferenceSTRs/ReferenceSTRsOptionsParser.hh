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

#include "ReferenceSTRsOptions.hh"

#include "common/Program.hh"

#include "boost/program_options.hpp"


/// add the GetReferenceSTRs configuration options, bound to the fields of opt
void
addReferenceSTRsOptions(
    ReferenceSTRsOptions& opt,
    boost::program_options::options_description& desc);

/// \return an error message for the first invalid option value, or nullptr if all options are valid
const char*
getReferenceSTRsOptionsError(const ReferenceSTRsOptions& opt);

/// parse and validate command-line options
///
/// prints usage and exits on any option error
void
parseReferenceSTRsOptions(
    const refstr::Program& prog,
    int argc,
    char** argv,
    ReferenceSTRsOptions& opt);
