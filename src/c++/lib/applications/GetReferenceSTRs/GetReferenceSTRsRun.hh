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

#include "repeatAnalysis/ReferenceSTRScanner.hh"

#include <iosfwd>
#include <string>


void
writeSTRTableHeader(std::ostream& os);

/// write one tab-delimited line per window position: contig, 1-indexed position, period,
/// repeat length and repeat unit
void
writeSTRTable(
    const std::string& contigName,
    const ReferenceSTRScanner& scanner,
    std::ostream& os);

void
getReferenceSTRs(const ReferenceSTRsOptions& opt);
