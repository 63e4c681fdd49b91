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

#include "blt_util/blt_types.hh"

#include <iosfwd>
#include <string>


/// a contig name and zero-indexed, half-open position range on that contig
///
/// when isEndPos is false the region extends to the end of the contig
///
struct GenomeRegion
{
    GenomeRegion()
        : beginPos(0), endPos(0), isEndPos(false)
    {}

    std::string contig;
    pos_t beginPos;
    pos_t endPos;
    bool isEndPos;
};

std::ostream&
operator<<(std::ostream& os, const GenomeRegion& region);


/// parse a samtools-style region string: "contig", "contig:begin" or
/// "contig:begin-end"
///
/// begin and end are one-indexed and inclusive in the region string, and
/// may contain ',' thousands separators. The region is split at the last ':'
/// in the string.
///
/// throws GeneralException for a malformed region string
///
void
parseGenomeRegion(
    const std::string& regionStr,
    GenomeRegion& region);
