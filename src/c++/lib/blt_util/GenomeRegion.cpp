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

#include "blt_util/GenomeRegion.hh"

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>



std::ostream&
operator<<(std::ostream& os, const GenomeRegion& region)
{
    os << region.contig << ":" << (region.beginPos+1) << "-";
    if (region.isEndPos)
    {
        os << region.endPos;
    }
    return os;
}



static
void
regionException(
    const std::string& regionStr,
    const char* reason)
{
    std::ostringstream oss;
    oss << "Can't parse genome region '" << regionStr << "': " << reason;
    BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
}



static
pos_t
parseRegionPos(
    const std::string& regionStr,
    std::string posStr)
{
    posStr.erase(std::remove(posStr.begin(), posStr.end(), ','), posStr.end());
    if (posStr.empty())
    {
        regionException(regionStr, "empty position");
    }
    const unsigned pos(refstr::blt_util::parse_unsigned_str(posStr));
    if (pos < 1)
    {
        regionException(regionStr, "positions must be 1 or greater");
    }
    if (pos > static_cast<unsigned>(std::numeric_limits<pos_t>::max()))
    {
        regionException(regionStr, "position exceeds the maximum contig length");
    }
    return static_cast<pos_t>(pos);
}



void
parseGenomeRegion(
    const std::string& regionStr,
    GenomeRegion& region)
{
    region = GenomeRegion();

    const std::string::size_type colonIndex(regionStr.rfind(':'));
    region.contig = regionStr.substr(0, colonIndex);
    if (region.contig.empty())
    {
        regionException(regionStr, "empty contig name");
    }

    if (colonIndex == std::string::npos) return;

    const std::string rangeStr(regionStr.substr(colonIndex+1));
    const std::string::size_type dashIndex(rangeStr.find('-'));

    region.beginPos = parseRegionPos(regionStr, rangeStr.substr(0, dashIndex)) - 1;
    if (dashIndex == std::string::npos) return;

    region.endPos = parseRegionPos(regionStr, rangeStr.substr(dashIndex+1));
    region.isEndPos = true;
    if (region.endPos <= region.beginPos)
    {
        regionException(regionStr, "end position precedes begin position");
    }
}
