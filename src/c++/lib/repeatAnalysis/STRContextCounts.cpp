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

#include "repeatAnalysis/STRContextCounts.hh"

#include "repeatAnalysis/ReferenceSTRScanner.hh"
#include "common/Exceptions.hh"

#include <iostream>
#include <sstream>
#include <string>



std::ostream&
operator<<(std::ostream& os, const STRContext& context)
{
    os << context.period << "x" << context.repeatLength;
    return os;
}



STRContextCounts::
STRContextCounts(const unsigned maxRepeatLength)
    : _maxRepeatLength(maxRepeatLength)
{
    if (maxRepeatLength == 0)
    {
        BOOST_THROW_EXCEPTION(refstr::common::InvalidParameterException("Maximum STR repeat length must be at least 1"));
    }
}



void
STRContextCounts::
addContext(
    const unsigned period,
    const unsigned repeatLength,
    const uint64_t count)
{
    if ((period == 0) || (repeatLength == 0))
    {
        std::ostringstream oss;
        oss << "Invalid STR context: period " << period << " repeat length " << repeatLength;
        BOOST_THROW_EXCEPTION(refstr::common::InvalidParameterException(oss.str()));
    }

    if (count == 0) return;
    _data[STRContext(period, capRepeatLength(repeatLength))] += count;
}



void
STRContextCounts::
addScanner(const ReferenceSTRScanner& scanner)
{
    for (pos_t pos(scanner.begin()); pos < scanner.end(); ++pos)
    {
        addContext(scanner.period(pos), scanner.repeatLength(pos));
    }
}



void
STRContextCounts::
merge(const STRContextCounts& rhs)
{
    if (rhs._maxRepeatLength != _maxRepeatLength)
    {
        std::ostringstream oss;
        oss << "Can't merge STR context counts with different maximum repeat lengths: "
            << _maxRepeatLength << " and " << rhs._maxRepeatLength;
        BOOST_THROW_EXCEPTION(refstr::common::InvalidParameterException(oss.str()));
    }

    for (const auto& value : rhs._data)
    {
        _data[value.first] += value.second;
    }
}



uint64_t
STRContextCounts::
getCount(
    const unsigned period,
    const unsigned repeatLength) const
{
    const auto iter(_data.find(STRContext(period, capRepeatLength(repeatLength))));
    if (iter == _data.end()) return 0;
    return iter->second;
}



uint64_t
STRContextCounts::
totalCount() const
{
    uint64_t total(0);
    for (const auto& value : _data)
    {
        total += value.second;
    }
    return total;
}



void
STRContextCounts::
dump(std::ostream& os) const
{
    static const std::string tag("STRContext");
    os << tag << "TotalPositions: " << totalCount() << "\n";
    os << tag << "KeyCount: " << _data.size() << "\n";
    os << tag << "MaxRepeatLength: " << _maxRepeatLength << "\n";

    static const char sep('\t');
    os << "period" << sep << "repeat_length" << sep << "count" << "\n";
    for (const auto& value : _data)
    {
        const STRContext& context(value.first);
        os << context.period << sep << context.repeatLength;
        if (context.repeatLength == _maxRepeatLength) os << '+';
        os << sep << value.second << "\n";
    }
}
