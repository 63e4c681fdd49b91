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

#include <cstdint>

#include <iosfwd>
#include <map>


class ReferenceSTRScanner;


/// STR period and repeat length describing a reference position
struct STRContext
{
    STRContext(
        unsigned initPeriod = 1,
        unsigned initRepeatLength = 1)
        : period(initPeriod), repeatLength(initRepeatLength)
    {}

    bool operator<(const STRContext& rhs) const
    {
        if (period < rhs.period)
        {
            return true;
        }
        if (period != rhs.period)
        {
            return false;
        }
        return repeatLength < rhs.repeatLength;
    }

    bool operator==(const STRContext& rhs) const
    {
        return ((period == rhs.period) && (repeatLength == rhs.repeatLength));
    }

    unsigned period;
    unsigned repeatLength;
};

std::ostream&
operator<<(std::ostream& os, const STRContext& context);


/// counts of reference positions in each STR context
///
/// repeat lengths above maxRepeatLength are counted in the maxRepeatLength bin
///
class STRContextCounts
{
public:
    typedef std::map<STRContext, uint64_t> data_t;
    typedef data_t::const_iterator const_iterator;

    /// throws InvalidParameterException if maxRepeatLength is 0
    explicit
    STRContextCounts(const unsigned maxRepeatLength = 20);

    /// throws InvalidParameterException if period or repeatLength is 0
    void
    addContext(
        const unsigned period,
        const unsigned repeatLength,
        const uint64_t count = 1);

    /// add the context of every position in the scanner window
    void
    addScanner(const ReferenceSTRScanner& scanner);

    /// throws InvalidParameterException if rhs uses a different maxRepeatLength
    void
    merge(const STRContextCounts& rhs);

    uint64_t
    getCount(
        const unsigned period,
        const unsigned repeatLength) const;

    uint64_t
    totalCount() const;

    unsigned
    maxRepeatLength() const
    {
        return _maxRepeatLength;
    }

    bool
    empty() const
    {
        return _data.empty();
    }

    void
    clear()
    {
        _data.clear();
    }

    const_iterator
    begin() const
    {
        return _data.begin();
    }

    const_iterator
    end() const
    {
        return _data.end();
    }

    /// write summary lines followed by a tab-delimited table of all observed contexts
    void
    dump(std::ostream& os) const;

private:
    unsigned
    capRepeatLength(const unsigned repeatLength) const
    {
        return ((repeatLength > _maxRepeatLength) ? _maxRepeatLength : repeatLength);
    }

    unsigned _maxRepeatLength;
    data_t _data;
};
