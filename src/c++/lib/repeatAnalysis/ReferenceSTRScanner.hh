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
#include "blt_util/reference_contig_segment.hh"

#include "boost/utility.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>


/// \brief Finds the STR period and repeat length of every position in a window of the reference
///
/// The period of a position is the unit length in [1,maxPeriod] giving the most consecutive copies
/// of the unit when scanning downstream from the position, where the unit is the sequence of
/// period bases starting at the position. Ties go to the smaller period. The repeat length adds the
/// copies of the same unit found immediately upstream of the position, so a longer upstream repeat
/// of a different unit has no influence on the result.
///
/// The period and forward repeat count of every window position are found in a single pass during
/// construction, in O(window size x maxPeriod). The upstream extension is computed on the first
/// repeatLength() query for each position and cached.
///
/// The window only restricts which positions can be queried, bases of the full reference segment
/// are used as context. The reference segment must outlive the scanner and must not be modified.
///
/// ### Example
///
/// Reference:     CCATATATGG
/// period:        1122211111
/// repeatLength:  2232311122
///
class ReferenceSTRScanner : private boost::noncopyable
{
public:
    /// \param[in] beginPos start of the query window
    /// \param[in] endPos end of the query window (exclusive)
    /// \param[in] maxPeriod longest repeat unit considered
    ///
    /// throws InvalidParameterException if maxPeriod is less than 1 or the window is not contained
    /// in the reference segment
    ReferenceSTRScanner(
        const reference_contig_segment& ref,
        const pos_t beginPos,
        const pos_t endPos,
        const int maxPeriod);

    /// all position queries throw OutOfRangeException for positions outside of [begin(),end())

    unsigned
    period(const pos_t pos) const
    {
        return _period[getWindowIndex(pos)];
    }

    /// copies of the unit at pos found scanning downstream, including the unit itself
    unsigned
    forwardRepeatCount(const pos_t pos) const
    {
        return _forwardCount[getWindowIndex(pos)];
    }

    /// copies of the unit at pos found scanning downstream and upstream, including the unit itself
    unsigned
    repeatLength(const pos_t pos) const;

    /// copy the period(pos) bases starting at pos into unit
    void
    getRepeatUnit(
        const pos_t pos,
        std::string& unit) const;

    std::string
    repeatUnitAsString(const pos_t pos) const;

    pos_t
    begin() const
    {
        return _beginPos;
    }

    pos_t
    end() const
    {
        return _endPos;
    }

    unsigned
    maxPeriod() const
    {
        return _maxPeriod;
    }

    const reference_contig_segment&
    ref() const
    {
        return _ref;
    }

private:
    unsigned
    getWindowIndex(const pos_t pos) const;

    /// find period and forward repeat count for all window positions
    void
    scanForward();

    const reference_contig_segment& _ref;
    const pos_t _beginPos;
    const pos_t _endPos;
    unsigned _maxPeriod;

    std::vector<unsigned> _period;
    std::vector<unsigned> _forwardCount;

    /// repeat length cache for each window position, 0 until the position is first queried
    ///
    /// each cell is written at most once with a deterministic value, so concurrent first queries
    /// of the same position can only store the same result
    std::unique_ptr<std::atomic<unsigned>[]> _repeatLength;
};
