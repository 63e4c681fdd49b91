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

#include "repeatAnalysis/ReferenceSTRScanner.hh"

#include "repeatAnalysis/STRRepeatCountUtil.hh"
#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>



ReferenceSTRScanner::
ReferenceSTRScanner(
    const reference_contig_segment& ref,
    const pos_t beginPos,
    const pos_t endPos,
    const int maxPeriod)
    : _ref(ref),
      _beginPos(beginPos),
      _endPos(endPos),
      _maxPeriod(0)
{
    using namespace refstr::common;

    if (maxPeriod < 1)
    {
        std::ostringstream oss;
        oss << "Maximum STR period must be at least 1, found: " << maxPeriod;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    if ((beginPos < ref.get_offset()) || (beginPos > endPos) || (endPos > ref.end()))
    {
        std::ostringstream oss;
        oss << "STR scan window [" << beginPos << "," << endPos
            << ") is not contained in reference segment [" << ref.get_offset() << "," << ref.end() << ")";
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    _maxPeriod = maxPeriod;

    const unsigned windowSize(endPos - beginPos);
    _period.resize(windowSize, 1);
    _forwardCount.resize(windowSize, 0);
    _repeatLength.reset(new std::atomic<unsigned>[windowSize]);
    for (unsigned windowIndex(0); windowIndex < windowSize; ++windowIndex)
    {
        _repeatLength[windowIndex].store(0, std::memory_order_relaxed);
    }

    scanForward();
}



void
ReferenceSTRScanner::
scanForward()
{
    if (_beginPos == _endPos) return;

    const std::string& seq(_ref.seq());
    const pos_t seqSize(seq.size());
    const pos_t beginIndex(_beginPos - _ref.get_offset());
    const pos_t endIndex(_endPos - _ref.get_offset());

    // no unit longer than the sequence downstream of the window start can fit:
    const unsigned maxFitPeriod(std::min(_maxPeriod, static_cast<unsigned>(seqSize - beginIndex)));

    // mismatchIndex[period] is the first index at or after the current index where the base differs
    // from the base one period downstream, or where that comparison would run past the end of the
    // sequence. Each cursor only moves downstream, so every base comparison for a given period is
    // made at most once across the window.
    //
    // With run=(mismatchIndex - index), the blocks at index+period, index+2*period... match the unit
    // at index for (run/period) copies.
    //
    std::vector<pos_t> mismatchIndex(maxFitPeriod+1, beginIndex);

    for (pos_t index(beginIndex); index < endIndex; ++index)
    {
        unsigned bestPeriod(1);
        unsigned bestCount(0);
        for (unsigned period(1); period <= maxFitPeriod; ++period)
        {
            const pos_t unitSize(period);

            // the unit does not fit, nor will any longer unit:
            if ((index + unitSize) > seqSize) break;

            pos_t& mismatch(mismatchIndex[period]);
            if (mismatch < index) mismatch = index;
            while (((mismatch + unitSize) < seqSize) && (seq[mismatch] == seq[mismatch + unitSize]))
            {
                ++mismatch;
            }

            const unsigned forwardCount(1 + (mismatch - index) / unitSize);

            // strict improvement required, so ties go to the smaller period:
            if (forwardCount > bestCount)
            {
                bestPeriod = period;
                bestCount = forwardCount;
            }
        }

        const unsigned windowIndex(index - beginIndex);
        _period[windowIndex] = bestPeriod;
        _forwardCount[windowIndex] = bestCount;
    }
}



unsigned
ReferenceSTRScanner::
getWindowIndex(const pos_t pos) const
{
    if ((pos < _beginPos) || (pos >= _endPos))
    {
        std::ostringstream oss;
        oss << "Position " << pos << " is outside of STR scan window [" << _beginPos << "," << _endPos << ")";
        BOOST_THROW_EXCEPTION(refstr::common::OutOfRangeException(oss.str()));
    }
    return (pos - _beginPos);
}



unsigned
ReferenceSTRScanner::
repeatLength(const pos_t pos) const
{
    const unsigned windowIndex(getWindowIndex(pos));
    std::atomic<unsigned>& cachedLength(_repeatLength[windowIndex]);

    unsigned length(cachedLength.load(std::memory_order_relaxed));
    if (length == 0)
    {
        length = _forwardCount[windowIndex] + getBackwardSTRRepeatCount(_period[windowIndex], pos, _ref);
        cachedLength.store(length, std::memory_order_relaxed);
    }
    return length;
}



void
ReferenceSTRScanner::
getRepeatUnit(
    const pos_t pos,
    std::string& unit) const
{
    _ref.get_substring(pos, period(pos), unit);
}



std::string
ReferenceSTRScanner::
repeatUnitAsString(const pos_t pos) const
{
    std::string unit;
    getRepeatUnit(pos, unit);
    return unit;
}
