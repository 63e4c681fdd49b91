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

#include "repeatAnalysis/STRRepeatCountUtil.hh"



/// true if period bases starting at pos lie within the reference segment
static
bool
isUnitInSegment(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref)
{
    if ((pos < ref.get_offset()) || (pos > ref.end())) return false;
    return (period <= static_cast<unsigned>(ref.end() - pos));
}



bool
compareRepeatUnit(
    const unsigned period,
    const pos_t pos1,
    const pos_t pos2,
    const reference_contig_segment& ref)
{
    const std::string& seq(ref.seq());
    const pos_t offset(ref.get_offset());
    return (seq.compare(pos1-offset, period, seq, pos2-offset, period) == 0);
}



unsigned
getForwardSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref)
{
    if (! isUnitInSegment(period, pos, ref)) return 0;

    const pos_t unitSize(period);
    unsigned count(1);
    const pos_t lastBlockPos(ref.end() - unitSize);
    for (pos_t blockPos(pos + unitSize); blockPos <= lastBlockPos; blockPos += unitSize)
    {
        if (! compareRepeatUnit(period, pos, blockPos, ref)) break;
        count++;
    }
    return count;
}



unsigned
getBackwardSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref)
{
    if (! isUnitInSegment(period, pos, ref)) return 0;

    const pos_t unitSize(period);
    unsigned count(0);
    const pos_t firstBlockPos(ref.get_offset());
    for (pos_t blockPos(pos - unitSize); blockPos >= firstBlockPos; blockPos -= unitSize)
    {
        if (! compareRepeatUnit(period, pos, blockPos, ref)) break;
        count++;
    }
    return count;
}



unsigned
getSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref,
    const bool isForwardOnly)
{
    const unsigned forwardCount(getForwardSTRRepeatCount(period, pos, ref));
    if (isForwardOnly || (forwardCount == 0)) return forwardCount;
    return forwardCount + getBackwardSTRRepeatCount(period, pos, ref);
}



void
getBestPeriodAndForwardCount(
    const unsigned maxPeriod,
    const pos_t pos,
    const reference_contig_segment& ref,
    unsigned& bestPeriod,
    unsigned& forwardCount)
{
    bestPeriod = 1;
    forwardCount = getForwardSTRRepeatCount(1, pos, ref);
    for (unsigned period(2); period <= maxPeriod; ++period)
    {
        const unsigned candidateCount(getForwardSTRRepeatCount(period, pos, ref));

        // longer units cannot fit either:
        if (candidateCount == 0) break;

        if (candidateCount > forwardCount)
        {
            bestPeriod = period;
            forwardCount = candidateCount;
        }
    }
}
