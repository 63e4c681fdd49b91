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


/// compare period bases starting at two positions in the ref
///
/// both blocks must lie within the reference segment
bool
compareRepeatUnit(
    const unsigned period,
    const pos_t pos1,
    const pos_t pos2,
    const reference_contig_segment& ref);

/// count consecutive copies of the period-length unit starting at pos, scanning downstream only
///
/// the unit at pos counts as the first copy, each following non-overlapping block which
/// matches the unit adds one copy, counting stops at the first mismatch or where the next
/// block would extend past the end of the reference segment.
///
/// \return copy count, or 0 if the unit itself does not fit in the reference segment
unsigned
getForwardSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref);

/// count the additional copies of the period-length unit at pos found immediately upstream of pos
///
/// each upstream block is compared to the unit at pos, not to its downstream neighbor.
///
/// \return upstream copy count, or 0 if the unit at pos does not fit in the reference segment
unsigned
getBackwardSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref);

/// total copy count of the period-length unit at pos
///
/// \param[in] isForwardOnly if true, skip upstream copies
unsigned
getSTRRepeatCount(
    const unsigned period,
    const pos_t pos,
    const reference_contig_segment& ref,
    const bool isForwardOnly);

/// find the period in [1,maxPeriod] with the highest forward repeat count at pos
///
/// a larger period replaces the current best only if its forward count is strictly greater,
/// so ties go to the smaller period. Brute-force counterpart of the forward pass in
/// ReferenceSTRScanner, O(maxPeriod x repeat span).
///
void
getBestPeriodAndForwardCount(
    const unsigned maxPeriod,
    const pos_t pos,
    const reference_contig_segment& ref,
    unsigned& bestPeriod,
    unsigned& forwardCount);
