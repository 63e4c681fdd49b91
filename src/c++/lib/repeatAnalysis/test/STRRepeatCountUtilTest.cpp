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

#include "boost/test/unit_test.hpp"

#include "STRRepeatCountUtil.hh"

#include <limits>


BOOST_AUTO_TEST_SUITE( test_STRRepeatCountUtil )


BOOST_AUTO_TEST_CASE( test_compareRepeatUnit )
{
    reference_contig_segment ref;
    ref.seq() = "GAGAGATTT";

    BOOST_REQUIRE(compareRepeatUnit(2, 0, 2, ref));
    BOOST_REQUIRE(compareRepeatUnit(2, 0, 4, ref));
    BOOST_REQUIRE(! compareRepeatUnit(2, 0, 6, ref));
    BOOST_REQUIRE(compareRepeatUnit(1, 6, 8, ref));
}


BOOST_AUTO_TEST_CASE( test_forward_and_backward_counts )
{
    reference_contig_segment ref;
    ref.seq() = "TTGTTTGAGAGATTTTGATGATGAA";
//               0123456789012345678901234

    // GA unit at 6 has two downstream copies, none upstream:
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(2, 6, ref), 3u);
    BOOST_REQUIRE_EQUAL(getBackwardSTRRepeatCount(2, 6, ref), 0u);

    // upstream copies are counted against the unit at pos:
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(2, 10, ref), 1u);
    BOOST_REQUIRE_EQUAL(getBackwardSTRRepeatCount(2, 10, ref), 2u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(2, 10, ref, false), 3u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(2, 10, ref, true), 1u);

    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(1, 12, ref, true), 4u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(1, 15, ref, true), 1u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(1, 15, ref, false), 4u);

    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(3, 17, ref, false), 2u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(3, 20, ref, true), 1u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(3, 20, ref, false), 2u);
}


BOOST_AUTO_TEST_CASE( test_unit_does_not_fit )
{
    reference_contig_segment ref;
    ref.seq() = "ACGTACGT";

    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(3, 6, ref), 0u);
    BOOST_REQUIRE_EQUAL(getBackwardSTRRepeatCount(3, 6, ref), 0u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(3, 6, ref, false), 0u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(3, 5, ref), 1u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(1, 8, ref), 0u);

    // a partial trailing block is not a copy:
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(3, 0, ref), 1u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(4, 4, ref, false), 2u);
}


BOOST_AUTO_TEST_CASE( test_segment_offset_bounds )
{
    reference_contig_segment ref;
    ref.seq() = "AAAA";
    ref.set_offset(10);

    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(1, 10, ref), 4u);
    BOOST_REQUIRE_EQUAL(getBackwardSTRRepeatCount(1, 13, ref), 3u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(1, 9, ref), 0u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(2, 12, ref), 1u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(2, 13, ref), 0u);
}


BOOST_AUTO_TEST_CASE( test_getBestPeriodAndForwardCount )
{
    reference_contig_segment ref;
    ref.seq() = "ATATAATATA";

    unsigned period(0);
    unsigned forwardCount(0);
    getBestPeriodAndForwardCount(6, 0, ref, period, forwardCount);
    BOOST_REQUIRE_EQUAL(period, 2u);
    BOOST_REQUIRE_EQUAL(forwardCount, 2u);

    // only period 1 fits at the last position:
    getBestPeriodAndForwardCount(6, 9, ref, period, forwardCount);
    BOOST_REQUIRE_EQUAL(period, 1u);
    BOOST_REQUIRE_EQUAL(forwardCount, 1u);

    getBestPeriodAndForwardCount(1, 0, ref, period, forwardCount);
    BOOST_REQUIRE_EQUAL(period, 1u);
    BOOST_REQUIRE_EQUAL(forwardCount, 1u);
}

BOOST_AUTO_TEST_CASE( test_huge_period )
{
    reference_contig_segment ref;
    ref.seq() = "ACACAC";
    ref.set_offset(100);

    const unsigned maxUnsigned(std::numeric_limits<unsigned>::max());
    const unsigned maxPos(std::numeric_limits<pos_t>::max());

    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(maxUnsigned, 100, ref), 0u);
    BOOST_REQUIRE_EQUAL(getForwardSTRRepeatCount(maxPos, 102, ref), 0u);
    BOOST_REQUIRE_EQUAL(getBackwardSTRRepeatCount(maxPos, 105, ref), 0u);
    BOOST_REQUIRE_EQUAL(getSTRRepeatCount(maxPos - 100, 104, ref, false), 0u);

    unsigned period(0);
    unsigned forwardCount(0);
    getBestPeriodAndForwardCount(maxUnsigned, 100, ref, period, forwardCount);
    BOOST_REQUIRE_EQUAL(period, 2u);
    BOOST_REQUIRE_EQUAL(forwardCount, 3u);
}

BOOST_AUTO_TEST_SUITE_END()
