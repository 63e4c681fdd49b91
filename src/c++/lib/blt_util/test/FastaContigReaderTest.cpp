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

#include "FastaContigReader.hh"
#include "common/Exceptions.hh"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_FastaContigReader )


BOOST_AUTO_TEST_CASE( test_read_contigs )
{
    std::istringstream iss(
        ">chr1 first contig\n"
        "ACGTn\n"
        "acgt\r\n"
        "\n"
        ">chr2\n"
        "GGGG\n"
        ">chrEmpty\n"
        ">chr3\t desc\n"
        "TT");

    FastaContigReader reader(iss);
    std::string contigName;
    reference_contig_segment ref;

    BOOST_REQUIRE(reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(contigName, "chr1");
    BOOST_REQUIRE_EQUAL(ref.seq(), "ACGTNACGT");
    BOOST_REQUIRE_EQUAL(ref.get_offset(), 0);

    BOOST_REQUIRE(reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(contigName, "chr2");
    BOOST_REQUIRE_EQUAL(ref.seq(), "GGGG");

    BOOST_REQUIRE(reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(contigName, "chrEmpty");
    BOOST_REQUIRE(ref.empty());

    BOOST_REQUIRE(reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(contigName, "chr3");
    BOOST_REQUIRE_EQUAL(ref.seq(), "TT");

    BOOST_REQUIRE(! reader.next(contigName, ref));
    BOOST_REQUIRE(! reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(reader.lineNumber(), 9u);
}


BOOST_AUTO_TEST_CASE( test_empty_input )
{
    std::istringstream iss("\n\n");
    FastaContigReader reader(iss);
    std::string contigName;
    reference_contig_segment ref;
    BOOST_REQUIRE(! reader.next(contigName, ref));
}


BOOST_AUTO_TEST_CASE( test_segment_reset )
{
    std::istringstream iss(">a\nAC\n");
    FastaContigReader reader(iss);
    std::string contigName;
    reference_contig_segment ref;
    ref.seq() = "TTTT";
    ref.set_offset(20);

    BOOST_REQUIRE(reader.next(contigName, ref));
    BOOST_REQUIRE_EQUAL(ref.seq(), "AC");
    BOOST_REQUIRE_EQUAL(ref.get_offset(), 0);
}


BOOST_AUTO_TEST_CASE( test_malformed_input )
{
    using namespace refstr::common;

    std::string contigName;
    reference_contig_segment ref;

    {
        std::istringstream iss("ACGT\n>chr1\nACGT\n");
        FastaContigReader reader(iss, "test.fa");
        BOOST_REQUIRE_THROW(reader.next(contigName, ref), GeneralException);
    }
    {
        std::istringstream iss(">chr1\nACGT\n>  \nACGT\n");
        FastaContigReader reader(iss, "test.fa");
        BOOST_REQUIRE(reader.next(contigName, ref));
        BOOST_REQUIRE_THROW(reader.next(contigName, ref), GeneralException);
    }
}

BOOST_AUTO_TEST_SUITE_END()
