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

#include "ReferenceSTRsOptionsParser.hh"

#include "boost/filesystem.hpp"

#include <fstream>
#include <string>
#include <vector>


/// parse args into opt with the GetReferenceSTRs configuration options
static
void
parseTestArgs(
    const std::vector<std::string>& args,
    ReferenceSTRsOptions& opt)
{
    namespace po = boost::program_options;
    po::options_description desc("configuration");
    addReferenceSTRsOptions(opt, desc);

    std::vector<const char*> argv(1, "GetReferenceSTRs");
    for (const std::string& arg : args)
    {
        argv.push_back(arg.c_str());
    }

    po::variables_map vm;
    po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(), desc), vm);
    po::notify(vm);
}



BOOST_AUTO_TEST_SUITE( test_ReferenceSTRsOptionsParser )


BOOST_AUTO_TEST_CASE( test_option_values )
{
    const boost::filesystem::path refPath(
        boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("refstr-%%%%-%%%%.fa"));
    {
        std::ofstream ofs(refPath.string().c_str());
        ofs << ">chrA\nACGT\n";
    }

    {
        ReferenceSTRsOptions opt;
        parseTestArgs({"--ref", refPath.string()}, opt);
        BOOST_REQUIRE_EQUAL(opt.referenceFilename, refPath.string());
        BOOST_REQUIRE_EQUAL(opt.maxPeriod, 8);
        BOOST_REQUIRE_EQUAL(opt.maxRepeatLength, 20);
        BOOST_REQUIRE(! opt.isVerbose);
        BOOST_REQUIRE(opt.regions.empty());
        BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) == nullptr);
    }

    {
        ReferenceSTRsOptions opt;
        parseTestArgs({"--ref", refPath.string(), "--max-period", "3", "--max-repeat-length", "12",
                       "--region", "chrA:1-2", "--region", "chrB", "--verbose"}, opt);
        BOOST_REQUIRE_EQUAL(opt.maxPeriod, 3);
        BOOST_REQUIRE_EQUAL(opt.maxRepeatLength, 12);
        BOOST_REQUIRE_EQUAL(opt.regions.size(), 2u);
        BOOST_REQUIRE(opt.isVerbose);
        BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) == nullptr);
    }

    // negative values must reach the range checks instead of wrapping:
    {
        ReferenceSTRsOptions opt;
        parseTestArgs({"--ref", refPath.string(), "--max-repeat-length=-1"}, opt);
        BOOST_REQUIRE_EQUAL(opt.maxRepeatLength, -1);
        BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) != nullptr);
    }
    {
        ReferenceSTRsOptions opt;
        parseTestArgs({"--ref", refPath.string(), "--max-repeat-length=0"}, opt);
        BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) != nullptr);
    }
    {
        ReferenceSTRsOptions opt;
        parseTestArgs({"--ref", refPath.string(), "--max-period=-2"}, opt);
        BOOST_REQUIRE_EQUAL(opt.maxPeriod, -2);
        BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) != nullptr);
    }

    boost::system::error_code ec;
    boost::filesystem::remove(refPath, ec);
}


BOOST_AUTO_TEST_CASE( test_reference_errors )
{
    ReferenceSTRsOptions opt;
    BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) != nullptr);

    opt.referenceFilename = (boost::filesystem::temp_directory_path() /
                             boost::filesystem::unique_path("refstr-missing-%%%%-%%%%.fa")).string();
    BOOST_REQUIRE(getReferenceSTRsOptionsError(opt) != nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
