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

#include "ReferenceSTRsOptionsParser.hh"

#include "blt_util/log.hh"
#include "common/ProgramUtil.hh"

#include "boost/filesystem.hpp"
#include "boost/program_options.hpp"

#include <iostream>



static
void
usage(
    std::ostream& os,
    const refstr::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "report the STR period and repeat length of reference positions", " > str_table", msg);
}



void
addReferenceSTRsOptions(
    ReferenceSTRsOptions& opt,
    boost::program_options::options_description& desc)
{
    namespace po = boost::program_options;
    desc.add_options()
    ("ref", po::value(&opt.referenceFilename),
     "fasta reference sequence (required)")
    ("region", po::value(&opt.regions),
     "samtools formatted region to scan, eg. 'chr1:20-30'. May be supplied more than once. "
     "The full contig sequence is used as context for positions in the region. "
     "Without any regions every position of the reference is scanned.")
    ("max-period", po::value(&opt.maxPeriod)->default_value(opt.maxPeriod),
     "longest STR unit considered")
    ("output-file", po::value(&opt.outputFilename),
     "write the per-position STR table to filename (default: stdout)")
    ("summary-file", po::value(&opt.summaryFilename),
     "write counts of positions in each STR period and repeat length context to filename")
    ("max-repeat-length", po::value(&opt.maxRepeatLength)->default_value(opt.maxRepeatLength),
     "repeat lengths above this value are counted together in the summary")
    ("verbose", po::value(&opt.isVerbose)->zero_tokens(),
     "log progress for each scanned contig")
    ;
}



const char*
getReferenceSTRsOptionsError(const ReferenceSTRsOptions& opt)
{
    if (opt.referenceFilename.empty())
    {
        return "Must specify a fasta reference file";
    }
    if (! boost::filesystem::exists(opt.referenceFilename))
    {
        return "Fasta reference file does not exist";
    }
    if (opt.maxPeriod < 1)
    {
        return "max-period must be at least 1";
    }
    if (opt.maxRepeatLength < 1)
    {
        return "max-repeat-length must be at least 1";
    }
    return nullptr;
}



void
parseReferenceSTRsOptions(
    const refstr::Program& prog,
    int argc,
    char** argv,
    ReferenceSTRsOptions& opt)
{
    namespace po = boost::program_options;
    po::options_description req("configuration");
    addReferenceSTRsOptions(opt, req);

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(req).add(help);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, visible), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if ((argc<=1) || (vm.count("help")) || po_parse_fail)
    {
        usage(log_os,prog,visible);
    }

    const char* errorMsg(getReferenceSTRsOptionsError(opt));
    if (errorMsg)
    {
        usage(log_os,prog,visible,errorMsg);
    }
}
