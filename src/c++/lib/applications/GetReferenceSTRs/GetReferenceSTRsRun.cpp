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

#include "GetReferenceSTRsRun.hh"

#include "blt_util/FastaContigReader.hh"
#include "blt_util/GenomeRegion.hh"
#include "blt_util/log.hh"
#include "common/Exceptions.hh"
#include "common/OutStream.hh"
#include "repeatAnalysis/STRContextCounts.hh"

#include <cerrno>

#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <vector>


typedef std::map<std::string, std::vector<GenomeRegion>> contigRegions_t;



void
writeSTRTableHeader(std::ostream& os)
{
    os << "#contig\tpos\tperiod\trepeat_length\tunit\n";
}



void
writeSTRTable(
    const std::string& contigName,
    const ReferenceSTRScanner& scanner,
    std::ostream& os)
{
    static const char sep('\t');

    std::string unit;
    for (pos_t pos(scanner.begin()); pos < scanner.end(); ++pos)
    {
        scanner.getRepeatUnit(pos, unit);
        os << contigName << sep
           << (pos+1) << sep
           << scanner.period(pos) << sep
           << scanner.repeatLength(pos) << sep
           << unit << '\n';
    }
}



static
void
parseRegions(
    const std::vector<std::string>& regionStrings,
    contigRegions_t& contigRegions)
{
    contigRegions.clear();
    GenomeRegion region;
    for (const std::string& regionStr : regionStrings)
    {
        parseGenomeRegion(regionStr, region);
        contigRegions[region.contig].push_back(region);
    }
}



/// convert region to a scan window on ref, throws if the region extends past the end of the contig
static
void
getRegionWindow(
    const GenomeRegion& region,
    const reference_contig_segment& ref,
    pos_t& beginPos,
    pos_t& endPos)
{
    beginPos = region.beginPos;
    endPos = (region.isEndPos ? region.endPos : ref.end());
    if ((beginPos >= ref.end()) || (endPos > ref.end()))
    {
        std::ostringstream oss;
        oss << "Region '" << region << "' extends past the end of contig '" << region.contig
            << "' (length " << ref.end() << ")";
        BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
    }
}



static
void
scanWindow(
    const ReferenceSTRsOptions& opt,
    const std::string& contigName,
    const reference_contig_segment& ref,
    const pos_t beginPos,
    const pos_t endPos,
    std::ostream& os,
    STRContextCounts& counts)
{
    const ReferenceSTRScanner scanner(ref, beginPos, endPos, opt.maxPeriod);
    writeSTRTable(contigName, scanner, os);
    if (! opt.summaryFilename.empty())
    {
        counts.addScanner(scanner);
    }

    if (opt.isVerbose)
    {
        log_os << "INFO: Scanned " << (endPos-beginPos) << " positions of contig '" << contigName
               << "' in [" << (beginPos+1) << "," << endPos << "]\n";
    }
}



void
getReferenceSTRs(const ReferenceSTRsOptions& opt)
{
    contigRegions_t contigRegions;
    parseRegions(opt.regions, contigRegions);

    std::ifstream refStream(opt.referenceFilename.c_str());
    if (! refStream)
    {
        std::ostringstream oss;
        oss << "Can't open fasta reference file: '" << opt.referenceFilename << "'";
        BOOST_THROW_EXCEPTION(refstr::common::IoException(errno, oss.str()));
    }

    OutStream outs(opt.outputFilename);
    std::ostream& os(outs.getStream());
    writeSTRTableHeader(os);

    STRContextCounts counts(static_cast<unsigned>(opt.maxRepeatLength));

    FastaContigReader reader(refStream, opt.referenceFilename);
    std::string contigName;
    reference_contig_segment ref;
    std::set<std::string> foundRegionContigs;
    while (reader.next(contigName, ref))
    {
        if (contigRegions.empty())
        {
            scanWindow(opt, contigName, ref, ref.get_offset(), ref.end(), os, counts);
            continue;
        }

        const auto contigIter(contigRegions.find(contigName));
        if (contigIter == contigRegions.end()) continue;
        foundRegionContigs.insert(contigName);

        for (const GenomeRegion& region : contigIter->second)
        {
            pos_t beginPos, endPos;
            getRegionWindow(region, ref, beginPos, endPos);
            scanWindow(opt, contigName, ref, beginPos, endPos, os, counts);
        }
    }

    if (foundRegionContigs.size() < contigRegions.size())
    {
        std::ostringstream oss;
        oss << "Region contigs not found in fasta reference file '" << opt.referenceFilename << "':";
        for (const auto& value : contigRegions)
        {
            if (foundRegionContigs.count(value.first)) continue;
            oss << " " << value.first;
        }
        BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
    }

    if (! opt.summaryFilename.empty())
    {
        OutStream summaryOuts(opt.summaryFilename);
        counts.dump(summaryOuts.getStream());
    }
}
