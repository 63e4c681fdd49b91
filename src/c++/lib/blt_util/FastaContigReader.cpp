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

#include "blt_util/FastaContigReader.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>



FastaContigReader::
FastaContigReader(
    std::istream& is,
    const std::string& label)
    : _is(is),
      _label(label),
      _lineNumber(0),
      _isHeaderPending(false)
{}



bool
FastaContigReader::
readLine()
{
    if (! std::getline(_is, _line))
    {
        if (_is.bad())
        {
            std::ostringstream oss;
            oss << "Unexpected failure while attempting to read line " << (_lineNumber+1)
                << " of fasta input '" << _label << "'";
            BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
        }
        return false;
    }
    ++_lineNumber;

    // windows fasta files may still have '\r'
    _line.erase(std::remove(_line.begin(), _line.end(), '\r'), _line.end());
    return true;
}



void
FastaContigReader::
parseHeader(std::string& contigName) const
{
    std::string::const_iterator nameBegin(_line.begin()+1);
    while ((nameBegin != _line.end()) && isspace(static_cast<unsigned char>(*nameBegin))) ++nameBegin;
    std::string::const_iterator nameEnd(nameBegin);
    while ((nameEnd != _line.end()) && (! isspace(static_cast<unsigned char>(*nameEnd)))) ++nameEnd;

    if (nameBegin == nameEnd)
    {
        std::ostringstream oss;
        oss << "Unexpected header format on line " << _lineNumber
            << " of fasta input '" << _label << "': '" << _line << "'";
        BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
    }
    contigName.assign(nameBegin, nameEnd);
}



bool
FastaContigReader::
next(
    std::string& contigName,
    reference_contig_segment& ref)
{
    contigName.clear();
    ref.clear();

    while (! _isHeaderPending)
    {
        if (! readLine()) return false;
        if (_line.empty()) continue;
        if (_line[0] != '>')
        {
            std::ostringstream oss;
            oss << "Missing header before sequence data on line " << _lineNumber
                << " of fasta input '" << _label << "'";
            BOOST_THROW_EXCEPTION(refstr::common::GeneralException(oss.str()));
        }
        _isHeaderPending=true;
    }

    parseHeader(contigName);
    _isHeaderPending=false;

    std::string& seq(ref.seq());
    while (readLine())
    {
        if (_line.empty()) continue;
        if (_line[0] == '>')
        {
            _isHeaderPending=true;
            break;
        }
        for (const char c : _line)
        {
            seq.push_back(static_cast<char>(toupper(static_cast<unsigned char>(c))));
        }
    }
    return true;
}
