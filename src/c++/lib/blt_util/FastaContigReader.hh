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

#include "blt_util/reference_contig_segment.hh"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>


/// streams contigs one at a time from fasta formatted input
///
/// contig names are the first whitespace-delimited word of each header line,
/// sequence lines are concatenated and converted to upper case. Blank lines
/// and '\r' characters are ignored.
///
class FastaContigReader : private boost::noncopyable
{
public:
    /// \param[in] label name of the input used in error messages
    explicit
    FastaContigReader(
        std::istream& is,
        const std::string& label = "stream");

    /// read the next contig into contigName and ref
    ///
    /// ref is reset to offset zero.
    ///
    /// \return false when no contigs remain
    bool
    next(
        std::string& contigName,
        reference_contig_segment& ref);

    /// number of input lines read so far
    unsigned
    lineNumber() const
    {
        return _lineNumber;
    }

private:
    bool
    readLine();

    void
    parseHeader(std::string& contigName) const;

    std::istream& _is;
    const std::string _label;
    std::string _line;
    unsigned _lineNumber;

    /// true when _line holds the header of the next contig
    bool _isHeaderPending;
};
