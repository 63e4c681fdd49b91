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

#include <string>


namespace refstr
{
namespace blt_util
{

/// parse an unsigned number from the start of s and advance s past the
/// parsed characters
///
/// throws GeneralException when no number can be read, the number is
/// negative or the value is out of range for unsigned
///
unsigned
parse_unsigned(const char*& s);


/// parse an unsigned number which must span the entire string
unsigned
parse_unsigned_str(const std::string& s);

}
}
