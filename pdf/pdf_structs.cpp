/* File: pdf_structs.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "pdf_structs.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include "pdf_utils.hpp"

namespace pdfseal::pdf {

std::string XYReal::ToString() const {
  return DoubleToString10(x) + " " + DoubleToString10(y);
}

std::string BBox::ToString() const {
  return "[ " + left_bottom.ToString() + " " + right_top.ToString() + " ]";
}

ObjRawId ObjRawId::CopyIdFromExisting(const QPDFObjectHandle &other) noexcept {
  return {other.getObjectID(), other.getGeneration()};
}

std::string XRefEntry::ToString() const {
  // fixed 20 byte entry: "nnnnnnnnnn ggggg n \n"
  std::ostringstream builder;
  builder << std::setw(10) << std::setfill('0') << offset << ' '
          << std::setw(5) << std::setfill('0') << gen << " n \n";
  return builder.str();
}

} // namespace pdfseal::pdf
