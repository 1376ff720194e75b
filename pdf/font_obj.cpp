/* File: font_obj.cpp
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

#include "font_obj.hpp"

#include <sstream>

namespace pdfseal::pdf {

std::string FontObj::ToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << kTagFont << "\n"
          << kTagSubType << " " << kTagType1 << "\n"
          << kTagBaseFont << " " << base_font << "\n"
          << kTagEncoding << " " << encoding << "\n"
          << kDictEnd << "\n"
          << kObjEnd;
  return builder.str();
}

} // namespace pdfseal::pdf
