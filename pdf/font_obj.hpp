/* File: font_obj.hpp
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

#pragma once

#include <string>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/// @brief one of the standard 14 Type1 fonts, not embedded
struct FontObj {
  ObjRawId id;
  std::string base_font = kWatermarkBaseFont;
  std::string encoding = kWinAnsiEncoding;

  [[nodiscard]] std::string ToString() const;
};

} // namespace pdfseal::pdf
