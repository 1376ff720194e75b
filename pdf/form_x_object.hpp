/* File: form_x_object.hpp
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

/// @brief appearance stream of the signature widget
struct FormXObject {
  ObjRawId id;
  // form space bounding box, [0 0 width height]
  BBox bbox;
  int form_type = 1;
  std::string font_tag = kWatermarkFontTag;
  ObjRawId font_ref;
  std::string content;  // content stream operators

  [[nodiscard]] std::string ToString() const;
};

} // namespace pdfseal::pdf
