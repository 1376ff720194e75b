/* File: pdf_structs.hpp
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

#include "pdf_defs.hpp"
#include <cstdint>
#include <qpdf/QPDFObjectHandle.hh>
#include <sstream>
#include <string>
#include <utility>

namespace pdfseal::pdf {

struct ObjRawId {
  int id = 0;
  int gen = 0;

  [[nodiscard]] std::string ToString() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " obj";
    return builder.str();
  }

  [[nodiscard]] std::string ToStringRef() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " R";
    return builder.str();
  }

  ObjRawId &operator++() noexcept {
    ++id;
    return *this;
  }

  bool operator==(const ObjRawId &other) const noexcept {
    return id == other.id && gen == other.gen;
  }

  static ObjRawId CopyIdFromExisting(const QPDFObjectHandle &other) noexcept;
};

struct XYReal {
  double x = 0;
  double y = 0;

  [[nodiscard]] std::string ToString() const;
};

struct BBox {
  XYReal left_bottom;
  XYReal right_top;

  [[nodiscard]] double Width() const noexcept {
    return right_top.x - left_bottom.x;
  }
  [[nodiscard]] double Height() const noexcept {
    return right_top.y - left_bottom.y;
  }

  [[nodiscard]] std::string ToString() const;
};

struct XRefEntry {
  ObjRawId id;
  size_t offset = 0;
  uint32_t gen = 0;

  [[nodiscard]] std::string ToString() const;
};

} // namespace pdfseal::pdf
