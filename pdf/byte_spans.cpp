/* File: byte_spans.cpp
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

#include "byte_spans.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace pdfseal::pdf {

void ByteSpans::Append(BytesVector chunk) {
  size_ += chunk.size();
  chunks_.push_back(std::move(chunk));
}

BytesVector ByteSpans::Flatten() const {
  BytesVector res;
  res.reserve(size_);
  if (base_ != nullptr) {
    std::copy(base_, base_ + base_size_, std::back_inserter(res));
  }
  for (const auto &chunk : chunks_) {
    std::copy(chunk.cbegin(), chunk.cend(), std::back_inserter(res));
  }
  return res;
}

} // namespace pdfseal::pdf
