/* File: byte_spans.hpp
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

#include <cstddef>
#include <deque>

#include "pdf_defs.hpp"

namespace pdfseal::pdf {

/**
 * @brief An output document assembled from a borrowed prefix and owned chunks
 * @details The prefix is not copied until Flatten, so the buffer it points to
 * must outlive the object.
 */
class ByteSpans {
 public:
  ByteSpans(const unsigned char *base, size_t base_size) noexcept
    : base_(base), base_size_(base_size), size_(base_size) {}

  void Append(BytesVector chunk);

  [[nodiscard]] size_t Size() const noexcept { return size_; }

  /// @return the whole document in one buffer
  [[nodiscard]] BytesVector Flatten() const;

 private:
  const unsigned char *base_;
  size_t base_size_;
  size_t size_;
  std::deque<BytesVector> chunks_;
};

} // namespace pdfseal::pdf
