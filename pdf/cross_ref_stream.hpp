/* File: cross_ref_stream.hpp
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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/**
 * @brief Cross-reference stream closing an incremental update
 * @details ISO32000 [7.5.8] Cross-Reference Streams
 */
struct CrossRefStream {
  ObjRawId id;
  int size_val = 0;  // highest object number + 1
  /* /Index [first count ...] sorted by the first field */
  std::vector<std::pair<int, int>> index_vec;
  // /W [type offset generation]
  static constexpr int kWType = 1;
  static constexpr int kWOffset = 4;
  static constexpr int kWGen = 2;
  std::string prev_val;
  std::string root_id;
  std::optional<std::string> info_id;
  std::optional<std::string> id_val;
  std::optional<std::string> encrypt;
  std::vector<XRefEntry> entries;  // must be sorted

  [[nodiscard]] static constexpr int EntrySize() noexcept {
    return kWType + kWOffset + kWGen;
  }

  /**
   * @brief Return data ready for copying to file
   * @return BytesVector
   * @throws runtime_error if an offset does not fit the /W field
   */
  [[nodiscard]] BytesVector ToRawData() const;
};

} // namespace pdfseal::pdf
