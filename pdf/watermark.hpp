/* File: watermark.hpp
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
#include <vector>

#include "crypto_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

struct WatermarkLayout {
  std::vector<std::string> lines;  // WinAnsi encoded
  BBox bbox;                       // form space
  BBox rect;                       // page space
};

/**
 * @brief Text lines of the visible signature
 * @param signer_name
 * @param timestamp ISO-8601
 * @param extra may contain line breaks, omitted when empty
 * @param digest_algo
 * @param digest content digest, the first bytes are shown
 * @return std::vector<std::string> UTF-8 lines
 */
std::vector<std::string> WatermarkLines(const std::string &signer_name,
                                        const std::string &timestamp,
                                        const std::string &extra,
                                        crypto::DigestAlgorithm digest_algo,
                                        const BytesVector &digest);

/**
 * @brief Place the text block in the top-left corner of the visible box
 * @param lines UTF-8 lines
 * @param page_size visible page size [0 0 width height]
 * @param crop_offset lower-left corner of the crop box
 * @return std::optional<WatermarkLayout> empty if the page is too small
 */
std::optional<WatermarkLayout> LayoutWatermark(
  const std::vector<std::string> &lines, const BBox &page_size,
  const XYReal &crop_offset) noexcept;

/// @brief content stream drawing the border and the text
std::string WatermarkContentStream(const WatermarkLayout &layout);

} // namespace pdfseal::pdf
