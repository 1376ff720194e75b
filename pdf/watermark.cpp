/* File: watermark.cpp
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

#include "watermark.hpp"

#include <qpdf/QUtil.hh>

#include <algorithm>
#include <exception>
#include <sstream>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_utils.hpp"
#include "utils.hpp"

namespace pdfseal::pdf {

namespace {

// rgb(50,62,168)
std::string BlueColor() {
  std::ostringstream builder;
  builder << DoubleToString10(50.0 / 255) << " "
          << DoubleToString10(62.0 / 255) << " "
          << DoubleToString10(168.0 / 255);
  return builder.str();
}

} // namespace

std::vector<std::string> WatermarkLines(const std::string &signer_name,
                                        const std::string &timestamp,
                                        const std::string &extra,
                                        crypto::DigestAlgorithm digest_algo,
                                        const BytesVector &digest) {
  std::vector<std::string> res;
  res.emplace_back(kWatermarkTitle + signer_name);
  res.push_back(timestamp);
  if (!extra.empty()) {
    std::istringstream extra_stream(extra);
    std::string line;
    while (std::getline(extra_stream, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      res.push_back(line);
    }
  }
  std::string fingerprint = VecBytesStringRepresentation(digest);
  if (fingerprint.size() > kWatermarkDigestChars) {
    fingerprint.resize(kWatermarkDigestChars);
  }
  res.emplace_back(std::string(crypto::DigestAlgorithmName(digest_algo)) +
                   ": " + fingerprint);
  return res;
}

std::optional<WatermarkLayout> LayoutWatermark(
  const std::vector<std::string> &lines, const BBox &page_size,
  const XYReal &crop_offset) noexcept {
  auto logger = logger::InitLog();
  const double max_width = page_size.Width() - 2 * kWatermarkMargin;
  const double max_height = page_size.Height() - 2 * kWatermarkMargin;
  if (lines.empty() || max_width <= 2 * kWatermarkPadding ||
      max_height <= 2 * kWatermarkPadding) {
    if (logger) {
      logger->warn("[LayoutWatermark] page is too small for the watermark");
    }
    return std::nullopt;
  }
  WatermarkLayout res;
  try {
    for (const auto &line : lines) {
      res.lines.push_back(QUtil::utf8_to_win_ansi(line, '?'));
    }
  } catch (const std::exception &ex) {
    if (logger) {
      logger->error("[LayoutWatermark] {}", ex.what());
    }
    return std::nullopt;
  }
  size_t max_chars = 0;
  for (const auto &line : res.lines) {
    max_chars = std::max(max_chars, line.size());
  }
  const double width = static_cast<double>(max_chars) * kWatermarkCharWidth *
                         kWatermarkFontSize +
                       2 * kWatermarkPadding;
  const double height =
    static_cast<double>(res.lines.size()) * kWatermarkLineHeight +
    2 * kWatermarkPadding;
  res.bbox.right_top.x = std::min(width, max_width);
  res.bbox.right_top.y = std::min(height, max_height);
  // anchored at the top-left corner
  res.rect.left_bottom.x = crop_offset.x + kWatermarkMargin;
  res.rect.right_top.y = crop_offset.y + page_size.Height() - kWatermarkMargin;
  res.rect.right_top.x = res.rect.left_bottom.x + res.bbox.Width();
  res.rect.left_bottom.y = res.rect.right_top.y - res.bbox.Height();
  return res;
}

std::string WatermarkContentStream(const WatermarkLayout &layout) {
  const std::string color = BlueColor();
  const double width = layout.bbox.Width();
  const double height = layout.bbox.Height();
  std::ostringstream builder;
  // border
  builder << "q\n"
          << color << " RG\n"
          << "0.5 w\n"
          << "0.25 0.25 " << DoubleToString10(width - 0.5) << " "
          << DoubleToString10(height - 0.5) << " re\nS\nQ\n";
  // text
  builder << "q\nBT\n"
          << color << " rg\n"
          << kWatermarkFontTag << " " << DoubleToString10(kWatermarkFontSize)
          << " Tf\n"
          << DoubleToString10(kWatermarkLineHeight) << " TL\n"
          << DoubleToString10(kWatermarkPadding) << " "
          << DoubleToString10(height - kWatermarkPadding - kWatermarkFontSize)
          << " Td\n";
  bool first = true;
  for (const auto &line : layout.lines) {
    if (!first) {
      builder << "T*\n";
    }
    first = false;
    builder << "<" << QUtil::hex_encode(line) << "> Tj\n";
  }
  builder << "ET\nQ";
  return builder.str();
}

} // namespace pdfseal::pdf
