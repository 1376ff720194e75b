/* File: cross_ref_stream.cpp
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

#include "cross_ref_stream.hpp"

#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "pdf_defs.hpp"

namespace pdfseal::pdf {

namespace {

// big-endian, as required by ISO32000 [7.5.8.3]
void PushBigEndian(BytesVector &dest, uint64_t val, int width) {
  for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
    dest.push_back(static_cast<unsigned char>((val >> shift) & 0xFF));
  }
}

} // namespace

BytesVector CrossRefStream::ToRawData() const {
  BytesVector stream_data;
  stream_data.reserve(entries.size() * EntrySize());
  for (const auto &entry : entries) {
    if (entry.offset > std::numeric_limits<uint32_t>::max()) {
      throw std::runtime_error(
        "[CrossRefStream::ToRawData] entry offset does not fit 32 bits");
    }
    PushBigEndian(stream_data, 1, kWType);
    PushBigEndian(stream_data, entry.offset, kWOffset);
    PushBigEndian(stream_data, entry.gen, kWGen);
  }

  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << kTagXref << "\n"
          << kTagSize << " " << size_val << "\n";
  if (!index_vec.empty()) {
    builder << kTagIndex << " [ ";
    for (const auto &ind_pair : index_vec) {
      builder << ind_pair.first << " " << ind_pair.second << " ";
    }
    builder << "]\n";
  }
  builder << kTagW << " [ " << kWType << " " << kWOffset << " " << kWGen
          << " ]\n";
  builder << kTagPrev << " " << prev_val << "\n";
  builder << kTagRoot << " " << root_id << "\n";
  builder << kTagLength << " " << stream_data.size() << "\n";
  if (info_id) {
    builder << kTagInfo << " " << info_id.value() << "\n";
  }
  if (id_val) {
    builder << kTagID << " " << id_val.value() << "\n";
  }
  if (encrypt) {
    builder << kTagEncrypt << " " << encrypt.value() << "\n";
  }
  builder << kDictEnd << "\n" << kStreamStart;

  const std::string head = builder.str();
  BytesVector res(head.cbegin(), head.cend());
  std::copy(stream_data.cbegin(), stream_data.cend(), std::back_inserter(res));
  std::string obj_end = "\n";
  obj_end += kStreamEnd;
  obj_end += kObjEnd;
  std::copy(obj_end.cbegin(), obj_end.cend(), std::back_inserter(res));
  return res;
}

} // namespace pdfseal::pdf
