/* File: signed_attributes.hpp
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

#include <cstdint>
#include <string>

#include "crypto_defs.hpp"

namespace pdfseal::crypto {

constexpr const char *const kSignedAttrsFormat = "pdfseal-v1";

/**
 * @brief The set of values covered by a signature
 * @details Encode() returns a deterministic byte sequence, each attribute is
 * written as "id:length:value\n" in a fixed order. The content digest binds
 * the document bytes, the other attributes bind the fields of the record.
 */
struct SignedAttributes {
  std::string format = kSignedAttrsFormat;
  DigestAlgorithm digest_algo = DigestAlgorithm::kSha256;
  SignatureAlgorithm sig_algo = SignatureAlgorithm::kRsaPss;
  BytesVector content_digest;
  uint64_t canonical_length = 0;
  std::string signer_name;
  std::string timestamp;
  std::string extra;
  BytesVector key_id;

  [[nodiscard]] BytesVector Encode() const;
};

} // namespace pdfseal::crypto
