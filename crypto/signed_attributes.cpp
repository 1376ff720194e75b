/* File: signed_attributes.cpp
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

#include "signed_attributes.hpp"

#include <iterator>
#include <string>

namespace pdfseal::crypto {

namespace {

template <typename TVAL>
void AppendAttribute(BytesVector &res, const std::string &attr_id,
                     const TVAL &value) {
  const std::string prefix =
    attr_id + ":" + std::to_string(value.size()) + ":";
  std::copy(prefix.cbegin(), prefix.cend(), std::back_inserter(res));
  std::copy(value.cbegin(), value.cend(), std::back_inserter(res));
  res.push_back('\n');
}

} // namespace

BytesVector SignedAttributes::Encode() const {
  BytesVector res;
  AppendAttribute(res, "format", format);
  AppendAttribute(res, "digest-algorithm", DigestAlgorithmName(digest_algo));
  AppendAttribute(res, "signature-algorithm",
                  SignatureAlgorithmName(sig_algo));
  AppendAttribute(res, "content-digest", content_digest);
  AppendAttribute(res, "canonical-length", std::to_string(canonical_length));
  AppendAttribute(res, "signer-name", signer_name);
  AppendAttribute(res, "signing-time", timestamp);
  AppendAttribute(res, "extra", extra);
  AppendAttribute(res, "key-id", key_id);
  return res;
}

} // namespace pdfseal::crypto
