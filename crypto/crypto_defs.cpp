/* File: crypto_defs.cpp
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

#include "crypto_defs.hpp"

namespace pdfseal::crypto {

std::string DigestAlgorithmName(DigestAlgorithm algo) noexcept {
  switch (algo) {
  case DigestAlgorithm::kSha256:
    return kDigestSha256;
  case DigestAlgorithm::kSha384:
    return kDigestSha384;
  case DigestAlgorithm::kSha512:
    return kDigestSha512;
  }
  return {};
}

std::string SignatureAlgorithmName(SignatureAlgorithm algo) noexcept {
  switch (algo) {
  case SignatureAlgorithm::kRsaPss:
    return kSigRsaPss;
  case SignatureAlgorithm::kRsaPkcs1v15:
    return kSigRsaPkcs1v15;
  }
  return {};
}

std::optional<DigestAlgorithm>
DigestAlgorithmFromName(const std::string &name) noexcept {
  if (name == kDigestSha256) {
    return DigestAlgorithm::kSha256;
  }
  if (name == kDigestSha384) {
    return DigestAlgorithm::kSha384;
  }
  if (name == kDigestSha512) {
    return DigestAlgorithm::kSha512;
  }
  return std::nullopt;
}

std::optional<SignatureAlgorithm>
SignatureAlgorithmFromName(const std::string &name) noexcept {
  if (name == kSigRsaPss) {
    return SignatureAlgorithm::kRsaPss;
  }
  if (name == kSigRsaPkcs1v15) {
    return SignatureAlgorithm::kRsaPkcs1v15;
  }
  return std::nullopt;
}

} // namespace pdfseal::crypto
