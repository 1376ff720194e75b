/* File: crypto_defs.hpp
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
#include <optional>
#include <string>

#include "common_defs.hpp"

namespace pdfseal::crypto {

using pdfseal::BytesVector;
using pdfseal::RangesVector;

enum class DigestAlgorithm : uint8_t { kSha256, kSha384, kSha512 };

enum class SignatureAlgorithm : uint8_t { kRsaPss, kRsaPkcs1v15 };

// identifiers stored in the signature record
constexpr const char *const kDigestSha256 = "SHA256";
constexpr const char *const kDigestSha384 = "SHA384";
constexpr const char *const kDigestSha512 = "SHA512";
constexpr const char *const kSigRsaPss = "RSASSA-PSS";
constexpr const char *const kSigRsaPkcs1v15 = "RSASSA-PKCS1-v1_5";

[[nodiscard]] std::string DigestAlgorithmName(DigestAlgorithm algo) noexcept;

[[nodiscard]] std::string
SignatureAlgorithmName(SignatureAlgorithm algo) noexcept;

/**
 * @brief Find a digest algorithm by it's identifier
 * @param name e.g. SHA256
 * @return std::optional<DigestAlgorithm> empty for unknown identifiers
 */
[[nodiscard]] std::optional<DigestAlgorithm>
DigestAlgorithmFromName(const std::string &name) noexcept;

[[nodiscard]] std::optional<SignatureAlgorithm>
SignatureAlgorithmFromName(const std::string &name) noexcept;

} // namespace pdfseal::crypto
