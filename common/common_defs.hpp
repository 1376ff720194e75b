/* File: common_defs.hpp
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
#include <utility>
#include <vector>

constexpr uint64_t kMaxPdfFileSize = 2147483648; //  2GB

#define LIB_API __attribute__((visibility("default")))
#define LIB_LOCAL __attribute__((visibility("hidden")))

namespace pdfseal {

using BytesVector = std::vector<unsigned char>;
// pairs {offset,length}
using RangesVector = std::vector<std::pair<uint64_t, uint64_t>>;

constexpr unsigned int kRsaMinBits = 2048;
constexpr unsigned int kRsaDefaultBits = 2048;

} // namespace pdfseal

// string error codes for frontends
const char *const kErrKeyGeneration = "KEY_GENERATION_FAILED";
const char *const kErrMalformedKey = "MALFORMED_KEY";
const char *const kErrKeyMismatch = "KEY_MISMATCH";
const char *const kErrNoKeyLoaded = "NO_KEY_LOADED";
const char *const kErrInvalidInput = "INVALID_INPUT";
const char *const kErrUnparsableDocument = "UNPARSABLE_DOCUMENT";
const char *const kErrCorruptSigLocation = "CORRUPT_SIGNATURE_LOCATION";
