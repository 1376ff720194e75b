/* File: verifier.hpp
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

#include "key_store.hpp"
#include "pdf_defs.hpp"
#include "sig_record.hpp"

namespace pdfseal::pdf {

enum class VerifyStatus : uint8_t {
  kNotSigned,
  kRecordCorrupt,
  kValid,
  kSignatureMismatch,
  kKeyMismatch,
  kModifiedAfterSigning
};

constexpr const char *const kMsgNotSigned = "not signed";
constexpr const char *const kMsgRecordCorrupt = "signature record corrupt";
constexpr const char *const kMsgValid = "valid";
constexpr const char *const kMsgSignatureMismatch =
  "signature does not match content";
constexpr const char *const kMsgKeyMismatch = "signed with a different key";
constexpr const char *const kMsgModifiedAfterSigning =
  "document modified after signing";

struct VerificationResult {
  VerifyStatus status = VerifyStatus::kNotSigned;
  bool is_signed = false;  // true only for a valid signature
  std::optional<SignatureRecord> record;
  std::string message = kMsgNotSigned;
};

class Verifier {
 public:
  explicit Verifier(const crypto::KeyStore &key_store) noexcept
    : key_store_(key_store) {}

  Verifier(const Verifier &) = delete;
  Verifier(Verifier &&) = delete;
  Verifier &operator=(const Verifier &) = delete;
  Verifier &operator=(Verifier &&) = delete;
  ~Verifier() = default;

  /**
   * @brief Check the pdfseal signature of a document
   * @param pdf_data
   * @return VerificationResult
   * @throws UnparsableDocumentError
   * @throws NoKeyLoadedError if a record is found but no key is resident
   */
  [[nodiscard]] VerificationResult Verify(const BytesVector &pdf_data) const;

 private:
  const crypto::KeyStore &key_store_;
};

} // namespace pdfseal::pdf
