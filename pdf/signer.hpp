/* File: signer.hpp
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

#include <chrono>
#include <functional>
#include <string>

#include "crypto_defs.hpp"
#include "key_store.hpp"
#include "pdf_defs.hpp"
#include "sig_record.hpp"

namespace pdfseal::pdf {

struct SignOptions {
  crypto::DigestAlgorithm digest = crypto::DigestAlgorithm::kSha256;
  crypto::SignatureAlgorithm signature = crypto::SignatureAlgorithm::kRsaPss;
  bool watermark = true;
};

struct SignResult {
  BytesVector signed_data;
  SignatureRecord record;
};

class Signer {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit Signer(const crypto::KeyStore &key_store) noexcept
    : key_store_(key_store) {}

  Signer(const Signer &) = delete;
  Signer(Signer &&) = delete;
  Signer &operator=(const Signer &) = delete;
  Signer &operator=(Signer &&) = delete;
  ~Signer() = default;

  /**
   * @brief Sign a document, replacing the existing pdfseal signature
   * @param pdf_data the document, left untouched
   * @param signer_name trimmed, must not be empty
   * @param extra free text, may be empty
   * @param options algorithms and watermark
   * @return SignResult the new document and the embedded record
   * @throws NoKeyLoadedError
   * @throws InvalidInputError empty name, encrypted document or algorithms
   * the key can't be used with
   * @throws UnparsableDocumentError
   * @throws CorruptSignatureLocationError
   */
  [[nodiscard]] SignResult Sign(const BytesVector &pdf_data,
                                const std::string &signer_name,
                                const std::string &extra,
                                const SignOptions &options = {}) const;

  /// @brief Set(Mock) the source of the signing time
  void SetClock(Clock clock) { clock_ = std::move(clock); }

 private:
  const crypto::KeyStore &key_store_;
  Clock clock_ = std::chrono::system_clock::now;
};

} // namespace pdfseal::pdf
