/* File: engine.hpp
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

#include <boost/json.hpp>

#include <optional>
#include <string>

#include "common_defs.hpp"
#include "errors.hpp"
#include "key_store.hpp"
#include "signer.hpp"
#include "verifier.hpp"

namespace pdfseal::bridge {

namespace json = boost::json;

struct SignatureInfo {
  std::string signer_name;
  std::string timestamp;
  std::string extra;
  std::string signature;  // hex

  [[nodiscard]] json::object ToJson() const;
};

struct SignPdfRequest {
  BytesVector pdf_data;
  std::string name;
  std::string extra;
  pdf::SignOptions options;
};

struct SignPdfResult {
  BytesVector signed_pdf_data;
  SignatureInfo signature_info;

  /// @brief without the document itself
  [[nodiscard]] json::object ToJson() const;
};

struct VerifyPdfResult {
  pdf::VerifyStatus status = pdf::VerifyStatus::kNotSigned;
  bool is_signed = false;
  std::optional<SignatureInfo> signature_info;
  std::string message;

  [[nodiscard]] json::object ToJson() const;
};

/// @brief {"error": code, "message": text}
[[nodiscard]] json::object ErrorToJson(const PdfSealError &err);

/// @brief stable identifier of a verification status, e.g. "valid"
[[nodiscard]] const char *VerifyStatusName(pdf::VerifyStatus status) noexcept;

/**
 * @brief The signing engine facade
 * @details Owns one resident keypair shared by the signer and the verifier.
 * Errors are reported with PdfSealError subclasses carrying a stable code.
 */
class LIB_API Engine {
 public:
  Engine() = default;
  Engine(const Engine &) = delete;
  Engine(Engine &&) = delete;
  Engine &operator=(const Engine &) = delete;
  Engine &operator=(Engine &&) = delete;
  ~Engine() = default;

  /**
   * @brief Generate a new resident keypair
   * @return std::string public key PEM
   * @throws KeyGenerationError
   */
  std::string GenerateKeypair();

  /**
   * @brief Replace the resident keypair with an imported one
   * @return std::string public key PEM
   * @throws MalformedKeyError
   * @throws KeyMismatchError
   */
  std::string ImportKey(const std::string &private_pem,
                        const std::string &public_pem);

  /// @throws NoKeyLoadedError
  [[nodiscard]] std::string ExportKey() const;

  [[nodiscard]] bool HasKey() const noexcept;

  /// @throws NoKeyLoadedError
  [[nodiscard]] std::string GetPublicKey() const;

  /**
   * @brief Sign a document
   * @param request
   * @return SignPdfResult
   * @throws NoKeyLoadedError,InvalidInputError,UnparsableDocumentError,
   * CorruptSignatureLocationError
   */
  [[nodiscard]] SignPdfResult SignPdf(const SignPdfRequest &request) const;

  /**
   * @brief Verify a document
   * @param pdf_data
   * @return VerifyPdfResult
   * @throws UnparsableDocumentError,NoKeyLoadedError
   */
  [[nodiscard]] VerifyPdfResult VerifyPdf(const BytesVector &pdf_data) const;

  /// @brief Set(Mock) the signing time source
  void SetClock(pdf::Signer::Clock clock) { signer_.SetClock(std::move(clock)); }

 private:
  crypto::KeyStore key_store_;
  pdf::Signer signer_{key_store_};
  pdf::Verifier verifier_{key_store_};
};

} // namespace pdfseal::bridge
