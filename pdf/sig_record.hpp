/* File: sig_record.hpp
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

#include <qpdf/QPDFObjectHandle.hh>

#include <cstdint>
#include <string>

#include "crypto_defs.hpp"
#include "pdf_structs.hpp"
#include "signed_attributes.hpp"

namespace pdfseal::pdf {

/**
 * @brief The signing result embedded in the document
 * @details A /Sig dictionary with /Filter /PdfSeal, written in the
 * incremental update that follows the canonical range [0,canonical_length).
 */
struct SignatureRecord {
  ObjRawId id;
  std::string signer_name;  // UTF-8
  std::string timestamp;    // YYYY-MM-DDThh:mm:ssZ
  std::string extra;        // UTF-8, may be empty
  crypto::DigestAlgorithm digest_algo = crypto::DigestAlgorithm::kSha256;
  crypto::SignatureAlgorithm sig_algo = crypto::SignatureAlgorithm::kRsaPss;
  BytesVector content_digest;
  BytesVector key_id;
  uint64_t canonical_length = 0;
  BytesVector signature;

  /// @brief indirect object ready for writing
  [[nodiscard]] std::string ToString() const;

  /// @brief the attributes covered by the signature
  [[nodiscard]] crypto::SignedAttributes ToSignedAttributes() const;

  /**
   * @brief Parse the record from a /Sig dictionary
   * @param obj signature value dictionary
   * @return SignatureRecord
   * @throws runtime_error if any field is missing or malformed
   */
  static SignatureRecord FromPdfObject(QPDFObjectHandle &obj);
};

} // namespace pdfseal::pdf
