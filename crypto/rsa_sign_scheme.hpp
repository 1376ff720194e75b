/* File: rsa_sign_scheme.hpp
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

#include "i_sign_scheme.hpp"

namespace pdfseal::crypto {

/// @brief RSA signatures, PSS or PKCS#1 v1.5 padding
class RsaSignScheme : public ISignScheme {
 public:
  RsaSignScheme(DigestAlgorithm digest, SignatureAlgorithm signature) noexcept
    : digest_(digest), signature_(signature) {}

  [[nodiscard]] DigestAlgorithm GetDigestAlgorithm() const noexcept override {
    return digest_;
  }

  [[nodiscard]] SignatureAlgorithm
  GetSignatureAlgorithm() const noexcept override {
    return signature_;
  }

  [[nodiscard]] BytesVector Digest(const BytesVector &data,
                                   const RangesVector &ranges) const override;

  [[nodiscard]] BytesVector Sign(EVP_PKEY *private_key,
                                 const BytesVector &message) const override;

  [[nodiscard]] bool Verify(EVP_PKEY *public_key, const BytesVector &message,
                            const BytesVector &signature) const override;

 private:
  /// set the padding parameters for a sign/verify context
  void SetPadding(EVP_PKEY_CTX *pctx) const;

  DigestAlgorithm digest_;
  SignatureAlgorithm signature_;
};

} // namespace pdfseal::crypto
