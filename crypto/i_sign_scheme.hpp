/* File: i_sign_scheme.hpp
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

#include <openssl/evp.h>

#include <memory>

#include "crypto_defs.hpp"

namespace pdfseal::crypto {

/**
 * @brief A digest + signature algorithm pair
 * @details Records keep the identifiers of the scheme used for signing, the
 * verifier creates the same scheme from these identifiers.
 */
class ISignScheme {
 public:
  ISignScheme() = default;
  ISignScheme(const ISignScheme &) = delete;
  ISignScheme(ISignScheme &&) = delete;
  ISignScheme &operator=(const ISignScheme &) = delete;
  ISignScheme &operator=(ISignScheme &&) = delete;
  virtual ~ISignScheme() = default;

  [[nodiscard]] virtual DigestAlgorithm GetDigestAlgorithm() const noexcept = 0;
  [[nodiscard]] virtual SignatureAlgorithm
  GetSignatureAlgorithm() const noexcept = 0;

  /**
   * @brief Hash the given ranges of data
   * @param data source buffer
   * @param ranges {offset,length} pairs, hashed in order
   * @return BytesVector digest value
   * @throws runtime_error if a range is out of the buffer
   */
  [[nodiscard]] virtual BytesVector Digest(const BytesVector &data,
                                           const RangesVector &ranges) const = 0;

  /**
   * @brief Sign a message
   * @param private_key
   * @param message
   * @return BytesVector raw signature
   * @throws runtime_error
   */
  [[nodiscard]] virtual BytesVector Sign(EVP_PKEY *private_key,
                                         const BytesVector &message) const = 0;

  /**
   * @brief Check a signature
   * @return true if the signature matches the message and the key
   * @throws runtime_error if the check can't be performed
   */
  [[nodiscard]] virtual bool Verify(EVP_PKEY *public_key,
                                    const BytesVector &message,
                                    const BytesVector &signature) const = 0;
};

/**
 * @brief Create a scheme for the algorithm pair
 * @param digest
 * @param signature
 * @return std::unique_ptr<ISignScheme>
 */
std::unique_ptr<ISignScheme> CreateSignScheme(DigestAlgorithm digest,
                                              SignatureAlgorithm signature);

} // namespace pdfseal::crypto
