/* File: key_store.hpp
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

#include <memory>
#include <shared_mutex>
#include <string>

#include "common_defs.hpp"
#include "evp_utils.hpp"

namespace pdfseal::crypto {

/**
 * @brief The resident RSA keypair
 * @details Immutable once created, shared between sign/verify calls.
 */
struct KeyPair {
  PtrEvpPkey private_key;
  PtrEvpPkey public_key;
  std::string public_pem;
  BytesVector key_id; // SHA-256 of the DER public key
};

/**
 * @brief Owns the signing keypair of one engine instance
 * @details Generate and Import replace the resident keypair, readers take a
 * snapshot that stays valid even if the keypair is replaced meanwhile.
 */
class KeyStore {
 public:
  KeyStore() = default;
  KeyStore(const KeyStore &) = delete;
  KeyStore(KeyStore &&) = delete;
  KeyStore &operator=(const KeyStore &) = delete;
  KeyStore &operator=(KeyStore &&) = delete;
  ~KeyStore() = default;

  /**
   * @brief Generate a fresh RSA keypair and make it resident
   * @param bits modulus size, >= 2048
   * @return std::string public key PEM
   * @throws KeyGenerationError if the random source is unavailable
   * @throws InvalidInputError if bits is too small
   */
  std::string Generate(unsigned int bits = kRsaDefaultBits);

  /**
   * @brief Import a keypair
   * @param private_pem PKCS#8 (or traditional RSA) PEM
   * @param public_pem SubjectPublicKeyInfo PEM
   * @return std::string public key PEM
   * @throws MalformedKeyError on parse failure, non-RSA or short keys
   * @throws KeyMismatchError if the keys do not correspond
   */
  std::string Import(const std::string &private_pem,
                     const std::string &public_pem);

  /**
   * @brief Export the private key
   * @return std::string PKCS#8 PEM
   * @throws NoKeyLoadedError
   */
  [[nodiscard]] std::string Export() const;

  [[nodiscard]] bool HasKey() const noexcept;

  /// @throws NoKeyLoadedError
  [[nodiscard]] std::string PublicKeyPem() const;

  /// @return the resident keypair or nullptr
  [[nodiscard]] std::shared_ptr<const KeyPair> Snapshot() const noexcept;

 private:
  static std::shared_ptr<const KeyPair> MakeKeyPair(PtrEvpPkey private_key,
                                                    PtrEvpPkey public_key);
  void Replace(std::shared_ptr<const KeyPair> key_pair) noexcept;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const KeyPair> key_pair_;
};

} // namespace pdfseal::crypto
