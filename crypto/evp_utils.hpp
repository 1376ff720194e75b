/* File: evp_utils.hpp
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

#include <openssl/bio.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

#include "crypto_defs.hpp"

namespace pdfseal::crypto {

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY *pkey) const noexcept { EVP_PKEY_free(pkey); }
};

struct EvpPkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX *ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

struct BioDeleter {
  void operator()(BIO *bio) const noexcept { BIO_free_all(bio); }
};

using PtrEvpPkey = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using PtrEvpPkeyCtx = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using PtrEvpMdCtx = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using PtrBio = std::unique_ptr<BIO, BioDeleter>;

/**
 * @brief Pop all errors from the OpenSSL error queue
 * @return std::string joined error descriptions
 */
std::string OpenSslErrors() noexcept;

/**
 * @brief Generate a new RSA key
 * @param bits modulus size
 * @return PtrEvpPkey
 * @throws KeyGenerationError
 */
PtrEvpPkey GenerateRsaKey(unsigned int bits);

/**
 * @brief Parse a private key (PKCS#8 or traditional RSA PEM)
 * @param pem
 * @return PtrEvpPkey
 * @throws MalformedKeyError
 */
PtrEvpPkey PrivateKeyFromPem(const std::string &pem);

/**
 * @brief Parse a SubjectPublicKeyInfo PEM
 * @param pem
 * @return PtrEvpPkey
 * @throws MalformedKeyError
 */
PtrEvpPkey PublicKeyFromPem(const std::string &pem);

/// @throws std::runtime_error
std::string PrivateKeyToPem(const EVP_PKEY *pkey);

/// @throws std::runtime_error
std::string PublicKeyToPem(const EVP_PKEY *pkey);

/// @brief DER encoded SubjectPublicKeyInfo
/// @throws std::runtime_error
BytesVector PublicKeyToDer(const EVP_PKEY *pkey);

/**
 * @brief Extract the public half of a key
 * @param pkey private or public key
 * @return PtrEvpPkey public key only
 * @throws std::runtime_error
 */
PtrEvpPkey PublicPart(const EVP_PKEY *pkey);

/**
 * @brief Check that key is an RSA key with at least kRsaMinBits modulus
 * @throws MalformedKeyError
 */
void RequireRsaKey(const EVP_PKEY *pkey, const std::string &what);

} // namespace pdfseal::crypto
