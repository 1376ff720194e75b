/* File: evp_utils.cpp
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

#include "evp_utils.hpp"

#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace pdfseal::crypto {

namespace {

// never ask for a passphrase on a terminal
int NoPassphrase(char * /*buf*/, int /*size*/, int /*rwflag*/,
                 void * /*userdata*/) {
  return 0;
}

PtrBio BioFromString(const std::string &str) {
  if (str.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw MalformedKeyError("[BioFromString] PEM is too big");
  }
  PtrBio bio(BIO_new_mem_buf(str.data(), static_cast<int>(str.size())));
  if (!bio) {
    throw std::runtime_error("[BioFromString] BIO_new_mem_buf failed");
  }
  return bio;
}

std::string BioToString(BIO *bio) {
  BUF_MEM *p_mem = nullptr;
  BIO_get_mem_ptr(bio, &p_mem);
  if (p_mem == nullptr || p_mem->data == nullptr) {
    throw std::runtime_error("[BioToString] empty BIO");
  }
  return {p_mem->data, p_mem->length};
}

} // namespace

std::string OpenSslErrors() noexcept {
  std::string res;
  unsigned long err = 0; // NOLINT (google-runtime-int)
  while ((err = ERR_get_error()) != 0) {
    std::array<char, 256> buf{};
    ERR_error_string_n(err, buf.data(), buf.size());
    if (!res.empty()) {
      res += "; ";
    }
    res += buf.data();
  }
  return res;
}

PtrEvpPkey GenerateRsaKey(unsigned int bits) {
  const std::string func_name = "[GenerateRsaKey] ";
  if (bits > static_cast<unsigned int>(std::numeric_limits<int>::max())) {
    throw KeyGenerationError(func_name + "invalid key size");
  }
  const PtrEvpPkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!ctx) {
    throw KeyGenerationError(func_name + "EVP_PKEY_CTX_new_id failed " +
                             OpenSslErrors());
  }
  EVP_PKEY *p_key = nullptr;
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) <=
        0 ||
      EVP_PKEY_keygen(ctx.get(), &p_key) <= 0) {
    throw KeyGenerationError(func_name + "RSA key generation failed " +
                             OpenSslErrors());
  }
  return PtrEvpPkey(p_key);
}

PtrEvpPkey PrivateKeyFromPem(const std::string &pem) {
  if (pem.empty()) {
    throw MalformedKeyError("[PrivateKeyFromPem] empty private key");
  }
  const PtrBio bio = BioFromString(pem);
  PtrEvpPkey res(
    PEM_read_bio_PrivateKey(bio.get(), nullptr, NoPassphrase, nullptr));
  if (!res) {
    throw MalformedKeyError("[PrivateKeyFromPem] can't parse private key " +
                            OpenSslErrors());
  }
  return res;
}

PtrEvpPkey PublicKeyFromPem(const std::string &pem) {
  if (pem.empty()) {
    throw MalformedKeyError("[PublicKeyFromPem] empty public key");
  }
  const PtrBio bio = BioFromString(pem);
  PtrEvpPkey res(
    PEM_read_bio_PUBKEY(bio.get(), nullptr, NoPassphrase, nullptr));
  if (!res) {
    throw MalformedKeyError("[PublicKeyFromPem] can't parse public key " +
                            OpenSslErrors());
  }
  return res;
}

std::string PrivateKeyToPem(const EVP_PKEY *pkey) {
  const std::string func_name = "[PrivateKeyToPem] ";
  if (pkey == nullptr) {
    throw std::runtime_error(func_name + "empty key");
  }
  const PtrBio bio(BIO_new(BIO_s_mem()));
  if (!bio) {
    throw std::runtime_error(func_name + "BIO_new failed");
  }
  // PKCS#8 without encryption
  if (PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr,
                               nullptr) != 1) {
    throw std::runtime_error(func_name + "PEM_write_bio_PrivateKey failed " +
                             OpenSslErrors());
  }
  return BioToString(bio.get());
}

std::string PublicKeyToPem(const EVP_PKEY *pkey) {
  const std::string func_name = "[PublicKeyToPem] ";
  if (pkey == nullptr) {
    throw std::runtime_error(func_name + "empty key");
  }
  const PtrBio bio(BIO_new(BIO_s_mem()));
  if (!bio) {
    throw std::runtime_error(func_name + "BIO_new failed");
  }
  if (PEM_write_bio_PUBKEY(bio.get(), pkey) != 1) {
    throw std::runtime_error(func_name + "PEM_write_bio_PUBKEY failed " +
                             OpenSslErrors());
  }
  return BioToString(bio.get());
}

BytesVector PublicKeyToDer(const EVP_PKEY *pkey) {
  const std::string func_name = "[PublicKeyToDer] ";
  if (pkey == nullptr) {
    throw std::runtime_error(func_name + "empty key");
  }
  unsigned char *p_der = nullptr;
  const int der_size = i2d_PUBKEY(pkey, &p_der);
  if (der_size <= 0 || p_der == nullptr) {
    throw std::runtime_error(func_name + "i2d_PUBKEY failed " +
                             OpenSslErrors());
  }
  BytesVector res(p_der, p_der + der_size); // NOLINT
  OPENSSL_free(p_der);
  return res;
}

PtrEvpPkey PublicPart(const EVP_PKEY *pkey) {
  const BytesVector der = PublicKeyToDer(pkey);
  const unsigned char *p_der = der.data();
  PtrEvpPkey res(d2i_PUBKEY(nullptr, &p_der, static_cast<long>(der.size())));
  if (!res) {
    throw std::runtime_error("[PublicPart] d2i_PUBKEY failed " +
                             OpenSslErrors());
  }
  return res;
}

void RequireRsaKey(const EVP_PKEY *pkey, const std::string &what) {
  if (pkey == nullptr) {
    throw MalformedKeyError(what + " is empty");
  }
  if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA) {
    throw MalformedKeyError(what + " is not an RSA key");
  }
  const int bits = EVP_PKEY_get_bits(pkey);
  if (bits < static_cast<int>(kRsaMinBits)) {
    throw MalformedKeyError(what + " is too short: " + std::to_string(bits) +
                            " bits, at least " + std::to_string(kRsaMinBits) +
                            " expected");
  }
}

} // namespace pdfseal::crypto
