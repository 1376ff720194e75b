/* File: key_store.cpp
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

#include "key_store.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <mutex>
#include <utility>

#include "errors.hpp"
#include "hash_handler.hpp"
#include "logger_utils.hpp"
#include "utils.hpp"

namespace pdfseal::crypto {

std::string KeyStore::Generate(unsigned int bits) {
  if (bits < kRsaMinBits) {
    throw InvalidInputError("[KeyStore::Generate] RSA key size " +
                            std::to_string(bits) + " is less than " +
                            std::to_string(kRsaMinBits));
  }
  if (RAND_status() != 1) {
    throw KeyGenerationError(
      "[KeyStore::Generate] random generator is not seeded");
  }
  PtrEvpPkey private_key = GenerateRsaKey(bits);
  PtrEvpPkey public_key = PublicPart(private_key.get());
  auto key_pair = MakeKeyPair(std::move(private_key), std::move(public_key));
  std::string res = key_pair->public_pem;
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("new {} bit RSA keypair generated, key id {}", bits,
                 VecBytesStringRepresentation(key_pair->key_id));
  }
  Replace(std::move(key_pair));
  return res;
}

std::string KeyStore::Import(const std::string &private_pem,
                             const std::string &public_pem) {
  PtrEvpPkey private_key = PrivateKeyFromPem(private_pem);
  PtrEvpPkey public_key = PublicKeyFromPem(public_pem);
  RequireRsaKey(private_key.get(), "private key");
  RequireRsaKey(public_key.get(), "public key");
  // compares the public components
  if (EVP_PKEY_eq(private_key.get(), public_key.get()) != 1) {
    throw KeyMismatchError(
      "[KeyStore::Import] the private key does not match the public key");
  }
  auto key_pair = MakeKeyPair(std::move(private_key), std::move(public_key));
  std::string res = key_pair->public_pem;
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("keypair imported, key id {}",
                 VecBytesStringRepresentation(key_pair->key_id));
  }
  Replace(std::move(key_pair));
  return res;
}

std::string KeyStore::Export() const {
  auto key_pair = Snapshot();
  if (!key_pair) {
    throw NoKeyLoadedError("[KeyStore::Export] no key loaded");
  }
  return PrivateKeyToPem(key_pair->private_key.get());
}

bool KeyStore::HasKey() const noexcept { return Snapshot() != nullptr; }

std::string KeyStore::PublicKeyPem() const {
  auto key_pair = Snapshot();
  if (!key_pair) {
    throw NoKeyLoadedError("[KeyStore::PublicKeyPem] no key loaded");
  }
  return key_pair->public_pem;
}

std::shared_ptr<const KeyPair> KeyStore::Snapshot() const noexcept {
  const std::shared_lock lock(mutex_);
  return key_pair_;
}

std::shared_ptr<const KeyPair> KeyStore::MakeKeyPair(PtrEvpPkey private_key,
                                                     PtrEvpPkey public_key) {
  auto res = std::make_shared<KeyPair>();
  res->public_pem = PublicKeyToPem(public_key.get());
  HashHandler hash(DigestAlgorithm::kSha256);
  hash.SetData(PublicKeyToDer(public_key.get()));
  res->key_id = hash.GetValue();
  res->private_key = std::move(private_key);
  res->public_key = std::move(public_key);
  return res;
}

void KeyStore::Replace(std::shared_ptr<const KeyPair> key_pair) noexcept {
  const std::unique_lock lock(mutex_);
  key_pair_ = std::move(key_pair);
}

} // namespace pdfseal::crypto
