/* File: rsa_sign_scheme.cpp
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

#include "rsa_sign_scheme.hpp"

#include <openssl/err.h>
#include <openssl/rsa.h>

#include <memory>
#include <stdexcept>

#include "evp_utils.hpp"
#include "hash_handler.hpp"
#include "logger_utils.hpp"

namespace pdfseal::crypto {

std::unique_ptr<ISignScheme> CreateSignScheme(DigestAlgorithm digest,
                                              SignatureAlgorithm signature) {
  switch (signature) {
  case SignatureAlgorithm::kRsaPss:
  case SignatureAlgorithm::kRsaPkcs1v15:
    return std::make_unique<RsaSignScheme>(digest, signature);
  }
  throw std::runtime_error("[CreateSignScheme] unsupported signature scheme");
}

BytesVector RsaSignScheme::Digest(const BytesVector &data,
                                  const RangesVector &ranges) const {
  HashHandler hash(digest_);
  for (const auto &range : ranges) {
    if (range.first > data.size() || range.second > data.size() - range.first) {
      throw std::runtime_error("[RsaSignScheme::Digest] range is out of data");
    }
    hash.SetData(data.data() + range.first, range.second); // NOLINT
  }
  return hash.GetValue();
}

void RsaSignScheme::SetPadding(EVP_PKEY_CTX *pctx) const {
  const std::string func_name = "[RsaSignScheme::SetPadding] ";
  if (signature_ == SignatureAlgorithm::kRsaPss) {
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
      throw std::runtime_error(func_name + "set PSS padding failed " +
                               OpenSslErrors());
    }
    return;
  }
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
    throw std::runtime_error(func_name + "set PKCS1 padding failed " +
                             OpenSslErrors());
  }
}

BytesVector RsaSignScheme::Sign(EVP_PKEY *private_key,
                                const BytesVector &message) const {
  const std::string func_name = "[RsaSignScheme::Sign] ";
  if (private_key == nullptr) {
    throw std::runtime_error(func_name + "empty private key");
  }
  const PtrEvpMdCtx ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error(func_name + "EVP_MD_CTX_new failed");
  }
  EVP_PKEY_CTX *pctx = nullptr; // owned by ctx
  if (EVP_DigestSignInit(ctx.get(), &pctx, GetEvpMd(digest_), nullptr,
                         private_key) <= 0) {
    throw std::runtime_error(func_name + "EVP_DigestSignInit failed " +
                             OpenSslErrors());
  }
  SetPadding(pctx);
  if (EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) <= 0) {
    throw std::runtime_error(func_name + "EVP_DigestSignUpdate failed");
  }
  size_t sig_len = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) <= 0) {
    throw std::runtime_error(func_name + "can't get the signature size");
  }
  BytesVector res(sig_len, 0x00);
  if (EVP_DigestSignFinal(ctx.get(), res.data(), &sig_len) <= 0) {
    throw std::runtime_error(func_name + "EVP_DigestSignFinal failed " +
                             OpenSslErrors());
  }
  res.resize(sig_len);
  return res;
}

bool RsaSignScheme::Verify(EVP_PKEY *public_key, const BytesVector &message,
                           const BytesVector &signature) const {
  const std::string func_name = "[RsaSignScheme::Verify] ";
  if (public_key == nullptr) {
    throw std::runtime_error(func_name + "empty public key");
  }
  const PtrEvpMdCtx ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error(func_name + "EVP_MD_CTX_new failed");
  }
  EVP_PKEY_CTX *pctx = nullptr; // owned by ctx
  if (EVP_DigestVerifyInit(ctx.get(), &pctx, GetEvpMd(digest_), nullptr,
                           public_key) <= 0) {
    throw std::runtime_error(func_name + "EVP_DigestVerifyInit failed " +
                             OpenSslErrors());
  }
  SetPadding(pctx);
  if (EVP_DigestVerifyUpdate(ctx.get(), message.data(), message.size()) <=
      0) {
    throw std::runtime_error(func_name + "EVP_DigestVerifyUpdate failed");
  }
  const int res =
    EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size());
  if (res != 1) {
    // a wrong signature leaves errors in the queue
    const std::string errors = OpenSslErrors();
    auto logger = logger::InitLog();
    if (logger) {
      logger->debug("{}signature check failed {}", func_name, errors);
    }
    return false;
  }
  return true;
}

} // namespace pdfseal::crypto
