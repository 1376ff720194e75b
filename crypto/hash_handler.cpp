/* File: hash_handler.cpp
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

#include "hash_handler.hpp"

#include <stdexcept>

#include "evp_utils.hpp"

namespace pdfseal::crypto {

const EVP_MD *GetEvpMd(DigestAlgorithm algo) noexcept {
  switch (algo) {
  case DigestAlgorithm::kSha256:
    return EVP_sha256();
  case DigestAlgorithm::kSha384:
    return EVP_sha384();
  case DigestAlgorithm::kSha512:
    return EVP_sha512();
  }
  return nullptr;
}

HashHandler::HashHandler(DigestAlgorithm algo)
  : algo_(algo), ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("[HashHandler] EVP_MD_CTX_new failed");
  }
  const EVP_MD *p_md = GetEvpMd(algo);
  if (p_md == nullptr || EVP_DigestInit_ex(ctx_, p_md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("[HashHandler] EVP_DigestInit_ex failed " +
                             OpenSslErrors());
  }
}

void HashHandler::SetData(const BytesVector &data) {
  SetData(data.data(), data.size());
}

void HashHandler::SetData(const unsigned char *data, size_t size) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("[HashHandler::SetData] moved-from handler");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("[HashHandler::SetData] EVP_DigestUpdate failed");
  }
}

BytesVector HashHandler::GetValue() const {
  if (ctx_ == nullptr) {
    throw std::runtime_error("[HashHandler::GetValue] moved-from handler");
  }
  // finalize a copy to keep this context usable
  const PtrEvpMdCtx tmp_ctx(EVP_MD_CTX_new());
  if (!tmp_ctx || EVP_MD_CTX_copy_ex(tmp_ctx.get(), ctx_) != 1) {
    throw std::runtime_error("[HashHandler::GetValue] copy context failed");
  }
  BytesVector res(EVP_MAX_MD_SIZE, 0x00);
  unsigned int hash_size = 0;
  if (EVP_DigestFinal_ex(tmp_ctx.get(), res.data(), &hash_size) != 1) {
    throw std::runtime_error("[HashHandler::GetValue] EVP_DigestFinal_ex "
                             "failed");
  }
  if (hash_size == 0) {
    throw std::runtime_error("hash size == 0");
  }
  res.resize(hash_size);
  return res;
}

HashHandler::~HashHandler() {
  if (ctx_ != nullptr) {
    EVP_MD_CTX_free(ctx_);
  }
}

HashHandler::HashHandler(HashHandler &&other) noexcept
  : algo_(other.algo_), ctx_(other.ctx_) {
  other.ctx_ = nullptr;
}

HashHandler &HashHandler::operator=(HashHandler &&other) noexcept {
  if (this == &other) {
    return *this;
  }
  if (ctx_ != nullptr) {
    EVP_MD_CTX_free(ctx_);
  }
  algo_ = other.algo_;
  ctx_ = other.ctx_;
  other.ctx_ = nullptr;
  return *this;
}

} // namespace pdfseal::crypto
