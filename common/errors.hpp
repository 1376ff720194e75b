/* File: errors.hpp
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

#include <stdexcept>
#include <string>

#include "common_defs.hpp"

namespace pdfseal {

/**
 * @brief Base class for all errors reported to the engine's callers
 * @details Code() returns a stable string code (see common_defs.hpp)
 */
class PdfSealError : public std::runtime_error {
 public:
  PdfSealError(const char *code, const std::string &msg)
    : std::runtime_error(msg), code_(code) {}

  [[nodiscard]] const char *Code() const noexcept { return code_; }

 private:
  const char *code_;
};

/// random source unavailable or key generation failed
class KeyGenerationError : public PdfSealError {
 public:
  explicit KeyGenerationError(const std::string &msg)
    : PdfSealError(kErrKeyGeneration, msg) {}
};

/// PEM can't be parsed, or the key is not an acceptable RSA key
class MalformedKeyError : public PdfSealError {
 public:
  explicit MalformedKeyError(const std::string &msg)
    : PdfSealError(kErrMalformedKey, msg) {}
};

/// the private key does not correspond to the public key
class KeyMismatchError : public PdfSealError {
 public:
  explicit KeyMismatchError(const std::string &msg)
    : PdfSealError(kErrKeyMismatch, msg) {}
};

class NoKeyLoadedError : public PdfSealError {
 public:
  explicit NoKeyLoadedError(const std::string &msg)
    : PdfSealError(kErrNoKeyLoaded, msg) {}
};

class InvalidInputError : public PdfSealError {
 public:
  explicit InvalidInputError(const std::string &msg)
    : PdfSealError(kErrInvalidInput, msg) {}
};

/// no structural trailer, or the document can't be opened
class UnparsableDocumentError : public PdfSealError {
 public:
  explicit UnparsableDocumentError(const std::string &msg)
    : PdfSealError(kErrUnparsableDocument, msg) {}
};

/// the declared signature record offset is outside of the document
class CorruptSignatureLocationError : public PdfSealError {
 public:
  explicit CorruptSignatureLocationError(const std::string &msg)
    : PdfSealError(kErrCorruptSigLocation, msg) {}
};

} // namespace pdfseal
