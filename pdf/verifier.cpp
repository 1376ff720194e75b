/* File: verifier.cpp
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

#include "verifier.hpp"

#include <exception>
#include <utility>

#include "canonicalizer.hpp"
#include "errors.hpp"
#include "i_sign_scheme.hpp"
#include "logger_utils.hpp"
#include "pdf.hpp"
#include "utils.hpp"

namespace pdfseal::pdf {

namespace {

VerificationResult MakeResult(VerifyStatus status,
                              std::optional<SignatureRecord> record,
                              const char *message) {
  VerificationResult res;
  res.status = status;
  res.is_signed = status == VerifyStatus::kValid;
  res.record = std::move(record);
  res.message = message;
  return res;
}

} // namespace

VerificationResult Verifier::Verify(const BytesVector &pdf_data) const {
  const std::string func_name = "[Verifier::Verify] ";
  auto logger = logger::InitLog();
  Pdf pdf;
  pdf.Open(pdf_data);
  // locate the record
  CanonicalRange range;
  try {
    range = ComputeRange(pdf);
  } catch (const CorruptSignatureLocationError &ex) {
    if (logger) {
      logger->warn("{}{}", func_name, ex.what());
    }
    return MakeResult(VerifyStatus::kRecordCorrupt, std::nullopt,
                      kMsgRecordCorrupt);
  }
  if (!range.has_record) {
    return MakeResult(VerifyStatus::kNotSigned, std::nullopt, kMsgNotSigned);
  }
  SignatureRecord record;
  try {
    record = SignatureRecord::FromPdfObject(*range.record_obj);
  } catch (const std::exception &ex) {
    if (logger) {
      logger->warn("{}{}", func_name, ex.what());
    }
    return MakeResult(VerifyStatus::kRecordCorrupt, std::nullopt,
                      kMsgRecordCorrupt);
  }
  const auto key_pair = key_store_.Snapshot();
  if (!key_pair) {
    throw NoKeyLoadedError(func_name + "no verification key loaded");
  }
  if (record.key_id != key_pair->key_id) {
    if (logger) {
      logger->info("{}record key {} resident key {}", func_name,
                   VecBytesStringRepresentation(record.key_id),
                   VecBytesStringRepresentation(key_pair->key_id));
    }
    return MakeResult(VerifyStatus::kKeyMismatch, std::move(record),
                      kMsgKeyMismatch);
  }
  const auto scheme =
    crypto::CreateSignScheme(record.digest_algo, record.sig_algo);
  const BytesVector digest = scheme->Digest(pdf_data, range.ranges);
  if (digest != record.content_digest) {
    if (logger) {
      logger->info("{}content digest differs", func_name);
    }
    return MakeResult(VerifyStatus::kSignatureMismatch, std::move(record),
                      kMsgSignatureMismatch);
  }
  // the attributes with the recomputed digest
  auto attributes = record.ToSignedAttributes();
  attributes.content_digest = digest;
  if (!scheme->Verify(key_pair->public_key.get(), attributes.Encode(),
                      record.signature)) {
    return MakeResult(VerifyStatus::kSignatureMismatch, std::move(record),
                      kMsgSignatureMismatch);
  }
  if (range.modified_after_signing) {
    return MakeResult(VerifyStatus::kModifiedAfterSigning, std::move(record),
                      kMsgModifiedAfterSigning);
  }
  return MakeResult(VerifyStatus::kValid, std::move(record), kMsgValid);
}

} // namespace pdfseal::pdf
