/* File: engine.cpp
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

#include "engine.hpp"

#include <utility>

#include "logger_utils.hpp"
#include "utils.hpp"

namespace pdfseal::bridge {

namespace {

SignatureInfo RecordToInfo(const pdf::SignatureRecord &record) {
  SignatureInfo res;
  res.signer_name = record.signer_name;
  res.timestamp = record.timestamp;
  res.extra = record.extra;
  res.signature = VecBytesStringRepresentation(record.signature);
  return res;
}

} // namespace

json::object SignatureInfo::ToJson() const {
  json::object res;
  res["signer_name"] = signer_name;
  res["timestamp"] = timestamp;
  res["extra"] = extra;
  res["signature"] = signature;
  return res;
}

json::object SignPdfResult::ToJson() const {
  json::object res;
  res["signed_pdf_size"] = signed_pdf_data.size();
  res["signature_info"] = signature_info.ToJson();
  return res;
}

json::object VerifyPdfResult::ToJson() const {
  json::object res;
  res["is_signed"] = is_signed;
  res["status"] = VerifyStatusName(status);
  res["message"] = message;
  if (signature_info) {
    res["signature_info"] = signature_info->ToJson();
  } else {
    res["signature_info"] = nullptr;
  }
  return res;
}

json::object ErrorToJson(const PdfSealError &err) {
  json::object res;
  res["error"] = err.Code();
  res["message"] = err.what();
  return res;
}

const char *VerifyStatusName(pdf::VerifyStatus status) noexcept {
  switch (status) {
    case pdf::VerifyStatus::kNotSigned:
      return "not_signed";
    case pdf::VerifyStatus::kRecordCorrupt:
      return "record_corrupt";
    case pdf::VerifyStatus::kValid:
      return "valid";
    case pdf::VerifyStatus::kSignatureMismatch:
      return "signature_mismatch";
    case pdf::VerifyStatus::kKeyMismatch:
      return "key_mismatch";
    case pdf::VerifyStatus::kModifiedAfterSigning:
      return "modified_after_signing";
  }
  return "unknown";
}

std::string Engine::GenerateKeypair() {
  return key_store_.Generate();
}

std::string Engine::ImportKey(const std::string &private_pem,
                              const std::string &public_pem) {
  return key_store_.Import(private_pem, public_pem);
}

std::string Engine::ExportKey() const {
  return key_store_.Export();
}

bool Engine::HasKey() const noexcept {
  return key_store_.HasKey();
}

std::string Engine::GetPublicKey() const {
  return key_store_.PublicKeyPem();
}

SignPdfResult Engine::SignPdf(const SignPdfRequest &request) const {
  auto sign_res = signer_.Sign(request.pdf_data, request.name, request.extra,
                               request.options);
  SignPdfResult res;
  res.signature_info = RecordToInfo(sign_res.record);
  res.signed_pdf_data = std::move(sign_res.signed_data);
  return res;
}

VerifyPdfResult Engine::VerifyPdf(const BytesVector &pdf_data) const {
  const auto verify_res = verifier_.Verify(pdf_data);
  VerifyPdfResult res;
  res.status = verify_res.status;
  res.is_signed = verify_res.is_signed;
  res.message = verify_res.message;
  if (verify_res.record) {
    res.signature_info = RecordToInfo(verify_res.record.value());
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[Engine::VerifyPdf] {}", res.message);
  }
  return res;
}

} // namespace pdfseal::bridge
