/* File: sig_record.cpp
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

#include "sig_record.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include "pdf_defs.hpp"
#include "pdf_utils.hpp"
#include "utils.hpp"

namespace pdfseal::pdf {

namespace {

std::string HexString(const BytesVector &val) {
  return "<" + VecBytesStringRepresentation(val) + ">";
}

std::string UnicodeHexString(const std::string &utf8) {
  return QPDFObjectHandle::newUnicodeString(utf8).unparseBinary();
}

QPDFObjectHandle RequireKey(QPDFObjectHandle &obj, const std::string &key) {
  if (!obj.hasKey(key)) {
    throw std::runtime_error("[SignatureRecord::FromPdfObject] no " + key);
  }
  return obj.getKey(key);
}

std::string RequireString(QPDFObjectHandle &obj, const std::string &key) {
  auto val = RequireKey(obj, key);
  if (!val.isString()) {
    throw std::runtime_error("[SignatureRecord::FromPdfObject] " + key +
                             " is not a string");
  }
  return val.getStringValue();
}

BytesVector RequireBytes(QPDFObjectHandle &obj, const std::string &key) {
  const std::string raw = RequireString(obj, key);
  if (raw.empty()) {
    throw std::runtime_error("[SignatureRecord::FromPdfObject] empty " + key);
  }
  return {raw.cbegin(), raw.cend()};
}

std::string RequireName(QPDFObjectHandle &obj, const std::string &key) {
  auto val = RequireKey(obj, key);
  if (!val.isName()) {
    throw std::runtime_error("[SignatureRecord::FromPdfObject] " + key +
                             " is not a name");
  }
  // without the leading slash
  return val.getName().substr(1);
}

} // namespace

std::string SignatureRecord::ToString() const {
  const std::string func_name = "[SignatureRecord::ToString] ";
  const auto pdf_date = Iso8601ToPdfDate(timestamp);
  if (!pdf_date) {
    throw std::runtime_error(func_name + "invalid timestamp " + timestamp);
  }
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << kTagSig << "\n"
          << kTagFilter << " " << kPdfSealFilter << "\n"
          << kTagSubFilter << " " << kPdfSealSubFilter << "\n"
          << kTagName << " " << UnicodeHexString(signer_name) << "\n"
          << kTagSigningTime << " (" << timestamp << ")\n"
          << kTagM << " (" << pdf_date.value() << ")\n";
  if (!extra.empty()) {
    builder << kTagReason << " " << UnicodeHexString(extra) << "\n";
  }
  builder << kTagDigestMethod << " /" << crypto::DigestAlgorithmName(digest_algo)
          << "\n"
          << kTagSignatureMethod << " /"
          << crypto::SignatureAlgorithmName(sig_algo) << "\n"
          << kTagDigestValue << " " << HexString(content_digest) << "\n"
          << kTagKeyId << " " << HexString(key_id) << "\n"
          << kTagByteRange << " [ 0 " << canonical_length << " ]\n"
          << kTagContents << " " << HexString(signature) << "\n"
          << kTagPropBuild << " " << kDictStart << " " << kTagApp << " "
          << kDictStart << " " << kTagName << " (" << kPdfSealAppName << ") "
          << kDictEnd << " " << kDictEnd << "\n"
          << kDictEnd << "\n"
          << kObjEnd;
  return builder.str();
}

crypto::SignedAttributes SignatureRecord::ToSignedAttributes() const {
  crypto::SignedAttributes res;
  res.digest_algo = digest_algo;
  res.sig_algo = sig_algo;
  res.content_digest = content_digest;
  res.canonical_length = canonical_length;
  res.signer_name = signer_name;
  res.timestamp = timestamp;
  res.extra = extra;
  res.key_id = key_id;
  return res;
}

SignatureRecord SignatureRecord::FromPdfObject(QPDFObjectHandle &obj) {
  const std::string func_name = "[SignatureRecord::FromPdfObject] ";
  if (!obj.isDictionary()) {
    throw std::runtime_error(func_name + "not a dictionary");
  }
  if (RequireName(obj, kTagFilter) != std::string(kPdfSealFilter).substr(1)) {
    throw std::runtime_error(func_name + "unexpected /Filter");
  }
  SignatureRecord res;
  res.id = ObjRawId::CopyIdFromExisting(obj);
  {
    auto name = RequireKey(obj, kTagName);
    if (!name.isString()) {
      throw std::runtime_error(func_name + "/Name is not a string");
    }
    res.signer_name = name.getUTF8Value();
  }
  res.timestamp = RequireString(obj, kTagSigningTime);
  if (!Iso8601ToTimeT(res.timestamp)) {
    throw std::runtime_error(func_name + "invalid /SigningTime");
  }
  if (obj.hasKey(kTagReason)) {
    auto reason = obj.getKey(kTagReason);
    if (!reason.isString()) {
      throw std::runtime_error(func_name + "/Reason is not a string");
    }
    res.extra = reason.getUTF8Value();
  }
  const auto digest_algo =
    crypto::DigestAlgorithmFromName(RequireName(obj, kTagDigestMethod));
  if (!digest_algo) {
    throw std::runtime_error(func_name + "unknown /DigestMethod");
  }
  res.digest_algo = digest_algo.value();
  const auto sig_algo =
    crypto::SignatureAlgorithmFromName(RequireName(obj, kTagSignatureMethod));
  if (!sig_algo) {
    throw std::runtime_error(func_name + "unknown /SignatureMethod");
  }
  res.sig_algo = sig_algo.value();
  res.content_digest = RequireBytes(obj, kTagDigestValue);
  res.key_id = RequireBytes(obj, kTagKeyId);
  res.signature = RequireBytes(obj, kTagContents);
  {
    auto byte_range = RequireKey(obj, kTagByteRange);
    if (!byte_range.isArray() || byte_range.getArrayNItems() != 2 ||
        !byte_range.getArrayItem(0).isInteger() ||
        !byte_range.getArrayItem(1).isInteger() ||
        byte_range.getArrayItem(0).getIntValue() != 0 ||
        byte_range.getArrayItem(1).getIntValue() <= 0) {
      throw std::runtime_error(func_name + "/ByteRange is not [0 N]");
    }
    res.canonical_length =
      static_cast<uint64_t>(byte_range.getArrayItem(1).getIntValue());
  }
  return res;
}

} // namespace pdfseal::pdf
