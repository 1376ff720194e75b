/* File: canonicalizer.cpp
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

#include "canonicalizer.hpp"

#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFXRefEntry.hh>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <set>
#include <string>

#include "errors.hpp"
#include "logger_utils.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::pdf {

namespace {

uint64_t DeclaredLength(QPDFObjectHandle &sig_value) {
  const std::string func_name = "[ComputeRange] ";
  if (!sig_value.hasKey(kTagByteRange)) {
    throw CorruptSignatureLocationError(func_name + "no /ByteRange");
  }
  auto byte_range = sig_value.getKey(kTagByteRange);
  if (!byte_range.isArray() || byte_range.getArrayNItems() != 2 ||
      !byte_range.getArrayItem(0).isInteger() ||
      !byte_range.getArrayItem(1).isInteger() ||
      byte_range.getArrayItem(0).getIntValue() != 0) {
    throw CorruptSignatureLocationError(func_name +
                                        "/ByteRange is not [0 N]");
  }
  const long long declared = byte_range.getArrayItem(1).getIntValue();
  if (declared <= 0) {
    throw CorruptSignatureLocationError(func_name +
                                        "declared offset is not positive");
  }
  return static_cast<uint64_t>(declared);
}

// one update follows the canonical range and the record lies inside it
bool SingleUpdateAfter(const Pdf &pdf, uint64_t canonical_length,
                       size_t record_offset) {
  const unsigned char *data = pdf.Data();
  const auto *const end = data + pdf.Size();
  const std::string tag = kEof;
  const auto *const it_eof =
    std::search(data + canonical_length, end, tag.cbegin(), tag.cend());
  if (it_eof == end || data + record_offset >= it_eof) {
    return false;
  }
  // whitespace only, so no second %%EOF either
  return std::all_of(it_eof + tag.size(), end, [](unsigned char symbol) {
    return std::isspace(symbol) != 0 || symbol == '\0';
  });
}

bool SameXRefEntry(const QPDFXRefEntry &left, const QPDFXRefEntry &right) {
  if (left.getType() != right.getType()) {
    return false;
  }
  switch (left.getType()) {
  case kXrefUncompressed:
    return left.getOffset() == right.getOffset();
  case kXrefCompressed:
    return left.getObjStreamNumber() == right.getObjStreamNumber() &&
           left.getObjStreamIndex() == right.getObjStreamIndex();
  default:
    return true;
  }
}

bool DiffersOnlyIn(QPDFObjectHandle before, QPDFObjectHandle after,
                   const std::set<std::string> &keys) {
  if (!before.isDictionary() || !after.isDictionary()) {
    return false;
  }
  auto map_before = DictToUnparsedMap(before);
  auto map_after = DictToUnparsedMap(after);
  for (const auto &key : keys) {
    map_before.erase(key);
    map_after.erase(key);
  }
  return map_before == map_after;
}

/**
 * @brief Check the objects of the signed revision the update redefines
 * @details Only the catalog (/AcroForm), the first page (/Annots) and an
 * indirect AcroForm (/Fields, /SigFlags) may be redefined. Every other object
 * of [0,N) must keep its xref entry.
 */
bool OnlySignatureObjectsRedefined(const Pdf &pdf, uint64_t canonical_length) {
  const std::string func_name = "[ComputeRange] ";
  auto logger = logger::InitLog();
  Pdf base;
  try {
    base.Open(pdf.Data(), canonical_length);
  } catch (const PdfSealError &ex) {
    if (logger) {
      logger->warn("{}the signed revision does not parse: {}", func_name,
                   ex.what());
    }
    return false;
  }
  try {
    QPDF &base_qpdf = *base.getQPDF();
    QPDF &full_qpdf = *pdf.getQPDF();
    auto base_trailer = base_qpdf.getTrailer();
    auto full_trailer = full_qpdf.getTrailer();
    for (const std::string key : {kTagRoot, kTagInfo, kTagEncrypt}) {
      if (base_trailer.getKey(key).unparse() !=
          full_trailer.getKey(key).unparse()) {
        if (logger) {
          logger->warn("{}trailer {} changed after signing", func_name, key);
        }
        return false;
      }
    }
    std::map<QPDFObjGen, std::set<std::string>> allowed;
    auto root = base_qpdf.getRoot();
    allowed[root.getObjGen()] = {kTagAcroForm};
    const auto &pages = base_qpdf.getAllPages();
    if (!pages.empty()) {
      allowed[pages.front().getObjGen()] = {kTagAnnots};
    }
    if (root.hasKey(kTagAcroForm) && root.getKey(kTagAcroForm).isIndirect()) {
      allowed[root.getKey(kTagAcroForm).getObjGen()] = {kTagFields,
                                                        kTagSigFlags};
    }
    const auto base_table = base_qpdf.getXRefTable();
    const auto full_table = full_qpdf.getXRefTable();
    for (const auto &base_entry : base_table) {
      const QPDFObjGen &obj_gen = base_entry.first;
      auto it_full = full_table.find(obj_gen);
      if (it_full != full_table.cend() &&
          SameXRefEntry(base_entry.second, it_full->second)) {
        continue;
      }
      auto it_allowed = allowed.find(obj_gen);
      if (it_full == full_table.cend() || it_allowed == allowed.cend() ||
          !DiffersOnlyIn(base_qpdf.getObjectByObjGen(obj_gen),
                         full_qpdf.getObjectByObjGen(obj_gen),
                         it_allowed->second)) {
        if (logger) {
          logger->warn("{}object {} {} changed after signing", func_name,
                       obj_gen.getObj(), obj_gen.getGen());
        }
        return false;
      }
    }
  } catch (const std::exception &ex) {
    if (logger) {
      logger->warn("{}can't compare with the signed revision: {}", func_name,
                   ex.what());
    }
    return false;
  }
  return true;
}

} // namespace

CanonicalRange ComputeRange(Pdf &pdf) {
  const std::string func_name = "[ComputeRange] ";
  CanonicalRange res;
  const size_t size = pdf.Size();
  if (!FindXrefOffset(pdf.Data(), size)) {
    throw UnparsableDocumentError(func_name + "no startxref");
  }
  if (!pdf.FindSignatures()) {
    res.canonical_length = size;
    res.ranges.emplace_back(0, size);
    return res;
  }
  // the most recent record
  const auto &signatures = pdf.GetSignatures();
  const auto it_last = std::max_element(
    signatures.cbegin(), signatures.cend(),
    [](const SigInstance &left, const SigInstance &right) {
      return left.offset.value_or(0) < right.offset.value_or(0);
    });
  res.has_record = true;
  res.record_obj = it_last->value;
  res.record_offset = it_last->offset;
  res.canonical_length = DeclaredLength(*it_last->value);
  if (res.canonical_length > size) {
    throw CorruptSignatureLocationError(
      func_name + "declared offset is past the end of the document");
  }
  if (!res.record_offset || res.record_offset.value() < res.canonical_length) {
    throw CorruptSignatureLocationError(
      func_name + "the record lies inside the signed range");
  }
  res.ranges.emplace_back(0, res.canonical_length);
  res.modified_after_signing =
    !SingleUpdateAfter(pdf, res.canonical_length, res.record_offset.value()) ||
    !OnlySignatureObjectsRedefined(pdf, res.canonical_length);
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{}record at {} covers [0,{}) modified after: {}", func_name,
                  res.record_offset.value(), res.canonical_length,
                  res.modified_after_signing);
  }
  return res;
}

CanonicalRange ComputeRange(const BytesVector &data) {
  Pdf pdf;
  pdf.Open(data);
  auto res = ComputeRange(pdf);
  res.record_obj.reset();
  return res;
}

} // namespace pdfseal::pdf
