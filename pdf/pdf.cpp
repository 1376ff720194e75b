/* File: pdf.cpp
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

#include "pdf.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFXRefEntry.hh>

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include "watermark.hpp"

namespace pdfseal::pdf {

namespace {

constexpr const char *const kQpdfDescription = "pdfseal input";

} // namespace

Pdf::Pdf() : qpdf_(std::make_unique<QPDF>()) {}

void Pdf::Open(const unsigned char *data, size_t size) {
  const std::string func_name = "[Pdf::Open] ";
  if (data == nullptr || size == 0) {
    throw UnparsableDocumentError(func_name + "empty document");
  }
  if (size > kMaxPdfFileSize) {
    throw InvalidInputError(func_name + "document is too big");
  }
  signatures_.clear();
  update_kit_.reset();
  data_ = nullptr;
  size_ = 0;
  qpdf_ = std::make_unique<QPDF>();
  qpdf_->setSuppressWarnings(true);
  try {
    qpdf_->processMemoryFile(kQpdfDescription,
                             reinterpret_cast<const char *>(data),  // NOLINT
                             size);
    if (!qpdf_->getRoot().isDictionary()) {
      throw std::runtime_error("no document catalog");
    }
  } catch (const std::exception &ex) {
    qpdf_ = std::make_unique<QPDF>();
    throw UnparsableDocumentError(func_name + ex.what());
  }
  data_ = data;
  size_ = size;
}

bool Pdf::FindSignatures() noexcept {
  signatures_.clear();
  auto logger = logger::InitLog();
  try {
    auto acroform = GetAcroform();
    if (!acroform || !acroform->isDictionary()) {
      if (logger) {
        logger->debug("[Pdf::FindSignatures] {}", kErrNoAcro);
      }
      return false;
    }
    if (!acroform->hasKey(kTagFields) ||
        !acroform->getKey(kTagFields).isArray()) {
      if (logger) {
        logger->debug("[Pdf::FindSignatures] no /Fields in the AcroForm");
      }
      return false;
    }
    for (auto &field : acroform->getKey(kTagFields).getArrayAsVector()) {
      if (!field.isDictionary() || !field.hasKey(kTagFT) ||
          !field.getKey(kTagFT).isName() ||
          field.getKey(kTagFT).getName() != kTagSig ||
          !field.hasKey(kTagV)) {
        continue;
      }
      auto value = field.getKey(kTagV);
      if (!value.isDictionary() || !value.hasKey(kTagFilter) ||
          !value.getKey(kTagFilter).isName() ||
          value.getKey(kTagFilter).getName() != kPdfSealFilter) {
        continue;
      }
      SigInstance sig;
      sig.offset = GetObjectOffset(value);
      sig.field = std::make_shared<QPDFObjectHandle>(field);
      sig.value = std::make_shared<QPDFObjectHandle>(value);
      signatures_.push_back(std::move(sig));
    }
  } catch (const std::exception &ex) {
    if (logger) {
      logger->error("[Pdf::FindSignatures] {}", ex.what());
    }
    signatures_.clear();
    return false;
  }
  return !signatures_.empty();
}

std::optional<size_t> Pdf::GetObjectOffset(
  const QPDFObjectHandle &obj) const noexcept {
  if (!qpdf_ || data_ == nullptr || !obj.isIndirect()) {
    return std::nullopt;
  }
  try {
    const auto xref = qpdf_->getXRefTable();
    const auto it_entry = xref.find(obj.getObjGen());
    if (it_entry == xref.cend()) {
      return std::nullopt;
    }
    const QPDFXRefEntry &entry = it_entry->second;
    if (entry.getType() == kXrefUncompressed) {
      return static_cast<size_t>(entry.getOffset());
    }
    if (entry.getType() == kXrefCompressed) {
      const auto it_stream =
        xref.find(QPDFObjGen(entry.getObjStreamNumber(), 0));
      if (it_stream != xref.cend() &&
          it_stream->second.getType() == kXrefUncompressed) {
        return static_cast<size_t>(it_stream->second.getOffset());
      }
    }
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Pdf::GetObjectOffset] {}", ex.what());
    }
  }
  return std::nullopt;
}

bool Pdf::IsEncrypted() const noexcept {
  return qpdf_ && data_ != nullptr && qpdf_->isEncrypted();
}

ObjRawId Pdf::GetLastObjID() const noexcept {
  if (!qpdf_ || data_ == nullptr) {
    return {};
  }
  ObjRawId res{};
  try {
    auto objects = qpdf_->getAllObjects();
    auto it_max = std::max_element(
      objects.cbegin(), objects.cend(),
      [](const QPDFObjectHandle &left, const QPDFObjectHandle &right) {
        return left.getObjectID() < right.getObjectID();
      });
    if (it_max != objects.cend()) {
      res.id = it_max->getObjectID();
      res.gen = it_max->getGeneration();
    }
    const size_t obj_count = qpdf_->getObjectCount();
    if (obj_count > std::numeric_limits<int>::max()) {
      return res;
    }
    const int count = static_cast<int>(obj_count);
    if (res.id < count) {
      res.id = count;
      res.gen = 0;
    }
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Pdf::GetLastObjID] {}", ex.what());
    }
  }
  return res;
}

PtrPdfObjShared Pdf::GetAcroform() const noexcept {
  auto obj_root = GetRoot();
  if (!obj_root) {
    return nullptr;
  }
  try {
    if (obj_root->hasKey(kTagAcroForm)) {
      auto res =
        std::make_shared<QPDFObjectHandle>(obj_root->getKey(kTagAcroForm));
      if (res->isNull()) {
        return nullptr;
      }
      return res;
    }
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Pdf::GetAcroform] {}", ex.what());
    }
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetPage(int page_index) const noexcept {
  if (!qpdf_ || data_ == nullptr) {
    return nullptr;
  }
  try {
    auto all_pages = qpdf_->getAllPages();
    if (all_pages.empty() || page_index < 0 ||
        static_cast<size_t>(page_index) > all_pages.size() - 1) {
      return nullptr;
    }
    auto res = std::make_shared<QPDFObjectHandle>(all_pages[page_index]);
    if (res->isNull() || !res->isPageObject()) {
      return nullptr;
    }
    return res;
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Pdf::GetPage] {}", ex.what());
    }
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetRoot() const noexcept {
  if (!qpdf_ || data_ == nullptr) {
    return nullptr;
  }
  try {
    auto obj_root = std::make_shared<QPDFObjectHandle>(qpdf_->getRoot());
    if (obj_root->isNull()) {
      return nullptr;
    }
    return obj_root;
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[Pdf::GetRoot] {}", ex.what());
    }
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetTrailer() const noexcept {
  if (!qpdf_ || data_ == nullptr) {
    return nullptr;
  }
  auto obj_trailer = std::make_shared<QPDFObjectHandle>(qpdf_->getTrailer());
  if (obj_trailer->isNull()) {
    return nullptr;
  }
  return obj_trailer;
}

BytesVector Pdf::CreateSignedUpdate(
  const SignatureRecord &record,
  const std::vector<std::string> &watermark_lines) {
  if (data_ == nullptr) {
    throw std::runtime_error("[Pdf::CreateSignedUpdate] no document");
  }
  update_kit_ = std::make_shared<PdfUpdateObjectKit>();
  // save last id of original doc
  update_kit_->original_last_id = GetLastObjID();
  update_kit_->last_assigned_id = update_kit_->original_last_id;
  // the widget goes to the first page
  update_kit_->p_page_original = GetPage(0);
  if (!update_kit_->p_page_original) {
    throw std::runtime_error("[Pdf::CreateSignedUpdate] Target page not found");
  }
  // font and form xobject
  CreateWatermark(watermark_lines);
  CreateSigRecord(record);
  // sig annot
  CreateSignAnnot();
  // create an AcroForm (or copy existing)
  CreateAcroForm();
  // update page
  CreateUpdatedPage();
  // root
  CreateUpdateRoot();
  // xref and trailer
  CreateXRef();
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[Pdf::CreateSignedUpdate] update size {} record {}",
                  update_kit_->update_data.size(),
                  update_kit_->sig_record.id.ToStringRef());
  }
  return std::move(update_kit_->update_data);
}

// ---------------------------------------------------
// private

void Pdf::CreateWatermark(const std::vector<std::string> &watermark_lines) {
  if (watermark_lines.empty()) {
    return;
  }
  const auto page_rect = VisiblePageSize(update_kit_->p_page_original);
  if (!page_rect) {
    throw std::runtime_error(kErrPageSize);
  }
  const auto crop_box_offset = CropBoxOffsetsXY(update_kit_->p_page_original);
  update_kit_->watermark = LayoutWatermark(
    watermark_lines, page_rect.value(), crop_box_offset.value_or(XYReal{}));
  if (!update_kit_->watermark) {
    return;
  }
  FontObj &font = update_kit_->font.emplace();
  font.id = ++update_kit_->last_assigned_id;
  FormXObject &form_x_object = update_kit_->form_x_object.emplace();
  form_x_object.id = ++update_kit_->last_assigned_id;
  form_x_object.bbox = update_kit_->watermark->bbox;
  form_x_object.font_ref = font.id;
  form_x_object.content = WatermarkContentStream(*update_kit_->watermark);
}

void Pdf::CreateSigRecord(const SignatureRecord &record) {
  update_kit_->sig_record = record;
  update_kit_->sig_record.id = ++update_kit_->last_assigned_id;
}

void Pdf::CreateSignAnnot() {
  SigField &sig_field = update_kit_->sig_field;
  sig_field.id = ++update_kit_->last_assigned_id;
  sig_field.parent =
    ObjRawId::CopyIdFromExisting(*update_kit_->p_page_original);
  sig_field.name = kSigFieldNamePrefix + std::to_string(sig_field.id.id);
  sig_field.value = update_kit_->sig_record.id;
  if (update_kit_->form_x_object && update_kit_->watermark) {
    sig_field.appearance_ref = update_kit_->form_x_object->id;
    sig_field.rect = update_kit_->watermark->rect;
  }
}

void Pdf::CreateAcroForm() {
  AcroForm &acroform = update_kit_->acroform;
  auto original_acro_form = GetAcroform();
  if (original_acro_form && original_acro_form->isDictionary()) {
    // copy original
    acroform = AcroForm::ShallowCopy(original_acro_form);
    if (!original_acro_form->isIndirect()) {
      // a direct dictionary in the catalog moves to a new object
      acroform.id = ++update_kit_->last_assigned_id;
    }
  } else {
    acroform.id = ++update_kit_->last_assigned_id;
  }
  acroform.fields.push_back(update_kit_->sig_field.id);
}

void Pdf::CreateUpdatedPage() {
  update_kit_->updated_page = CreatePageUpdateWithAnnots(
    update_kit_->p_page_original, {update_kit_->sig_field.id});
}

void Pdf::CreateUpdateRoot() {
  auto root = GetRoot();
  update_kit_->p_root_original = root;
  if (!root || !root->isDictionary()) {
    throw std::runtime_error("[Pdf::CreateUpdateRoot] Can't find the pdf root");
  }
  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*root).ToString() << "\n"
          << kDictStart << "\n";
  auto root_unparsed_map = DictToUnparsedMap(*root);
  root_unparsed_map.insert_or_assign(kTagAcroForm,
                                     update_kit_->acroform.id.ToStringRef());
  builder << UnparsedMapToString(root_unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  update_kit_->root_updated = builder.str();
}

void Pdf::CreateXRef() {
  // find the previous xref
  auto prev_x_ref = FindXrefOffset(data_, size_);
  if (!prev_x_ref) {
    throw std::runtime_error("[Pdf::CreateXRef] Can't find pdf xref");
  }
  BytesVector &update_buf = update_kit_->update_data;
  std::vector<XRefEntry> &ref_entries = update_kit_->ref_entries;
  update_buf.push_back('\n');
  auto push_object = [this, &update_buf, &ref_entries](
                       const ObjRawId &obj_id, const std::string &raw) {
    ref_entries.push_back(XRefEntry{obj_id, size_ + update_buf.size(),
                                    static_cast<uint32_t>(obj_id.gen)});
    std::copy(raw.cbegin(), raw.cend(), std::back_inserter(update_buf));
  };
  push_object(ObjRawId::CopyIdFromExisting(*update_kit_->p_page_original),
              update_kit_->updated_page);
  push_object(ObjRawId::CopyIdFromExisting(*update_kit_->p_root_original),
              update_kit_->root_updated);
  push_object(update_kit_->acroform.id, update_kit_->acroform.ToString());
  push_object(update_kit_->sig_field.id, update_kit_->sig_field.ToString());
  push_object(update_kit_->sig_record.id, update_kit_->sig_record.ToString());
  if (update_kit_->form_x_object) {
    push_object(update_kit_->form_x_object->id,
                update_kit_->form_x_object->ToString());
  }
  if (update_kit_->font) {
    push_object(update_kit_->font->id, update_kit_->font->ToString());
  }
  // create new trailer
  auto trailer_orig = GetTrailer();
  if (!trailer_orig || !trailer_orig->isDictionary()) {
    throw std::runtime_error("[Pdf::CreateXRef] Can't find document trailer");
  }
  auto map_unparsed = DictToUnparsedMap(*trailer_orig);
  // the same kind of cross-reference as the previous one
  if (trailer_orig->hasKey(kTagType) &&
      trailer_orig->getKey(kTagType).isName() &&
      trailer_orig->getKey(kTagType).getName() == kTagXref) {
    CreateCrossRefStream(map_unparsed, prev_x_ref.value(), update_buf, size_,
                         update_kit_->last_assigned_id, ref_entries);
  } else {
    CreateSimpleXref(map_unparsed, prev_x_ref.value(), update_buf, size_,
                     update_kit_->last_assigned_id, ref_entries);
  }
}

} // namespace pdfseal::pdf
