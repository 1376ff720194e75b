/* File: pdf.hpp
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

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "pdf_update_object_kit.hpp"
#include "sig_record.hpp"

namespace pdfseal::pdf {

/// @brief a signature field carrying a pdfseal record
struct SigInstance {
  PtrPdfObjShared field;
  PtrPdfObjShared value;  // the /Sig dictionary
  std::optional<size_t> offset;  // of the /Sig object in the file
};

class Pdf {
 public:
  /**
   * @brief Construct a new Pdf object
   * @throws propagated exceptions
   */
  Pdf();

  Pdf(const Pdf &) = delete;
  Pdf(Pdf &&) = delete;
  Pdf &operator=(const Pdf &) = delete;
  Pdf &operator=(Pdf &&) = delete;
  ~Pdf() = default;

  /**
   * @brief Open a pdf from memory
   * @param data the buffer, is not copied and must outlive the object
   * @param size number of bytes to use from the buffer beginning
   * @throws InvalidInputError if the document is too big
   * @throws UnparsableDocumentError if qpdf can't open it
   */
  void Open(const unsigned char *data, size_t size);

  void Open(const BytesVector &data) { Open(data.data(), data.size()); }

  /**
   * @brief Find signature fields with a pdfseal record
   * @return true if some signatures found
   */
  [[nodiscard]] bool FindSignatures() noexcept;

  [[nodiscard]] const std::vector<SigInstance> &GetSignatures()
    const noexcept {
    return signatures_;
  }

  /**
   * @brief Offset of an indirect object in the file
   * @details object stream members resolve to the offset of the stream
   * @return std::optional<size_t> empty for direct or unknown objects
   */
  [[nodiscard]] std::optional<size_t> GetObjectOffset(
    const QPDFObjectHandle &obj) const noexcept;

  [[nodiscard]] bool IsEncrypted() const noexcept;

  [[nodiscard]] const unsigned char *Data() const noexcept { return data_; }
  [[nodiscard]] size_t Size() const noexcept { return size_; }

  // for tests
  [[nodiscard]] const std::unique_ptr<QPDF> &getQPDF() const & noexcept {
    return qpdf_;
  }

  /**
   * @brief Get the Last Object ID
   * @return ObjRawId
   */
  [[nodiscard]] ObjRawId GetLastObjID() const noexcept;

  /**
   * @brief check is there /Acroform in document calalog
   * @return shared pointer to acroform
   */
  [[nodiscard]] PtrPdfObjShared GetAcroform() const noexcept;
  [[nodiscard]] PtrPdfObjShared GetPage(int page_index) const noexcept;
  [[nodiscard]] PtrPdfObjShared GetRoot() const noexcept;
  [[nodiscard]] PtrPdfObjShared GetTrailer() const noexcept;

  /**
   * @brief Build an incremental update carrying the signature record
   * @details The widget annotation is placed on the first page, the
   * watermark becomes its appearance.
   * @param record ready record, the object id is assigned here
   * @param watermark_lines UTF-8 lines, no appearance if empty
   * @return BytesVector the update to append to the opened document
   * @throws std::runtime_error
   */
  BytesVector CreateSignedUpdate(
    const SignatureRecord &record,
    const std::vector<std::string> &watermark_lines);

 private:
  void CreateWatermark(const std::vector<std::string> &watermark_lines);
  void CreateSigRecord(const SignatureRecord &record);
  void CreateSignAnnot();
  void CreateAcroForm();
  void CreateUpdatedPage();
  void CreateUpdateRoot();
  void CreateXRef();

  std::unique_ptr<QPDF> qpdf_;
  const unsigned char *data_ = nullptr;
  size_t size_ = 0;
  std::vector<SigInstance> signatures_;
  std::shared_ptr<PdfUpdateObjectKit> update_kit_;
};

} // namespace pdfseal::pdf
