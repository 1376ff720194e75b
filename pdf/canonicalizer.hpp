/* File: canonicalizer.hpp
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

#include <cstdint>
#include <optional>

#include "pdf.hpp"
#include "pdf_defs.hpp"

namespace pdfseal::pdf {

/**
 * @brief The bytes a signature covers and where the current record lives
 */
struct CanonicalRange {
  RangesVector ranges;
  uint64_t canonical_length = 0;
  bool has_record = false;
  std::optional<size_t> record_offset;
  // more than the signing update follows [0,N), or it changes other objects
  bool modified_after_signing = false;
  PtrPdfObjShared record_obj;  // valid while the Pdf is alive
};

/**
 * @brief Compute the canonical range of an opened document
 * @details The most recent pdfseal record (greatest object offset) declares
 * the range [0,N) with /ByteRange [0 N]. Without a record the whole document
 * is covered.
 * @param pdf opened document
 * @return CanonicalRange
 * @throws UnparsableDocumentError if there is no startxref
 * @throws CorruptSignatureLocationError if N is missing, malformed, zero,
 * past the end of the document or after the record object
 */
CanonicalRange ComputeRange(Pdf &pdf);

/**
 * @brief Compute the canonical range of a document buffer
 * @return CanonicalRange without the record object
 * @throws UnparsableDocumentError
 * @throws CorruptSignatureLocationError
 */
CanonicalRange ComputeRange(const BytesVector &data);

} // namespace pdfseal::pdf
