/* File: pdf_utils.hpp
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
#include <filesystem>
#include <map>
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {
/// @brief read the whole file, empty optional if it can't be read
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept;

/**
 * @brief Write data to a file, replacing an existing one
 * @param path destination
 * @param data
 * @param perms permissions of the created file
 * @throws std::runtime_error
 */
void WriteFile(const std::string &path, const BytesVector &data,
               std::filesystem::perms perms);

/// @brief PDF real number, at most 10 fractional digits, no trailing zeros
std::string DoubleToString10(double val);

/**
 * @brief Return the size of visible page rectangle [0,0,width,height]
 * @param page obj
 * @return BBox [0,0,width,height]
 */
std::optional<BBox> VisiblePageSize(const PtrPdfObjShared &page_obj) noexcept;

/// @brief lower-left corner of the crop box relative to the media box
std::optional<XYReal> CropBoxOffsetsXY(
  const PtrPdfObjShared &page_obj) noexcept;

/// @brief "/Key" -> unparsed value, for copying dictionaries to an update
std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict);

/// @brief "/Key value" lines, without the << >> brackets
std::string UnparsedMapToString(const std::map<std::string, std::string> &map);

/**
 * @brief Build a cross-reference table
 * @details 7.5.4 Cross-Reference Table
 * @param entries
 * @return std::string ready for embedding
 */
std::string BuildXrefRawTable(const std::vector<XRefEntry> &entries);

/**
 * @brief sorts entries, builds sections for cross-reference stream
 *
 * @param entries XRefEntry for cross reference
 * @return std::vector<std::pair<int, int>>
 * @details ISO 32000 [7.5.8 Cross-Reference Streams]
 * @throws runtime_error on duplicate entries
 */
std::vector<std::pair<int, int>> BuildXRefStreamSections(
  std::vector<XRefEntry> &entries);

/**
 * @brief Offset value of the last startxref keyword
 * @return std::optional<std::string> decimal digits, empty if not found
 */
std::optional<std::string> FindXrefOffset(const unsigned char *data,
                                          size_t size);

/**
 * @brief Create a Page updated with the Annots objects
 * @param p_page_original
 * @param annot_ids
 * @return std::string unparsed page
 * @details appends the new ids to the /Annots array of page
 */
std::string CreatePageUpdateWithAnnots(const PtrPdfObjShared &p_page_original,
                                       const std::vector<ObjRawId> &annot_ids);

// The update keeps the kind of the previous cross-reference section.

/**
 * @brief Create a Cross Ref Stream object
 * @details ISO3200 [7.5.8] Cross-Reference Streams
 * @param old_trailer_fields
 * @param prev_x_ref_offset
 * @param [in,out] update_buf the incremental update
 * @param update_offset offset of update_buf in the resulting file
 * @param [in,out] last_assigned_id  reference to the last_assigned_id
 * @param [in,out] ref_entries referenct to the XRefEntry vector
 */
void CreateCrossRefStream(
  std::map<std::string, std::string> &old_trailer_fields,
  const std::string &prev_x_ref_offset, BytesVector &update_buf,
  size_t update_offset, ObjRawId &last_assigned_id,
  std::vector<XRefEntry> &ref_entries);

/**
 * @brief Create a simple trailer and xref table
 *
 * @param[in,out] old_trailer_fields - previous trailer fields string->string
 * @param[in] prev_x_ref_offset - offset in bytes of previous x_ref (string)
 * @param [in,out] update_buf the incremental update
 * @param update_offset offset of update_buf in the resulting file
 * @param [in,out] last_assigned_id  reference to the last_assigned_id
 * @param [in,out] ref_entries referenct to the XRefEntry vector
 */
void CreateSimpleXref(std::map<std::string, std::string> &old_trailer_fields,
                      const std::string &prev_x_ref_offset,
                      BytesVector &update_buf, size_t update_offset,
                      ObjRawId &last_assigned_id,
                      std::vector<XRefEntry> &ref_entries);

} // namespace pdfseal::pdf
