/* File: pdf_defs.hpp
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
#define POINTERHOLDER_TRANSITION 3 // NOLINT (cppcoreguidelines-macro-usage)
#include <cstdint>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QUtil.hh>
#include <vector>

#include "common_defs.hpp"

namespace pdfseal::pdf {
using pdfseal::BytesVector;
using pdfseal::RangesVector;
using PtrPdfObj = std::unique_ptr<QPDFObjectHandle>;
using PtrPdfObjShared = std::shared_ptr<QPDFObjectHandle>;

constexpr const char *const kTagAcroForm = "/AcroForm";
constexpr const char *const kTagFields = "/Fields";
constexpr const char *const kTagType = "/Type";
constexpr const char *const kTagSubType = "/Subtype";
constexpr const char *const kTagFilter = "/Filter";
constexpr const char *const kTagSubFilter = "/SubFilter";
constexpr const char *const kTagContents = "/Contents";
constexpr const char *const kTagByteRange = "/ByteRange";
constexpr const char *const kTagXObject = "/XObject";
constexpr const char *const kTagForm = "/Form";
constexpr const char *const kTagFormType = "/FormType";
constexpr const char *const kTagBBox = "/BBox";
constexpr const char *const kTagLength = "/Length";
constexpr const char *const kTagResources = "/Resources";
constexpr const char *const kTagFont = "/Font";
constexpr const char *const kTagType1 = "/Type1";
constexpr const char *const kTagBaseFont = "/BaseFont";
constexpr const char *const kTagEncoding = "/Encoding";
constexpr const char *const kTagFT = "/FT";
constexpr const char *const kTagSig = "/Sig";
constexpr const char *const kTagSigFlags = "/SigFlags";
constexpr const char *const kTagT = "/T";
constexpr const char *const kTagF = "/F";
constexpr const char *const kTagAnnot = "/Annot";
constexpr const char *const kTagAnnots = "/Annots";
constexpr const char *const kTagWidget = "/Widget";
constexpr const char *const kTagP = "/P";
constexpr const char *const kTagRect = "/Rect";
constexpr const char *const kTagAP = "/AP";
constexpr const char *const kTagN = "/N";
constexpr const char *const kTagV = "/V";
constexpr const char *const kTagM = "/M";
constexpr const char *const kTagName = "/Name";
constexpr const char *const kTagReason = "/Reason";
constexpr const char *const kTagSigningTime = "/SigningTime";
constexpr const char *const kTagDigestMethod = "/DigestMethod";
constexpr const char *const kTagSignatureMethod = "/SignatureMethod";
constexpr const char *const kTagDigestValue = "/DigestValue";
constexpr const char *const kTagKeyId = "/KeyId";
constexpr const char *const kTagPage = "/Page";
constexpr const char *const kTagPrev = "/Prev";
constexpr const char *const kTagSize = "/Size";
constexpr const char *const kTagPropBuild = "/Prop_Build";
constexpr const char *const kTagApp = "/App";
constexpr const char *const kTagRoot = "/Root";
constexpr const char *const kTagEncrypt = "/Encrypt";
constexpr const char *const kTagInfo = "/Info";
constexpr const char *const kTagID = "/ID";
constexpr const char *const kTagXref = "/XRef";
constexpr const char *const kTagIndex = "/Index";
constexpr const char *const kTagW = "/W";

constexpr const char *const kDictStart = "<<";
constexpr const char *const kDictEnd = ">>";
constexpr const char *const kStreamStart = "stream\n";
constexpr const char *const kStreamEnd = "endstream\n";
constexpr const char *const kObjEnd = "endobj\n";
constexpr const char *const kXref = "xref\n";
constexpr const char *const kStartXref = "startxref";
constexpr const char *const kEof = "%%EOF";
// the xref entry types of ISO32000 [7.5.8.3]
constexpr int kXrefUncompressed = 1;
constexpr int kXrefCompressed = 2;

constexpr const char *const kErrNoAcro = "No acroform found";
constexpr const char *const kErrPageSize = "Can't determine page size";

// signature record
constexpr const char *const kPdfSealFilter = "/PdfSeal";
constexpr const char *const kPdfSealSubFilter = "/PdfSeal.detached";
constexpr const char *const kPdfSealAppName = "pdfseal";
constexpr const char *const kSigFieldNamePrefix = "pdfseal_signature";

// watermark
constexpr const char *const kWatermarkFontTag = "/FWM";
constexpr const char *const kWatermarkBaseFont = "/Helvetica";
constexpr const char *const kWinAnsiEncoding = "/WinAnsiEncoding";
constexpr const char *const kWatermarkTitle = "Digitally signed by ";
constexpr double kWatermarkFontSize = 8;
constexpr double kWatermarkLineHeight = 10;
constexpr double kWatermarkMargin = 10;  // from the page corner
constexpr double kWatermarkPadding = 4;  // text to border
constexpr double kWatermarkCharWidth = 0.62; // average, font size units
constexpr size_t kWatermarkDigestChars = 16;

} // namespace pdfseal::pdf
