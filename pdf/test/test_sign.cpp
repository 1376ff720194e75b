/* File: test_sign.cpp
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

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "canonicalizer.hpp"
#include "common_defs.hpp"
#include "errors.hpp"
#include "key_store.hpp"
#include "pdf.hpp"
#include "pdf_defs.hpp"
#include "pdf_utils.hpp"
#include "sig_record.hpp"
#include "signer.hpp"
#include "test_documents.hpp"
#include "utils.hpp"
#include "verifier.hpp"

using namespace pdfseal::pdf;
using pdfseal::pdf::test::FindText;
using pdfseal::pdf::test::MakeTestPdf;
using pdfseal::pdf::test::OpenInQpdf;
using pdfseal::pdf::test::OtherKeyStore;
using pdfseal::pdf::test::TestKeyStore;

namespace {

constexpr const char *const kFixedTime = "2026-10-19T10:00:00Z";

std::chrono::system_clock::time_point FixedClock() {
  return std::chrono::system_clock::from_time_t(
    pdfseal::Iso8601ToTimeT(kFixedTime).value());
}

SignResult SignTestDoc(const BytesVector &data, const std::string &name,
                       const std::string &extra = "",
                       const SignOptions &options = {}) {
  Signer signer(TestKeyStore());
  signer.SetClock(FixedClock);
  return signer.Sign(data, name, extra, options);
}

VerificationResult VerifyTestDoc(const BytesVector &data) {
  const Verifier verifier(TestKeyStore());
  return verifier.Verify(data);
}

void ReplaceText(BytesVector &data, const std::string &from,
                 const std::string &to, size_t start = 0) {
  REQUIRE(from.size() == to.size());
  const size_t pos = FindText(data, from, start);
  REQUIRE(pos != std::string::npos);
  std::copy(to.cbegin(), to.cend(),
            data.begin() + static_cast<std::ptrdiff_t>(pos));
}

/**
 * @brief Append an update that swaps the page content
 * @details The update carries a copy of the signature record in a new field
 * and replaces the AcroForm, so the copy is the most recent record.
 */
BytesVector AppendForgedUpdate(const BytesVector &signed_data) {
  struct Entry {
    int id;
    int gen;
    size_t offset;
  };
  auto qpdf = OpenInQpdf(signed_data);
  auto root = qpdf->getRoot();
  auto page = qpdf->getAllPages().at(0);
  auto acroform = root.getKey(kTagAcroForm);
  REQUIRE(acroform.isIndirect());
  auto record = acroform.getKey(kTagFields).getArrayItem(0).getKey(kTagV);
  const auto next_id =
    static_cast<int>(qpdf->getTrailer().getKey(kTagSize).getIntValue());
  const int contents_id = next_id;
  const int record_id = next_id + 1;
  const int field_id = next_id + 2;
  const auto prev_xref = FindXrefOffset(signed_data.data(), signed_data.size());
  REQUIRE(prev_xref);

  BytesVector res = signed_data;
  std::vector<Entry> entries;
  auto push_object = [&res, &entries](int id, int gen,
                                      const std::string &body) {
    entries.push_back(Entry{id, gen, res.size()});
    const std::string raw = std::to_string(id) + " " + std::to_string(gen) +
                            " obj\n" + body + "\nendobj\n";
    std::copy(raw.cbegin(), raw.cend(), std::back_inserter(res));
  };
  res.push_back('\n');
  const std::string content = "BT /F1 24 Tf 72 720 Td (Forged) Tj ET\n";
  push_object(contents_id, 0,
              "<< /Length " + std::to_string(content.size()) +
                " >>\nstream\n" + content + "endstream");
  std::string page_body = "<< ";
  for (const auto &key : page.getKeys()) {
    page_body += key + " " +
                 (key == "/Contents" ? std::to_string(contents_id) + " 0 R"
                                     : page.getKey(key).unparse()) +
                 " ";
  }
  page_body += ">>";
  push_object(page.getObjectID(), page.getGeneration(), page_body);
  push_object(record_id, 0, record.unparseResolved());
  push_object(field_id, 0,
              "<< /FT /Sig /T (copy) /V " + std::to_string(record_id) +
                " 0 R >>");
  push_object(acroform.getObjectID(), acroform.getGeneration(),
              "<< /Fields [ " + std::to_string(field_id) +
                " 0 R ] /SigFlags 3 >>");

  const size_t xref_offset = res.size();
  std::ostringstream builder;
  builder << "xref\n0 1\n0000000000 65535 f \n";
  for (const auto &entry : entries) {
    builder << entry.id << " 1\n"
            << std::setw(10) << std::setfill('0') << entry.offset << " "
            << std::setw(5) << std::setfill('0') << entry.gen << " n \n";
  }
  builder << "trailer\n<< /Size " << next_id + 3 << " /Root "
          << root.getObjectID() << " " << root.getGeneration()
          << " R /Prev " << prev_xref.value() << " >>\nstartxref\n"
          << xref_offset << "\n%%EOF\n";
  const std::string tail = builder.str();
  std::copy(tail.cbegin(), tail.cend(), std::back_inserter(res));
  return res;
}

std::string FirstPageText(const BytesVector &data) {
  auto qpdf = OpenInQpdf(data);
  auto stream_data =
    qpdf->getAllPages().at(0).getKey("/Contents").getStreamData();
  return {reinterpret_cast<const char *>(stream_data->getBuffer()),
          stream_data->getSize()};
}

} // namespace

TEST_CASE("Sign and verify") {
  const auto xref_stream = GENERATE(false, true);
  const auto original = MakeTestPdf("Hello pdfseal", xref_stream);
  const auto signed_doc = SignTestDoc(original, "  Alice  ", "For review");

  SECTION("Prefix is untouched") {
    REQUIRE(signed_doc.signed_data.size() > original.size());
    REQUIRE(std::equal(original.cbegin(), original.cend(),
                       signed_doc.signed_data.cbegin()));
  }
  SECTION("Record") {
    const auto &record = signed_doc.record;
    REQUIRE(record.signer_name == "Alice");
    REQUIRE(record.extra == "For review");
    REQUIRE(record.timestamp == kFixedTime);
    REQUIRE(record.canonical_length == original.size());
    REQUIRE(record.content_digest.size() == 32);
    REQUIRE(record.key_id == TestKeyStore().Snapshot()->key_id);
    REQUIRE(record.signature.size() == 256);
  }
  SECTION("Valid") {
    const auto res = VerifyTestDoc(signed_doc.signed_data);
    REQUIRE(res.status == VerifyStatus::kValid);
    REQUIRE(res.is_signed);
    REQUIRE(res.message == "valid");
    REQUIRE(res.record);
    REQUIRE(res.record->signer_name == "Alice");
    REQUIRE(res.record->extra == "For review");
    REQUIRE(res.record->timestamp == kFixedTime);
    REQUIRE(res.record->signature == signed_doc.record.signature);
  }
  SECTION("Output opens in qpdf") {
    auto qpdf = OpenInQpdf(signed_doc.signed_data);
    auto pages = qpdf->getAllPages();
    REQUIRE(pages.size() == 1);
    auto annots = pages[0].getKey(kTagAnnots);
    REQUIRE(annots.isArray());
    REQUIRE(annots.getArrayNItems() == 1);
    auto widget = annots.getArrayItem(0);
    REQUIRE(widget.getKey(kTagFT).getName() == kTagSig);
    REQUIRE(widget.getKey(kTagT).getUTF8Value().find(kSigFieldNamePrefix) ==
            0);
    auto sig_value = widget.getKey(kTagV);
    REQUIRE(sig_value.getKey(kTagFilter).getName() == kPdfSealFilter);
    REQUIRE(sig_value.getKey(kTagSubFilter).getName() == kPdfSealSubFilter);
    REQUIRE(sig_value.getKey(kTagM).getStringValue() == "D:20261019100000Z");
    auto appearance = widget.getKey(kTagAP).getKey(kTagN);
    REQUIRE(appearance.isStream());
    auto fields = qpdf->getRoot().getKey(kTagAcroForm).getKey(kTagFields);
    REQUIRE(fields.getArrayNItems() == 1);
    REQUIRE(fields.getArrayItem(0).getObjectID() == widget.getObjectID());
    // the kind of cross-reference is kept
    const bool is_xref_stream =
      qpdf->getTrailer().hasKey(kTagType) &&
      qpdf->getTrailer().getKey(kTagType).getName() == kTagXref;
    REQUIRE(is_xref_stream == xref_stream);
  }
  SECTION("Canonical range") {
    const auto range = ComputeRange(signed_doc.signed_data);
    REQUIRE(range.has_record);
    REQUIRE(range.canonical_length == original.size());
    REQUIRE(range.ranges.size() == 1);
    REQUIRE(range.ranges[0].first == 0);
    REQUIRE(range.ranges[0].second == original.size());
    REQUIRE(range.record_offset);
    REQUIRE(range.record_offset.value() > original.size());
    REQUIRE_FALSE(range.modified_after_signing);
  }
}

TEST_CASE("Not signed") {
  const auto original = MakeTestPdf("Hello pdfseal");
  const auto range = ComputeRange(original);
  REQUIRE_FALSE(range.has_record);
  REQUIRE(range.canonical_length == original.size());
  REQUIRE(range.ranges == pdfseal::RangesVector{{0, original.size()}});
  const auto res = VerifyTestDoc(original);
  REQUIRE(res.status == VerifyStatus::kNotSigned);
  REQUIRE_FALSE(res.is_signed);
  REQUIRE_FALSE(res.record);
  REQUIRE(res.message == "not signed");
  // no key is needed for an unsigned document
  const pdfseal::crypto::KeyStore empty_store;
  REQUIRE(Verifier(empty_store).Verify(original).status ==
          VerifyStatus::kNotSigned);
}

TEST_CASE("Tampered content") {
  const auto xref_stream = GENERATE(false, true);
  const auto original = MakeTestPdf("Hello pdfseal", xref_stream);
  auto signed_data = SignTestDoc(original, "Alice").signed_data;
  ReplaceText(signed_data, "Hello pdfseal", "Jello pdfseal");
  const auto res = VerifyTestDoc(signed_data);
  REQUIRE(res.status == VerifyStatus::kSignatureMismatch);
  REQUIRE_FALSE(res.is_signed);
  REQUIRE(res.message == "signature does not match content");
  REQUIRE(res.record);
  REQUIRE(res.record->signer_name == "Alice");
}

TEST_CASE("Tampered record") {
  const auto original = MakeTestPdf("Hello pdfseal");
  auto signed_data = SignTestDoc(original, "Alice").signed_data;
  SECTION("Signer name") {
    // PDFDocEncoding hex of "Alice"
    ReplaceText(signed_data, "416c696365", "416c696366", original.size());
    const auto res = VerifyTestDoc(signed_data);
    REQUIRE(res.status == VerifyStatus::kSignatureMismatch);
    REQUIRE(res.record->signer_name == "Alicf");
  }
  SECTION("Signing time") {
    ReplaceText(signed_data, "(2026-10-19T10:00:00Z)",
                "(2026-10-19T11:00:00Z)", original.size());
    REQUIRE(VerifyTestDoc(signed_data).status ==
            VerifyStatus::kSignatureMismatch);
  }
  SECTION("Digest method") {
    ReplaceText(signed_data, "/DigestMethod /SHA256",
                "/DigestMethod /SHA999", original.size());
    const auto res = VerifyTestDoc(signed_data);
    REQUIRE(res.status == VerifyStatus::kRecordCorrupt);
    REQUIRE(res.message == "signature record corrupt");
    REQUIRE_FALSE(res.record);
  }
  SECTION("Declared offset") {
    const std::string declared =
      "/ByteRange [ 0 " + std::to_string(original.size()) + " ]";
    const std::string zeros =
      "/ByteRange [ 0 " + std::string(std::to_string(original.size()).size(), '0') +
      " ]";
    ReplaceText(signed_data, declared, zeros, original.size());
    REQUIRE_THROWS_AS(ComputeRange(signed_data),
                      pdfseal::CorruptSignatureLocationError);
    const auto res = VerifyTestDoc(signed_data);
    REQUIRE(res.status == VerifyStatus::kRecordCorrupt);
    REQUIRE_FALSE(res.record);
    REQUIRE_THROWS_AS(SignTestDoc(signed_data, "Bob"),
                      pdfseal::CorruptSignatureLocationError);
  }
}

TEST_CASE("Declared offset past the end") {
  const auto original = MakeTestPdf("Hello pdfseal");
  auto signed_data = SignTestDoc(original, "Alice").signed_data;
  const std::string declared = std::to_string(original.size());
  // the same width, bigger than the signed document
  const std::string bigger(declared.size() + 1, '9');
  const std::string from = "/ByteRange [ 0 " + declared + " ]";
  const std::string to = "/ByteRange [ 0 " + bigger + "]";
  ReplaceText(signed_data, from, to, original.size());
  REQUIRE_THROWS_AS(ComputeRange(signed_data),
                    pdfseal::CorruptSignatureLocationError);
  REQUIRE(VerifyTestDoc(signed_data).status == VerifyStatus::kRecordCorrupt);
}

TEST_CASE("Modified after signing") {
  const auto original = MakeTestPdf("Hello pdfseal");
  auto signed_data = SignTestDoc(original, "Alice").signed_data;
  SECTION("Whitespace is ignored") {
    signed_data.push_back('\n');
    signed_data.push_back(' ');
    REQUIRE(VerifyTestDoc(signed_data).status == VerifyStatus::kValid);
  }
  SECTION("Appended bytes") {
    const std::string tail = "% appended comment\n";
    std::copy(tail.cbegin(), tail.cend(), std::back_inserter(signed_data));
    REQUIRE(ComputeRange(signed_data).modified_after_signing);
    const auto res = VerifyTestDoc(signed_data);
    REQUIRE(res.status == VerifyStatus::kModifiedAfterSigning);
    REQUIRE_FALSE(res.is_signed);
    REQUIRE(res.message == "document modified after signing");
    REQUIRE(res.record);
  }
}

TEST_CASE("Update appended after the signing update") {
  const auto xref_stream = GENERATE(false, true);
  const auto original = MakeTestPdf("Hello pdfseal", xref_stream);
  const auto signed_data = SignTestDoc(original, "Alice").signed_data;
  auto forged = AppendForgedUpdate(signed_data);
  REQUIRE(FirstPageText(forged).find("Forged") != std::string::npos);

  SECTION("Two updates") {
    REQUIRE(ComputeRange(forged).modified_after_signing);
    const auto res = VerifyTestDoc(forged);
    REQUIRE(res.status == VerifyStatus::kModifiedAfterSigning);
    REQUIRE_FALSE(res.is_signed);
    REQUIRE(res.record);
    REQUIRE(res.record->signer_name == "Alice");
  }
  SECTION("One %%EOF left") {
    // blank out the %%EOF of the signing update
    const size_t pos = FindText(forged, kEof, original.size());
    REQUIRE(pos != std::string::npos);
    REQUIRE(FindText(forged, kEof, pos + 1) != std::string::npos);
    ReplaceText(forged, kEof, "     ", pos);
    REQUIRE(FirstPageText(forged).find("Forged") != std::string::npos);
    REQUIRE(ComputeRange(forged).modified_after_signing);
    REQUIRE(VerifyTestDoc(forged).status ==
            VerifyStatus::kModifiedAfterSigning);
  }
}

TEST_CASE("No startxref") {
  auto data = MakeTestPdf("Hello pdfseal");
  const std::string keyword = kStartXref;
  ReplaceText(data, keyword, std::string(keyword.size(), ' '));
  REQUIRE(FindText(data, kStartXref) == std::string::npos);
  REQUIRE_THROWS_AS(ComputeRange(data), pdfseal::UnparsableDocumentError);
  REQUIRE_THROWS_AS(VerifyTestDoc(data), pdfseal::UnparsableDocumentError);
  REQUIRE_THROWS_AS(SignTestDoc(data, "Alice"),
                    pdfseal::UnparsableDocumentError);
}

TEST_CASE("Any damage to the signed bytes is detected") {
  const auto xref_stream = GENERATE(false, true);
  const auto original = MakeTestPdf("Hello pdfseal", xref_stream);
  const auto signed_data = SignTestDoc(original, "Alice").signed_data;
  const size_t size = original.size();
  // every 7th byte and the whole xref, trailer and startxref area
  constexpr size_t kStep = 7;
  constexpr size_t kTail = 512;
  std::vector<size_t> positions;
  for (size_t pos = 0; pos < size; pos += kStep) {
    positions.push_back(pos);
  }
  for (size_t pos = size > kTail ? size - kTail : 0; pos < size; ++pos) {
    if (pos % kStep != 0) {
      positions.push_back(pos);
    }
  }
  size_t verified = 0;
  for (const size_t pos : positions) {
    auto damaged = signed_data;
    damaged[pos] = static_cast<unsigned char>(damaged[pos] ^ 0x01U);
    VerificationResult res;
    try {
      res = VerifyTestDoc(damaged);
    } catch (const pdfseal::UnparsableDocumentError &) {
      // a broken xref may leave nothing to read
      continue;
    }
    INFO("flipped byte " << pos);
    REQUIRE(res.status != VerifyStatus::kValid);
    REQUIRE_FALSE(res.is_signed);
    if (res.status != VerifyStatus::kRecordCorrupt) {
      REQUIRE(res.record);
    }
    ++verified;
  }
  REQUIRE(verified > 0);
}

TEST_CASE("Re-signing replaces the signature") {
  const auto original = MakeTestPdf("Hello pdfseal");
  const auto first = SignTestDoc(original, "Alice", "first");
  const auto second = SignTestDoc(first.signed_data, "Bob", "second");
  REQUIRE(second.record.canonical_length == original.size());
  REQUIRE(std::equal(original.cbegin(), original.cend(),
                     second.signed_data.cbegin()));
  // the previous update is gone
  REQUIRE(FindText(second.signed_data, QUtil::hex_encode("first"),
                   original.size()) == std::string::npos);
  const auto res = VerifyTestDoc(second.signed_data);
  REQUIRE(res.status == VerifyStatus::kValid);
  REQUIRE(res.record->signer_name == "Bob");
  REQUIRE(res.record->extra == "second");
  Pdf pdf;
  pdf.Open(second.signed_data);
  REQUIRE(pdf.FindSignatures());
  REQUIRE(pdf.GetSignatures().size() == 1);
  // modified after the first signing, the changes are dropped
  auto modified = first.signed_data;
  const std::string tail = "% appended\n";
  std::copy(tail.cbegin(), tail.cend(), std::back_inserter(modified));
  const auto third = SignTestDoc(modified, "Carol");
  REQUIRE(VerifyTestDoc(third.signed_data).status == VerifyStatus::kValid);
  REQUIRE(FindText(third.signed_data, "% appended") == std::string::npos);
}

TEST_CASE("Keys") {
  const auto original = MakeTestPdf("Hello pdfseal");
  const auto signed_data = SignTestDoc(original, "Alice").signed_data;
  SECTION("Different key") {
    const Verifier verifier(OtherKeyStore());
    const auto res = verifier.Verify(signed_data);
    REQUIRE(res.status == VerifyStatus::kKeyMismatch);
    REQUIRE(res.message == "signed with a different key");
    REQUIRE(res.record);
  }
  SECTION("No key") {
    const pdfseal::crypto::KeyStore empty_store;
    REQUIRE_THROWS_AS(Verifier(empty_store).Verify(signed_data),
                      pdfseal::NoKeyLoadedError);
    REQUIRE_THROWS_AS(Signer(empty_store).Sign(original, "Alice", ""),
                      pdfseal::NoKeyLoadedError);
  }
}

TEST_CASE("Invalid input") {
  const auto original = MakeTestPdf("Hello pdfseal");
  REQUIRE_THROWS_AS(SignTestDoc(original, ""), pdfseal::InvalidInputError);
  REQUIRE_THROWS_AS(SignTestDoc(original, " \t\n"),
                    pdfseal::InvalidInputError);
  const std::string garbage = "%PDF-1.7 nothing else";
  const BytesVector garbage_data(garbage.cbegin(), garbage.cend());
  REQUIRE_THROWS_AS(SignTestDoc(garbage_data, "Alice"),
                    pdfseal::UnparsableDocumentError);
  REQUIRE_THROWS_AS(VerifyTestDoc(garbage_data),
                    pdfseal::UnparsableDocumentError);
  REQUIRE_THROWS_AS(VerifyTestDoc({}), pdfseal::UnparsableDocumentError);
}

TEST_CASE("Unusable algorithms") {
  const auto original = MakeTestPdf("Hello pdfseal");
  SECTION("Digest") {
    SignOptions options;
    options.digest = static_cast<pdfseal::crypto::DigestAlgorithm>(42);
    REQUIRE_THROWS_AS(SignTestDoc(original, "Alice", "", options),
                      pdfseal::InvalidInputError);
  }
  SECTION("Signature") {
    SignOptions options;
    options.signature = static_cast<pdfseal::crypto::SignatureAlgorithm>(42);
    REQUIRE_THROWS_AS(SignTestDoc(original, "Alice", "", options),
                      pdfseal::InvalidInputError);
  }
  SECTION("Clock failure") {
    Signer signer(TestKeyStore());
    signer.SetClock([]() -> std::chrono::system_clock::time_point {
      throw std::runtime_error("clock failure");
    });
    REQUIRE_THROWS_AS(signer.Sign(original, "Alice", ""),
                      pdfseal::InvalidInputError);
  }
}

TEST_CASE("Sign options") {
  const auto original = MakeTestPdf("Hello pdfseal");
  SECTION("PKCS1 and SHA-512") {
    SignOptions options;
    options.digest = pdfseal::crypto::DigestAlgorithm::kSha512;
    options.signature = pdfseal::crypto::SignatureAlgorithm::kRsaPkcs1v15;
    const auto signed_doc = SignTestDoc(original, "Alice", "", options);
    REQUIRE(signed_doc.record.content_digest.size() == 64);
    const auto res = VerifyTestDoc(signed_doc.signed_data);
    REQUIRE(res.status == VerifyStatus::kValid);
    REQUIRE(res.record->digest_algo == options.digest);
    REQUIRE(res.record->sig_algo == options.signature);
    REQUIRE(FindText(signed_doc.signed_data, "/RSASSA-PKCS1-v1_5") !=
            std::string::npos);
  }
  SECTION("No watermark") {
    SignOptions options;
    options.watermark = false;
    const auto signed_doc = SignTestDoc(original, "Alice", "", options);
    REQUIRE(VerifyTestDoc(signed_doc.signed_data).status ==
            VerifyStatus::kValid);
    auto qpdf = OpenInQpdf(signed_doc.signed_data);
    auto widget = qpdf->getAllPages()[0].getKey(kTagAnnots).getArrayItem(0);
    REQUIRE_FALSE(widget.hasKey(kTagAP));
    REQUIRE(FindText(signed_doc.signed_data, "/Helvetica", original.size()) ==
            std::string::npos);
  }
  SECTION("Watermark text") {
    const auto signed_doc = SignTestDoc(original, "Alice", "");
    auto qpdf = OpenInQpdf(signed_doc.signed_data);
    auto widget = qpdf->getAllPages()[0].getKey(kTagAnnots).getArrayItem(0);
    auto appearance = widget.getKey(kTagAP).getKey(kTagN);
    auto stream_data = appearance.getStreamData();
    const std::string content(
      reinterpret_cast<const char *>(stream_data->getBuffer()),
      stream_data->getSize());
    REQUIRE(content.find(QUtil::hex_encode("Digitally signed by Alice")) !=
            std::string::npos);
    REQUIRE(content.find(QUtil::hex_encode(kFixedTime)) != std::string::npos);
    const std::string fingerprint =
      "SHA256: " +
      pdfseal::VecBytesStringRepresentation(signed_doc.record.content_digest)
        .substr(0, 16);
    REQUIRE(content.find(QUtil::hex_encode(fingerprint)) != std::string::npos);
    auto font = appearance.getDict()
                  .getKey(kTagResources)
                  .getKey(kTagFont)
                  .getKey(kWatermarkFontTag);
    REQUIRE(font.getKey(kTagBaseFont).getName() == kWatermarkBaseFont);
  }
}

TEST_CASE("Existing page structures") {
  SECTION("Annotations are kept") {
    const auto original = MakeTestPdf(
      "Hello pdfseal", false,
      "/Annots [ << /Type /Annot /Subtype /Text /Rect [ 0 0 10 10 ] >> ]");
    const auto signed_doc = SignTestDoc(original, "Alice");
    auto qpdf = OpenInQpdf(signed_doc.signed_data);
    auto annots = qpdf->getAllPages()[0].getKey(kTagAnnots);
    REQUIRE(annots.getArrayNItems() == 2);
    REQUIRE(annots.getArrayItem(0).getKey(kTagSubType).getName() == "/Text");
    REQUIRE(VerifyTestDoc(signed_doc.signed_data).status ==
            VerifyStatus::kValid);
  }
  SECTION("Crop box") {
    const auto original =
      MakeTestPdf("Hello pdfseal", false, "/CropBox [ 50 50 562 742 ]");
    const auto signed_doc = SignTestDoc(original, "Alice");
    auto qpdf = OpenInQpdf(signed_doc.signed_data);
    auto rect = qpdf->getAllPages()[0]
                  .getKey(kTagAnnots)
                  .getArrayItem(0)
                  .getKey(kTagRect)
                  .getArrayAsRectangle();
    REQUIRE(rect.llx == Approx(60));
    REQUIRE(rect.ury == Approx(732));
  }
}

TEST_CASE("Existing AcroForm") {
  QPDF qpdf;
  qpdf.emptyPDF();
  auto page = qpdf.makeIndirectObject(
    QPDFObjectHandle::parse("<< /Type /Page /MediaBox [ 0 0 300 300 ] >>"));
  QPDFPageDocumentHelper(qpdf).addPage(page, false);
  auto text_field = qpdf.makeIndirectObject(
    QPDFObjectHandle::parse("<< /FT /Tx /T (comment) >>"));
  auto fields = QPDFObjectHandle::newArray();
  fields.appendItem(text_field);
  const bool indirect = GENERATE(false, true);
  auto acroform = QPDFObjectHandle::newDictionary();
  acroform.replaceKey(kTagFields, fields);
  acroform.replaceKey("/DA", QPDFObjectHandle::newString("/Helv 0 Tf 0 g"));
  if (indirect) {
    acroform = qpdf.makeIndirectObject(acroform);
  }
  qpdf.getRoot().replaceKey(kTagAcroForm, acroform);
  const auto original = pdfseal::pdf::test::WriteTestPdf(qpdf, false);

  const auto signed_doc = SignTestDoc(original, "Alice");
  REQUIRE(VerifyTestDoc(signed_doc.signed_data).status ==
          VerifyStatus::kValid);
  auto signed_qpdf = OpenInQpdf(signed_doc.signed_data);
  auto new_acroform = signed_qpdf->getRoot().getKey(kTagAcroForm);
  REQUIRE(new_acroform.isIndirect());
  REQUIRE(new_acroform.getKey("/DA").getStringValue() == "/Helv 0 Tf 0 g");
  auto new_fields = new_acroform.getKey(kTagFields);
  REQUIRE(new_fields.getArrayNItems() == 2);
  REQUIRE(new_fields.getArrayItem(0).getKey(kTagT).getUTF8Value() ==
          "comment");
  if (indirect) {
    auto orig_qpdf = OpenInQpdf(original);
    REQUIRE(new_acroform.getObjectID() ==
            orig_qpdf->getRoot().getKey(kTagAcroForm).getObjectID());
  }
}
