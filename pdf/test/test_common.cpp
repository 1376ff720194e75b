/* File: test_common.cpp
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

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "acro_form.hpp"
#include "common_defs.hpp"
#include "cross_ref_stream.hpp"
#include "errors.hpp"
#include "font_obj.hpp"
#include "form_x_object.hpp"
#include "pdf.hpp"
#include "pdf_utils.hpp"
#include "sig_field.hpp"
#include "test_documents.hpp"
#include "watermark.hpp"

#ifndef TEST_DIR
#define TEST_DIR "/tmp/"
#endif

using namespace pdfseal::pdf;
using pdfseal::pdf::test::MakeTestPdf;

TEST_CASE("Test reading file") {
  const std::string kTestDir(TEST_DIR);
  SECTION("Test FileToVector") {
    constexpr const char *const kTestFile = "test_file1";
    const std::string kFile1full(kTestDir + kTestFile);
    REQUIRE(FileToVector("") == std::nullopt);
    REQUIRE(FileToVector("/var/sadl/ff") == std::nullopt);
    std::ofstream testfile(kFile1full, std::ios::out | std::ios::trunc);
    REQUIRE(testfile.is_open());
    auto res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->empty()));
    for (int i = 0; i < 1024; ++i) {
      testfile.write("\1", 1);
    }
    testfile.flush();
    res = FileToVector(kFile1full);
    REQUIRE((res.has_value() && res->size() == 1024));
    testfile.close();
    std::filesystem::remove(kFile1full);
  }
  SECTION("Test WriteFile") {
    const std::string path = kTestDir + "test_write_file";
    const BytesVector data{'%', 'P', 'D', 'F', 0x00, 0xFF};
    namespace fs = std::filesystem;
    WriteFile(path, data, fs::perms::owner_read | fs::perms::owner_write);
    REQUIRE(FileToVector(path) == data);
    REQUIRE((fs::status(path).permissions() & fs::perms::others_read) ==
            fs::perms::none);
    // overwrite
    WriteFile(path, {'1'}, fs::perms::owner_read | fs::perms::owner_write);
    REQUIRE(FileToVector(path)->size() == 1);
    fs::remove(path);
    REQUIRE_THROWS(WriteFile("", data, fs::perms::owner_read));
  }
}

TEST_CASE("BBox") {
  SECTION("DoubleToString") {
    REQUIRE(DoubleToString10(0) == "0");
    REQUIRE(DoubleToString10(-0.000000) == "0");
    REQUIRE(DoubleToString10(-0.0000000001) == "-0.0000000001");
    REQUIRE(DoubleToString10(-0.00000000001000100000) == "0");
    REQUIRE(DoubleToString10(12.5) == "12.5");
  }
  const BBox bbox{{0, 0.000003434121212}, {255, 100.124324454664654}};
  REQUIRE(bbox.ToString() == "[ 0 0.0000034341 255 100.1243244547 ]");
  REQUIRE(bbox.Width() == 255);
}

TEST_CASE("XRefEntry") {
  const XRefEntry entry{{12, 0}, 1234, 0};
  REQUIRE(entry.ToString() == "0000001234 00000 n \n");
  REQUIRE(entry.ToString().size() == 20);
  const XRefEntry entry_gen{{12, 3}, 5, 3};
  REQUIRE(entry_gen.ToString() == "0000000005 00003 n \n");
}

TEST_CASE("XrefRawTable") {
  const std::vector<XRefEntry> src{
    {{10, 0}, 1010, 0}, {{11, 0}, 1111, 0}, {{4, 0}, 44, 0}};
  const std::string expected =
    "xref\n"
    "0 1\n0000000000 65535 f\r\n"
    "4 1\n0000000044 00000 n \n"
    "10 2\n0000001010 00000 n \n0000001111 00000 n \n";
  REQUIRE(BuildXrefRawTable(src) == expected);
}

TEST_CASE("XrefStreamSections") {
  SECTION("Normal") {
    std::vector<XRefEntry> src{
      {{10, 0}, 1010}, {{11, 0}, 1111}, {{12, 0}, 1212}, {{30, 0}, 3030},
      {{31, 0}, 3131}, {{32, 0}, 3232}, {{40, 0}, 4040}, {{5, 0}, 55}};
    auto res = BuildXRefStreamSections(src);
    const std::vector<std::pair<int, int>> expected = {
      {5, 1}, {10, 3}, {30, 3}, {40, 1}};
    REQUIRE(res == expected);
  }
  SECTION("Empty") {
    std::vector<XRefEntry> src;
    REQUIRE(BuildXRefStreamSections(src).empty());
  }
  SECTION("Duplicates") {
    std::vector<XRefEntry> src{
      {{10, 0}, 1010}, {{10, 0}, 1111}, {{12, 0}, 1212}, {{5, 0}, 55}};
    REQUIRE_THROWS(BuildXRefStreamSections(src));
  }
}

TEST_CASE("CrossRefStream") {
  CrossRefStream crs;
  crs.id = {7, 0};
  crs.size_val = 8;
  crs.entries = {{{5, 0}, 0x0102, 0}, {{7, 0}, 0x01020304, 0}};
  crs.index_vec = {{5, 1}, {7, 1}};
  crs.prev_val = "100";
  crs.root_id = "1 0 R";
  const BytesVector raw = crs.ToRawData();
  const std::string raw_str(raw.cbegin(), raw.cend());
  REQUIRE(raw_str.find("/Index [ 5 1 7 1 ]") != std::string::npos);
  REQUIRE(raw_str.find("/W [ 1 4 2 ]") != std::string::npos);
  REQUIRE(raw_str.find("/Length 14") != std::string::npos);
  const std::string stream_start = "stream\n";
  const size_t data_pos = raw_str.find(stream_start) + stream_start.size();
  const BytesVector expected{1, 0, 0, 1, 2, 0, 0, 1, 1, 2, 3, 4, 0, 0};
  REQUIRE(BytesVector(raw.cbegin() + static_cast<std::ptrdiff_t>(data_pos),
                      raw.cbegin() + static_cast<std::ptrdiff_t>(data_pos) +
                        14) == expected);
  crs.entries.push_back({{9, 0}, 0x100000000ULL, 0});
  REQUIRE_THROWS(crs.ToRawData());
}

TEST_CASE("Acroform") {
  AcroForm acr;
  acr.fields.push_back({});
  const std::string expected =
    "0 0 obj\n"
    "<<\n"
    "/Fields [ 0 0 R ]\n"
    "/SigFlags 3\n"
    ">>\n"
    "endobj\n";
  REQUIRE(acr.ToString() == expected);
}

TEST_CASE("SigField") {
  SigField sigf;
  sigf.id = {12, 0};
  sigf.parent = {3, 0};
  sigf.value = {11, 0};
  sigf.name = "sig";
  SECTION("Without appearance") {
    const std::string res = sigf.ToString();
    REQUIRE(res.find("12 0 obj\n") == 0);
    REQUIRE(res.find("/FT /Sig\n") != std::string::npos);
    REQUIRE(res.find("/Subtype /Widget\n") != std::string::npos);
    REQUIRE(res.find("/P 3 0 R\n") != std::string::npos);
    REQUIRE(res.find("/V 11 0 R\n") != std::string::npos);
    REQUIRE(res.find("/AP") == std::string::npos);
    // hex text string
    REQUIRE(res.find("/T <") != std::string::npos);
  }
  SECTION("With appearance") {
    sigf.appearance_ref = ObjRawId{13, 0};
    REQUIRE(sigf.ToString().find("/AP << /N 13 0 R >>") != std::string::npos);
  }
}

TEST_CASE("FontObj") {
  FontObj font;
  font.id = {4, 0};
  const std::string expected =
    "4 0 obj\n"
    "<<\n"
    "/Type /Font\n"
    "/Subtype /Type1\n"
    "/BaseFont /Helvetica\n"
    "/Encoding /WinAnsiEncoding\n"
    ">>\n"
    "endobj\n";
  REQUIRE(font.ToString() == expected);
}

TEST_CASE("FormXObject") {
  FormXObject xobj;
  xobj.id = {5, 0};
  xobj.font_ref = {4, 0};
  xobj.bbox.right_top = {100, 20};
  xobj.content = "q Q";
  const std::string expected =
    "5 0 obj\n"
    "<<\n"
    "/Length 3\n"
    "/Type /XObject\n"
    "/Subtype /Form\n"
    "/BBox [ 0 0 100 20 ]\n"
    "/FormType 1\n"
    "/Resources << /Font << /FWM 4 0 R >> >>\n"
    ">>\n"
    "stream\n"
    "q Q\n"
    "endstream\n"
    "endobj\n";
  REQUIRE(xobj.ToString() == expected);
}

TEST_CASE("Watermark") {
  const pdfseal::BytesVector digest(32, 0xAB);
  SECTION("Lines") {
    auto lines =
      WatermarkLines("Alice", "2026-10-19T10:00:00Z", "line1\r\nline2",
                     pdfseal::crypto::DigestAlgorithm::kSha256, digest);
    const std::vector<std::string> expected{
      "Digitally signed by Alice", "2026-10-19T10:00:00Z", "line1", "line2",
      "SHA256: abababababababab"};
    REQUIRE(lines == expected);
    lines = WatermarkLines("Alice", "2026-10-19T10:00:00Z", "",
                           pdfseal::crypto::DigestAlgorithm::kSha512, digest);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines.back() == "SHA512: abababababababab");
  }
  SECTION("Layout") {
    const BBox page{{0, 0}, {612, 792}};
    auto layout = LayoutWatermark({"abc", "abcdef"}, page, {0, 0});
    REQUIRE(layout);
    REQUIRE(layout->bbox.Height() == 2 * 10 + 2 * 4);
    REQUIRE(layout->bbox.Width() > 6 * 0.62 * 8);
    REQUIRE(layout->rect.left_bottom.x == 10);
    REQUIRE(layout->rect.right_top.y == 782);
    REQUIRE(layout->rect.Width() == layout->bbox.Width());
    // crop box offset
    layout = LayoutWatermark({"abc"}, {{0, 0}, {512, 692}}, {50, 50});
    REQUIRE(layout);
    REQUIRE(layout->rect.left_bottom.x == 60);
    REQUIRE(layout->rect.right_top.y == 732);
  }
  SECTION("Long lines are clamped") {
    const BBox page{{0, 0}, {100, 100}};
    auto layout = LayoutWatermark({std::string(200, 'x')}, page, {0, 0});
    REQUIRE(layout);
    REQUIRE(layout->bbox.Width() == 80);
  }
  SECTION("Tiny page") {
    REQUIRE_FALSE(LayoutWatermark({"abc"}, {{0, 0}, {20, 20}}, {0, 0}));
  }
  SECTION("Content stream") {
    auto layout = LayoutWatermark({"Ab", "\xd0\x96"}, {{0, 0}, {612, 792}},
                                  {0, 0});
    REQUIRE(layout);
    // unrepresentable in WinAnsi
    REQUIRE(layout->lines[1] == "?");
    const std::string content = WatermarkContentStream(*layout);
    REQUIRE(content.find("/FWM 8 Tf") != std::string::npos);
    REQUIRE(content.find("<4162> Tj") != std::string::npos);
    REQUIRE(content.find("T*\n<3f> Tj") != std::string::npos);
    REQUIRE(content.find(" re\nS") != std::string::npos);
  }
}

TEST_CASE("Pdf open") {
  SECTION("Empty") {
    Pdf pdf;
    REQUIRE_THROWS_AS(pdf.Open(BytesVector{}),
                      pdfseal::UnparsableDocumentError);
  }
  SECTION("Garbage") {
    const std::string garbage = "this is not a pdf document at all";
    const BytesVector data(garbage.cbegin(), garbage.cend());
    Pdf pdf;
    REQUIRE_THROWS_AS(pdf.Open(data), pdfseal::UnparsableDocumentError);
    REQUIRE_FALSE(pdf.GetRoot());
  }
  SECTION("Valid") {
    const auto data = MakeTestPdf("Hello");
    Pdf pdf;
    REQUIRE_NOTHROW(pdf.Open(data));
    REQUIRE(pdf.GetRoot());
    REQUIRE(pdf.GetPage(0));
    REQUIRE_FALSE(pdf.GetPage(1));
    REQUIRE_FALSE(pdf.GetAcroform());
    REQUIRE_FALSE(pdf.IsEncrypted());
    REQUIRE_FALSE(pdf.FindSignatures());
    REQUIRE(pdf.Size() == data.size());
  }
}

TEST_CASE("LastID") {
  const auto data = MakeTestPdf("Hello");
  Pdf pdf;
  pdf.Open(data);
  // catalog, pages, font, page, contents
  const ObjRawId last_id = pdf.GetLastObjID();
  REQUIRE(last_id.id == 5);
  REQUIRE(last_id.gen == 0);
}

TEST_CASE("FindXrefOffset") {
  SECTION("Classic") {
    const auto data = MakeTestPdf("Hello");
    auto res = FindXrefOffset(data.data(), data.size());
    REQUIRE(res);
    const size_t offset = std::stoul(res.value());
    REQUIRE(offset < data.size());
    REQUIRE(std::string(data.cbegin() + static_cast<std::ptrdiff_t>(offset),
                        data.cbegin() + static_cast<std::ptrdiff_t>(offset) +
                          4) == "xref");
  }
  SECTION("Stream") {
    const auto data = MakeTestPdf("Hello", true);
    auto res = FindXrefOffset(data.data(), data.size());
    REQUIRE(res);
    REQUIRE(std::stoul(res.value()) < data.size());
  }
  SECTION("Missing") {
    const std::string text = "%PDF-1.7\n1 0 obj\n<<>>\nendobj\n";
    const BytesVector data(text.cbegin(), text.cend());
    REQUIRE_FALSE(FindXrefOffset(data.data(), data.size()));
    REQUIRE_FALSE(FindXrefOffset(nullptr, 0));
  }
}

TEST_CASE("Object offsets") {
  const auto data = MakeTestPdf("Hello");
  Pdf pdf;
  pdf.Open(data);
  auto page = pdf.GetPage(0);
  REQUIRE(page);
  auto offset = pdf.GetObjectOffset(*page);
  REQUIRE(offset);
  const std::string expected =
    ObjRawId::CopyIdFromExisting(*page).ToString();
  REQUIRE(std::string(data.cbegin() + static_cast<std::ptrdiff_t>(*offset),
                      data.cbegin() + static_cast<std::ptrdiff_t>(*offset) +
                        static_cast<std::ptrdiff_t>(expected.size())) ==
          expected);
  // direct objects have no offset
  REQUIRE_FALSE(pdf.GetObjectOffset(QPDFObjectHandle::newInteger(1)));
}

TEST_CASE("Copy acroform") {
  QPDF qpdf;
  qpdf.emptyPDF();
  auto field = qpdf.makeIndirectObject(
    QPDFObjectHandle::parse("<< /FT /Tx /T (name) >>"));
  auto acroform = qpdf.makeIndirectObject(
    QPDFObjectHandle::parse("<< /DA (/Helv 0 Tf 0 g) >>"));
  auto fields = QPDFObjectHandle::newArray();
  fields.appendItem(field);
  fields.appendItem(QPDFObjectHandle::parse("<< /FT /Tx >>"));
  acroform.replaceKey("/Fields", fields);
  auto copy = AcroForm::ShallowCopy(std::make_shared<QPDFObjectHandle>(acroform));
  REQUIRE(copy.id.id == acroform.getObjectID());
  REQUIRE(copy.fields.size() == 1);
  REQUIRE(copy.fields[0].id == field.getObjectID());
  REQUIRE(copy.other_fields_copied.count("/DA") == 1);
  REQUIRE_THROWS(AcroForm::ShallowCopy(nullptr));
}
