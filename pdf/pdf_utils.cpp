/* File: pdf_utils.cpp
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

#include "pdf_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ios>
#include <iterator>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cross_ref_stream.hpp"
#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

namespace {

void AppendString(BytesVector &dest, const std::string &str) {
  std::copy(str.cbegin(), str.cend(), std::back_inserter(dest));
}

std::string FinalInfo(size_t xref_offset) {
  std::string final_info = kStartXref;
  final_info += "\n";
  final_info += std::to_string(xref_offset);
  final_info += "\n";
  final_info += kEof;
  final_info += "\n";
  return final_info;
}

} // namespace

// read file to vector
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept {
  namespace fs = std::filesystem;
  std::error_code err;
  if (path.empty() || !fs::exists(path, err) ||
      !fs::is_regular_file(path, err)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios_base::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  try {
    std::vector<unsigned char> res;
    const auto file_size = fs::file_size(path, err);
    if (!err) {
      res.reserve(file_size);
    }
    std::copy(std::istreambuf_iterator<char>(file),
              std::istreambuf_iterator<char>(), std::back_inserter(res));
    if (file.bad()) {
      return std::nullopt;
    }
    return res;
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[FileToVector] {}", ex.what());
    }
  }
  return std::nullopt;
}

void WriteFile(const std::string &path, const BytesVector &data,
               std::filesystem::perms perms) {
  const std::string func_name = "[WriteFile] ";
  namespace fs = std::filesystem;
  if (path.empty()) {
    throw std::invalid_argument(func_name + "empty path");
  }
  if (fs::exists(path) && !fs::remove(path)) {
    throw std::runtime_error(func_name + "remove file failed " + path);
  }
  {
    const std::ofstream ofile(path, std::ios_base::binary);
    if (!ofile.is_open()) {
      throw std::runtime_error(func_name + "can't create a file " + path);
    }
  }
  fs::permissions(path, perms, fs::perm_options::replace);
  std::ofstream ofile(path, std::ios_base::binary);
  if (!ofile.is_open()) {
    throw std::runtime_error(func_name + "can't open a file " + path);
  }
  if (data.size() > static_cast<size_t>(std::numeric_limits<std::streamsize>::max())) {
    throw std::runtime_error(func_name + "data is too big");
  }
  ofile.write(reinterpret_cast<const char *>(data.data()),  // NOLINT
              static_cast<std::streamsize>(data.size()));
  if (ofile.fail()) {
    throw std::runtime_error(func_name + "error write to file " + path);
  }
}

std::string DoubleToString10(double val) {
  std::ostringstream builder;
  builder << std::setprecision(10) << std::fixed << val;
  std::string res = builder.str();
  res.erase(res.find_last_not_of('0') + 1, std::string::npos);
  if (res.back() == '.') {
    res.pop_back();
  }
  if (res == "-0") {
    res = "0";
  }
  return res;
}

std::optional<BBox> VisiblePageSize(const PtrPdfObjShared &page_obj) noexcept {
  if (!page_obj || page_obj->isNull() || !page_obj->isDictionary() ||
      !page_obj->hasKey(kTagType) ||
      page_obj->getKey(kTagType).getName() != kTagPage) {
    return std::nullopt;
  }
  try {
    QPDFPageObjectHelper page_helper(*page_obj);
    auto media_box = page_helper.getMediaBox();
    if (!media_box.isArray()) {
      return std::nullopt;
    }
    const auto crop_box_rect = page_helper.getCropBox().getArrayAsRectangle();
    BBox res;
    res.right_top.x = crop_box_rect.urx - crop_box_rect.llx;
    res.right_top.y = crop_box_rect.ury - crop_box_rect.lly;
    return res;
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->warn("[VisiblePageSize] {}", ex.what());
    }
  }
  return std::nullopt;
}

std::optional<XYReal> CropBoxOffsetsXY(
  const PtrPdfObjShared &page_obj) noexcept {
  if (!page_obj || page_obj->isNull() || !page_obj->isDictionary() ||
      !page_obj->hasKey(kTagType) ||
      page_obj->getKey(kTagType).getName() != kTagPage) {
    return std::nullopt;
  }
  try {
    QPDFPageObjectHelper page_helper(*page_obj);
    const auto crop_box_rect = page_helper.getCropBox().getArrayAsRectangle();
    return XYReal{crop_box_rect.llx, crop_box_rect.lly};
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->warn("[CropBoxOffsetsXY] {}", ex.what());
    }
  }
  return std::nullopt;
}

std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict) {
  if (!dict.isDictionary()) {
    return {};
  }
  std::map<std::string, std::string> unparsed_map;
  for (auto &pair_val : dict.getDictAsMap()) {
    unparsed_map[pair_val.first] = pair_val.second.unparse();
  }
  return unparsed_map;
}

std::string UnparsedMapToString(const std::map<std::string, std::string> &map) {
  std::ostringstream builder;
  for (const auto &pair : map) {
    builder << pair.first << " " << pair.second << "\n";
  }
  return builder.str();
}

std::string BuildXrefRawTable(const std::vector<XRefEntry> &entries) {
  auto entries_cp = entries;
  std::sort(entries_cp.begin(), entries_cp.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  std::ostringstream res;
  // a table of an update always carries the free head entry
  res << kXref << "0 1\n0000000000 65535 f\r\n";
  std::string tmp;
  for (size_t i = 0; i < entries_cp.size(); ++i) {
    // first iteration or sequentinal id
    if (i == 0 || entries_cp[i].id.id == prev + 1) {
      if (counter == 0) {
        start_id = entries_cp[i].id.id;
      }
      tmp.append(entries_cp[i].ToString());
      prev = entries_cp[i].id.id;
      ++counter;
      continue;
    }
    res << start_id << " " << counter << "\n" << tmp;
    counter = 1;
    tmp = entries_cp[i].ToString();
    start_id = entries_cp[i].id.id;
    prev = entries_cp[i].id.id;
  }
  if (counter > 0) {
    res << start_id << " " << counter << "\n" << tmp;
  }
  return res.str();
}

std::vector<std::pair<int, int>> BuildXRefStreamSections(
  std::vector<XRefEntry> &entries) {
  std::vector<std::pair<int, int>> res;
  if (entries.empty()) {
    return res;
  }
  std::sort(entries.begin(), entries.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const int curr_id = entries[i].id.id;
    if (i > 0 && curr_id == prev) {
      throw std::runtime_error("[BuildXRefStreamSections] non unique entries");
    }
    if (i == 0 || curr_id == prev + 1) {
      if (counter == 0) {
        start_id = curr_id;
      }
      ++counter;
      prev = curr_id;
      continue;
    }
    res.emplace_back(start_id, counter);
    counter = 1;
    start_id = curr_id;
    prev = curr_id;
  }
  res.emplace_back(start_id, counter);
  return res;
}

std::optional<std::string> FindXrefOffset(const unsigned char *data,
                                          size_t size) {
  const std::string tag = kStartXref;
  if (data == nullptr || size <= tag.size()) {
    return std::nullopt;
  }
  const auto *const end = data + size;
  const auto r_it = std::find_end(data, end, tag.cbegin(), tag.cend());
  if (r_it == end) {
    return std::nullopt;
  }
  const auto *pos = r_it + tag.size();
  while (pos < end && (*pos == '\r' || *pos == '\n' || *pos == ' ')) {
    ++pos;
  }
  const auto *pos_end = pos;
  while (pos_end < end && std::isdigit(*pos_end) != 0) {
    ++pos_end;
  }
  if (pos_end == pos) {
    return std::nullopt;
  }
  return std::string(pos, pos_end);
}

std::string CreatePageUpdateWithAnnots(const PtrPdfObjShared &p_page_original,
                                       const std::vector<ObjRawId> &annot_ids) {
  std::ostringstream annots_builder;
  annots_builder << "[ ";
  if (p_page_original->hasKey(kTagAnnots) &&
      p_page_original->getKey(kTagAnnots).isArray()) {
    // keep the existing items as they are, both references and direct dicts
    for (auto &item : p_page_original->getKey(kTagAnnots).getArrayAsVector()) {
      annots_builder << item.unparse() << " ";
    }
  }
  for (const auto &ann : annot_ids) {
    annots_builder << ann.ToStringRef() << " ";
  }
  annots_builder << "]";
  auto unparsed_map = DictToUnparsedMap(*p_page_original);
  unparsed_map.insert_or_assign(kTagAnnots, annots_builder.str());

  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*p_page_original).ToString() << " \n"
          << kDictStart << "\n";
  builder << UnparsedMapToString(unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

void CreateCrossRefStream(
  std::map<std::string, std::string> &old_trailer_fields,
  const std::string &prev_x_ref_offset, BytesVector &update_buf,
  size_t update_offset, ObjRawId &last_assigned_id,
  std::vector<XRefEntry> &ref_entries) {
  CrossRefStream crs{};
  crs.id = ++last_assigned_id;
  crs.size_val = crs.id.id + 1;
  const size_t xref_offset = update_offset + update_buf.size();
  // the stream describes itself
  ref_entries.push_back(XRefEntry{crs.id, xref_offset, 0});
  crs.entries = ref_entries;
  crs.index_vec = BuildXRefStreamSections(crs.entries);
  crs.prev_val = prev_x_ref_offset;
  if (old_trailer_fields.count(kTagRoot) == 0) {
    throw std::runtime_error("[CreateCrossRefStream] no /Root in trailer");
  }
  crs.root_id = old_trailer_fields.at(kTagRoot);
  if (old_trailer_fields.count(kTagInfo) > 0) {
    crs.info_id = old_trailer_fields.at(kTagInfo);
  }
  if (old_trailer_fields.count(kTagID) > 0) {
    crs.id_val = old_trailer_fields.at(kTagID);
  }
  if (old_trailer_fields.count(kTagEncrypt) > 0) {
    crs.encrypt = old_trailer_fields.at(kTagEncrypt);
  }
  const auto raw = crs.ToRawData();
  std::copy(raw.cbegin(), raw.cend(), std::back_inserter(update_buf));
  AppendString(update_buf, FinalInfo(xref_offset));
}

void CreateSimpleXref(std::map<std::string, std::string> &old_trailer_fields,
                      const std::string &prev_x_ref_offset,
                      BytesVector &update_buf, size_t update_offset,
                      ObjRawId &last_assigned_id,
                      std::vector<XRefEntry> &ref_entries) {
  old_trailer_fields.insert_or_assign(kTagPrev, prev_x_ref_offset);
  old_trailer_fields.insert_or_assign(kTagSize,
                                      std::to_string(last_assigned_id.id + 1));
  // fields to copy from the old trailer
  {
    const std::set<std::string> trailer_possible_fields{
      kTagSize, kTagPrev, kTagRoot, kTagEncrypt, kTagInfo, kTagID};
    std::map<std::string, std::string> tmp_trailer;
    std::copy_if(old_trailer_fields.cbegin(), old_trailer_fields.cend(),
                 std::inserter(tmp_trailer, tmp_trailer.end()),
                 [&trailer_possible_fields](
                   const std::pair<std::string, std::string> &pair_val) {
                   return trailer_possible_fields.count(pair_val.first) > 0;
                 });
    std::swap(old_trailer_fields, tmp_trailer);
  }
  std::string raw_trailer = "trailer\n<<\n";
  raw_trailer += UnparsedMapToString(old_trailer_fields);
  raw_trailer += ">>\n";
  const size_t xref_offset = update_offset + update_buf.size();
  AppendString(update_buf, BuildXrefRawTable(ref_entries));
  AppendString(update_buf, raw_trailer);
  AppendString(update_buf, FinalInfo(xref_offset));
}

} // namespace pdfseal::pdf
