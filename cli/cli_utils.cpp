/* File: cli_utils.cpp
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

#include "cli_utils.hpp"

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/json.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iostream>
#include <optional>
#include <string>

#include "errors.hpp"
#include "key_file.hpp"
#include "pdf_utils.hpp"
#include "tr.hpp"

namespace pdfseal::cli {

namespace {

std::optional<std::string> ReadTextFile(
  const std::string& path, const std::shared_ptr<spdlog::logger>& log) {
  auto data = pdf::FileToVector(path);
  if (!data) {
    log->error(trs("Can not read the file") + " " + path);
    return std::nullopt;
  }
  return std::string(data->cbegin(), data->cend());
}

void PrintVerifyResult(const std::string& src_file,
                       const bridge::VerifyPdfResult& result) {
  std::cout << src_file << ": " << result.message << "\n";
  if (result.signature_info) {
    const auto& info = result.signature_info.value();
    std::cout << "  " << tr("Signer") << ": " << info.signer_name << "\n"
              << "  " << tr("Time") << ": " << info.timestamp << "\n";
    if (!info.extra.empty()) {
      std::cout << "  " << tr("Extra") << ": " << info.extra << "\n";
    }
  }
}

} // namespace

bool CheckInputFiles(const std::vector<std::string>& files,
                     const std::shared_ptr<spdlog::logger>& log) {
  return std::all_of(
    files.cbegin(), files.cend(), [&log](const std::string& file) {
      try {
        if (!std::filesystem::exists(file)) {
          log->error(trs("File not found") + " " + file);
          return false;
        }
        if (!std::filesystem::is_regular_file(file)) {
          log->error(trs("This file is not a regular file") + " " + file);
          return false;
        }
        if (std::filesystem::file_size(file) < 10) {
          log->error(trs("File is empty or too small") + " " + file);
          return false;
        }
        auto ifile = std::ifstream(file, std::ios_base::binary);
        if (!ifile.is_open()) {
          log->error(trs("Can not open file") + " " + file);
          return false;
        }
        std::string read_buff;
        read_buff.resize(10, 0x00);
        if (!ifile.read(read_buff.data(), 10)) {
          log->error(trs("Can not read the file") + " " + file);
          return false;
        }
        if (!boost::contains(read_buff, "%PDF")) {
          log->error(trs("Not a pdf file") + " " + file);
          return false;
        }
      } catch (const std::exception& ex) {
        log->error(ex.what());
        return false;
      }
      return true;
    });
}

bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log) {
  if (!std::filesystem::exists(output_dir) ||
      !std::filesystem::is_directory(output_dir)) {
    log->error(trs("Directory not found") + " " + output_dir);
    return false;
  }
  std::string tmp_filename = output_dir;
  if (tmp_filename.back() != '/') {
    tmp_filename.push_back('/');
  }
  tmp_filename += "test_temporary_file_for_pdfseal";
  std::ofstream ofile(tmp_filename);
  if (!ofile.is_open()) {
    log->error(trs("Can not create file in directory") + " " + output_dir);
    return false;
  }
  ofile.close();
  std::error_code err_code;
  std::filesystem::remove(tmp_filename, err_code);
  return true;
}

std::string DestFileName(const std::string& src_file,
                         const std::string& output_dir,
                         const std::string& postfix,
                         const std::shared_ptr<spdlog::logger>& log) {
  std::vector<std::string> extensions;
  const uint max_it = 10;
  uint it_counter = 0;
  const std::filesystem::path src_path(src_file);
  const std::filesystem::path dir = output_dir.empty()
                                      ? src_path.parent_path()
                                      : std::filesystem::path(output_dir);
  std::string clear_path = (dir / src_path.filename()).string();
  std::string next = std::filesystem::path(clear_path).extension();
  while (!next.empty() && it_counter < max_it) {
    ++it_counter;
    // shrink one extension
    clear_path.resize(clear_path.length() - next.length());
    extensions.emplace_back(std::move(next));
    next = std::filesystem::path(clear_path).extension();
  }
  clear_path += postfix;
  // extensions were collected last to first
  std::for_each(extensions.crbegin(), extensions.crend(),
                [&clear_path](const std::string& ext) { clear_path += ext; });
  while (std::filesystem::exists(clear_path)) {
    log->warn(trs("File already exists ") + clear_path);
    clear_path += ".next";
  }
  return clear_path;
}

bool LoadKey(const std::string& key_file, bridge::Engine& engine,
             const std::shared_ptr<spdlog::logger>& log) {
  const auto content = LoadKeyFile(key_file);
  if (!content) {
    log->error(trs("No valid key file found") + " " + key_file);
    return false;
  }
  try {
    engine.ImportKey(content->private_key, content->public_key);
  } catch (const PdfSealError& ex) {
    log->error(trs("The stored keypair is not valid: ") + ex.what());
    return false;
  }
  log->debug(trs("Keypair loaded from ") + key_file);
  return true;
}

void StoreKey(const std::string& key_file, const bridge::Engine& engine) {
  KeyFileContent content;
  content.public_key = engine.GetPublicKey();
  content.private_key = engine.ExportKey();
  SaveKeyFile(key_file, content);
}

int PerformKeyCommand(const Options& options, bridge::Engine& engine,
                      const std::shared_ptr<spdlog::logger>& log) {
  const std::string key_file = options.GetKeyFile();
  if (key_file.empty()) {
    log->error(tr("Can not find the key file location, use --key-file"));
    return 1;
  }
  try {
    switch (options.GetMode()) {
      case Mode::kGenerateKey:
        std::cout << engine.GenerateKeypair();
        StoreKey(key_file, engine);
        log->info(trs("Keypair saved to ") + key_file);
        return 0;
      case Mode::kImportKey: {
        const auto private_pem =
          ReadTextFile(options.GetPrivateKeyFile(), log);
        const auto public_pem = ReadTextFile(options.GetPublicKeyFile(), log);
        if (!private_pem || !public_pem) {
          return 1;
        }
        std::cout << engine.ImportKey(private_pem.value(), public_pem.value());
        StoreKey(key_file, engine);
        log->info(trs("Keypair saved to ") + key_file);
        return 0;
      }
      case Mode::kExportKey: {
        if (!LoadKey(key_file, engine, log)) {
          return 1;
        }
        const std::string private_pem = engine.ExportKey();
        const std::string output = options.GetOutputFile();
        if (output.empty()) {
          std::cout << private_pem;
          return 0;
        }
        pdf::WriteFile(output, BytesVector(private_pem.cbegin(), private_pem.cend()),
                       std::filesystem::perms::owner_read |
                         std::filesystem::perms::owner_write);
        log->info(trs("Private key saved to ") + output);
        return 0;
      }
      case Mode::kPublicKey:
        if (!LoadKey(key_file, engine, log)) {
          return 1;
        }
        std::cout << engine.GetPublicKey();
        return 0;
      case Mode::kHasKey: {
        const bool has_key = LoadKey(key_file, engine, log);
        std::cout << (has_key ? "true" : "false") << "\n";
        return has_key ? 0 : 1;
      }
      default:
        log->error(tr("Not a key management mode"));
        return 1;
    }
  } catch (const PdfSealError& ex) {
    log->error("{} {}", ex.Code(), ex.what());
  } catch (const std::exception& ex) {
    log->error(ex.what());
  }
  return 1;
}

bool PerformSign(const std::string& src_file, const Options& options,
                 const bridge::Engine& engine,
                 const std::shared_ptr<spdlog::logger>& log) {
  auto data = pdf::FileToVector(src_file);
  if (!data) {
    log->error(trs("Can not read the file") + " " + src_file);
    return false;
  }
  try {
    bridge::SignPdfRequest request;
    request.pdf_data = std::move(data.value());
    request.name = options.GetSignerName();
    request.extra = options.GetExtra();
    request.options = options.GetSignOptions();
    const auto result = engine.SignPdf(request);
    const std::string dest = DestFileName(src_file, options.GetOutputDir(),
                                          options.GetNamePostfix(), log);
    pdf::WriteFile(dest, result.signed_pdf_data,
                   std::filesystem::perms::owner_read |
                     std::filesystem::perms::owner_write |
                     std::filesystem::perms::group_read |
                     std::filesystem::perms::others_read);
    log->info(trs("Signed file saved to ") + dest);
    return true;
  } catch (const PdfSealError& ex) {
    log->error("{} {}: {}", src_file, ex.Code(), ex.what());
  } catch (const std::exception& ex) {
    log->error("{}: {}", src_file, ex.what());
  }
  return false;
}

bool PerformVerify(const std::string& src_file, const Options& options,
                   const bridge::Engine& engine,
                   const std::shared_ptr<spdlog::logger>& log) {
  auto data = pdf::FileToVector(src_file);
  if (!data) {
    log->error(trs("Can not read the file") + " " + src_file);
    return false;
  }
  try {
    const auto result = engine.VerifyPdf(data.value());
    if (options.JsonOutput()) {
      auto obj = result.ToJson();
      obj["file"] = src_file;
      std::cout << boost::json::serialize(obj) << "\n";
    } else {
      PrintVerifyResult(src_file, result);
    }
    return result.is_signed;
  } catch (const PdfSealError& ex) {
    if (options.JsonOutput()) {
      auto obj = bridge::ErrorToJson(ex);
      obj["file"] = src_file;
      std::cout << boost::json::serialize(obj) << "\n";
    }
    log->error("{} {}: {}", src_file, ex.Code(), ex.what());
  } catch (const std::exception& ex) {
    log->error("{}: {}", src_file, ex.what());
  }
  return false;
}

} // namespace pdfseal::cli
