/* File: key_file.cpp
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

#include "key_file.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <stdexcept>

#include "logger_utils.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::cli {

json::object KeyFileContent::ToJson() const {
  json::object res;
  res[kJsonPublicKey] = public_key;
  res[kJsonPrivateKey] = private_key;
  return res;
}

std::optional<KeyFileContent> KeyFileContent::FromJson(
  const std::string &text) noexcept {
  auto logger = logger::InitLog();
  try {
    const json::value val = json::parse(text);
    const auto &obj = val.as_object();
    KeyFileContent res;
    res.public_key = json::value_to<std::string>(obj.at(kJsonPublicKey));
    res.private_key = json::value_to<std::string>(obj.at(kJsonPrivateKey));
    return res;
  } catch (const std::exception &ex) {
    if (logger) {
      logger->error("[KeyFileContent::FromJson] {}", ex.what());
    }
  }
  return std::nullopt;
}

std::string DefaultKeyFilePath() noexcept {
  try {
    std::filesystem::path base;
    const char *xdg_config = std::getenv("XDG_CONFIG_HOME");  // NOLINT
    const char *home = std::getenv("HOME");                   // NOLINT
    if (xdg_config != nullptr && *xdg_config != '\0') {
      base = xdg_config;
    } else if (home != nullptr && *home != '\0') {
      base = std::filesystem::path(home) / ".config";
    } else {
      return {};
    }
    return (base / kKeyFileDir / kKeyFileName).string();
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[DefaultKeyFilePath] {}", ex.what());
    }
  }
  return {};
}

void SaveKeyFile(const std::string &path, const KeyFileContent &content) {
  const std::string func_name = "[SaveKeyFile] ";
  if (path.empty()) {
    throw std::runtime_error(func_name + "empty key file path");
  }
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code err_code;
    std::filesystem::create_directories(parent, err_code);
    if (err_code) {
      throw std::runtime_error(func_name + "can't create directory " +
                               parent.string() + " " + err_code.message());
    }
  }
  const std::string text = json::serialize(content.ToJson());
  const BytesVector data(text.cbegin(), text.cend());
  pdf::WriteFile(path, data,
                 std::filesystem::perms::owner_read |
                   std::filesystem::perms::owner_write);
}

std::optional<KeyFileContent> LoadKeyFile(const std::string &path) noexcept {
  auto logger = logger::InitLog();
  const auto data = pdf::FileToVector(path);
  if (!data) {
    if (logger) {
      logger->debug("[LoadKeyFile] can't read {}", path);
    }
    return std::nullopt;
  }
  return KeyFileContent::FromJson(std::string(data->cbegin(), data->cend()));
}

} // namespace pdfseal::cli
