/* File: key_file.hpp
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

#include <boost/json.hpp>

#include <optional>
#include <string>

namespace pdfseal::cli {

namespace json = boost::json;

constexpr const char *const kKeyFileDir = "pdfseal";
constexpr const char *const kKeyFileName = "keypair.json";
constexpr const char *const kJsonPublicKey = "public_key";
constexpr const char *const kJsonPrivateKey = "private_key";

/// @brief the stored keypair, PEM text
struct KeyFileContent {
  std::string public_key;
  std::string private_key;

  [[nodiscard]] json::object ToJson() const;

  /// @brief parse {"public_key":..,"private_key":..}, empty on error
  [[nodiscard]] static std::optional<KeyFileContent> FromJson(
    const std::string &text) noexcept;
};

/**
 * @brief Default key file location
 * @return std::string $XDG_CONFIG_HOME/pdfseal/keypair.json or
 * $HOME/.config/pdfseal/keypair.json, empty if neither is set
 */
[[nodiscard]] std::string DefaultKeyFilePath() noexcept;

/**
 * @brief Write the key file, readable by the owner only
 * @param path
 * @param content
 * @throws std::runtime_error
 * @details the parent directory is created if needed
 */
void SaveKeyFile(const std::string &path, const KeyFileContent &content);

/**
 * @brief Read the key file
 * @param path
 * @return std::optional<KeyFileContent> empty if missing or malformed
 */
[[nodiscard]] std::optional<KeyFileContent> LoadKeyFile(
  const std::string &path) noexcept;

} // namespace pdfseal::cli
