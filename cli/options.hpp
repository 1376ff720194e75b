/* File: options.hpp
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

#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "signer.hpp"

namespace pdfseal::cli {

namespace po = boost::program_options;

const char *const kInputFileTag = "input-file,i";
const char *const kInputFileTagL = "input-file";
const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
// modes
const char *const kGenerateKeyTagL = "generate-key";
const char *const kImportKeyTagL = "import-key";
const char *const kExportKeyTagL = "export-key";
const char *const kPublicKeyTagL = "public-key";
const char *const kHasKeyTagL = "has-key";
const char *const kSignTagL = "sign";
const char *const kVerifyTagL = "verify";
// parameters
const char *const kKeyFileTagL = "key-file";
const char *const kPrivateTagL = "private";
const char *const kPublicTagL = "public";
const char *const kOutputTag = "output,o";
const char *const kOutputTagL = "output";
const char *const kNameTag = "name,n";
const char *const kNameTagL = "name";
const char *const kExtraTag = "extra,e";
const char *const kExtraTagL = "extra";
const char *const kOutputDIRTag = "output-dir,d";
const char *const kOutputDIRTagL = "output-dir";
const char *const kOutputPostfixTag = "output-file-postfix,P";
const char *const kOutputPostfixTagL = "output-file-postfix";
const char *const kNoWatermarkTagL = "no-watermark";
const char *const kDigestTagL = "digest";
const char *const kPkcs1TagL = "pkcs1";
const char *const kJsonTagL = "json";

const char *const kDefaultPostfix = "_signed";

enum class Mode : uint8_t {
  kNone,
  kGenerateKey,
  kImportKey,
  kExportKey,
  kPublicKey,
  kHasKey,
  kSign,
  kVerify
};

class Options {
 public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] bool help() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  /// @brief the single mode passed, kNone if none or more than one
  [[nodiscard]] Mode GetMode() const;

  [[nodiscard]] std::vector<std::string> GetInputFiles() const;

  /// @brief output directory with a trailing slash, empty if not set
  [[nodiscard]] std::string GetOutputDir() const;

  [[nodiscard]] std::string GetNamePostfix() const;

  /// @brief --key-file or the default location
  [[nodiscard]] std::string GetKeyFile() const;

  [[nodiscard]] std::string GetPrivateKeyFile() const;
  [[nodiscard]] std::string GetPublicKeyFile() const;

  /// @brief --output, empty for stdout
  [[nodiscard]] std::string GetOutputFile() const;

  [[nodiscard]] std::string GetSignerName() const;
  [[nodiscard]] std::string GetExtra() const;

  /**
   * @brief Signing algorithms and watermark switch
   * @return pdf::SignOptions
   * @details call after AllMandatoryAreSet, an invalid digest name falls back
   * to SHA256
   */
  [[nodiscard]] pdf::SignOptions GetSignOptions() const;

  [[nodiscard]] bool JsonOutput() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;
  [[nodiscard]] std::string GetString(const char *tag) const;

  std::shared_ptr<spdlog::logger> log_;
  po::positional_options_description pos_opt_desc_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

} // namespace pdfseal::cli
