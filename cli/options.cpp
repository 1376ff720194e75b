/* File: options.cpp
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

#include "options.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "crypto_defs.hpp"
#include "key_file.hpp"
#include "tr.hpp"

namespace pdfseal::cli {

namespace {

const std::vector<std::pair<const char *, Mode>> &ModeTags() {
  static const std::vector<std::pair<const char *, Mode>> modes{
    {kGenerateKeyTagL, Mode::kGenerateKey},
    {kImportKeyTagL, Mode::kImportKey},
    {kExportKeyTagL, Mode::kExportKey},
    {kPublicKeyTagL, Mode::kPublicKey},
    {kHasKeyTagL, Mode::kHasKey},
    {kSignTagL, Mode::kSign},
    {kVerifyTagL, Mode::kVerify}};
  return modes;
}

} // namespace

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_(tr("Allowed options")) {
  description_.add_options()
    // clang-format off
      (kHelpTag, tr("produce this help message"))
      (kGenerateKeyTagL, tr("generate a new keypair and store it in the key file"))
      (kImportKeyTagL, tr("import a keypair from --private and --public PEM files"))
      (kExportKeyTagL, tr("print the private key PEM (or write it to --output)"))
      (kPublicKeyTagL, tr("print the public key PEM"))
      (kHasKeyTagL, tr("check if a keypair is stored"))
      (kSignTagL, tr("sign the input files"))
      (kVerifyTagL, tr("verify the input files"))
      (kInputFileTag, po::value<std::vector<std::string>>(),tr("input file"))
      (kKeyFileTagL, po::value<std::string>(),tr("Key file (default $XDG_CONFIG_HOME/pdfseal/keypair.json)"))
      (kPrivateTagL, po::value<std::string>(),tr("Private key PEM file"))
      (kPublicTagL, po::value<std::string>(),tr("Public key PEM file"))
      (kOutputTag, po::value<std::string>(),tr("Output file"))
      (kNameTag, po::value<std::string>(),tr("Signer name"))
      (kExtraTag, po::value<std::string>(),tr("Additional text (reason)"))
      (kOutputDIRTag,po::value<std::string>(),tr("Output directory (default: next to the source file)"))
      (kOutputPostfixTag,po::value<std::string>(),tr("Postfix to add to the filename (default _signed)"))
      (kNoWatermarkTagL, tr("do not draw the visible watermark"))
      (kDigestTagL,po::value<std::string>(),tr("Digest: sha256, sha384 or sha512"))
      (kPkcs1TagL, tr("use RSASSA-PKCS1-v1_5 instead of RSASSA-PSS"))
      (kJsonTagL, tr("print verification results as JSON"));
  // clang-format on
  try {
    pos_opt_desc_.add(kInputFileTagL, -1);
    po::store(po::command_line_parser(argc, argv)
                .options(description_)
                .positional(pos_opt_desc_)
                .run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    const boost::wrapexcept<po::invalid_command_line_syntax> & /*ex*/) {
    log_->error(tr("Wrong parameters, see --help"));
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::unknown_option> &ex) {
    log_->error(trs("Unknown option passed. ") + ex.what());
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::ambiguous_option> & /*ex*/) {
    wrong_params_ = true;
    log_->error(
      tr("Ambiguous option passed,use - for short options and -- "
         "for full otions,--help for help"));
  } catch (const boost::wrapexcept<po::multiple_occurrences> &ex) {
    wrong_params_ = true;
    log_->error(trs("Option passed more than once. ") + ex.what());
  }
}

bool Options::help() const {
  if (var_map_.empty() || var_map_.count(kHelpTagL) > 0 || wrong_params_) {
    std::cout << tr("A tool for signing and verifying PDF files") << "\n";
    // clang-format off
    std::cout << tr("Usage") << ":\n"
              << "  " << TRANSLATION_DOMAIN << " --generate-key [--key-file F]\n"
              << "  " << TRANSLATION_DOMAIN << " --import-key --private P --public Q\n"
              << "  " << TRANSLATION_DOMAIN << " --export-key [--output F]\n"
              << "  " << TRANSLATION_DOMAIN << " --public-key | --has-key\n"
              << "  " << TRANSLATION_DOMAIN << " --sign -n NAME [-e EXTRA] [-d OUTDIR]"
              << " [-P POSTFIX] [--no-watermark] [--digest sha256|sha384|sha512]"
              << " [--pkcs1] file.pdf...\n"
              << "  " << TRANSLATION_DOMAIN << " --verify [--json] file.pdf...\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  std::string current_path = std::filesystem::current_path();
  current_path += "/";
  if (local_path.empty() || local_path == ".") {
    local_path = std::filesystem::current_path();
  }
  if (boost::starts_with(local_path, "./")) {
    boost::replace_first(local_path, "./", current_path);
  }
  const char *home = std::getenv("HOME");  // NOLINT
  if (home != nullptr && boost::starts_with(local_path, "~/")) {
    std::string home_path = std::filesystem::path(home);
    home_path += "/";
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
  }
  local_path = fs_path;
  return local_path;
}

std::string Options::GetString(const char *tag) const {
  if (var_map_.count(tag) == 0) {
    return {};
  }
  return var_map_.at(tag).as<std::string>();
}

Mode Options::GetMode() const {
  Mode res = Mode::kNone;
  size_t count = 0;
  for (const auto &[tag, mode] : ModeTags()) {
    if (var_map_.count(tag) > 0) {
      res = mode;
      ++count;
    }
  }
  return count == 1 ? res : Mode::kNone;
}

bool Options::AllMandatoryAreSet() const {
  const auto modes_count = std::count_if(
    ModeTags().cbegin(), ModeTags().cend(),
    [this](const auto &tag_mode) { return var_map_.count(tag_mode.first) > 0; });
  if (modes_count == 0) {
    log_->error(tr("No mode is set, see --help"));
    return false;
  }
  if (modes_count > 1) {
    log_->error(tr("Only one mode can be set at a time"));
    return false;
  }
  const Mode mode = GetMode();
  if (mode == Mode::kImportKey) {
    if (var_map_.count(kPrivateTagL) == 0 || var_map_.count(kPublicTagL) == 0) {
      log_->error(tr("Both --private and --public key files are required"));
      return false;
    }
    return true;
  }
  if (mode != Mode::kSign && mode != Mode::kVerify) {
    return true;
  }
  if (var_map_.count(kInputFileTagL) == 0) {
    log_->error(tr("No input files are set"));
    return false;
  }
  if (mode == Mode::kVerify) {
    return true;
  }
  if (boost::trim_copy(GetString(kNameTagL)).empty()) {
    log_->error(tr("No signer name is set"));
    return false;
  }
  if (var_map_.count(kDigestTagL) > 0 &&
      !crypto::DigestAlgorithmFromName(
        boost::to_upper_copy(GetString(kDigestTagL)))) {
    log_->error(tr("Digest is expected to be: sha256 or sha384 or sha512"));
    return false;
  }
  if (var_map_.count(kOutputPostfixTagL) > 0 &&
      boost::contains(GetString(kOutputPostfixTagL), "/")) {
    log_->error(tr("File postfix can not contain / symbol"));
    return false;
  }
  return true;
}

std::vector<std::string> Options::GetInputFiles() const {
  if (var_map_.count(kInputFileTagL) > 0) {
    auto files_list =
      var_map_.at(kInputFileTagL).as<std::vector<std::string>>();
    std::for_each(
      files_list.begin(), files_list.end(),
      [this](std::string &file_name) { file_name = ResolvePath(file_name); });
    return files_list;
  }
  return {};
}

std::string Options::GetOutputDir() const {
  if (var_map_.count(kOutputDIRTagL) == 0) {
    return {};
  }
  std::string res = ResolvePath(GetString(kOutputDIRTagL));
  if (!res.empty() && res.back() != '/') {
    res.push_back('/');
  }
  return res;
}

std::string Options::GetNamePostfix() const {
  if (var_map_.count(kOutputPostfixTagL) == 0) {
    return kDefaultPostfix;
  }
  return GetString(kOutputPostfixTagL);
}

std::string Options::GetKeyFile() const {
  if (var_map_.count(kKeyFileTagL) == 0) {
    return DefaultKeyFilePath();
  }
  return ResolvePath(GetString(kKeyFileTagL));
}

std::string Options::GetPrivateKeyFile() const {
  if (var_map_.count(kPrivateTagL) == 0) {
    return {};
  }
  return ResolvePath(GetString(kPrivateTagL));
}

std::string Options::GetPublicKeyFile() const {
  if (var_map_.count(kPublicTagL) == 0) {
    return {};
  }
  return ResolvePath(GetString(kPublicTagL));
}

std::string Options::GetOutputFile() const {
  if (var_map_.count(kOutputTagL) == 0) {
    return {};
  }
  return ResolvePath(GetString(kOutputTagL));
}

std::string Options::GetSignerName() const { return GetString(kNameTagL); }

std::string Options::GetExtra() const { return GetString(kExtraTagL); }

pdf::SignOptions Options::GetSignOptions() const {
  pdf::SignOptions res;
  if (var_map_.count(kDigestTagL) > 0) {
    const auto digest = crypto::DigestAlgorithmFromName(
      boost::to_upper_copy(GetString(kDigestTagL)));
    if (digest) {
      res.digest = digest.value();
    } else {
      log_->warn(tr("Unknown digest, SHA256 will be used"));
    }
  }
  if (var_map_.count(kPkcs1TagL) > 0) {
    res.signature = crypto::SignatureAlgorithm::kRsaPkcs1v15;
  }
  res.watermark = var_map_.count(kNoWatermarkTagL) == 0;
  return res;
}

bool Options::JsonOutput() const { return var_map_.count(kJsonTagL) > 0; }

} // namespace pdfseal::cli
