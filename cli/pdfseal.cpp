/* File: pdfseal.cpp
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

#include <libintl.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clocale>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>

#include "cli_utils.hpp"
#include "engine.hpp"
#include "options.hpp"
#include "tr.hpp"

int main(int argc, char* argv[]) {
  using pdfseal::cli::Mode;
  using pdfseal::cli::tr;
  using pdfseal::cli::trs;
  // setup the transtlator
  if (setlocale(LC_ALL, "") == nullptr) {  // NOLINT
    std::cerr << "Failed to set locale.\n";
    return 1;
  }
  bindtextdomain(TRANSLATION_DOMAIN, TRANSLATIONS_INSTALL_DIR);
  bind_textdomain_codeset(TRANSLATION_DOMAIN, "UTF-8");
  textdomain(TRANSLATION_DOMAIN);
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stderr_color_mt(TRANSLATION_DOMAIN);
    if (!console) {
      std::cerr << tr("Setup logger failed");
      return 1;
    }
    const pdfseal::cli::Options options(argc, argv, console);
    if (options.help()) {
      return options.WrongParams() ? 1 : 0;
    }
    if (!options.AllMandatoryAreSet()) {
      return 1;
    }
    pdfseal::bridge::Engine engine;
    const Mode mode = options.GetMode();
    if (mode != Mode::kSign && mode != Mode::kVerify) {
      return pdfseal::cli::PerformKeyCommand(options, engine, console);
    }
    // ----------------
    // check the files
    auto input_files = options.GetInputFiles();
    if (pdfseal::cli::CheckInputFiles(input_files, console)) {
      console->debug(tr("Files are OK"));
    } else {
      console->error(tr("Files are not OK"));
      return 1;
    }
    const std::string output_dir = options.GetOutputDir();
    if (mode == Mode::kSign && !output_dir.empty()) {
      if (!pdfseal::cli::CheckOutputDir(output_dir, console)) {
        console->error(tr("Output directory is not OK"));
        return 1;
      }
      console->debug(tr("Output directory is OK"));
    }
    // ----------------
    // load the key
    const bool key_loaded =
      pdfseal::cli::LoadKey(options.GetKeyFile(), engine, console);
    if (mode == Mode::kSign && !key_loaded) {
      console->error(tr("No keypair, run with --generate-key first"));
      return 1;
    }
    // ----------------
    // process files
    size_t succeeded_count = 0;
    for (const auto& src_file : input_files) {
      console->debug(trs("Processing file ") + src_file);
      const bool res =
        mode == Mode::kSign
          ? pdfseal::cli::PerformSign(src_file, options, engine, console)
          : pdfseal::cli::PerformVerify(src_file, options, engine, console);
      if (res) {
        ++succeeded_count;
      }
    }
    // return 0 if all files succeeded
    return succeeded_count == input_files.size() ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << tr("Error:") << ex.what() << "\n";
    return 1;
  }
  return 0;
}
