/* File: cli_utils.hpp
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

#include <memory>
#include <string>
#include <vector>

#include "engine.hpp"
#include "options.hpp"

namespace pdfseal::cli {

/**
 * @brief Check all files - readable,non-empty, PDF
 *
 * @param files filenames
 * @param log logger
 * @return true if all files are ok
 * @return false if at least one file is bad
 */
bool CheckInputFiles(const std::vector<std::string>& files,
                     const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Check the output directory
 *
 * @param output_dir
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool CheckOutputDir(const std::string& output_dir,
                    const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Build a free destination filename
 *
 * @param src_file source file
 * @param output_dir directory, the source's directory if empty
 * @param postfix added before the extensions: doc.pdf -> doc_signed.pdf
 * @return std::string
 * @details ".next" is appended while the file exists
 */
std::string DestFileName(const std::string& src_file,
                         const std::string& output_dir,
                         const std::string& postfix,
                         const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Load the keypair from the key file into the engine
 *
 * @param key_file
 * @param engine
 * @param log
 * @return true if a valid keypair was loaded
 */
bool LoadKey(const std::string& key_file, bridge::Engine& engine,
             const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Store the engine's keypair to the key file
 * @throws NoKeyLoadedError, std::runtime_error
 */
void StoreKey(const std::string& key_file, const bridge::Engine& engine);

/**
 * @brief Run --generate-key, --import-key, --export-key, --public-key or
 * --has-key
 *
 * @param options
 * @param engine
 * @param log
 * @return int process exit code
 */
int PerformKeyCommand(const Options& options, bridge::Engine& engine,
                      const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Perfom file sign
 *
 * @param src_file source file
 * @param options command options object
 * @param engine with the keypair loaded
 * @param log
 * @return true if the signed file was written
 */
bool PerformSign(const std::string& src_file, const Options& options,
                 const bridge::Engine& engine,
                 const std::shared_ptr<spdlog::logger>& log);

/**
 * @brief Verify one file and print the result to stdout
 *
 * @return true if the signature is valid
 */
bool PerformVerify(const std::string& src_file, const Options& options,
                   const bridge::Engine& engine,
                   const std::shared_ptr<spdlog::logger>& log);

} // namespace pdfseal::cli
