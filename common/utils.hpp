/* File: utils.hpp
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

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

#include "common_defs.hpp"

namespace pdfseal {

/**
 * @brief Convert bytes to a lowercase hex string
 * @param vec
 * @return std::string
 */
std::string VecBytesStringRepresentation(const BytesVector &vec) noexcept;

/**
 * @brief Format time as ISO-8601 UTC
 * @param time
 * @return std::string like 2024-10-15T12:30:37Z
 */
std::string TimeTToIso8601(time_t time) noexcept;

std::string TimePointToIso8601(
  const std::chrono::system_clock::time_point &time_point) noexcept;

/**
 * @brief Parse an ISO-8601 UTC instant produced by TimeTToIso8601
 * @param iso string
 * @return std::optional<time_t> empty on format error
 */
std::optional<time_t> Iso8601ToTimeT(const std::string &iso) noexcept;

/**
 * @brief Convert ISO-8601 UTC instant to the PDF date format
 * @param iso 2024-10-15T12:30:37Z
 * @return std::optional<std::string> D:20241015123037Z
 */
std::optional<std::string> Iso8601ToPdfDate(const std::string &iso) noexcept;

/// @brief trim whitespace at both ends
std::string TrimWhitespace(const std::string &val);

} // namespace pdfseal
