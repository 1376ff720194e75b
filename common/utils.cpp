/* File: utils.cpp
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

#include "utils.hpp"

#include <boost/algorithm/string.hpp>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace pdfseal {

std::string
VecBytesStringRepresentation(const BytesVector &vec) noexcept {
  std::stringstream builder;
  for (const auto symbol : vec) {
    builder << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(symbol);
  }
  return builder.str();
}

std::string TimeTToIso8601(time_t time) noexcept {
  struct tm tm_info {};
  gmtime_r(&time, &tm_info);
  std::ostringstream oss;
  oss << std::put_time(&tm_info, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string TimePointToIso8601(
  const std::chrono::system_clock::time_point &time_point) noexcept {
  return TimeTToIso8601(std::chrono::system_clock::to_time_t(time_point));
}

std::optional<time_t> Iso8601ToTimeT(const std::string &iso) noexcept {
  // YYYY-MM-DDThh:mm:ssZ
  constexpr size_t kIsoLength = 20;
  if (iso.size() != kIsoLength || iso[4] != '-' || iso[7] != '-' ||
      iso[10] != 'T' || iso[13] != ':' || iso[16] != ':' || iso[19] != 'Z') {
    return std::nullopt;
  }
  for (const size_t pos : {0, 1, 2, 3, 5, 6, 8, 9, 11, 12, 14, 15, 17, 18}) {
    if (std::isdigit(static_cast<unsigned char>(iso[pos])) == 0) {
      return std::nullopt;
    }
  }
  struct tm tm_info {};
  std::istringstream iss(iso.substr(0, kIsoLength - 1));
  iss >> std::get_time(&tm_info, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  const time_t res = timegm(&tm_info);
  // reject out of range values like month 13, normalized by timegm
  if (TimeTToIso8601(res) != iso) {
    return std::nullopt;
  }
  return res;
}

std::optional<std::string>
Iso8601ToPdfDate(const std::string &iso) noexcept {
  const auto time = Iso8601ToTimeT(iso);
  if (!time) {
    return std::nullopt;
  }
  struct tm tm_info {};
  gmtime_r(&time.value(), &tm_info);
  std::ostringstream oss;
  oss << std::put_time(&tm_info, "D:%Y%m%d%H%M%SZ");
  return oss.str();
}

std::string TrimWhitespace(const std::string &val) {
  return boost::algorithm::trim_copy(val);
}

} // namespace pdfseal
