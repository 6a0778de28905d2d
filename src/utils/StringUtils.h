/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace UTILS
{
namespace STRING
{

/*!
 * \brief Decode a percent-encoded string, '+' chars are converted to spaces.
 */
std::string URLDecode(std::string_view strURLData);

/*!
 * \brief Compare two strings, case-insensitive.
 */
bool CompareNoCase(std::string_view str1, std::string_view str2);

/*!
 * \brief Split a string into a vector of strings.
 * \param input The string to split
 * \param delimiter The char used to split
 * \param maxStrings [OPT] The max number of strings, 0 means no limit
 * \return The splitted strings
 */
std::vector<std::string> SplitToVec(std::string_view input, const char delimiter, int maxStrings = 0);

std::string Trim(std::string value);

/*!
 * \brief Convert bytes to a lowercase hexadecimal string.
 */
std::string ToHexadecimal(const uint8_t* data, const size_t size);
std::string ToHexadecimal(const std::vector<uint8_t>& data);

/*!
 * \brief Parse an HTTP headers string (e.g. "name=value&name2=value2")
 *        values are URL decoded.
 * \param headerMap[OUT] Where to add the parsed headers
 * \param header The headers string
 */
void ParseHeaderString(std::map<std::string, std::string>& headerMap, std::string_view header);

} // namespace STRING
} // namespace UTILS
