/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace UTILS
{
namespace BASE64
{

void Encode(const uint8_t* input, const size_t length, std::string& output);
std::string Encode(const std::vector<uint8_t>& input);
std::string Encode(std::string_view input);

/*!
 * \brief Decode a base64 string, invalid characters are skipped.
 * \param input The base64 data
 * \param length The data length
 * \param output[OUT] The decoded bytes, cleared when the padding is malformed
 * \return True if has success, otherwise false
 */
bool Decode(const char* input, const size_t length, std::vector<uint8_t>& output);
std::vector<uint8_t> Decode(std::string_view input);

/*!
 * \brief Check that a string is made only of base64 characters with a valid padding.
 */
bool IsValidBase64(std::string_view input);

} // namespace BASE64
} // namespace UTILS
