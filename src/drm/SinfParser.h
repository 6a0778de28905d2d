/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DRM
{

/*!
 * \brief Find the key id in FairPlay "sinf" init data.
 *        The init data is a JSON document e.g. {"sinf": ["<base64 data>"]},
 *        the base64 data contains a "schi" box (or a "sinf" box with a "schi" child)
 *        where the key id is read from the "tenc" child box.
 * \param initData The init data
 * \param keyId[OUT] The key id as lowercase hexadecimal string,
 *                   or empty value when the boxes are not found
 * \return True if has success, false if the JSON or base64 data are malformed
 */
bool FindKeyIdInSinf(const std::vector<uint8_t>& initData, std::optional<std::string>& keyId);

} // namespace DRM
