/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <string_view>

namespace DRM
{

constexpr std::string_view KS_WIDEVINE = "com.widevine.alpha";
constexpr std::string_view KS_FAIRPLAY = "com.apple.fps";

// HLS EXT-X-KEY KEYFORMAT used by FairPlay streams
constexpr std::string_view KEYFORMAT_FAIRPLAY = "com.apple.streamingkeydelivery";

// Init data type of FairPlay, JSON with the base64 "sinf" box
constexpr std::string_view INIT_DATA_TYPE_SINF = "sinf";

/*!
 * \brief Check if the key system is one of the supported ones.
 */
bool IsValidKeySystem(std::string_view keySystem);

/*!
 * \brief Get the key system to be used for a HLS key format.
 * \param keyFormat The KEYFORMAT attribute value, can be empty
 * \return The key system, Widevine when the key format is not a FairPlay one
 */
std::string_view GetKeySystemFromKeyFormat(std::string_view keyFormat);

/*!
 * \brief Check if the key system cannot work without a license server certificate.
 */
bool IsServerCertificateRequired(std::string_view keySystem);

} // namespace DRM
