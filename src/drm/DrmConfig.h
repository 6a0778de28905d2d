/*
 *  Copyright (C) 2023 Team Kodi
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

// forward
namespace DRMKEYS::KODI_PROPS
{
struct DrmCfg;
}

namespace DRM
{

struct Config
{
  struct License
  {
    // The license server url
    std::string serverUrl;
    // HTTP request headers
    std::map<std::string, std::string> reqHeaders;
    // The license server certificate
    std::vector<uint8_t> serverCert;
    // Url where to download the license server certificate
    std::string serverCertUrl;
  };

  // The license configuration
  License license;
};

/*!
 * \brief Create the DRM configuration from the Kodi property configuration,
 *        missing values are filled with the key system defaults.
 * \param keySystem The key system
 * \param propCfg The configuration from the Kodi properties
 * \return The DRM configuration
 */
Config CreateDRMConfig(std::string_view keySystem, const DRMKEYS::KODI_PROPS::DrmCfg& propCfg);

} // namespace DRM
