/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#ifdef DRMKEYS_TEST_BUILD
#include "test/KodiStubs.h"
#else
#include <kodi/AddonBase.h>
#endif

#include <map>
#include <string>
#include <string_view>

namespace DRMKEYS
{
namespace KODI_PROPS
{

// Generic add-on configuration
struct Config
{
  // Determines whether curl verifies the authenticity of the peer's certificate,
  // if set to false CA certificates are not loaded and verification will be skipped.
  bool curlSSLVerifyPeer{true};
};

struct DrmCfg
{
  struct License
  {
    // The license server url
    std::string serverUrl;
    // HTTP request headers
    std::map<std::string, std::string> reqHeaders;
    // The license server certificate encoded as base64
    std::string serverCert;
    // Url where to download the license server certificate, used when "serverCert" is empty
    std::string serverCertUrl;
  };

  // The license configuration
  License license;
};

class ATTR_DLL_LOCAL CCompKodiProps
{
public:
  CCompKodiProps() = default;
  ~CCompKodiProps() = default;

  void Init(const std::map<std::string, std::string>& props);

  // \brief Specifies if the key system negotiation is enabled
  bool IsEmeEnabled() const { return m_isEmeEnabled; }

  // \brief Specifies generic add-on configuration
  const Config& GetConfig() const { return m_config; }

  // \brief Get DRM configurations, mapped by key system
  const std::map<std::string, DrmCfg>& GetDrmConfigs() const { return m_drmConfigs; }

private:
  void ParseConfig(const std::string& data);
  bool ParseDrmConfig(const std::string& data);

  bool m_isEmeEnabled{false};
  Config m_config;
  std::map<std::string, DrmCfg> m_drmConfigs;
};

} // namespace KODI_PROPS
} // namespace DRMKEYS
