/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "DrmConfig.h"

#include "CompKodiProps.h"
#include "KeySystems.h"
#include "utils/Base64Utils.h"
#include "utils/log.h"

using namespace UTILS;

namespace
{
// \brief Fill in missing drm configuration info with defaults
void FillDrmConfigDefaults(std::string_view keySystem, DRM::Config& cfg)
{
  auto& licCfg = cfg.license;

  if (keySystem == DRM::KS_WIDEVINE)
  {
    if (licCfg.reqHeaders.empty())
      licCfg.reqHeaders["Content-Type"] = "application/octet-stream";
  }
}
} // unnamed namespace

DRM::Config DRM::CreateDRMConfig(std::string_view keySystem,
                                 const DRMKEYS::KODI_PROPS::DrmCfg& propCfg)
{
  DRM::Config cfg;

  auto& propLicCfg = propCfg.license;
  auto& licCfg = cfg.license;

  licCfg.serverUrl = propLicCfg.serverUrl;
  licCfg.reqHeaders = propLicCfg.reqHeaders;
  licCfg.serverCertUrl = propLicCfg.serverCertUrl;

  if (!propLicCfg.serverCert.empty())
  {
    if (BASE64::IsValidBase64(propLicCfg.serverCert))
      licCfg.serverCert = BASE64::Decode(propLicCfg.serverCert);
    else
      LOG::LogF(LOGERROR, "The license \"server_certificate\" parameter must have data encoded "
                          "as base 64, the certificate has been ignored.");
  }

  FillDrmConfigDefaults(keySystem, cfg);

  return cfg;
}
