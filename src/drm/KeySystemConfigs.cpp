/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "KeySystemConfigs.h"

#include "KeySystems.h"
#include "utils/log.h"

namespace
{
DRM::KeySystemConfiguration CreateConfiguration(std::vector<std::string> initDataTypes,
                                                const std::vector<std::string>& videoCodecs)
{
  DRM::KeySystemConfiguration config;
  config.initDataTypes = std::move(initDataTypes);

  for (const std::string& codec : videoCodecs)
  {
    DRM::MediaKeySystemMediaCapability capability;
    capability.contentType = "video/mp4; codecs=\"" + codec + "\"";
    config.videoCapabilities.emplace_back(capability);
  }
  return config;
}
} // unnamed namespace

bool DRM::GetSupportedConfigurations(std::string_view keySystem,
                                     const std::vector<std::string>& audioCodecs,
                                     const std::vector<std::string>& videoCodecs,
                                     std::vector<KeySystemConfiguration>& configs)
{
  configs.clear();

  //! @todo: audio codecs are not added to the audio capabilities, some platforms
  //! reject configurations that have audio capabilities with unknown codec strings
  if (keySystem == KS_WIDEVINE)
  {
    configs.emplace_back(CreateConfiguration({}, videoCodecs));
  }
  else if (keySystem == KS_FAIRPLAY)
  {
    configs.emplace_back(CreateConfiguration({std::string(INIT_DATA_TYPE_SINF)}, videoCodecs));
  }
  else
  {
    LOG::LogF(LOGERROR, "Unsupported key system \"%s\"", std::string(keySystem).c_str());
    return false;
  }

  LOG::LogF(LOGDEBUG, "Key system \"%s\" configurations: %zu (video capabilities: %zu, audio codecs: %zu)",
            std::string(keySystem).c_str(), configs.size(), configs.front().videoCapabilities.size(),
            audioCodecs.size());
  return true;
}
