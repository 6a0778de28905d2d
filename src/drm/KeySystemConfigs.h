/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace DRM
{

enum class MediaKeysRequirement
{
  OPTIONAL,
  REQUIRED,
  NOT_ALLOWED,
};

// See https://www.w3.org/TR/encrypted-media/#dom-mediakeysystemmediacapability
struct MediaKeySystemMediaCapability
{
  std::string contentType;
  std::string robustness;
};

// See https://www.w3.org/TR/encrypted-media/#mediakeysystemconfiguration-dictionary
struct KeySystemConfiguration
{
  std::string label;
  std::vector<std::string> initDataTypes;
  std::vector<MediaKeySystemMediaCapability> audioCapabilities;
  std::vector<MediaKeySystemMediaCapability> videoCapabilities;
  MediaKeysRequirement distinctiveIdentifier{MediaKeysRequirement::OPTIONAL};
  MediaKeysRequirement persistentState{MediaKeysRequirement::OPTIONAL};
  // Empty means the platform default ("temporary")
  std::vector<std::string> sessionTypes;
};

/*!
 * \brief Get the configurations to request the access to a key system,
 *        ordered by preference.
 * \param keySystem The key system
 * \param audioCodecs The audio codecs of the content (not mapped to capabilities)
 * \param videoCodecs The video codecs of the content, one video capability for each codec
 * \param configs[OUT] The configurations
 * \return True if has success, false if the key system is not supported
 */
bool GetSupportedConfigurations(std::string_view keySystem,
                                const std::vector<std::string>& audioCodecs,
                                const std::vector<std::string>& videoCodecs,
                                std::vector<KeySystemConfiguration>& configs);

} // namespace DRM
