/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "KeySystems.h"

bool DRM::IsValidKeySystem(std::string_view keySystem)
{
  return keySystem == KS_WIDEVINE || keySystem == KS_FAIRPLAY;
}

std::string_view DRM::GetKeySystemFromKeyFormat(std::string_view keyFormat)
{
  if (keyFormat == KEYFORMAT_FAIRPLAY)
    return KS_FAIRPLAY;

  return KS_WIDEVINE;
}

bool DRM::IsServerCertificateRequired(std::string_view keySystem)
{
  return keySystem == KS_FAIRPLAY;
}
