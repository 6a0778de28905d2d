/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CompSettings.h"

bool DRMKEYS::SETTINGS::CCompSettings::IsDebugLicense() const
{
  return kodi::addon::GetSettingBoolean("debug.save.license");
}

bool DRMKEYS::SETTINGS::CCompSettings::IsDebugVerbose() const
{
  return kodi::addon::GetSettingBoolean("debug.verbose");
}
