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

namespace DRMKEYS
{
namespace SETTINGS
{

class ATTR_DLL_LOCAL CCompSettings
{
public:
  CCompSettings() = default;
  ~CCompSettings() = default;

  // Expert settings

  // Save license challenge / response data to the add-on user folder
  bool IsDebugLicense() const;
  bool IsDebugVerbose() const;
};

} // namespace SETTINGS
} // namespace DRMKEYS
