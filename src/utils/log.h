/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#ifndef DRMKEYS_TEST_BUILD
#include <kodi/AddonBase.h>
#else
#include "kodi/tools/StringUtils.h"
#include <iostream>
#endif

#include <utility>

enum LogLevel
{
  LOGDEBUG,
  LOGINFO,
  LOGWARNING,
  LOGERROR,
  LOGFATAL
};

namespace LOG
{

#ifndef DRMKEYS_TEST_BUILD
inline ADDON_LOG ToAddonLevel(const LogLevel level)
{
  switch (level)
  {
    case LogLevel::LOGFATAL:
      return ADDON_LOG::ADDON_LOG_FATAL;
    case LogLevel::LOGERROR:
      return ADDON_LOG::ADDON_LOG_ERROR;
    case LogLevel::LOGWARNING:
      return ADDON_LOG::ADDON_LOG_WARNING;
    case LogLevel::LOGINFO:
      return ADDON_LOG::ADDON_LOG_INFO;
    default:
      return ADDON_LOG::ADDON_LOG_DEBUG;
  }
}
#endif

template<typename... Args>
inline void Log(const LogLevel level, const char* format, Args&&... args)
{
#ifndef DRMKEYS_TEST_BUILD
  kodi::Log(ToAddonLevel(level), format, std::forward<Args>(args)...);
#else
  // Tests print only the problems, debug and info output would flood the gtest report
  if (level < LogLevel::LOGWARNING)
    return;

  std::string logStr = kodi::tools::StringUtils::Format(format, std::forward<Args>(args)...);
  switch (level)
  {
    case LogLevel::LOGFATAL:
      std::cout << "[ LOG-FATAL ] " << logStr << std::endl;
      break;
    case LogLevel::LOGERROR:
      std::cout << "[ LOG-ERROR ] " << logStr << std::endl;
      break;
    default:
      std::cout << "[ LOG-WARN  ] " << logStr << std::endl;
      break;
  }
#endif
}

#define LogF(level, format, ...) Log((level), ("%s: " format), __FUNCTION__, ##__VA_ARGS__)

} // namespace LOG
