/*
 *  Copyright (C) 2024 Team Kodi
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

#include <string>
#include <string_view>

namespace DRM
{

enum class ErrorType
{
  KEY_SYSTEM_ERROR,
};

enum class ErrorDetail
{
  KEY_SYSTEM_NO_KEYS,
  KEY_SYSTEM_NO_ACCESS,
  KEY_SYSTEM_NO_SESSION,
  KEY_SYSTEM_NO_INIT_DATA,
  KEY_SYSTEM_CERTIFICATE_REQUEST_FAILED,
  KEY_SYSTEM_LICENSE_REQUEST_FAILED,
};

struct ErrorEvent
{
  ErrorType type{ErrorType::KEY_SYSTEM_ERROR};
  ErrorDetail details{ErrorDetail::KEY_SYSTEM_NO_ACCESS};
  // When true the playback of the current content cannot continue
  bool fatal{true};
  std::string reason;
};

std::string_view ErrorDetailToString(ErrorDetail details);

class ATTR_DLL_LOCAL IErrorListener
{
public:
  virtual ~IErrorListener() = default;
  virtual void OnError(const ErrorEvent& event) = 0;
};

/*!
 * \brief Log the error and notify it to the listener.
 */
void NotifyError(IErrorListener& listener,
                 ErrorDetail details,
                 bool fatal,
                 std::string_view reason);

} // namespace DRM
