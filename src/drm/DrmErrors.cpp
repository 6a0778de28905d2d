/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "DrmErrors.h"

#include "utils/log.h"

std::string_view DRM::ErrorDetailToString(ErrorDetail details)
{
  switch (details)
  {
    case ErrorDetail::KEY_SYSTEM_NO_KEYS:
      return "keySystemNoKeys";
    case ErrorDetail::KEY_SYSTEM_NO_ACCESS:
      return "keySystemNoAccess";
    case ErrorDetail::KEY_SYSTEM_NO_SESSION:
      return "keySystemNoSession";
    case ErrorDetail::KEY_SYSTEM_NO_INIT_DATA:
      return "keySystemNoInitData";
    case ErrorDetail::KEY_SYSTEM_CERTIFICATE_REQUEST_FAILED:
      return "keySystemCertificateRequestFailed";
    case ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED:
      return "keySystemLicenseRequestFailed";
  }
  return "unknown";
}

void DRM::NotifyError(IErrorListener& listener,
                      ErrorDetail details,
                      bool fatal,
                      std::string_view reason)
{
  LOG::Log(fatal ? LOGERROR : LOGWARNING, "Key system error \"%s\" (fatal: %s): %s",
           ErrorDetailToString(details).data(), fatal ? "true" : "false",
           std::string(reason).c_str());

  ErrorEvent event;
  event.details = details;
  event.fatal = fatal;
  event.reason = reason;
  listener.OnError(event);
}
