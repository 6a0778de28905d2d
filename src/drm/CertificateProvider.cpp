/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CertificateProvider.h"

#include "utils/log.h"

#include <string>

bool DRM::CCertificateProvider::HasCertificateSource(const Config::License& licConfig)
{
  return !licConfig.serverCert.empty() || !licConfig.serverCertUrl.empty();
}

UTILS::CPromise<std::vector<uint8_t>> DRM::CCertificateProvider::GetCertificate(
    const Config::License& licConfig, const UTILS::CCancelToken& token)
{
  if (!licConfig.serverCert.empty())
  {
    LOG::Log(LOGDEBUG, "Using the configured license server certificate (%zu bytes)",
             licConfig.serverCert.size());
    return UTILS::CPromise<std::vector<uint8_t>>::Resolved(licConfig.serverCert);
  }

  if (licConfig.serverCertUrl.empty())
  {
    return UTILS::CPromise<std::vector<uint8_t>>::Rejected(
        "CertificateFetchFailed: no certificate source configured");
  }

  UTILS::CPromise<std::vector<uint8_t>> promise;

  CHttpRequest request;
  request.Open("GET", licConfig.serverCertUrl);

  LOG::Log(LOGDEBUG, "Downloading the license server certificate from: %s",
           licConfig.serverCertUrl.c_str());

  m_transport.Send(request, {}, token,
                   [promise](const HttpResponse& response) mutable
                   {
                     if (response.statusCode == 200)
                     {
                       promise.Resolve(response.data);
                       return;
                     }

                     std::string reason{"CertificateFetchFailed: "};
                     if (response.statusCode == -1)
                       reason += "transport error";
                     else
                       reason += "HTTP status " + std::to_string(response.statusCode) + " " +
                                 response.statusText;

                     promise.Reject(reason);
                   });
  return promise;
}
