/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "DrmConfig.h"
#include "HttpTransport.h"
#include "utils/Promise.h"

#include <cstdint>
#include <vector>

namespace DRM
{

/*!
 * \brief Provide the license server certificate, from the static configured data
 *        or downloaded from the configured url. Downloads are never retried.
 */
class ATTR_DLL_LOCAL CCertificateProvider
{
public:
  CCertificateProvider(IHttpTransport& transport) : m_transport(transport) {}

  /*!
   * \brief Check if the configuration has a certificate source.
   */
  static bool HasCertificateSource(const Config::License& licConfig);

  /*!
   * \brief Get the certificate.
   * \param licConfig The license configuration
   * \param token The cancel token
   * \return The promise resolved with the certificate data, rejected with a
   *         "CertificateFetchFailed" reason on failure
   */
  UTILS::CPromise<std::vector<uint8_t>> GetCertificate(const Config::License& licConfig,
                                                       const UTILS::CCancelToken& token);

private:
  IHttpTransport& m_transport;
};

} // namespace DRM
