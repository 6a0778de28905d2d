/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "DrmConfig.h"
#include "DrmErrors.h"
#include "HttpTransport.h"
#include "NegotiationState.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DRM
{

// Max consecutive failed license requests before the error is fatal
constexpr uint32_t MAX_LICENSE_REQUEST_FAILURES = 3;

struct LicenseRequestAuxData
{
  // The key id (lowercase hexadecimal) when known from the init data
  std::optional<std::string> keyId;
};

/*!
 * \brief Hook to customize the license HTTP request (method, headers, credentials mode).
 *        The request can be not opened yet, in this case setting headers throws,
 *        then the request is opened with POST method and the hook is called again.
 */
using LicenseRequestSetupFunc = std::function<void(
    CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)>;

using LicenseCallback = std::function<void(const std::vector<uint8_t>& license)>;

class ATTR_DLL_LOCAL CLicenseRequester
{
public:
  CLicenseRequester(CNegotiationState& state,
                    const std::map<std::string, Config>& drmConfigs,
                    IHttpTransport& transport,
                    IErrorListener& errorListener,
                    LicenseRequestSetupFunc setupFunc);

  /*!
   * \brief Send the CDM session message to the license server of the active key system,
   *        failed requests are retried up to MAX_LICENSE_REQUEST_FAILURES times.
   * \param message The CDM session message
   * \param onLicense Called with the license server response
   */
  void RequestLicense(const std::vector<uint8_t>& message, LicenseCallback onLicense);

private:
  bool CreateLicenseRequest(const CKeySystemEntry& entry,
                            const Config::License& licConfig,
                            CHttpRequest& request);
  bool GenerateChallenge(const CKeySystemEntry& entry,
                         const std::vector<uint8_t>& message,
                         std::vector<uint8_t>& challenge);
  void OnLicenseResponse(const HttpResponse& response,
                         const std::string& keySystem,
                         const std::vector<uint8_t>& message,
                         LicenseCallback onLicense);
  void SaveDebugData(std::string_view keySystem,
                     std::string_view fileExt,
                     const std::vector<uint8_t>& data);

  CNegotiationState& m_state;
  const std::map<std::string, Config>& m_drmConfigs;
  IHttpTransport& m_transport;
  IErrorListener& m_errorListener;
  LicenseRequestSetupFunc m_setupFunc;
};

} // namespace DRM
