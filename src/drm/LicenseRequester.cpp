/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "LicenseRequester.h"

#include "CompSettings.h"
#include "KeySystems.h"
#include "SrvBroker.h"
#include "utils/FileUtils.h"
#include "utils/log.h"

#include <exception>

using namespace UTILS;

namespace
{
// Run the setup hook, any exception thrown is returned as error message
bool RunSetupFunc(const DRM::LicenseRequestSetupFunc& setupFunc,
                  DRM::CHttpRequest& request,
                  const std::string& url,
                  const DRM::LicenseRequestAuxData& auxData,
                  std::string& error)
{
  try
  {
    setupFunc(request, url, auxData);
    return true;
  }
  catch (const std::exception& e)
  {
    error = e.what();
  }
  catch (...)
  {
    error = "unknown exception";
  }
  return false;
}
} // unnamed namespace

DRM::CLicenseRequester::CLicenseRequester(CNegotiationState& state,
                                          const std::map<std::string, Config>& drmConfigs,
                                          IHttpTransport& transport,
                                          IErrorListener& errorListener,
                                          LicenseRequestSetupFunc setupFunc)
  : m_state(state),
    m_drmConfigs(drmConfigs),
    m_transport(transport),
    m_errorListener(errorListener),
    m_setupFunc(std::move(setupFunc))
{
}

void DRM::CLicenseRequester::RequestLicense(const std::vector<uint8_t>& message,
                                            LicenseCallback onLicense)
{
  std::shared_ptr<CKeySystemEntry> entry = m_state.GetActiveEntry();
  if (!entry)
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_ACCESS, true,
                "No key system access available to request the license");
    return;
  }

  auto itCfg = m_drmConfigs.find(entry->GetKeySystem());
  if (itCfg == m_drmConfigs.end() || itCfg->second.license.serverUrl.empty())
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true,
                "No license server url configured for key system \"" + entry->GetKeySystem() +
                    "\"");
    return;
  }
  const Config::License& licConfig = itCfg->second.license;

  CHttpRequest request;
  if (!CreateLicenseRequest(*entry, licConfig, request))
    return;

  std::vector<uint8_t> challenge;
  if (!GenerateChallenge(*entry, message, challenge))
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true,
                "Cannot generate the license challenge");
    return;
  }

  if (CSrvBroker::GetSettings().IsDebugLicense())
    SaveDebugData(entry->GetKeySystem(), "challenge", challenge);

  LOG::Log(LOGDEBUG, "Sending license request to: %s (method %s, challenge %zu bytes)",
           request.GetUrl().c_str(), request.GetMethod().c_str(), challenge.size());

  const std::string keySystem = entry->GetKeySystem();
  const CCancelToken token = m_state.GetCancelToken();

  m_transport.Send(request, challenge, token,
                   [this, token, keySystem, message, onLicense](const HttpResponse& response)
                   {
                     if (token.IsCancelled())
                       return;
                     OnLicenseResponse(response, keySystem, message, onLicense);
                   });
}

bool DRM::CLicenseRequester::CreateLicenseRequest(const CKeySystemEntry& entry,
                                                  const Config::License& licConfig,
                                                  CHttpRequest& request)
{
  const std::string& url = licConfig.serverUrl;
  LicenseRequestAuxData auxData;
  auxData.keyId = entry.GetKeyId();

  if (m_setupFunc)
  {
    std::string error;
    if (!RunSetupFunc(m_setupFunc, request, url, auxData, error))
    {
      LOG::LogF(LOGWARNING, "License request setup failed (%s), retrying with opened request",
                error.c_str());
      request.Open("POST", url);

      if (!RunSetupFunc(m_setupFunc, request, url, auxData, error))
      {
        NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true,
                    "License request setup failed: " + error);
        return false;
      }
    }
  }

  // The setup hook can open the request with its own method
  if (!request.IsOpened())
    request.Open("POST", url);

  for (const auto& header : licConfig.reqHeaders)
  {
    if (!request.HasHeader(header.first))
      request.SetHeader(header.first, header.second);
  }
  return true;
}

bool DRM::CLicenseRequester::GenerateChallenge(const CKeySystemEntry& entry,
                                               const std::vector<uint8_t>& message,
                                               std::vector<uint8_t>& challenge)
{
  // Widevine and FairPlay license servers accept the CDM message as is
  if (entry.GetKeySystem() == KS_WIDEVINE || entry.GetKeySystem() == KS_FAIRPLAY)
  {
    challenge = message;
    return true;
  }

  LOG::LogF(LOGERROR, "Unsupported key system \"%s\"", entry.GetKeySystem().c_str());
  return false;
}

void DRM::CLicenseRequester::OnLicenseResponse(const HttpResponse& response,
                                               const std::string& keySystem,
                                               const std::vector<uint8_t>& message,
                                               LicenseCallback onLicense)
{
  if (response.statusCode == 200)
  {
    m_state.ResetLicenseFailures();
    LOG::Log(LOGDEBUG, "License request succeeded (%zu bytes)", response.data.size());

    if (CSrvBroker::GetSettings().IsDebugLicense())
      SaveDebugData(keySystem, "response", response.data);

    onLicense(response.data);
    return;
  }

  LOG::Log(LOGERROR, "License server returned failure (HTTP status %i %s)", response.statusCode,
           response.statusText.c_str());

  const uint32_t failures = m_state.IncreaseLicenseFailures();
  if (failures > MAX_LICENSE_REQUEST_FAILURES)
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true,
                "License request failed " + std::to_string(failures) + " times, last HTTP status " +
                    std::to_string(response.statusCode));
    return;
  }

  const uint32_t attemptsLeft = MAX_LICENSE_REQUEST_FAILURES - failures + 1;
  LOG::Log(LOGWARNING, "Retrying license request, %u attempts left", attemptsLeft);
  RequestLicense(message, onLicense);
}

void DRM::CLicenseRequester::SaveDebugData(std::string_view keySystem,
                                           std::string_view fileExt,
                                           const std::vector<uint8_t>& data)
{
  const std::string filePath = FILESYS::PathCombine(
      FILESYS::GetAddonUserPath(), std::string(keySystem) + "." + std::string(fileExt));

  if (!FILESYS::SaveFile(filePath, data, true))
    LOG::LogF(LOGERROR, "Cannot save license debug data to \"%s\"", filePath.c_str());
}
