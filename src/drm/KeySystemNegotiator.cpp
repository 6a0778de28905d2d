/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "KeySystemNegotiator.h"

#include "KeySystems.h"
#include "utils/log.h"

using namespace UTILS;

DRM::CKeySystemNegotiator::CKeySystemNegotiator(CNegotiationState& state,
                                                RequestAccessFunc requestAccessFunc,
                                                const std::map<std::string, Config>& drmConfigs,
                                                CCertificateProvider& certProvider,
                                                CKeySessionManager& sessionManager,
                                                IErrorListener& errorListener)
  : m_state(state),
    m_requestAccessFunc(std::move(requestAccessFunc)),
    m_drmConfigs(drmConfigs),
    m_certProvider(certProvider),
    m_sessionManager(sessionManager),
    m_errorListener(errorListener)
{
}

bool DRM::CKeySystemNegotiator::RequestAccess(std::string_view keySystem,
                                              const std::vector<std::string>& audioCodecs,
                                              const std::vector<std::string>& videoCodecs)
{
  if (m_state.HasKeysPromise())
  {
    LOG::Log(LOGDEBUG, "Key system access already requested");
    return true;
  }

  std::vector<KeySystemConfiguration> configs;
  if (!GetSupportedConfigurations(keySystem, audioCodecs, videoCodecs, configs))
    return false;

  if (!m_requestAccessFunc)
  {
    LOG::LogF(LOGERROR, "No function to request the key system access");
    return false;
  }

  LOG::Log(LOGDEBUG, "Requesting access to key system \"%s\"", std::string(keySystem).c_str());

  CNegotiationState::KeysPromise keysPromise = m_state.CreateKeysPromise();
  const CCancelToken token = m_state.GetCancelToken();
  const std::string keySystemStr{keySystem};

  m_requestAccessFunc(keySystem, configs, token)
      .Then(
          [this, token, keySystemStr](const std::shared_ptr<IKeySystemAccess>& access)
          {
            if (token.IsCancelled())
              return;
            OnAccessGranted(keySystemStr, access);
          },
          [token, keySystemStr, keysPromise](const std::string& reason) mutable
          {
            if (token.IsCancelled())
              return;
            LOG::Log(LOGERROR, "Access to key system \"%s\" denied: %s", keySystemStr.c_str(),
                     reason.c_str());
            keysPromise.Reject(reason);
          });

  return true;
}

void DRM::CKeySystemNegotiator::OnAccessGranted(const std::string& keySystem,
                                                std::shared_ptr<IKeySystemAccess> access)
{
  CNegotiationState::KeysPromise keysPromise = m_state.GetKeysPromise();

  if (!access)
  {
    LOG::LogF(LOGERROR, "Key system \"%s\" access granted without access object",
              keySystem.c_str());
    keysPromise.Reject("Invalid key system access");
    return;
  }

  LOG::Log(LOGDEBUG, "Access to key system \"%s\" granted", keySystem.c_str());

  auto entry = std::make_shared<CKeySystemEntry>(keySystem, access);
  m_state.AddEntry(entry);

  const CCancelToken token = m_state.GetCancelToken();
  std::weak_ptr<CKeySystemEntry> weakEntry = entry;

  access->CreateMediaKeys(token).Then(
      [this, token, weakEntry](const std::shared_ptr<IMediaKeys>& mediaKeys)
      {
        std::shared_ptr<CKeySystemEntry> entry = weakEntry.lock();
        if (token.IsCancelled() || !entry)
          return;
        OnMediaKeysCreated(entry, mediaKeys);
      },
      [token, keySystem, keysPromise](const std::string& reason) mutable
      {
        if (token.IsCancelled())
          return;
        LOG::Log(LOGERROR, "Cannot create media keys for key system \"%s\": %s",
                 keySystem.c_str(), reason.c_str());
        keysPromise.Reject(reason);
      });
}

void DRM::CKeySystemNegotiator::OnMediaKeysCreated(std::shared_ptr<CKeySystemEntry> entry,
                                                   std::shared_ptr<IMediaKeys> mediaKeys)
{
  if (!mediaKeys)
  {
    LOG::LogF(LOGERROR, "Media keys created without keys object");
    m_state.GetKeysPromise().Reject("Invalid media keys");
    return;
  }

  LOG::Log(LOGDEBUG, "Media keys created for key system \"%s\"", entry->GetKeySystem().c_str());
  entry->SetMediaKeys(mediaKeys);

  const bool isCertRequired = IsServerCertificateRequired(entry->GetKeySystem());

  // A missing configuration is reported when the license is requested
  auto itCfg = m_drmConfigs.find(entry->GetKeySystem());
  if (itCfg == m_drmConfigs.end() ||
      !CCertificateProvider::HasCertificateSource(itCfg->second.license))
  {
    if (isCertRequired)
    {
      LOG::Log(LOGWARNING, "No server certificate configured for key system \"%s\"",
               entry->GetKeySystem().c_str());
    }
    CompleteMediaKeys(mediaKeys);
    return;
  }

  const CCancelToken token = m_state.GetCancelToken();

  m_certProvider.GetCertificate(itCfg->second.license, token)
      .Then(
          [this, token, mediaKeys](const std::vector<uint8_t>& certificate)
          {
            if (token.IsCancelled())
              return;

            LOG::Log(LOGDEBUG, "Setting server certificate (%zu bytes)", certificate.size());
            mediaKeys->SetServerCertificate(certificate, token)
                .Then(nullptr,
                      [](const std::string& reason) {
                        LOG::Log(LOGERROR, "Cannot set the server certificate: %s",
                                 reason.c_str());
                      });
            CompleteMediaKeys(mediaKeys);
          },
          [this, token, mediaKeys](const std::string& reason)
          {
            if (token.IsCancelled())
              return;

            // The media keys remain usable without the certificate
            NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_CERTIFICATE_REQUEST_FAILED, true,
                        reason);
            CompleteMediaKeys(mediaKeys);
          });
}

void DRM::CKeySystemNegotiator::CompleteMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys)
{
  m_sessionManager.OnMediaKeysCreated();
  m_state.GetKeysPromise().Resolve(mediaKeys);
}
