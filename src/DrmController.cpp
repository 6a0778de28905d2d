/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "DrmController.h"

#include "CompKodiProps.h"
#include "CompSettings.h"
#include "SrvBroker.h"
#include "drm/KeySystems.h"
#include "utils/log.h"

using namespace DRMKEYS;
using namespace DRM;
using namespace UTILS;

CDrmController::CDrmController(RequestAccessFunc requestAccessFunc,
                               IHttpTransport& transport,
                               IErrorListener& errorListener,
                               LicenseRequestSetupFunc licenseSetupFunc)
  : m_errorListener(errorListener)
{
  const KODI_PROPS::CCompKodiProps& kodiProps = CSrvBroker::GetKodiProps();
  m_isEmeEnabled = kodiProps.IsEmeEnabled();

  for (const auto& [keySystem, propCfg] : kodiProps.GetDrmConfigs())
  {
    m_drmConfigs.emplace(keySystem, CreateDRMConfig(keySystem, propCfg));
  }

  m_certProvider = std::make_unique<CCertificateProvider>(transport);
  m_licenseRequester = std::make_unique<CLicenseRequester>(m_state, m_drmConfigs, transport,
                                                           m_errorListener,
                                                           std::move(licenseSetupFunc));
  m_sessionManager =
      std::make_unique<CKeySessionManager>(m_state, *m_licenseRequester, m_errorListener);
  m_negotiator = std::make_unique<CKeySystemNegotiator>(m_state, std::move(requestAccessFunc),
                                                        m_drmConfigs, *m_certProvider,
                                                        *m_sessionManager, m_errorListener);
}

CDrmController::~CDrmController()
{
  OnMediaDetached();
}

void CDrmController::OnMediaAttached(std::shared_ptr<IMediaSink> media)
{
  if (!m_isEmeEnabled)
    return;

  if (!media)
  {
    LOG::LogF(LOGERROR, "Cannot attach an empty media");
    return;
  }

  if (m_media)
    OnMediaDetached();

  m_state.Reset();
  m_media = std::move(media);
  m_media->AttachEncryptedListener(this);

  if (m_pendingLevel.has_value())
  {
    const LevelLoadedInfo info = *m_pendingLevel;
    m_pendingLevel.reset();
    OnLevelLoaded(info);
  }
}

void CDrmController::OnMediaDetached()
{
  if (m_media)
  {
    m_media->DetachEncryptedListener(this);
    m_media.reset();
  }
  m_state.Teardown();
}

void CDrmController::OnManifestParsed(std::vector<LevelInfo> levels)
{
  m_levels = std::move(levels);
}

void CDrmController::OnLevelLoaded(const LevelLoadedInfo& info)
{
  if (!m_isEmeEnabled || !info.key.has_value() || info.levelIndex >= m_levels.size())
    return;

  // Access is requested when the media will be attached
  if (!m_media)
  {
    LOG::Log(LOGDEBUG, "Level %zu loaded without media attached, key system access deferred",
             info.levelIndex);
    m_pendingLevel = info;
    return;
  }

  const LevelInfo& level = m_levels[info.levelIndex];
  const std::string_view keySystem = GetKeySystemFromKeyFormat(info.key->format);

  std::vector<std::string> audioCodecs;
  std::vector<std::string> videoCodecs;
  if (!level.audioCodec.empty())
    audioCodecs.emplace_back(level.audioCodec);
  if (!level.videoCodec.empty())
    videoCodecs.emplace_back(level.videoCodec);

  if (CSrvBroker::GetSettings().IsDebugVerbose())
  {
    LOG::Log(LOGDEBUG,
             "Level %zu loaded, key format \"%s\", key system \"%s\", codecs: audio \"%s\" video "
             "\"%s\"",
             info.levelIndex, info.key->format.c_str(), std::string(keySystem).c_str(),
             level.audioCodec.c_str(), level.videoCodec.c_str());
  }

  if (!m_negotiator->RequestAccess(keySystem, audioCodecs, videoCodecs))
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_ACCESS, true,
                "Cannot request access to key system \"" + std::string(keySystem) + "\"");
  }
}

void CDrmController::OnMediaEncrypted(const MediaEncryptedEvent& event)
{
  LOG::Log(LOGDEBUG, "Media is encrypted using \"%s\" init data type",
           event.initDataType.c_str());

  if (!m_state.HasKeysPromise())
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_KEYS, true,
                "Media is encrypted but no key system access or keys have been requested");
    return;
  }

  const CCancelToken token = m_state.GetCancelToken();

  // Proceed on both outcomes, a rejected negotiation is reported by the missing keys
  auto setKeysAndGenerateRequest = [this, token, event]()
  {
    if (token.IsCancelled() || !m_media)
      return;

    AttemptSetMediaKeys();
    m_sessionManager->GenerateRequest(event.initDataType, event.initData);
  };

  m_state.GetKeysPromise().Then(
      [setKeysAndGenerateRequest](const std::shared_ptr<IMediaKeys>&)
      { setKeysAndGenerateRequest(); },
      [setKeysAndGenerateRequest](const std::string&) { setKeysAndGenerateRequest(); });
}

void CDrmController::AttemptSetMediaKeys()
{
  if (m_state.IsKeysApplied())
    return;

  std::shared_ptr<CKeySystemEntry> entry = m_state.GetActiveEntry();
  if (!entry || !entry->GetMediaKeys())
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_KEYS, true,
                "Media is encrypted but no key system access or keys have been obtained");
    return;
  }

  LOG::Log(LOGDEBUG, "Setting media keys of key system \"%s\"", entry->GetKeySystem().c_str());
  m_media->SetMediaKeys(entry->GetMediaKeys());
  m_state.SetKeysApplied();
}
