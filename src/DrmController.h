/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "drm/CertificateProvider.h"
#include "drm/DrmConfig.h"
#include "drm/DrmErrors.h"
#include "drm/HttpTransport.h"
#include "drm/IKeySystemPlatform.h"
#include "drm/KeySessionManager.h"
#include "drm/KeySystemNegotiator.h"
#include "drm/LicenseRequester.h"
#include "drm/NegotiationState.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DRMKEYS
{

struct LevelInfo
{
  std::string audioCodec;
  std::string videoCodec;
};

// The key of a HLS media playlist (EXT-X-KEY)
struct LevelKey
{
  std::string format; // KEYFORMAT attribute
};

struct LevelLoadedInfo
{
  size_t levelIndex{0};
  std::optional<LevelKey> key;
};

/*!
 * \brief Drive the key system negotiation of the playback, from the media attach
 *        to the license exchange of the key session.
 *        All methods must be called from the control thread.
 */
class ATTR_DLL_LOCAL CDrmController : public DRM::IMediaEncryptedListener
{
public:
  /*!
   * \param requestAccessFunc Platform function to request the key system access
   * \param transport HTTP transport for license and certificate requests
   * \param errorListener Receive the key system errors
   * \param licenseSetupFunc [OPT] Hook to customize the license requests
   */
  CDrmController(DRM::RequestAccessFunc requestAccessFunc,
                 DRM::IHttpTransport& transport,
                 DRM::IErrorListener& errorListener,
                 DRM::LicenseRequestSetupFunc licenseSetupFunc = nullptr);
  ~CDrmController() override;

  void OnMediaAttached(std::shared_ptr<DRM::IMediaSink> media);
  void OnMediaDetached();
  void OnManifestParsed(std::vector<LevelInfo> levels);
  void OnLevelLoaded(const LevelLoadedInfo& info);

  // IMediaEncryptedListener
  void OnMediaEncrypted(const DRM::MediaEncryptedEvent& event) override;

  bool IsEmeEnabled() const { return m_isEmeEnabled; }

private:
  void AttemptSetMediaKeys();

  bool m_isEmeEnabled{false};
  std::map<std::string, DRM::Config> m_drmConfigs;
  DRM::IErrorListener& m_errorListener;

  DRM::CNegotiationState m_state;
  std::unique_ptr<DRM::CCertificateProvider> m_certProvider;
  std::unique_ptr<DRM::CLicenseRequester> m_licenseRequester;
  std::unique_ptr<DRM::CKeySessionManager> m_sessionManager;
  std::unique_ptr<DRM::CKeySystemNegotiator> m_negotiator;

  std::shared_ptr<DRM::IMediaSink> m_media;
  std::vector<LevelInfo> m_levels;
  std::optional<LevelLoadedInfo> m_pendingLevel; // Last keyed level loaded while detached
};

} // namespace DRMKEYS
