/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "CertificateProvider.h"
#include "DrmConfig.h"
#include "DrmErrors.h"
#include "IKeySystemPlatform.h"
#include "KeySessionManager.h"
#include "NegotiationState.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace DRM
{

class ATTR_DLL_LOCAL CKeySystemNegotiator
{
public:
  CKeySystemNegotiator(CNegotiationState& state,
                       RequestAccessFunc requestAccessFunc,
                       const std::map<std::string, Config>& drmConfigs,
                       CCertificateProvider& certProvider,
                       CKeySessionManager& sessionManager,
                       IErrorListener& errorListener);

  /*!
   * \brief Request the access to the key system and create the media keys,
   *        the result is provided by the keys promise of the negotiation state.
   *        When the keys promise exists already the request is not made again.
   * \param keySystem The key system
   * \param audioCodecs The audio codecs of the content
   * \param videoCodecs The video codecs of the content
   * \return True if the request has been started (or was already started), otherwise false
   */
  bool RequestAccess(std::string_view keySystem,
                     const std::vector<std::string>& audioCodecs,
                     const std::vector<std::string>& videoCodecs);

private:
  void OnAccessGranted(const std::string& keySystem, std::shared_ptr<IKeySystemAccess> access);
  void OnMediaKeysCreated(std::shared_ptr<CKeySystemEntry> entry,
                          std::shared_ptr<IMediaKeys> mediaKeys);
  void CompleteMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys);

  CNegotiationState& m_state;
  RequestAccessFunc m_requestAccessFunc;
  const std::map<std::string, Config>& m_drmConfigs;
  CCertificateProvider& m_certProvider;
  CKeySessionManager& m_sessionManager;
  IErrorListener& m_errorListener;
};

} // namespace DRM
