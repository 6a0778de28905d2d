/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "KeySessionManager.h"

#include "KeySystems.h"
#include "SinfParser.h"
#include "utils/log.h"

using namespace UTILS;

namespace
{
// Forward the CDM session messages to the license server
class ATTR_DLL_LOCAL CKeySessionObserver : public DRM::ICdmObserver
{
public:
  CKeySessionObserver(DRM::CLicenseRequester& licenseRequester,
                      std::weak_ptr<DRM::IMediaKeySession> session,
                      const CCancelToken& token)
    : m_licenseRequester(licenseRequester), m_session(std::move(session)), m_cancelToken(token)
  {
  }

  void OnNotify(const DRM::CdmMessage& message) override
  {
    if (m_cancelToken.IsCancelled())
      return;

    if (message.type == DRM::CdmMessageType::SESSION_MESSAGE)
    {
      LOG::Log(LOGDEBUG, "Key session \"%s\" message received (%zu bytes)",
               message.sessionId.c_str(), message.data.size());

      std::weak_ptr<DRM::IMediaKeySession> weakSession = m_session;
      const CCancelToken token = m_cancelToken;

      m_licenseRequester.RequestLicense(
          message.data,
          [weakSession, token](const std::vector<uint8_t>& license)
          {
            std::shared_ptr<DRM::IMediaKeySession> session = weakSession.lock();
            if (!session || token.IsCancelled())
              return;

            session->Update(license, token)
                .Then(nullptr,
                      [](const std::string& reason)
                      { LOG::Log(LOGERROR, "Key session update failed: %s", reason.c_str()); });
          });
    }
    else if (message.type == DRM::CdmMessageType::SESSION_KEY_CHANGE)
    {
      LOG::Log(LOGDEBUG, "Key session \"%s\" key status changed (status %u)",
               message.sessionId.c_str(), message.status);
    }
  }

private:
  DRM::CLicenseRequester& m_licenseRequester;
  std::weak_ptr<DRM::IMediaKeySession> m_session;
  CCancelToken m_cancelToken;
};
} // unnamed namespace

DRM::CKeySessionManager::CKeySessionManager(CNegotiationState& state,
                                            CLicenseRequester& licenseRequester,
                                            IErrorListener& errorListener)
  : m_state(state), m_licenseRequester(licenseRequester), m_errorListener(errorListener)
{
}

void DRM::CKeySessionManager::OnMediaKeysCreated()
{
  const CCancelToken& token = m_state.GetCancelToken();

  m_state.ForEachEntry(
      [this, &token](CKeySystemEntry& entry)
      {
        if (!entry.GetMediaKeys() || entry.GetSession())
          return;

        std::shared_ptr<IMediaKeySession> session = entry.GetMediaKeys()->CreateSession();
        if (!session)
        {
          LOG::LogF(LOGERROR, "Cannot create the key session for key system \"%s\"",
                    entry.GetKeySystem().c_str());
          return;
        }

        LOG::Log(LOGDEBUG, "Key session created for key system \"%s\"",
                 entry.GetKeySystem().c_str());
        auto observer = std::make_unique<CKeySessionObserver>(m_licenseRequester, session, token);
        entry.SetSession(session, std::move(observer));
      });
}

void DRM::CKeySessionManager::GenerateRequest(std::string_view initDataType,
                                              const std::vector<uint8_t>& initData)
{
  std::shared_ptr<CKeySystemEntry> entry = m_state.GetActiveEntry();
  if (!entry)
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_ACCESS, true,
                "No key system access to generate the license request");
    return;
  }

  if (entry->IsSessionInitialized())
  {
    LOG::LogF(LOGWARNING, "License request already generated for key system \"%s\", ignored",
              entry->GetKeySystem().c_str());
    return;
  }

  std::shared_ptr<IMediaKeySession> session = entry->GetSession();
  if (!session)
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_SESSION, true,
                "No key session to generate the license request");
    return;
  }

  if (initData.empty())
  {
    NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_INIT_DATA, true,
                "No init data to generate the license request");
    return;
  }

  if (initDataType == INIT_DATA_TYPE_SINF)
  {
    std::optional<std::string> keyId;
    if (!FindKeyIdInSinf(initData, keyId))
    {
      LOG::LogF(LOGERROR, "Cannot parse the \"sinf\" init data, the key id is not available");
    }
    else if (keyId.has_value())
    {
      LOG::Log(LOGDEBUG, "Found key id in \"sinf\" init data: %s", keyId->c_str());
      entry->SetKeyId(*keyId);
    }
  }

  entry->SetSessionInitialized();

  const CCancelToken token = m_state.GetCancelToken();
  std::weak_ptr<CKeySystemEntry> weakEntry = entry;

  session->GenerateRequest(initDataType, initData, token)
      .Then(
          [weakEntry, token](const VoidResult&)
          {
            std::shared_ptr<CKeySystemEntry> entry = weakEntry.lock();
            if (token.IsCancelled() || !entry)
              return;

            LOG::Log(LOGDEBUG, "License request generated for key system \"%s\"",
                     entry->GetKeySystem().c_str());
            entry->SetState(KeySessionState::REQUEST_GENERATED);
          },
          [this, weakEntry, token](const std::string& reason)
          {
            std::shared_ptr<CKeySystemEntry> entry = weakEntry.lock();
            if (token.IsCancelled() || !entry)
              return;

            entry->SetState(KeySessionState::REQUEST_FAILED);
            NotifyError(m_errorListener, ErrorDetail::KEY_SYSTEM_NO_SESSION, false,
                        "Failed to generate the license request: " + reason);
          });
}
