/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TestHelper.h"

#include "../SrvBroker.h"
#include "../utils/Base64Utils.h"

#include <algorithm>
#include <memory>

#include <bento4/Ap4.h>

using namespace DRM;
using namespace UTILS;

std::vector<uint8_t> testHelper::CreateSinfInitData(const uint8_t* keyId, bool isSinfBox)
{
  auto schi = std::make_unique<AP4_ContainerAtom>(AP4_ATOM_TYPE_SCHI);
  schi->AddChild(new AP4_TencAtom(AP4_CENC_CIPHER_AES_128_CTR, 8, keyId));

  std::unique_ptr<AP4_ContainerAtom> box;
  if (isSinfBox)
  {
    box = std::make_unique<AP4_ContainerAtom>(AP4_ATOM_TYPE_SINF);
    box->AddChild(new AP4_FrmaAtom(AP4_ATOM_TYPE_AVC1));
    box->AddChild(schi.release());
  }
  else
  {
    box = std::move(schi);
  }

  AP4_MemoryByteStream boxData;
  box->Write(boxData);

  std::string base64;
  BASE64::Encode(boxData.GetData(), boxData.GetDataSize(), base64);

  return ToBytes("{\"sinf\":[\"" + base64 + "\"]}");
}

void testHelper::SetKodiProps(bool isEmeEnabled, const std::string& drmJson)
{
  std::map<std::string, std::string> props;
  props["inputstream.drmkeys.eme_enabled"] = isEmeEnabled ? "true" : "false";
  if (!drmJson.empty())
    props["inputstream.drmkeys.drm"] = drmJson;

  CSrvBroker::GetInstance()->Init(props);
}

std::vector<uint8_t> testHelper::ToBytes(std::string_view data)
{
  return std::vector<uint8_t>(data.begin(), data.end());
}

void CTestKeySession::DetachObserver(ICdmObserver* observer)
{
  m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), observer),
                    m_observers.end());
}

CPromise<VoidResult> CTestKeySession::GenerateRequest(std::string_view initDataType,
                                                      const std::vector<uint8_t>& initData,
                                                      const CCancelToken& token)
{
  m_generateCount++;
  m_initDataType = initDataType;
  m_initData = initData;

  if (m_isAutoResolve)
    return CPromise<VoidResult>::Resolved(VoidResult{});

  m_generatePromise = CPromise<VoidResult>();
  return m_generatePromise;
}

CPromise<VoidResult> CTestKeySession::Update(const std::vector<uint8_t>& response,
                                             const CCancelToken& token)
{
  m_updates.emplace_back(response);
  return CPromise<VoidResult>::Resolved(VoidResult{});
}

void CTestKeySession::SendMessage(CdmMessageType type, const std::vector<uint8_t>& data)
{
  CdmMessage message;
  message.sessionId = GetSessionId();
  message.type = type;
  message.data = data;

  // Copy, an observer can be detached while notified
  const std::vector<ICdmObserver*> observers = m_observers;
  for (ICdmObserver* observer : observers)
  {
    observer->OnNotify(message);
  }
}

std::shared_ptr<IMediaKeySession> CTestMediaKeys::CreateSession()
{
  if (m_isCreateSessionFailing)
    return nullptr;

  auto session = std::make_shared<CTestKeySession>();
  m_sessions.emplace_back(session);
  return session;
}

CPromise<VoidResult> CTestMediaKeys::SetServerCertificate(const std::vector<uint8_t>& certificate,
                                                          const CCancelToken& token)
{
  m_certificates.emplace_back(certificate);
  return CPromise<VoidResult>::Resolved(VoidResult{});
}

CPromise<std::shared_ptr<IMediaKeys>> CTestKeySystemAccess::CreateMediaKeys(
    const CCancelToken& token)
{
  m_createCount++;

  if (m_isAutoResolve)
    return CPromise<std::shared_ptr<IMediaKeys>>::Resolved(m_mediaKeys);

  return m_keysPromise;
}

RequestAccessFunc CTestPlatform::GetRequestAccessFunc()
{
  return [this](std::string_view keySystem, const std::vector<KeySystemConfiguration>& configs,
                const CCancelToken& token)
  {
    m_requestCount++;
    m_keySystem = keySystem;
    m_configs = configs;

    if (!m_access)
      m_access = std::make_shared<CTestKeySystemAccess>(keySystem);

    switch (m_mode)
    {
      case Mode::GRANT:
        return CPromise<std::shared_ptr<IKeySystemAccess>>::Resolved(m_access);
      case Mode::DENY:
        return CPromise<std::shared_ptr<IKeySystemAccess>>::Rejected(
            "Unsupported keySystem or supportedConfigurations");
      default:
        return m_accessPromise;
    }
  };
}

void CTestMediaSink::SetMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys)
{
  m_setKeysCount++;
  m_mediaKeys = std::move(mediaKeys);
}

void CTestMediaSink::AttachEncryptedListener(IMediaEncryptedListener* listener)
{
  m_listener = listener;
}

void CTestMediaSink::DetachEncryptedListener(IMediaEncryptedListener* listener)
{
  if (m_listener == listener)
    m_listener = nullptr;
}

void CTestMediaSink::Encrypted(std::string_view initDataType,
                               const std::vector<uint8_t>& initData)
{
  if (!m_listener)
    return;

  MediaEncryptedEvent event;
  event.initDataType = initDataType;
  event.initData = initData;
  m_listener->OnMediaEncrypted(event);
}

void CTestHttpTransport::Send(const CHttpRequest& request,
                              const std::vector<uint8_t>& body,
                              const CCancelToken& token,
                              HttpResponseCallback callback)
{
  m_requests.push_back({request, body, token, std::move(callback)});
  const size_t index = m_requests.size() - 1;

  if (m_responses.empty())
  {
    m_pending.emplace_back(index);
    return;
  }

  const HttpResponse response = m_responses.front();
  m_responses.pop_front();
  Respond(index, response);
}

void CTestHttpTransport::AddResponse(int statusCode, std::vector<uint8_t> data)
{
  HttpResponse response;
  response.statusCode = statusCode;
  response.statusText = statusCode == 200 ? "OK" : "Error";
  response.data = std::move(data);
  m_responses.emplace_back(response);
}

bool CTestHttpTransport::RespondPending(int statusCode, std::vector<uint8_t> data)
{
  if (m_pending.empty())
    return false;

  const size_t index = m_pending.front();
  m_pending.pop_front();

  HttpResponse response;
  response.statusCode = statusCode;
  response.statusText = statusCode == 200 ? "OK" : "Error";
  response.data = std::move(data);
  Respond(index, response);
  return true;
}

void CTestHttpTransport::Respond(size_t index, const HttpResponse& response)
{
  // Copy, the callback can send other requests
  const CCancelToken token = m_requests[index].token;
  const HttpResponseCallback callback = m_requests[index].callback;

  if (!token.IsCancelled())
    callback(response);
}

size_t CTestErrorListener::Count(ErrorDetail details, bool fatal) const
{
  return std::count_if(m_errors.begin(), m_errors.end(),
                       [&](const ErrorEvent& event)
                       { return event.details == details && event.fatal == fatal; });
}

size_t CTestErrorListener::CountFatal() const
{
  return std::count_if(m_errors.begin(), m_errors.end(),
                       [](const ErrorEvent& event) { return event.fatal; });
}
