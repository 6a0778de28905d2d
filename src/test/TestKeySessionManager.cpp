/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TestHelper.h"

#include "../drm/KeySessionManager.h"
#include "../drm/KeySystems.h"

#include <gtest/gtest.h>

using namespace DRM;
using namespace UTILS;

class KeySessionManagerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Config config;
    config.license.serverUrl = TEST_LICENSE_URL;
    m_drmConfigs[STR(KS_FAIRPLAY)] = config;

    m_state.Reset();
    m_access = std::make_shared<CTestKeySystemAccess>(KS_FAIRPLAY);
    m_entry = std::make_shared<CKeySystemEntry>(KS_FAIRPLAY, m_access);
    m_entry->SetMediaKeys(m_access->m_mediaKeys);
    m_state.AddEntry(m_entry);
  }

  void TearDown() override { m_state.Teardown(); }

  std::shared_ptr<CTestKeySession> CreateSession()
  {
    m_sessionManager.OnMediaKeysCreated();
    if (m_access->m_mediaKeys->m_sessions.empty())
      return nullptr;
    return m_access->m_mediaKeys->m_sessions.back();
  }

  std::map<std::string, Config> m_drmConfigs;
  CNegotiationState m_state;
  CTestHttpTransport m_transport;
  CTestErrorListener m_errors;
  std::optional<std::string> m_hookKeyId;
  CLicenseRequester m_licenseRequester{
      m_state, m_drmConfigs, m_transport, m_errors,
      [this](CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)
      {
        m_hookKeyId = auxData.keyId;
        request.Open("POST", url);
      }};
  CKeySessionManager m_sessionManager{m_state, m_licenseRequester, m_errors};

  std::shared_ptr<CTestKeySystemAccess> m_access;
  std::shared_ptr<CKeySystemEntry> m_entry;
};

TEST_F(KeySessionManagerTest, SessionCreatedOnce)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);
  EXPECT_EQ(m_entry->GetState(), KeySessionState::SESSION_CREATED);
  EXPECT_EQ(session->GetObserversCount(), 1);

  m_sessionManager.OnMediaKeysCreated();
  EXPECT_EQ(m_access->m_mediaKeys->m_sessions.size(), 1);
}

TEST_F(KeySessionManagerTest, SessionCreationFailed)
{
  m_access->m_mediaKeys->m_isCreateSessionFailing = true;
  EXPECT_FALSE(CreateSession());
  EXPECT_FALSE(m_entry->GetSession());

  m_sessionManager.GenerateRequest("sinf", testHelper::CreateSinfInitData(TEST_KEY_ID, true));
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_NO_SESSION, true), 1);
}

TEST_F(KeySessionManagerTest, GenerateRequestWithSinf)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);

  const std::vector<uint8_t> initData = testHelper::CreateSinfInitData(TEST_KEY_ID, true);
  m_sessionManager.GenerateRequest("sinf", initData);

  EXPECT_EQ(session->m_generateCount, 1);
  EXPECT_EQ(session->m_initDataType, "sinf");
  EXPECT_EQ(session->m_initData, initData);
  EXPECT_TRUE(m_entry->IsSessionInitialized());
  EXPECT_EQ(m_entry->GetState(), KeySessionState::REQUEST_GENERATED);
  ASSERT_TRUE(m_entry->GetKeyId().has_value());
  EXPECT_EQ(*m_entry->GetKeyId(), STR(TEST_KEY_ID_HEX));
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(KeySessionManagerTest, GenerateRequestOnlyOnce)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);

  const std::vector<uint8_t> initData = testHelper::CreateSinfInitData(TEST_KEY_ID, false);
  m_sessionManager.GenerateRequest("sinf", initData);
  m_sessionManager.GenerateRequest("sinf", initData);
  m_sessionManager.GenerateRequest("sinf", initData);

  EXPECT_EQ(session->m_generateCount, 1);
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(KeySessionManagerTest, GenerateRequestPreconditions)
{
  // No init data
  ASSERT_TRUE(CreateSession());
  m_sessionManager.GenerateRequest("sinf", {});
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_NO_INIT_DATA, true), 1);
  EXPECT_FALSE(m_entry->IsSessionInitialized());

  // No key system access
  m_state.Reset();
  m_sessionManager.GenerateRequest("sinf", testHelper::ToBytes("{}"));
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_NO_ACCESS, true), 1);
}

TEST_F(KeySessionManagerTest, MalformedSinfProceedsWithoutKeyId)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);

  m_sessionManager.GenerateRequest("sinf", testHelper::ToBytes("{\"sinf\":[\"%%%\"]}"));

  EXPECT_EQ(session->m_generateCount, 1);
  EXPECT_FALSE(m_entry->GetKeyId().has_value());
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(KeySessionManagerTest, GenerateRequestRejected)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);
  session->m_isAutoResolve = false;

  m_sessionManager.GenerateRequest("sinf", testHelper::CreateSinfInitData(TEST_KEY_ID, true));
  EXPECT_TRUE(m_entry->IsSessionInitialized());
  EXPECT_TRUE(m_errors.m_errors.empty());

  session->m_generatePromise.Reject("InvalidStateError");
  EXPECT_EQ(m_entry->GetState(), KeySessionState::REQUEST_FAILED);
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_NO_SESSION, false), 1);
  EXPECT_EQ(m_errors.CountFatal(), 0);
}

TEST_F(KeySessionManagerTest, GenerateRequestResultAfterTeardown)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);
  session->m_isAutoResolve = false;

  m_sessionManager.GenerateRequest("sinf", testHelper::CreateSinfInitData(TEST_KEY_ID, true));
  m_entry.reset();
  m_state.Teardown();

  session->m_generatePromise.Reject("AbortError");
  EXPECT_TRUE(m_errors.m_errors.empty());
  EXPECT_EQ(session->GetObserversCount(), 0);
}

TEST_F(KeySessionManagerTest, SessionMessageToLicenseServer)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);
  m_sessionManager.GenerateRequest("sinf", testHelper::CreateSinfInitData(TEST_KEY_ID, true));

  m_transport.AddResponse(200, testHelper::ToBytes("license"));
  session->SendMessage(CdmMessageType::SESSION_MESSAGE, testHelper::ToBytes("spc"));

  ASSERT_EQ(m_transport.m_requests.size(), 1);
  EXPECT_EQ(m_transport.m_requests[0].body, testHelper::ToBytes("spc"));
  ASSERT_TRUE(m_hookKeyId.has_value());
  EXPECT_EQ(*m_hookKeyId, STR(TEST_KEY_ID_HEX));

  ASSERT_EQ(session->m_updates.size(), 1);
  EXPECT_EQ(session->m_updates[0], testHelper::ToBytes("license"));
}

TEST_F(KeySessionManagerTest, KeyChangeMessageIgnored)
{
  std::shared_ptr<CTestKeySession> session = CreateSession();
  ASSERT_TRUE(session);

  session->SendMessage(CdmMessageType::SESSION_KEY_CHANGE, {});
  EXPECT_TRUE(m_transport.m_requests.empty());
  EXPECT_TRUE(session->m_updates.empty());
}
