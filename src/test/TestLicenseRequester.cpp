/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TestHelper.h"

#include "../drm/CertificateProvider.h"
#include "../drm/KeySystems.h"
#include "../drm/LicenseRequester.h"
#include "../drm/NegotiationState.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace DRM;
using namespace UTILS;

class LicenseRequesterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Config config;
    config.license.serverUrl = TEST_LICENSE_URL;
    config.license.reqHeaders["Content-Type"] = "application/octet-stream";
    m_drmConfigs[STR(KS_WIDEVINE)] = config;

    m_state.Reset();
    m_entry = std::make_shared<CKeySystemEntry>(
        KS_WIDEVINE, std::make_shared<CTestKeySystemAccess>(KS_WIDEVINE));
    m_state.AddEntry(m_entry);
  }

  void TearDown() override { m_state.Teardown(); }

  std::unique_ptr<CLicenseRequester> CreateRequester(LicenseRequestSetupFunc setupFunc = nullptr)
  {
    return std::make_unique<CLicenseRequester>(m_state, m_drmConfigs, m_transport, m_errors,
                                               std::move(setupFunc));
  }

  void RequestLicense(CLicenseRequester& requester)
  {
    requester.RequestLicense(testHelper::ToBytes("challenge"),
                             [this](const std::vector<uint8_t>& license)
                             { m_licenses.emplace_back(license); });
  }

  std::map<std::string, Config> m_drmConfigs;
  CNegotiationState m_state;
  std::shared_ptr<CKeySystemEntry> m_entry;
  CTestHttpTransport m_transport;
  CTestErrorListener m_errors;
  std::vector<std::vector<uint8_t>> m_licenses;
};

TEST_F(LicenseRequesterTest, LicenseReceived)
{
  auto requester = CreateRequester();
  m_transport.AddResponse(200, testHelper::ToBytes("license"));
  RequestLicense(*requester);

  ASSERT_EQ(m_transport.m_requests.size(), 1);
  const CHttpRequest& request = m_transport.m_requests[0].request;
  EXPECT_EQ(request.GetMethod(), "POST");
  EXPECT_EQ(request.GetUrl(), STR(TEST_LICENSE_URL));
  EXPECT_EQ(request.GetHeaders().at("Content-Type"), "application/octet-stream");
  EXPECT_EQ(m_transport.m_requests[0].body, testHelper::ToBytes("challenge"));

  ASSERT_EQ(m_licenses.size(), 1);
  EXPECT_EQ(m_licenses[0], testHelper::ToBytes("license"));
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(LicenseRequesterTest, FailuresRetriedThenFatal)
{
  auto requester = CreateRequester();
  for (int i = 0; i < 4; i++)
    m_transport.AddResponse(500);

  RequestLicense(*requester);

  // First attempt and three retries
  EXPECT_EQ(m_transport.m_requests.size(), MAX_LICENSE_REQUEST_FAILURES + 1);
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true), 1);
  EXPECT_EQ(m_errors.m_errors.size(), 1);
  EXPECT_TRUE(m_licenses.empty());
}

TEST_F(LicenseRequesterTest, FailuresResetAfterSuccess)
{
  auto requester = CreateRequester();
  m_transport.AddResponse(500);
  m_transport.AddResponse(-1);
  m_transport.AddResponse(200, testHelper::ToBytes("license"));

  RequestLicense(*requester);
  EXPECT_EQ(m_transport.m_requests.size(), 3);
  EXPECT_EQ(m_licenses.size(), 1);
  EXPECT_EQ(m_state.GetLicenseFailures(), 0);

  // The whole retry budget is available again
  for (int i = 0; i < 3; i++)
    m_transport.AddResponse(403);
  m_transport.AddResponse(200, testHelper::ToBytes("license"));

  RequestLicense(*requester);
  EXPECT_EQ(m_transport.m_requests.size(), 7);
  EXPECT_EQ(m_licenses.size(), 2);
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(LicenseRequesterTest, FailuresSharedAcrossRequests)
{
  auto requester = CreateRequester();

  RequestLicense(*requester);
  RequestLicense(*requester);
  ASSERT_EQ(m_transport.GetPendingCount(), 2);

  // Each failed response of both requests counts
  m_transport.RespondPending(500);
  m_transport.RespondPending(500);
  EXPECT_EQ(m_state.GetLicenseFailures(), 2);
  EXPECT_EQ(m_transport.GetPendingCount(), 2);

  m_transport.RespondPending(500);
  m_transport.RespondPending(500);
  EXPECT_EQ(m_state.GetLicenseFailures(), 4);
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true), 1);
}

TEST_F(LicenseRequesterTest, NoActiveKeySystem)
{
  auto requester = CreateRequester();
  m_state.Reset();

  RequestLicense(*requester);
  EXPECT_TRUE(m_transport.m_requests.empty());
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_NO_ACCESS, true), 1);
}

TEST_F(LicenseRequesterTest, NoLicenseServerUrl)
{
  m_drmConfigs[STR(KS_WIDEVINE)].license.serverUrl.clear();
  auto requester = CreateRequester();

  RequestLicense(*requester);
  EXPECT_TRUE(m_transport.m_requests.empty());
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true), 1);
}

TEST_F(LicenseRequesterTest, SetupHookOpensRequest)
{
  m_entry->SetKeyId(STR(TEST_KEY_ID_HEX));

  std::optional<std::string> hookKeyId;
  auto requester = CreateRequester(
      [&](CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)
      {
        hookKeyId = auxData.keyId;
        request.Open("PUT", std::string(url) + "?kid=" + auxData.keyId.value_or(""));
        request.SetHeader("content-type", "application/json");
        request.SetWithCredentials(true);
      });
  m_transport.AddResponse(200, testHelper::ToBytes("license"));

  RequestLicense(*requester);

  ASSERT_EQ(m_transport.m_requests.size(), 1);
  const CHttpRequest& request = m_transport.m_requests[0].request;
  EXPECT_EQ(request.GetMethod(), "PUT");
  EXPECT_EQ(request.GetUrl(), STR(TEST_LICENSE_URL) + "?kid=" + STR(TEST_KEY_ID_HEX));
  EXPECT_TRUE(request.IsWithCredentials());
  // The header set by the hook is not replaced by the configured one
  ASSERT_EQ(request.GetHeaders().size(), 1);
  EXPECT_EQ(request.GetHeaders().at("content-type"), "application/json");

  ASSERT_TRUE(hookKeyId.has_value());
  EXPECT_EQ(*hookKeyId, STR(TEST_KEY_ID_HEX));
}

TEST_F(LicenseRequesterTest, SetupHookRetriedOnOpenedRequest)
{
  int hookCalls{0};
  auto requester = CreateRequester(
      [&](CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)
      {
        hookCalls++;
        // Throws when the request is not opened yet
        request.SetHeader("X-Custom", "value");
      });
  m_transport.AddResponse(200, testHelper::ToBytes("license"));

  RequestLicense(*requester);

  EXPECT_EQ(hookCalls, 2);
  ASSERT_EQ(m_transport.m_requests.size(), 1);
  const CHttpRequest& request = m_transport.m_requests[0].request;
  EXPECT_EQ(request.GetMethod(), "POST");
  EXPECT_TRUE(request.HasHeader("X-Custom"));
  EXPECT_TRUE(request.HasHeader("Content-Type"));
  EXPECT_EQ(m_licenses.size(), 1);
  EXPECT_TRUE(m_errors.m_errors.empty());
}

TEST_F(LicenseRequesterTest, SetupHookAlwaysFailing)
{
  int hookCalls{0};
  auto requester = CreateRequester(
      [&](CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)
      {
        hookCalls++;
        throw std::runtime_error("hook failure");
      });

  RequestLicense(*requester);

  EXPECT_EQ(hookCalls, 2);
  EXPECT_TRUE(m_transport.m_requests.empty());
  EXPECT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true), 1);
}

TEST_F(LicenseRequesterTest, SetupHookThrowingNonStandardException)
{
  int hookCalls{0};
  auto requester = CreateRequester(
      [&](CHttpRequest& request, std::string_view url, const LicenseRequestAuxData& auxData)
      {
        hookCalls++;
        throw 42;
      });

  EXPECT_NO_THROW(RequestLicense(*requester));

  EXPECT_EQ(hookCalls, 2);
  EXPECT_TRUE(m_transport.m_requests.empty());
  ASSERT_EQ(m_errors.Count(ErrorDetail::KEY_SYSTEM_LICENSE_REQUEST_FAILED, true), 1);
  EXPECT_EQ(m_errors.m_errors[0].reason, "License request setup failed: unknown exception");
}

TEST_F(LicenseRequesterTest, ResponseIgnoredAfterTeardown)
{
  auto requester = CreateRequester();
  RequestLicense(*requester);
  ASSERT_EQ(m_transport.GetPendingCount(), 1);

  m_state.Teardown();
  EXPECT_TRUE(m_transport.m_requests[0].token.IsCancelled());

  m_transport.RespondPending(500);
  EXPECT_TRUE(m_licenses.empty());
  EXPECT_TRUE(m_errors.m_errors.empty());
  EXPECT_EQ(m_transport.m_requests.size(), 1);
}

class CertificateProviderTest : public ::testing::Test
{
protected:
  CTestHttpTransport m_transport;
  CCertificateProvider m_provider{m_transport};
};

TEST_F(CertificateProviderTest, StaticCertificate)
{
  Config::License licConfig;
  licConfig.serverCert = testHelper::ToBytes("certificate");
  licConfig.serverCertUrl = TEST_CERT_URL;

  std::vector<uint8_t> certificate;
  m_provider.GetCertificate(licConfig, CCancelToken())
      .Then([&](const std::vector<uint8_t>& cert) { certificate = cert; }, nullptr);

  EXPECT_EQ(certificate, testHelper::ToBytes("certificate"));
  EXPECT_TRUE(m_transport.m_requests.empty());
}

TEST_F(CertificateProviderTest, FetchedCertificate)
{
  Config::License licConfig;
  licConfig.serverCertUrl = TEST_CERT_URL;

  auto promise = m_provider.GetCertificate(licConfig, CCancelToken());
  EXPECT_TRUE(promise.IsPending());

  ASSERT_EQ(m_transport.m_requests.size(), 1);
  EXPECT_EQ(m_transport.m_requests[0].request.GetMethod(), "GET");
  EXPECT_EQ(m_transport.m_requests[0].request.GetUrl(), STR(TEST_CERT_URL));
  EXPECT_TRUE(m_transport.m_requests[0].body.empty());

  std::vector<uint8_t> certificate;
  promise.Then([&](const std::vector<uint8_t>& cert) { certificate = cert; }, nullptr);
  m_transport.RespondPending(200, testHelper::ToBytes("certificate"));
  EXPECT_EQ(certificate, testHelper::ToBytes("certificate"));
}

TEST_F(CertificateProviderTest, FetchFailed)
{
  Config::License licConfig;
  licConfig.serverCertUrl = TEST_CERT_URL;
  m_transport.AddResponse(404);

  std::string reason;
  m_provider.GetCertificate(licConfig, CCancelToken())
      .Then(nullptr, [&](const std::string& r) { reason = r; });

  EXPECT_EQ(reason.rfind("CertificateFetchFailed", 0), 0);
  EXPECT_NE(reason.find("404"), std::string::npos);
  // Never retried
  EXPECT_EQ(m_transport.m_requests.size(), 1);
}

TEST_F(CertificateProviderTest, NoCertificateSource)
{
  Config::License licConfig;
  EXPECT_FALSE(CCertificateProvider::HasCertificateSource(licConfig));

  auto promise = m_provider.GetCertificate(licConfig, CCancelToken());
  EXPECT_TRUE(promise.IsRejected());
  EXPECT_TRUE(m_transport.m_requests.empty());
}
