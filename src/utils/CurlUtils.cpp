/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CurlUtils.h"

#include "Base64Utils.h"
#include "log.h"

#include "CompKodiProps.h"
#include "SrvBroker.h"

#include <cstdlib>

using namespace UTILS;
using namespace UTILS::CURL;

UTILS::CURL::CUrl::CUrl(std::string_view url)
{
  m_isCreated = m_file.CURLCreate(std::string(url));
  if (m_isCreated)
  {
    // Default curl options
    m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "seekable", "0");
    m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "acceptencoding", "gzip, deflate");
    // HTTP error status codes are returned by Open, not handled as open failures
    m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "failonerror", "false");
    if (!CSrvBroker::GetKodiProps().GetConfig().curlSSLVerifyPeer)
      m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "verifypeer", "false");
  }
  else
  {
    LOG::LogF(LOGERROR, "CURLCreate failed");
  }
}

UTILS::CURL::CUrl::CUrl(std::string_view url, const std::vector<uint8_t>& postData)
  : CUrl::CUrl(url)
{
  if (m_isCreated && !postData.empty())
  {
    m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "postdata", BASE64::Encode(postData));
  }
}

UTILS::CURL::CUrl::~CUrl()
{
  m_file.Close();
}

void UTILS::CURL::CUrl::SetMethod(std::string_view method)
{
  if (m_isCreated)
    m_file.CURLAddOption(ADDON_CURL_OPTION_PROTOCOL, "customrequest", std::string(method));
}

int UTILS::CURL::CUrl::Open()
{
  if (!m_isCreated || !m_file.CURLOpen(ADDON_READ_NO_CACHE | ADDON_READ_CHUNKED))
  {
    LOG::LogF(LOGERROR, "CURLOpen failed");
    return -1;
  }

  // Get HTTP response status line (e.g. "HTTP/1.1 200 OK")
  const std::string statusLine = m_file.GetPropertyValue(ADDON_FILE_PROPERTY_RESPONSE_PROTOCOL, "");
  const size_t codePos = statusLine.find(' ');
  if (codePos == std::string::npos)
    return -1;

  const size_t textPos = statusLine.find(' ', codePos + 1);
  if (textPos != std::string::npos)
    m_statusText = statusLine.substr(textPos + 1);

  char* end{nullptr};
  const long statusCode = std::strtol(statusLine.c_str() + codePos + 1, &end, 10);
  if (end == statusLine.c_str() + codePos + 1)
    return -1;

  return static_cast<int>(statusCode);
}

void UTILS::CURL::CUrl::AddHeaders(const std::map<std::string, std::string>& headers)
{
  for (auto& header : headers)
  {
    m_file.CURLAddOption(ADDON_CURL_OPTION_HEADER, header.first, header.second);
  }
}

ReadStatus UTILS::CURL::CUrl::ReadChunk(void* buffer, size_t bufferSize, size_t& bytesRead)
{
  const ssize_t ret = m_file.Read(buffer, bufferSize);
  if (ret == -1)
    return ReadStatus::ERROR;
  else if (ret == 0)
    return ReadStatus::IS_EOF;

  bytesRead = static_cast<size_t>(ret);
  m_bytesRead += static_cast<size_t>(ret);
  return ReadStatus::CHUNK_READ;
}
