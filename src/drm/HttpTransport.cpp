/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "HttpTransport.h"

#include "utils/StringUtils.h"

#include <stdexcept>

using namespace UTILS;

void DRM::CHttpRequest::Open(std::string_view method, std::string_view url)
{
  m_method = method;
  m_url = url;
  m_headers.clear();
  m_isOpened = true;
}

void DRM::CHttpRequest::SetHeader(std::string_view name, std::string_view value)
{
  if (!m_isOpened)
    throw std::logic_error("Cannot set an HTTP header before the request is opened");

  m_headers[std::string(name)] = value;
}

bool DRM::CHttpRequest::HasHeader(std::string_view name) const
{
  for (const auto& header : m_headers)
  {
    if (STRING::CompareNoCase(header.first, name))
      return true;
  }
  return false;
}

void DRM::CHttpRequest::SetWithCredentials(bool withCredentials)
{
  if (!m_isOpened)
    throw std::logic_error("Cannot set the credentials mode before the request is opened");

  m_withCredentials = withCredentials;
}
