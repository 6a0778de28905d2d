/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#ifdef DRMKEYS_TEST_BUILD
#include "test/KodiStubs.h"
#else
#include <kodi/AddonBase.h>
#endif

#include "utils/CancelToken.h"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace DRM
{

/*!
 * \brief An HTTP request to be sent through IHttpTransport, the response is always binary.
 *        Headers and credentials mode can be set only once the request is opened,
 *        otherwise std::logic_error is thrown.
 */
class ATTR_DLL_LOCAL CHttpRequest
{
public:
  CHttpRequest() = default;

  void Open(std::string_view method, std::string_view url);
  bool IsOpened() const { return m_isOpened; }

  void SetHeader(std::string_view name, std::string_view value);
  bool HasHeader(std::string_view name) const;
  void SetWithCredentials(bool withCredentials);

  const std::string& GetMethod() const { return m_method; }
  const std::string& GetUrl() const { return m_url; }
  const std::map<std::string, std::string>& GetHeaders() const { return m_headers; }
  bool IsWithCredentials() const { return m_withCredentials; }

private:
  bool m_isOpened{false};
  std::string m_method;
  std::string m_url;
  std::map<std::string, std::string> m_headers;
  bool m_withCredentials{false};
};

struct HttpResponse
{
  // HTTP status code, -1 when the request cannot be made (transport error)
  int statusCode{-1};
  std::string statusText;
  std::vector<uint8_t> data;
};

using HttpResponseCallback = std::function<void(const HttpResponse& response)>;

class ATTR_DLL_LOCAL IHttpTransport
{
public:
  virtual ~IHttpTransport() = default;

  /*!
   * \brief Send a request, the callback is called on the control thread with the response.
   *        When the token is cancelled the request is aborted and the callback is not called.
   * \param request The opened request
   * \param body The request body, empty for no body
   * \param token The cancel token
   * \param callback The response callback
   */
  virtual void Send(const CHttpRequest& request,
                    const std::vector<uint8_t>& body,
                    const UTILS::CCancelToken& token,
                    HttpResponseCallback callback) = 0;
};

} // namespace DRM
