/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CurlTransport.h"

#include "utils/CurlUtils.h"
#include "utils/StringUtils.h"
#include "utils/TaskQueue.h"
#include "utils/log.h"

using namespace UTILS;

DRM::CCurlTransport::CCurlTransport(UTILS::CTaskQueue& taskQueue) : m_taskQueue(taskQueue)
{
}

DRM::CCurlTransport::~CCurlTransport()
{
  {
    std::lock_guard<std::mutex> lock(m_jobsMutex);
    m_threadStop = true;
  }
  m_cvJobs.notify_all();

  if (m_thread.joinable())
    m_thread.join();
}

void DRM::CCurlTransport::Send(const CHttpRequest& request,
                               const std::vector<uint8_t>& body,
                               const UTILS::CCancelToken& token,
                               HttpResponseCallback callback)
{
  if (token.IsCancelled())
    return;

  {
    std::lock_guard<std::mutex> lock(m_jobsMutex);
    m_jobs.emplace_back(
        [this, request, body, token, callback]
        {
          // The token can be cancelled while the request was queued
          if (token.IsCancelled())
            return;

          HttpResponse response = Execute(request, body, token);
          if (token.IsCancelled())
          {
            LOG::Log(LOGDEBUG, "HTTP request to \"%s\" aborted", request.GetUrl().c_str());
            return;
          }

          m_taskQueue.Post(
              [response, token, callback]
              {
                if (!token.IsCancelled())
                  callback(response);
              });
        });

    if (!m_thread.joinable())
      m_thread = std::thread(&CCurlTransport::Worker, this);
  }
  m_cvJobs.notify_one();
}

void DRM::CCurlTransport::Worker()
{
  std::unique_lock<std::mutex> lock(m_jobsMutex);
  while (true)
  {
    m_cvJobs.wait(lock, [this] { return m_threadStop || !m_jobs.empty(); });

    // On stop the queued requests are still consumed, the cancelled ones return immediately
    if (m_jobs.empty())
      break;

    std::function<void()> job = std::move(m_jobs.front());
    m_jobs.pop_front();

    lock.unlock();
    job();
    lock.lock();
  }
}

DRM::HttpResponse DRM::CCurlTransport::Execute(const CHttpRequest& request,
                                               const std::vector<uint8_t>& body,
                                               const UTILS::CCancelToken& token)
{
  HttpResponse response;
  const std::string& method = request.GetMethod();
  const bool isGetRequest = STRING::CompareNoCase(method, "GET");

  if (isGetRequest && !body.empty())
    LOG::LogF(LOGWARNING, "The body of the GET request to \"%s\" is not sent",
              request.GetUrl().c_str());

  CURL::CUrl curl{request.GetUrl(), isGetRequest ? std::vector<uint8_t>() : body};

  // Kodi curl does a POST when there is post data, otherwise GET
  if (!isGetRequest && !STRING::CompareNoCase(method, "POST"))
    curl.SetMethod(method);

  curl.AddHeaders(request.GetHeaders());

  if (request.IsWithCredentials())
  {
    //! @todo: Kodi curl sessions keep the cookies by domain, there is no way to
    //! request a credentials mode on the binary add-on interface
    LOG::LogF(LOGDEBUG, "Credentials mode requested, cookies are managed by the Kodi curl session");
  }

  response.statusCode = curl.Open();
  response.statusText = curl.GetStatusText();

  if (response.statusCode == -1)
  {
    LOG::Log(LOGERROR, "HTTP request failed, internal error: %s", request.GetUrl().c_str());
    return response;
  }

  std::vector<uint8_t> buffer(CURL::BUFFER_SIZE_32);
  while (!token.IsCancelled())
  {
    size_t bytesRead{0};
    const CURL::ReadStatus status = curl.ReadChunk(buffer.data(), buffer.size(), bytesRead);

    if (status == CURL::ReadStatus::IS_EOF)
      break;

    if (status == CURL::ReadStatus::ERROR)
    {
      LOG::Log(LOGERROR, "HTTP request failed, cannot read the response data: %s",
               request.GetUrl().c_str());
      response.statusCode = -1;
      response.data.clear();
      break;
    }

    response.data.insert(response.data.end(), buffer.begin(), buffer.begin() + bytesRead);
  }

  LOG::Log(LOGDEBUG, "HTTP request finished: %s (HTTP status %i, downloaded %zu byte)",
           request.GetUrl().c_str(), response.statusCode, curl.GetTotalByteRead());
  return response;
}
