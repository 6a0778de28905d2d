/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "HttpTransport.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace UTILS
{
class CTaskQueue;
}

namespace DRM
{

/*!
 * \brief HTTP transport based on Kodi curl. The requests are executed in order on a
 *        worker thread and the responses are posted to the task queue of the control thread.
 */
class ATTR_DLL_LOCAL CCurlTransport : public IHttpTransport
{
public:
  CCurlTransport(UTILS::CTaskQueue& taskQueue);
  ~CCurlTransport() override;

  void Send(const CHttpRequest& request,
            const std::vector<uint8_t>& body,
            const UTILS::CCancelToken& token,
            HttpResponseCallback callback) override;

private:
  void Worker();
  static HttpResponse Execute(const CHttpRequest& request,
                              const std::vector<uint8_t>& body,
                              const UTILS::CCancelToken& token);

  UTILS::CTaskQueue& m_taskQueue;
  std::thread m_thread;
  std::mutex m_jobsMutex;
  std::condition_variable m_cvJobs;
  std::deque<std::function<void()>> m_jobs;
  bool m_threadStop{false};
};

} // namespace DRM
