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

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace UTILS
{

/*!
 * \brief Queue of tasks posted from any thread and executed on the control thread,
 *        when the owner calls ProcessPending.
 */
class ATTR_DLL_LOCAL CTaskQueue
{
public:
  CTaskQueue() = default;
  ~CTaskQueue() = default;

  void Post(std::function<void()> task);

  /*!
   * \brief Execute the tasks queued so far, tasks posted while running are
   *        left for the next call.
   * \return The number of executed tasks
   */
  size_t ProcessPending();

  bool IsEmpty() const;

private:
  mutable std::mutex m_mutex;
  std::deque<std::function<void()>> m_tasks;
};

} // namespace UTILS
