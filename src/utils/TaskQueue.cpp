/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TaskQueue.h"

void UTILS::CTaskQueue::Post(std::function<void()> task)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_tasks.emplace_back(std::move(task));
}

size_t UTILS::CTaskQueue::ProcessPending()
{
  std::deque<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    tasks.swap(m_tasks);
  }

  for (auto& task : tasks)
  {
    task();
  }
  return tasks.size();
}

bool UTILS::CTaskQueue::IsEmpty() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_tasks.empty();
}
