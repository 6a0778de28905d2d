/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CancelToken.h"

UTILS::CCancelToken::CCancelToken() : m_state(std::make_shared<State>())
{
}

void UTILS::CCancelToken::Cancel()
{
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->isCancelled.exchange(true))
      return;

    callbacks.swap(m_state->callbacks);
  }

  // Called outside the lock, a callback can query the token
  for (auto& callback : callbacks)
  {
    callback();
  }
}

bool UTILS::CCancelToken::IsCancelled() const
{
  return m_state->isCancelled.load();
}

void UTILS::CCancelToken::OnCancel(std::function<void()> callback) const
{
  {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->isCancelled.load())
    {
      m_state->callbacks.emplace_back(std::move(callback));
      return;
    }
  }
  callback();
}
