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

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace UTILS
{

/*!
 * \brief Shared cancellation flag. Copies refer to the same state, so a token
 *        can be handed to every asynchronous operation of a lifecycle and cancelled
 *        once from the owner. Registered callbacks run once, on the cancelling thread.
 */
class ATTR_DLL_LOCAL CCancelToken
{
public:
  CCancelToken();

  /*!
   * \brief Cancel the token, callbacks registered with OnCancel are called.
   *        Calling it again has no effect.
   */
  void Cancel();

  bool IsCancelled() const;

  /*!
   * \brief Register a callback to abort work in progress.
   *        If the token is already cancelled the callback is called immediately.
   */
  void OnCancel(std::function<void()> callback) const;

private:
  struct State
  {
    std::atomic<bool> isCancelled{false};
    std::mutex mutex;
    std::vector<std::function<void()>> callbacks;
  };

  std::shared_ptr<State> m_state;
};

} // namespace UTILS
