/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace UTILS
{

/*!
 * \brief A promise for single threaded asynchronous flows. It settles once, to a value
 *        or to a rejection reason, and continuations registered with Then are called
 *        synchronously when it settles (or immediately when it is already settled).
 *        Copies share the same state. Not thread safe, results from other threads
 *        must be posted to the control thread (see CTaskQueue).
 */
template<typename T>
class CPromise
{
public:
  using ResolveFunc = std::function<void(const T&)>;
  using RejectFunc = std::function<void(const std::string&)>;

  CPromise() : m_state(std::make_shared<State>()) {}

  static CPromise Resolved(T value)
  {
    CPromise promise;
    promise.Resolve(std::move(value));
    return promise;
  }

  static CPromise Rejected(std::string reason)
  {
    CPromise promise;
    promise.Reject(std::move(reason));
    return promise;
  }

  /*!
   * \brief Resolve the promise.
   * \return False if the promise was already settled, the value is discarded
   */
  bool Resolve(T value)
  {
    if (m_state->status != Status::PENDING)
      return false;

    m_state->value = std::move(value);
    m_state->status = Status::RESOLVED;
    RunContinuations();
    return true;
  }

  /*!
   * \brief Reject the promise.
   * \return False if the promise was already settled
   */
  bool Reject(std::string reason)
  {
    if (m_state->status != Status::PENDING)
      return false;

    m_state->reason = std::move(reason);
    m_state->status = Status::REJECTED;
    RunContinuations();
    return true;
  }

  void Then(ResolveFunc onResolve, RejectFunc onReject) const
  {
    m_state->continuations.emplace_back(std::move(onResolve), std::move(onReject));
    if (m_state->status != Status::PENDING)
      RunContinuations();
  }

  bool IsPending() const { return m_state->status == Status::PENDING; }
  bool IsResolved() const { return m_state->status == Status::RESOLVED; }
  bool IsRejected() const { return m_state->status == Status::REJECTED; }

private:
  enum class Status
  {
    PENDING,
    RESOLVED,
    REJECTED,
  };

  struct State
  {
    Status status{Status::PENDING};
    std::optional<T> value;
    std::string reason;
    std::vector<std::pair<ResolveFunc, RejectFunc>> continuations;
  };

  void RunContinuations() const
  {
    // Keep the state alive, a continuation can release the last copy of this promise
    std::shared_ptr<State> state = m_state;

    std::vector<std::pair<ResolveFunc, RejectFunc>> continuations;
    continuations.swap(state->continuations);

    for (auto& continuation : continuations)
    {
      if (state->status == Status::RESOLVED)
      {
        if (continuation.first)
          continuation.first(*state->value);
      }
      else if (continuation.second)
      {
        continuation.second(state->reason);
      }
    }
  }

  std::shared_ptr<State> m_state;
};

} // namespace UTILS
