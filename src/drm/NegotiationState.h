/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "IKeySystemPlatform.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DRM
{

enum class KeySessionState
{
  KEY_CONTAINER_PENDING,
  SESSION_CREATED,
  REQUEST_GENERATED,
  REQUEST_FAILED,
};

/*!
 * \brief A key system for which the platform has granted the access,
 *        with the key container and the key session created from it.
 *        Handles are set once, a second assignment is refused.
 */
class ATTR_DLL_LOCAL CKeySystemEntry
{
public:
  CKeySystemEntry(std::string_view keySystem, std::shared_ptr<IKeySystemAccess> access);
  ~CKeySystemEntry();

  const std::string& GetKeySystem() const { return m_keySystem; }
  std::shared_ptr<IKeySystemAccess> GetAccess() const { return m_access; }

  std::shared_ptr<IMediaKeys> GetMediaKeys() const { return m_mediaKeys; }
  bool SetMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys);

  std::shared_ptr<IMediaKeySession> GetSession() const { return m_session; }
  /*!
   * \brief Set the key session, the observer is attached to the session
   *        and detached when the entry is destroyed.
   */
  bool SetSession(std::shared_ptr<IMediaKeySession> session,
                  std::unique_ptr<ICdmObserver> observer);

  bool IsSessionInitialized() const { return m_isSessionInitialized; }
  void SetSessionInitialized() { m_isSessionInitialized = true; }

  const std::optional<std::string>& GetKeyId() const { return m_keyId; }
  bool SetKeyId(std::string keyId);

  KeySessionState GetState() const { return m_state; }
  void SetState(KeySessionState state) { m_state = state; }

private:
  std::string m_keySystem;
  std::shared_ptr<IKeySystemAccess> m_access;
  std::shared_ptr<IMediaKeys> m_mediaKeys;
  std::shared_ptr<IMediaKeySession> m_session;
  std::unique_ptr<ICdmObserver> m_sessionObserver;
  bool m_isSessionInitialized{false};
  std::optional<std::string> m_keyId;
  KeySessionState m_state{KeySessionState::KEY_CONTAINER_PENDING};
};

/*!
 * \brief State of the key system negotiation for the attached media,
 *        created on media attach and torn down on media detach.
 *        Only the first entry is the active one, the others are kept
 *        but never used for keys and licenses.
 */
class ATTR_DLL_LOCAL CNegotiationState
{
public:
  using KeysPromise = UTILS::CPromise<std::shared_ptr<IMediaKeys>>;

  CNegotiationState() = default;
  ~CNegotiationState();

  /*!
   * \brief Start a new lifecycle, the operations of the previous one are cancelled.
   */
  void Reset();

  /*!
   * \brief End the lifecycle, the operations in progress are cancelled.
   */
  void Teardown();

  const UTILS::CCancelToken& GetCancelToken() const { return m_cancelToken; }

  std::shared_ptr<CKeySystemEntry> GetActiveEntry() const;
  void AddEntry(std::shared_ptr<CKeySystemEntry> entry);
  void ForEachEntry(const std::function<void(CKeySystemEntry&)>& func);

  bool HasKeysPromise() const { return m_keysPromise.has_value(); }
  /*!
   * \brief Get the access and keys promise, must be checked with HasKeysPromise.
   */
  KeysPromise GetKeysPromise() const { return *m_keysPromise; }
  KeysPromise CreateKeysPromise();

  uint32_t GetLicenseFailures() const { return m_licenseFailures; }
  uint32_t IncreaseLicenseFailures() { return ++m_licenseFailures; }
  void ResetLicenseFailures() { m_licenseFailures = 0; }

  bool IsKeysApplied() const { return m_isKeysApplied; }
  void SetKeysApplied() { m_isKeysApplied = true; }

private:
  void Clear();

  UTILS::CCancelToken m_cancelToken;
  std::vector<std::shared_ptr<CKeySystemEntry>> m_entries;
  std::optional<KeysPromise> m_keysPromise;
  uint32_t m_licenseFailures{0};
  bool m_isKeysApplied{false};
};

} // namespace DRM
