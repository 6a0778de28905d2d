/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "NegotiationState.h"

#include "utils/log.h"

DRM::CKeySystemEntry::CKeySystemEntry(std::string_view keySystem,
                                      std::shared_ptr<IKeySystemAccess> access)
  : m_keySystem(keySystem), m_access(std::move(access))
{
}

DRM::CKeySystemEntry::~CKeySystemEntry()
{
  if (m_session && m_sessionObserver)
    m_session->DetachObserver(m_sessionObserver.get());
}

bool DRM::CKeySystemEntry::SetMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys)
{
  if (m_mediaKeys)
  {
    LOG::LogF(LOGERROR, "Media keys already set for key system \"%s\"", m_keySystem.c_str());
    return false;
  }
  m_mediaKeys = std::move(mediaKeys);
  return true;
}

bool DRM::CKeySystemEntry::SetSession(std::shared_ptr<IMediaKeySession> session,
                                      std::unique_ptr<ICdmObserver> observer)
{
  if (m_session)
  {
    LOG::LogF(LOGERROR, "Key session already set for key system \"%s\"", m_keySystem.c_str());
    return false;
  }
  m_session = std::move(session);
  m_sessionObserver = std::move(observer);

  if (m_sessionObserver)
    m_session->AttachObserver(m_sessionObserver.get());

  m_state = KeySessionState::SESSION_CREATED;
  return true;
}

bool DRM::CKeySystemEntry::SetKeyId(std::string keyId)
{
  if (m_keyId.has_value())
  {
    LOG::LogF(LOGWARNING, "Key id already set for key system \"%s\"", m_keySystem.c_str());
    return false;
  }
  m_keyId = std::move(keyId);
  return true;
}

DRM::CNegotiationState::~CNegotiationState()
{
  Teardown();
}

void DRM::CNegotiationState::Reset()
{
  Teardown();
  m_cancelToken = UTILS::CCancelToken();
}

void DRM::CNegotiationState::Teardown()
{
  // Cancel first, the entries released below must not receive other callbacks
  m_cancelToken.Cancel();
  Clear();
}

std::shared_ptr<DRM::CKeySystemEntry> DRM::CNegotiationState::GetActiveEntry() const
{
  if (m_entries.empty())
    return nullptr;

  return m_entries.front();
}

void DRM::CNegotiationState::AddEntry(std::shared_ptr<CKeySystemEntry> entry)
{
  if (!m_entries.empty())
  {
    LOG::LogF(LOGWARNING, "Key system \"%s\" added but \"%s\" remains the active one",
              entry->GetKeySystem().c_str(), m_entries.front()->GetKeySystem().c_str());
  }
  m_entries.emplace_back(std::move(entry));
}

void DRM::CNegotiationState::ForEachEntry(const std::function<void(CKeySystemEntry&)>& func)
{
  // Copy, the function can add entries
  const std::vector<std::shared_ptr<CKeySystemEntry>> entries = m_entries;
  for (const auto& entry : entries)
  {
    func(*entry);
  }
}

DRM::CNegotiationState::KeysPromise DRM::CNegotiationState::CreateKeysPromise()
{
  m_keysPromise = KeysPromise();
  return *m_keysPromise;
}

void DRM::CNegotiationState::Clear()
{
  m_entries.clear();
  m_keysPromise.reset();
  m_licenseFailures = 0;
  m_isKeysApplied = false;
}
