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

#include "KeySystemConfigs.h"
#include "utils/CancelToken.h"
#include "utils/Promise.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DRM
{

// Result of the platform operations that complete without a value
using VoidResult = std::monostate;

enum class CdmMessageType
{
  UNKNOWN,
  SESSION_MESSAGE,
  SESSION_KEY_CHANGE,
};

struct CdmMessage
{
  std::string sessionId;
  CdmMessageType type{CdmMessageType::UNKNOWN};
  std::vector<uint8_t> data;
  uint32_t status{0};
};

class ATTR_DLL_LOCAL ICdmObserver // Observer called by ICdmSubject interface
{
public:
  virtual ~ICdmObserver() = default;
  virtual void OnNotify(const CdmMessage& message) = 0;
};

class ATTR_DLL_LOCAL ICdmSubject // Subject to make callbacks to ICdmObserver interfaces
{
public:
  virtual ~ICdmSubject() = default;
  virtual void AttachObserver(ICdmObserver* observer) = 0;
  virtual void DetachObserver(ICdmObserver* observer) = 0;
};

/*!
 * \brief A key session of the CDM, the session messages (license challenges)
 *        are notified to the attached observers.
 */
class ATTR_DLL_LOCAL IMediaKeySession : public ICdmSubject
{
public:
  virtual ~IMediaKeySession() = default;

  virtual std::string GetSessionId() const = 0;

  virtual UTILS::CPromise<VoidResult> GenerateRequest(std::string_view initDataType,
                                                      const std::vector<uint8_t>& initData,
                                                      const UTILS::CCancelToken& token) = 0;

  /*!
   * \brief Provide the license server response to the CDM.
   */
  virtual UTILS::CPromise<VoidResult> Update(const std::vector<uint8_t>& response,
                                             const UTILS::CCancelToken& token) = 0;
};

/*!
 * \brief The key container of a key system.
 */
class ATTR_DLL_LOCAL IMediaKeys
{
public:
  virtual ~IMediaKeys() = default;

  /*!
   * \brief Create a key session.
   * \return The session, or nullptr on failure
   */
  virtual std::shared_ptr<IMediaKeySession> CreateSession() = 0;

  virtual UTILS::CPromise<VoidResult> SetServerCertificate(const std::vector<uint8_t>& certificate,
                                                           const UTILS::CCancelToken& token) = 0;
};

/*!
 * \brief The access to a key system, granted by the platform for one of the requested configurations.
 */
class ATTR_DLL_LOCAL IKeySystemAccess
{
public:
  virtual ~IKeySystemAccess() = default;

  virtual std::string GetKeySystem() const = 0;

  virtual UTILS::CPromise<std::shared_ptr<IMediaKeys>> CreateMediaKeys(
      const UTILS::CCancelToken& token) = 0;
};

struct MediaEncryptedEvent
{
  std::string initDataType;
  std::vector<uint8_t> initData;
};

class ATTR_DLL_LOCAL IMediaEncryptedListener
{
public:
  virtual ~IMediaEncryptedListener() = default;
  virtual void OnMediaEncrypted(const MediaEncryptedEvent& event) = 0;
};

/*!
 * \brief The media element where the keys are applied, it notifies the encrypted content found.
 */
class ATTR_DLL_LOCAL IMediaSink
{
public:
  virtual ~IMediaSink() = default;

  virtual void SetMediaKeys(std::shared_ptr<IMediaKeys> mediaKeys) = 0;

  virtual void AttachEncryptedListener(IMediaEncryptedListener* listener) = 0;
  virtual void DetachEncryptedListener(IMediaEncryptedListener* listener) = 0;
};

/*!
 * \brief Platform function to request the access to a key system,
 *        the promise is rejected when no configuration can be satisfied.
 */
using RequestAccessFunc = std::function<UTILS::CPromise<std::shared_ptr<IKeySystemAccess>>(
    std::string_view keySystem,
    const std::vector<KeySystemConfiguration>& configs,
    const UTILS::CCancelToken& token)>;

} // namespace DRM
