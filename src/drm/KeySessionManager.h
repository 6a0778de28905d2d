/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "DrmErrors.h"
#include "LicenseRequester.h"
#include "NegotiationState.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace DRM
{

class ATTR_DLL_LOCAL CKeySessionManager
{
public:
  CKeySessionManager(CNegotiationState& state,
                     CLicenseRequester& licenseRequester,
                     IErrorListener& errorListener);

  /*!
   * \brief Create the key sessions of the entries that have the media keys
   *        but not a session yet.
   */
  void OnMediaKeysCreated();

  /*!
   * \brief Generate the license request of the active key session from the init data.
   *        A request is generated only once per key session, next calls are ignored.
   * \param initDataType The init data type e.g. "sinf"
   * \param initData The init data
   */
  void GenerateRequest(std::string_view initDataType, const std::vector<uint8_t>& initData);

private:
  CNegotiationState& m_state;
  CLicenseRequester& m_licenseRequester;
  IErrorListener& m_errorListener;
};

} // namespace DRM
