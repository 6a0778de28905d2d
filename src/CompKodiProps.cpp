/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CompKodiProps.h"

#include "drm/KeySystems.h"
#include "utils/StringUtils.h"
#include "utils/log.h"

#include <rapidjson/document.h>

using namespace UTILS;

namespace
{
constexpr std::string_view PROP_EME_ENABLED = "inputstream.drmkeys.eme_enabled";
constexpr std::string_view PROP_CONFIG = "inputstream.drmkeys.config";
constexpr std::string_view PROP_DRM = "inputstream.drmkeys.drm";

void LogProp(std::string_view name, std::string_view value, bool isValueRedacted = false)
{
  LOG::Log(LOGDEBUG, "Property found \"%s\" value: %s", name.data(),
           isValueRedacted ? "[redacted]" : std::string(value).c_str());
}

void LogDrmJsonDictKeys(std::string_view keyName,
                        const rapidjson::Value& dictValue,
                        std::string_view keySystem)
{
  if (dictValue.IsObject())
  {
    std::string keys;
    for (auto it = dictValue.MemberBegin(); it != dictValue.MemberEnd(); ++it)
    {
      if (!keys.empty())
        keys += ", ";
      keys += it->name.GetString();
    }
    LOG::Log(LOGDEBUG,
             "Found DRM config for key system: \"%s\" -> Dictionary: \"%s\", Values: \"%s\"",
             std::string(keySystem).c_str(), std::string(keyName).c_str(), keys.c_str());
  }
}
} // unnamed namespace

void DRMKEYS::KODI_PROPS::CCompKodiProps::Init(const std::map<std::string, std::string>& props)
{
  m_isEmeEnabled = false;
  m_config = Config();
  m_drmConfigs.clear();

  for (const auto& prop : props)
  {
    bool logPropValRedacted{false};

    if (prop.first == PROP_EME_ENABLED)
    {
      m_isEmeEnabled = STRING::CompareNoCase(prop.second, "true");
    }
    else if (prop.first == PROP_CONFIG)
    {
      ParseConfig(prop.second);
    }
    else if (prop.first == PROP_DRM)
    {
      // Can contain license urls with tokens
      logPropValRedacted = true;
      ParseDrmConfig(prop.second);
    }
    else
    {
      LOG::Log(LOGWARNING, "Property found \"%s\" is not supported", prop.first.c_str());
      continue;
    }

    LogProp(prop.first, prop.second, logPropValRedacted);
  }
}

void DRMKEYS::KODI_PROPS::CCompKodiProps::ParseConfig(const std::string& data)
{
  /*
   * Expected JSON structure:
   * { "config_name": "value", ... }
   */
  rapidjson::Document jDoc;
  jDoc.Parse(data.c_str(), data.size());

  if (!jDoc.IsObject())
  {
    LOG::LogF(LOGERROR, "Malformed JSON data in to \"%s\" property", PROP_CONFIG.data());
    return;
  }

  for (auto& jChildObj : jDoc.GetObject())
  {
    const std::string configName = jChildObj.name.GetString();
    rapidjson::Value& jDictVal = jChildObj.value;

    if (configName == "ssl_verify_peer" && jDictVal.IsBool())
    {
      m_config.curlSSLVerifyPeer = jDictVal.GetBool();
    }
    else
    {
      LOG::LogF(LOGERROR, "Unsupported \"%s\" config or wrong data type on \"%s\" property",
                configName.c_str(), PROP_CONFIG.data());
    }
  }
}

bool DRMKEYS::KODI_PROPS::CCompKodiProps::ParseDrmConfig(const std::string& data)
{
  /* Expected JSON structure:
   * { "keysystem_name" : { "license": { "server_url": str,
   *                                     "req_headers": str,
   *                                     "server_certificate": str,
   *                                     "server_certificate_url": str } },
   *   "keysystem_name_2" : { ... }}
   */
  rapidjson::Document jDoc;
  jDoc.Parse(data.c_str(), data.size());

  if (!jDoc.IsObject())
  {
    LOG::LogF(LOGERROR, "Malformed JSON data in to \"%s\" property", PROP_DRM.data());
    return false;
  }

  // Iterate key systems dict
  for (auto& jChildObj : jDoc.GetObject())
  {
    const char* keySystem = jChildObj.name.GetString();

    if (!DRM::IsValidKeySystem(keySystem))
    {
      LOG::LogF(LOGERROR, "Ignored unknown key system \"%s\" on DRM property", keySystem);
      continue;
    }

    auto& jDictVal = jChildObj.value;

    if (!jDictVal.IsObject())
    {
      LOG::LogF(LOGERROR, "Cannot parse key system \"%s\" value on DRM property, wrong data type",
                keySystem);
      continue;
    }

    DrmCfg& drmCfg = m_drmConfigs[keySystem];

    if (jDictVal.HasMember("license") && jDictVal["license"].IsObject())
    {
      auto& jDictLic = jDictVal["license"];

      LogDrmJsonDictKeys("license", jDictLic, keySystem);

      if (jDictLic.HasMember("server_url") && jDictLic["server_url"].IsString())
        drmCfg.license.serverUrl = jDictLic["server_url"].GetString();

      if (jDictLic.HasMember("req_headers") && jDictLic["req_headers"].IsString())
        STRING::ParseHeaderString(drmCfg.license.reqHeaders, jDictLic["req_headers"].GetString());

      if (jDictLic.HasMember("server_certificate") && jDictLic["server_certificate"].IsString())
        drmCfg.license.serverCert = jDictLic["server_certificate"].GetString();

      if (jDictLic.HasMember("server_certificate_url") &&
          jDictLic["server_certificate_url"].IsString())
        drmCfg.license.serverCertUrl = jDictLic["server_certificate_url"].GetString();
    }
  }

  return true;
}
