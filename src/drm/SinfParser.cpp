/*
 *  Copyright (C) 2024 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "SinfParser.h"

#include "utils/Base64Utils.h"
#include "utils/StringUtils.h"
#include "utils/log.h"

#include <memory>

#include <bento4/Ap4.h>
#include <rapidjson/document.h>

using namespace UTILS;

namespace
{
// "tenc" payload: version/flags (4 bytes), reserved/protection fields (4 bytes), KID (16 bytes)
constexpr AP4_Size TENC_KID_OFFSET = 8;
constexpr AP4_Size TENC_KID_SIZE = 16;

/*!
 * \brief Read the key id from the raw bytes of the tenc box,
 *        the box is written back to get the payload as it is laid out in the data.
 */
std::optional<std::string> ReadTencKeyId(AP4_Atom& tenc)
{
  AP4_MemoryByteStream boxData;
  if (AP4_FAILED(tenc.Write(boxData)))
  {
    LOG::LogF(LOGERROR, "Cannot read \"tenc\" box data");
    return std::nullopt;
  }

  const AP4_UI08* data = boxData.GetData();
  const AP4_Size dataSize = boxData.GetDataSize();
  if (dataSize < AP4_ATOM_HEADER_SIZE)
    return std::nullopt;

  // A 32 bit size of 1 means that a 64 bit size follows the box type
  AP4_Size payloadStart = AP4_ATOM_HEADER_SIZE;
  if (AP4_BytesToUInt32BE(data) == 1)
    payloadStart += 8;

  if (dataSize < payloadStart + TENC_KID_OFFSET + TENC_KID_SIZE)
  {
    LOG::LogF(LOGWARNING, "The \"tenc\" box is too small to contain the key id");
    return std::nullopt;
  }

  return STRING::ToHexadecimal(data + payloadStart + TENC_KID_OFFSET, TENC_KID_SIZE);
}

AP4_ContainerAtom* FindSchiAtom(AP4_Atom* atom)
{
  if (atom->GetType() == AP4_ATOM_TYPE_SCHI)
    return AP4_DYNAMIC_CAST(AP4_ContainerAtom, atom);

  if (atom->GetType() == AP4_ATOM_TYPE_SINF)
  {
    AP4_ContainerAtom* sinf = AP4_DYNAMIC_CAST(AP4_ContainerAtom, atom);
    if (sinf)
      return AP4_DYNAMIC_CAST(AP4_ContainerAtom, sinf->GetChild(AP4_ATOM_TYPE_SCHI, 0));
  }
  return nullptr;
}
} // unnamed namespace

bool DRM::FindKeyIdInSinf(const std::vector<uint8_t>& initData, std::optional<std::string>& keyId)
{
  keyId.reset();

  rapidjson::Document jDoc;
  jDoc.Parse(reinterpret_cast<const char*>(initData.data()), initData.size());

  if (!jDoc.IsObject() || !jDoc.HasMember("sinf") || !jDoc["sinf"].IsArray() ||
      jDoc["sinf"].Empty() || !jDoc["sinf"][0].IsString())
  {
    LOG::LogF(LOGERROR, "Malformed \"sinf\" init data, JSON with \"sinf\" array expected");
    return false;
  }

  const rapidjson::Value& jSinf = jDoc["sinf"][0];
  std::vector<uint8_t> sinfData;
  if (!BASE64::Decode(jSinf.GetString(), jSinf.GetStringLength(), sinfData) || sinfData.empty())
  {
    LOG::LogF(LOGERROR, "Malformed \"sinf\" init data, cannot decode the base64 data");
    return false;
  }

  AP4_MemoryByteStream byteStream{sinfData.data(), static_cast<AP4_Size>(sinfData.size())};

  // Iterate each top level box
  AP4_DefaultAtomFactory atomFactory;
  AP4_Atom* atom{nullptr};
  while (!keyId.has_value() && AP4_SUCCEEDED(atomFactory.CreateAtomFromStream(byteStream, atom)))
  {
    std::unique_ptr<AP4_Atom> atomPtr{atom};

    AP4_ContainerAtom* schi = FindSchiAtom(atom);
    if (!schi)
      continue;

    AP4_Atom* tenc = schi->GetChild(AP4_ATOM_TYPE_TENC, 0);
    if (tenc)
      keyId = ReadTencKeyId(*tenc);
  }

  if (!keyId.has_value())
    LOG::LogF(LOGDEBUG, "No \"schi/tenc\" box found in \"sinf\" init data");

  return true;
}
