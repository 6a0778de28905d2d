/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "Base64Utils.h"

#include "log.h"

using namespace UTILS::BASE64;

namespace
{
constexpr char PADDING{'='};
constexpr std::string_view CHARACTERS{"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                      "abcdefghijklmnopqrstuvwxyz"
                                      "0123456789+/"};
constexpr unsigned char INVALID_CHAR{255};

// clang-format off
constexpr unsigned char BASE64_TABLE[] = {
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255, 62, 255,255,255, 63,
     52, 53, 54, 55,  56, 57, 58, 59,  60, 61,255,255, 255,255,255,255,
    255,  0,  1,  2,   3,  4,  5,  6,   7,  8,  9, 10,  11, 12, 13, 14,
     15, 16, 17, 18,  19, 20, 21, 22,  23, 24, 25,255, 255,255,255,255,
    255, 26, 27, 28,  29, 30, 31, 32,  33, 34, 35, 36,  37, 38, 39, 40,
     41, 42, 43, 44,  45, 46, 47, 48,  49, 50, 51,255, 255,255,255,255,

    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
    255,255,255,255, 255,255,255,255, 255,255,255,255, 255,255,255,255,
};
// clang-format on
} // unnamed namespace

void UTILS::BASE64::Encode(const uint8_t* input, const size_t length, std::string& output)
{
  output.clear();
  if (input == nullptr || length == 0)
    return;

  output.reserve(((length + 2) / 3) * 4);

  for (size_t i{0}; i < length; i += 3)
  {
    const uint32_t triple = (static_cast<uint32_t>(input[i]) << 16) |
                            ((i + 1 < length) ? static_cast<uint32_t>(input[i + 1]) << 8 : 0) |
                            ((i + 2 < length) ? static_cast<uint32_t>(input[i + 2]) : 0);

    output.push_back(CHARACTERS[(triple >> 18) & 0x3F]);
    output.push_back(CHARACTERS[(triple >> 12) & 0x3F]);
    output.push_back(i + 1 < length ? CHARACTERS[(triple >> 6) & 0x3F] : PADDING);
    output.push_back(i + 2 < length ? CHARACTERS[triple & 0x3F] : PADDING);
  }
}

std::string UTILS::BASE64::Encode(const std::vector<uint8_t>& input)
{
  std::string output;
  Encode(input.data(), input.size(), output);
  return output;
}

std::string UTILS::BASE64::Encode(std::string_view input)
{
  std::string output;
  Encode(reinterpret_cast<const uint8_t*>(input.data()), input.size(), output);
  return output;
}

bool UTILS::BASE64::Decode(const char* input, const size_t length, std::vector<uint8_t>& output)
{
  output.clear();
  if (!input)
    return false;

  output.reserve((length / 4) * 3);

  bool paddingStarted{false};
  int quadPos{0};
  unsigned char leftChar{0};

  for (size_t i{0}; i < length; i++)
  {
    if (input[i] == PADDING)
    {
      paddingStarted = true;
      continue;
    }

    const unsigned char thisChar{BASE64_TABLE[static_cast<unsigned char>(input[i])]};
    // Skip not allowed characters (e.g. line breaks)
    if (thisChar == INVALID_CHAR)
      continue;

    if (paddingStarted)
    {
      LOG::LogF(LOGERROR, "Invalid base64-encoded string: data after padding characters");
      output.clear();
      return false;
    }

    switch (quadPos)
    {
      case 0:
        leftChar = thisChar;
        break;
      case 1:
        output.push_back(static_cast<uint8_t>((leftChar << 2) | (thisChar >> 4)));
        leftChar = thisChar & 0x0f;
        break;
      case 2:
        output.push_back(static_cast<uint8_t>((leftChar << 4) | (thisChar >> 2)));
        leftChar = thisChar & 0x03;
        break;
      case 3:
        output.push_back(static_cast<uint8_t>((leftChar << 6) | thisChar));
        leftChar = 0;
        break;
    }
    quadPos = (quadPos + 1) % 4;
  }

  if (quadPos == 1)
  {
    // A single trailing character cannot carry a whole byte
    LOG::LogF(LOGERROR, "Invalid base64-encoded string: number of data characters cannot be 1 "
                        "more than a multiple of 4");
    output.clear();
    return false;
  }
  return true;
}

std::vector<uint8_t> UTILS::BASE64::Decode(std::string_view input)
{
  std::vector<uint8_t> data;
  Decode(input.data(), input.size(), data);
  return data;
}

bool UTILS::BASE64::IsValidBase64(std::string_view input)
{
  if (input.empty() || input.size() % 4 != 0)
    return false;

  size_t paddingSize{0};
  for (const char ch : input)
  {
    if (ch == PADDING)
    {
      paddingSize++;
    }
    else if (paddingSize > 0 || BASE64_TABLE[static_cast<unsigned char>(ch)] == INVALID_CHAR)
    {
      return false;
    }
  }

  return paddingSize <= 2;
}
