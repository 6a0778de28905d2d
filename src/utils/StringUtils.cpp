/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "StringUtils.h"

#include "kodi/tools/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <iterator>
#include <sstream>

using namespace UTILS::STRING;
using namespace kodi::tools;

std::string UTILS::STRING::URLDecode(std::string_view strURLData)
// Taken from xbmc/URL.cpp
// if a non hex value follows a % the characters are taken directly
{
  std::string strResult;
  strResult.reserve(strURLData.length());

  for (size_t i = 0; i < strURLData.size(); ++i)
  {
    const char kar = strURLData[i];
    if (kar == '+')
    {
      strResult += ' ';
    }
    else if (kar == '%' && i + 2 < strURLData.size() &&
             std::isxdigit(static_cast<unsigned char>(strURLData[i + 1])) &&
             std::isxdigit(static_cast<unsigned char>(strURLData[i + 2])))
    {
      const std::string strTmp{strURLData.substr(i + 1, 2)};
      unsigned int decNum{0};
      std::sscanf(strTmp.c_str(), "%x", &decNum);
      strResult += static_cast<char>(decNum);
      i += 2;
    }
    else
    {
      strResult += kar;
    }
  }
  return strResult;
}

bool UTILS::STRING::CompareNoCase(std::string_view str1, std::string_view str2)
{
  if (str1.size() != str2.size())
    return false;
  return std::equal(str1.cbegin(), str1.cend(), str2.cbegin(),
                    [](std::string::value_type l, std::string::value_type r)
                    { return std::tolower(l) == std::tolower(r); });
}

std::vector<std::string> UTILS::STRING::SplitToVec(std::string_view input,
                                                   const char delimiter,
                                                   int maxStrings /* = 0 */)
{
  std::vector<std::string> result;
  StringUtils::SplitTo(std::back_inserter(result), std::string(input), delimiter, maxStrings);
  return result;
}

std::string UTILS::STRING::Trim(std::string value)
{
  StringUtils::Trim(value);
  return value;
}

std::string UTILS::STRING::ToHexadecimal(const uint8_t* data, const size_t size)
{
  std::ostringstream ss;
  ss << std::hex;
  for (size_t i = 0; i < size; ++i)
  {
    ss << std::setw(2) << std::setfill('0') << static_cast<unsigned long>(data[i]);
  }
  return ss.str();
}

std::string UTILS::STRING::ToHexadecimal(const std::vector<uint8_t>& data)
{
  return ToHexadecimal(data.data(), data.size());
}

void UTILS::STRING::ParseHeaderString(std::map<std::string, std::string>& headerMap,
                                      std::string_view header)
{
  for (const std::string& headerPair : SplitToVec(header, '&'))
  {
    const size_t pos = headerPair.find('=');
    if (pos == std::string::npos)
      continue;

    const std::string name = Trim(headerPair.substr(0, pos));
    if (!name.empty())
      headerMap[name] = URLDecode(Trim(headerPair.substr(pos + 1)));
  }
}
