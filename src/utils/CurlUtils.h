/*
 *  Copyright (C) 2023 Team Kodi
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
#include <kodi/Filesystem.h>
#endif

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace UTILS
{
namespace CURL
{

enum class ReadStatus
{
  IS_EOF, // The end-of-file is reached
  CHUNK_READ,
  ERROR,
};

constexpr size_t BUFFER_SIZE_32 = 32 * 1024; // 32 Kbyte

class ATTR_DLL_LOCAL CUrl
{
public:
 /*!
  * \brief Create CUrl.
  * \param url The url of the file to download
  */
  CUrl(std::string_view url);

 /*!
  * \brief Create CUrl for POST request, if the data are empty, GET will be performed.
  * \param url The request url
  * \param postData The data for the POST request
  */
  CUrl(std::string_view url, const std::vector<uint8_t>& postData);
  ~CUrl();

 /*!
  * \brief Override the HTTP method (e.g. "PUT"), must be set before Open.
  */
  void SetMethod(std::string_view method);

 /*!
  * \brief Open the url.
  * \return Return HTTP status code, or -1 for any internal error
  */
  int Open();

  void AddHeaders(const std::map<std::string, std::string>& headers);

 /*!
  * \brief Get the reason phrase of the HTTP status line (e.g. "OK"), available after Open.
  */
  const std::string& GetStatusText() const { return m_statusText; }

 /*!
  * \brief Download / read a chunk.
  * \param buffer[OUT] Buffer where to write the chunk data
  * \param bufferSize The buffer size
  * \param bytesRead[OUT] The chunk size read
  * \return The read status
  */
  ReadStatus ReadChunk(void* buffer, size_t bufferSize, size_t& bytesRead);

 /*!
  * \brief Get the total byte read of the download (total of chunks size).
  */
  size_t GetTotalByteRead() const { return m_bytesRead; }

private:
  kodi::vfs::CFile m_file;
  bool m_isCreated{false};
  std::string m_statusText;
  size_t m_bytesRead{0};
};

} // namespace CURL
} // namespace UTILS
