/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "FileUtils.h"

#include "log.h"

#ifdef DRMKEYS_TEST_BUILD
#include "test/KodiStubs.h"
#else
#include <kodi/AddonBase.h>
#include <kodi/Filesystem.h>
#endif

bool UTILS::FILESYS::SaveFile(const std::string& filePath,
                              const std::vector<uint8_t>& data,
                              bool overwrite)
{
  if (filePath.empty())
    return false;

  kodi::vfs::CFile saveFile;
  if (!saveFile.OpenFileForWrite(filePath, overwrite))
  {
    LOG::LogF(LOGERROR, "Cannot create file \"%s\".", filePath.c_str());
    return false;
  }

  const bool isWritten = saveFile.Write(data.data(), data.size()) != -1;
  saveFile.Close();
  return isWritten;
}

std::string UTILS::FILESYS::PathCombine(std::string path, std::string filePath)
{
  if (path.empty())
    return filePath;
  if (filePath.empty())
    return path;

  if (path.back() == SEPARATOR)
    path.pop_back();

  if (filePath.front() == SEPARATOR)
    filePath.erase(0, 1);

  return path + SEPARATOR + filePath;
}

std::string UTILS::FILESYS::GetAddonUserPath()
{
  return kodi::addon::GetUserPath();
}
