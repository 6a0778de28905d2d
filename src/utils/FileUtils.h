/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace UTILS
{
namespace FILESYS
{

#ifdef _WIN32
constexpr char SEPARATOR = '\\';
#else
constexpr char SEPARATOR = '/';
#endif

/*!
 * \brief Save the data into a file
 * \param filePath The file path where to save the file, if the path is missing will be created.
 * \param data The data to be saved.
 * \param overwrite If true will overwrite the existing file.
 * \return True if success, otherwise false.
 */
bool SaveFile(const std::string& filePath, const std::vector<uint8_t>& data, bool overwrite);

/*!
 * \brief Combine a path with another one
 * \param path The starting path.
 * \param filePath The path to be combined, like filename or another path.
 * \return The combined path.
 */
std::string PathCombine(std::string path, std::string filePath);

/*!
 * \brief Get the user-related data folder of the addon.
 * \return The path.
 */
std::string GetAddonUserPath();

} // namespace FILESYS
} // namespace UTILS
