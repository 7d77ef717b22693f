/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <cstdint>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace UTILS
{
namespace STRING
{

/*!
 * \brief Get map value of the specified key
 * \param map The map where find the value
 * \param key The key to find
 * \param val[OUT] The value that match to the specified key, if found
 * \return True if found, otherwise false.
 */
template<typename T, typename TValue>
bool GetMapValue(const std::map<T, TValue>& map, const T& key, TValue& val)
{
  auto mapIt = map.find(key);
  if (mapIt != map.cend())
  {
    val = mapIt->second;
    return true;
  }
  return false;
}

/*!
 * \brief Replace all string occurrences in a string
 * \param inputStr The string to perform the replace
 * \param oldStr String to find
 * \param newStr String used to replace the old one
 * \return The number of chars replaced
 */
int ReplaceAll(std::string& inputStr, std::string_view oldStr, std::string_view newStr);

/*!
 * \brief Converts a string to unsigned int32 without throw exceptions.
 * \param str The number as string
 * \param fallback [OPT] The value returned if the parsing fails.
 * \return The resulting number, if fails return the fallback value.
 */
uint32_t ToUint32(std::string_view str, uint32_t fallback = 0);

/*!
 * \brief Converts a string to unsigned int64 without throw exceptions.
 * \param str The number as string
 * \param fallback [OPT] The value returned if the parsing fails.
 * \return The resulting number, if fails return the fallback value.
 */
uint64_t ToUint64(std::string_view str, uint64_t fallback = 0);

/*!
 * \brief Converts a string to double without throw exceptions.
 * \param str The number as string
 * \param fallback [OPT] The value returned if the parsing fails.
 * \return The resulting number, if fails return the fallback value.
 */
double ToDouble(std::string_view str, double fallback = 0);

/*!
 * \brief Check if a string is a decimal number, e.g. "10", "6.006" or "-1.5"
 * \param str The string to check
 * \return True if the whole string is a number, otherwise false
 */
bool IsNumber(std::string_view str);

/*!
 * \brief Check if a string is a decimal integer without sign, e.g. "266"
 * \param str The string to check
 * \return True if the whole string is made of digits, otherwise false
 */
bool IsUnsignedInteger(std::string_view str);

/*!
 * \brief Checks a string for the begin of another string.
 * \param str String to be checked
 * \param startStr String with which text in str is checked at the beginning
 * \return True if string started with asked text, false otherwise
 */
bool StartsWith(std::string_view str, std::string_view startStr);

/*!
 * \brief Splits the given input string using the given delimiter into separate strings.
 * \param input Input string to be split
 * \param delimiter Delimiter to be used to split the input string
 * \param maxStrings [OPT] Maximum number of resulting split strings
 * \return List of splitted strings.
 */
std::vector<std::string> SplitToVec(std::string_view input, const char delimiter, int maxStrings = 0);

/*!
 * \brief Get a line from string stream, by skipping empty lines.
 * \param ss Input stringstream
 * \param line[OUT] A line string read
 * \return True when the next line is read, otherwise false when EOF.
 */
bool GetLine(std::stringstream& ss, std::string& line);

/*!
 * \brief Trim a string with remove of not wanted spaces at begin and end of string.
 * \param value The string to be trimmed
 * \return The string trimmed
 */
std::string Trim(std::string value);

/*!
 * \brief Format a floating point value with the shortest representation, e.g. 10 or 4.004
 * \param value The value to format
 * \return The formatted value
 */
std::string FormatDouble(double value);

} // namespace STRING
} // namespace UTILS
