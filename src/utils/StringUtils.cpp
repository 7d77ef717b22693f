/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "StringUtils.h"

#include "kodi/tools/StringUtils.h"

#include <fmt/format.h>

#include <cctype>
#include <iterator>

using namespace UTILS::STRING;
using namespace kodi::tools;

namespace
{
/*!
 * \brief Converts a string to a number of a specified type, by using istringstream.
 * \param str The string to convert
 * \param fallback [OPT] The number to return when the conversion fails
 * \return The converted number, otherwise fallback if conversion fails
 */
template<typename T>
T NumberFromSS(std::string_view str, T fallback) noexcept
{
  std::istringstream iss{std::string(str)};
  T result{fallback};
  if (!(iss >> result))
    return fallback;
  return result;
}
} // namespace

int UTILS::STRING::ReplaceAll(std::string& inputStr,
                              std::string_view oldStr,
                              std::string_view newStr)
{
  if (oldStr.empty())
    return 0;

  int replacedChars = 0;
  size_t index = 0;

  while (index < inputStr.size() && (index = inputStr.find(oldStr, index)) != std::string::npos)
  {
    inputStr.replace(index, oldStr.size(), newStr);
    index += newStr.size();
    replacedChars++;
  }
  return replacedChars;
}

uint32_t UTILS::STRING::ToUint32(std::string_view str, uint32_t fallback /* = 0 */)
{
  return NumberFromSS(str, fallback);
}

uint64_t UTILS::STRING::ToUint64(std::string_view str, uint64_t fallback /* = 0 */)
{
  return NumberFromSS(str, fallback);
}

double UTILS::STRING::ToDouble(std::string_view str, double fallback)
{
  return NumberFromSS(str, fallback);
}

bool UTILS::STRING::IsNumber(std::string_view str)
{
  if (!str.empty() && (str.front() == '-' || str.front() == '+'))
    str.remove_prefix(1);

  if (str.empty())
    return false;

  bool hasDigits{false};
  bool hasDot{false};
  for (const char ch : str)
  {
    if (std::isdigit(static_cast<unsigned char>(ch)))
      hasDigits = true;
    else if (ch == '.' && !hasDot)
      hasDot = true;
    else
      return false;
  }
  return hasDigits;
}

bool UTILS::STRING::IsUnsignedInteger(std::string_view str)
{
  if (str.empty())
    return false;

  for (const char ch : str)
  {
    if (!std::isdigit(static_cast<unsigned char>(ch)))
      return false;
  }
  return true;
}

bool UTILS::STRING::StartsWith(std::string_view str, std::string_view startStr)
{
  return str.substr(0, startStr.size()) == startStr;
}

std::vector<std::string> UTILS::STRING::SplitToVec(std::string_view input,
                                                   const char delimiter,
                                                   int maxStrings /* = 0 */)
{
  std::vector<std::string> result;
  StringUtils::SplitTo(std::back_inserter(result), std::string(input), delimiter, maxStrings);
  return result;
}

bool UTILS::STRING::GetLine(std::stringstream& ss, std::string& line)
{
  do
  {
    if (!std::getline(ss, line))
      return false;

    // Trim return chars and spaces at the end of string
    size_t charPos = line.size();
    while (charPos &&
           (line[charPos - 1] == '\r' || line[charPos - 1] == '\n' || line[charPos - 1] == ' '))
    {
      charPos--;
    }
    line.resize(charPos);

    // Skip possible empty lines
  } while (line.empty());

  return true;
}

std::string UTILS::STRING::Trim(std::string value)
{
  StringUtils::Trim(value);
  return value;
}

std::string UTILS::STRING::FormatDouble(double value)
{
  // Shortest representation that reads back to the same value
  return fmt::format("{}", value);
}
