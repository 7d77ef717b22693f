/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

 // Kodi interface stubs

#include <map>
#include <string>

#define ATTR_DLL_LOCAL

namespace kodi
{
namespace addon
{

// \brief Values of the settings changed by the tests, the others return the default value
inline std::map<std::string, std::string>& GetStubSettings()
{
  static std::map<std::string, std::string> settings;
  return settings;
}

inline std::string GetSettingString(const std::string& settingName,
                                    const std::string& defaultValue = "")
{
  auto it = GetStubSettings().find(settingName);
  return it != GetStubSettings().end() ? it->second : defaultValue;
}

inline bool GetSettingBoolean(const std::string& settingName, bool defaultValue = false)
{
  auto it = GetStubSettings().find(settingName);
  return it != GetStubSettings().end() ? it->second == "true" : defaultValue;
}

inline void SetSettingString(const std::string& settingName, const std::string& settingValue)
{
  GetStubSettings()[settingName] = settingValue;
}

inline void SetSettingBoolean(const std::string& settingName, bool settingValue)
{
  GetStubSettings()[settingName] = settingValue ? "true" : "false";
}

} // namespace addon
} // namespace kodi
