/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CompSettings.h"

using namespace playlistgraph::SETTINGS;

bool playlistgraph::SETTINGS::CCompSettings::IsLowLatencyEnabled() const
{
  return kodi::addon::GetSettingBoolean("HLS.lowlatency", true);
}

bool playlistgraph::SETTINGS::CCompSettings::IsDebugVerbose() const
{
  return kodi::addon::GetSettingBoolean("debug.verbose");
}
