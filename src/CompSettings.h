/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#ifdef PLAYLISTGRAPH_TEST_BUILD
#include "test/KodiStubs.h"
#else
#include <kodi/AddonBase.h>
#endif

namespace playlistgraph
{
namespace SETTINGS
{

class ATTR_DLL_LOCAL CCompSettings
{
public:
  CCompSettings() = default;
  ~CCompSettings() = default;

  // \brief Keep the low-latency HLS features of the manifests
  bool IsLowLatencyEnabled() const;

  // Expert settings

  bool IsDebugVerbose() const;
};

} // namespace SETTINGS
} // namespace playlistgraph
