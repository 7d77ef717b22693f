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

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace playlistgraph
{
namespace KODI_PROPS
{

// \brief Custom tag stored as raw line data, see CustomTagParser
struct CustomTagConfig
{
  std::string expression;
  std::string customType;
  bool isSegment{false};
};

struct ManifestConfig
{
  // Keep the low-latency HLS features, when set it override the add-on setting
  std::optional<bool> llhls;
  // Rendition playlists without locator: the first one takes the group id as locator,
  // disabling this all of them will take their own playlist id as locator
  bool legacyRenditionLocator{true};
  // Custom tags to store on the manifest or on the segments
  std::vector<CustomTagConfig> customTags;
};

class ATTR_DLL_LOCAL CCompKodiProps
{
public:
  CCompKodiProps() = default;
  ~CCompKodiProps() = default;

  void Init(const std::map<std::string, std::string>& props);

  // \brief The location of the playback context, used as locator of the synthesized main playlists
  std::string GetContextUrl() const { return m_contextUrl; }

  // \brief Specifies the manifest configuration
  const ManifestConfig& GetManifestConfig() const { return m_manifestConfig; }

private:
  void ParseManifestConfig(const std::string& data);

  std::string m_contextUrl;
  ManifestConfig m_manifestConfig;
};

} // namespace KODI_PROPS
} // namespace playlistgraph
