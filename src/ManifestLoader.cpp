/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "ManifestLoader.h"

#include "manifest/DocumentDefaults.h"
#include "manifest/GraphAssembler.h"
#include "manifest/MainPlaylist.h"
#include "parser/M3U8Parser.h"
#include "utils/log.h"

using namespace playlistgraph;
using namespace PLAYLIST;

void playlistgraph::CManifestLoader::Configure(const KODI_PROPS::CCompKodiProps& kodiProps,
                                               const SETTINGS::CCompSettings& settings)
{
  const KODI_PROPS::ManifestConfig& manifestConfig = kodiProps.GetManifestConfig();

  // Kodi properties override the add-on settings
  m_isLowLatency = manifestConfig.llhls.value_or(settings.IsLowLatencyEnabled());
  m_isLegacyRenditionLocator = manifestConfig.legacyRenditionLocator;
  m_isDebugVerbose = settings.IsDebugVerbose();
  m_contextUrl = kodiProps.GetContextUrl();

  m_customTagParsers.clear();
  for (const KODI_PROPS::CustomTagConfig& tagConfig : manifestConfig.customTags)
  {
    CustomTagParser tagParser;
    tagParser.m_expression = tagConfig.expression;
    tagParser.m_customType = tagConfig.customType;
    tagParser.m_isSegment = tagConfig.isSegment;
    m_customTagParsers.emplace_back(tagParser);
  }
}

bool playlistgraph::CManifestLoader::Open(std::string_view url, const std::string& data)
{
  m_warnings.clear();
  m_media.reset();
  m_main = CManifestDocument();

  ParseOptions options;
  options.llhls = m_isLowLatency;
  options.customTagParsers = m_customTagParsers;
  options.onWarn = [this](std::string_view message)
  {
    LOG::Log(LOGWARNING, "Manifest warning: %s", std::string(message).c_str());
    m_warnings.emplace_back(message);
  };
  if (m_isDebugVerbose)
  {
    options.onInfo = [](std::string_view message)
    { LOG::Log(LOGDEBUG, "Manifest info: %s", std::string(message).c_str()); };
  }

  std::unique_ptr<IManifestParser> parser = CreateParser();
  CManifestDocument doc;

  if (!ParseManifest(*parser, data, options, doc))
  {
    LOG::LogF(LOGERROR, "Failed to parse the manifest file");
    return false;
  }

  if (doc.IsMain())
  {
    m_main = std::move(doc);
  }
  else
  {
    LOG::Log(LOGDEBUG, "Media playlist detected, the main playlist will be synthesized");
    m_main = WrapAsMain(doc, url, m_contextUrl);
    m_media = std::move(doc);
  }

  ResolveOptions resolveOptions;
  resolveOptions.legacyRenditionLocator = m_isLegacyRenditionLocator;
  // Already logged by the graph assembler
  resolveOptions.onWarn = [this](std::string_view message) { m_warnings.emplace_back(message); };

  ResolveGraph(m_main, url, DefaultGroupId, resolveOptions);

  LOG::Log(LOGDEBUG, "Manifest opened with %zu variant playlists", m_main.m_playlists.Size());
  return true;
}

std::unique_ptr<IManifestParser> playlistgraph::CManifestLoader::CreateParser() const
{
  return std::make_unique<CM3U8Parser>();
}
