/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "CompKodiProps.h"
#include "CompSettings.h"
#include "common/ManifestDocument.h"
#include "parser/IManifestParser.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace playlistgraph
{

/*!
 * \brief Load a manifest as a resolved playlist graph.
 *        The manifest is parsed, normalized and resolved, a media playlist
 *        is wrapped in a synthesized main playlist.
 */
class ATTR_DLL_LOCAL CManifestLoader
{
public:
  CManifestLoader() = default;
  virtual ~CManifestLoader() = default;

  /*!
   * \brief Configure the loader, must be called before open a manifest.
   * \param kodiProps The Kodi properties
   * \param settings The add-on settings
   */
  void Configure(const KODI_PROPS::CCompKodiProps& kodiProps,
                 const SETTINGS::CCompSettings& settings);

  /*!
   * \brief Open manifest data for parsing, the previous graph is replaced.
   * \param url Effective url where the manifest is downloaded
   * \param data The manifest data
   * \return True if success, otherwise false
   */
  bool Open(std::string_view url, const std::string& data);

  // \brief The resolved main playlist of the last opened manifest
  const PLAYLIST::CManifestDocument& GetMain() const { return m_main; }

  /*!
   * \brief Get the media playlist document, when the last opened manifest is a media playlist.
   * \return The media playlist document, otherwise nullptr
   */
  const PLAYLIST::CManifestDocument* GetMedia() const
  {
    return m_media.has_value() ? &*m_media : nullptr;
  }

  // \brief The warnings of the last opened manifest
  const std::vector<std::string>& GetWarnings() const { return m_warnings; }

  bool IsLowLatencyEnabled() const { return m_isLowLatency; }

protected:
  // \brief Create the grammar parser, overridable method for test project
  virtual std::unique_ptr<IManifestParser> CreateParser() const;

private:
  bool m_isLowLatency{true};
  bool m_isLegacyRenditionLocator{true};
  bool m_isDebugVerbose{false};
  std::string m_contextUrl;
  std::vector<CustomTagParser> m_customTagParsers;

  PLAYLIST::CManifestDocument m_main;
  std::optional<PLAYLIST::CManifestDocument> m_media;
  std::vector<std::string> m_warnings;
};

} // namespace playlistgraph
