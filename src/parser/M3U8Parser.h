/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "IManifestParser.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace playlistgraph
{

/*!
 * \brief Grammar parser of HLS (M3U8) playlists, main or media playlists,
 *        including the low-latency extension tags.
 */
class ATTR_DLL_LOCAL CM3U8Parser : public IManifestParser
{
public:
  CM3U8Parser() = default;
  ~CM3U8Parser() override = default;

  void SetWarnSink(EventSink sink) override { m_onWarn = std::move(sink); }
  void SetInfoSink(EventSink sink) override { m_onInfo = std::move(sink); }

  void AddTagParser(CustomTagParser parser) override;
  void AddTagMapper(CustomTagMapper mapper) override;

  bool Parse(std::string_view data, PLAYLIST::CManifestDocument& doc) override;

private:
  void ParseLine(const std::string& line, PLAYLIST::CManifestDocument& doc);
  bool ParseCustomTag(const std::string& line, PLAYLIST::CManifestDocument& doc);
  void ParseUri(const std::string& line, PLAYLIST::CManifestDocument& doc);
  void ParseMedia(const std::map<std::string, std::string>& attribs,
                  PLAYLIST::CManifestDocument& doc);
  void ParsePart(const std::map<std::string, std::string>& attribs);
  void ParsePreloadHint(const std::map<std::string, std::string>& attribs);

  // \brief Get the segment that will be completed by the next URI line
  PLAYLIST::CSegment& PendingSegment();

  void Warn(std::string_view message) const;
  void Info(std::string_view message) const;

  EventSink m_onWarn;
  EventSink m_onInfo;
  std::vector<CustomTagParser> m_tagParsers;
  std::vector<CustomTagMapper> m_tagMappers;

  // Parsing state, reset on each Parse call
  bool m_isExtM3Uformat{false};
  std::optional<PLAYLIST::CSegment> m_pendingSegment;
  std::optional<std::map<std::string, std::string>> m_pendingStreamInf;
  std::optional<PLAYLIST::SegmentKey> m_currentKey;
  std::optional<PLAYLIST::SegmentMap> m_currentMap;
};

} // namespace playlistgraph
