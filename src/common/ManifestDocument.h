/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "MediaGroups.h"
#include "PlaylistTable.h"
#include "Segment.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PLAYLIST
{

// \brief Usually refer to an EXT-X-SERVER-CONTROL tag
struct ServerControl
{
  bool m_canBlockReload{false};
  std::optional<double> m_canSkipUntil;
  bool m_canSkipDateRanges{false};
  std::optional<double> m_holdBack;
  std::optional<double> m_partHoldBack;
};

// \brief Usually refer to an EXT-X-SKIP tag
struct SkipInfo
{
  uint64_t m_skippedSegments{0};
  std::vector<std::string> m_recentlyRemovedDateRanges;
};

// \brief Usually refer to an EXT-X-RENDITION-REPORT tag
struct RenditionReport
{
  std::string m_uri;
  std::optional<uint64_t> m_lastMsn;
  std::optional<uint64_t> m_lastPart;
};

// \brief Usually refer to an EXT-X-PART-INF tag
struct PartInf
{
  double m_partTarget{0};
};

/*!
 * \brief The root of a manifest, a main (multivariant) playlist or a media playlist.
 *        The document is move-only, the playlist table holds pointers to the
 *        playlists owned by the document itself.
 */
class ATTR_DLL_LOCAL CManifestDocument
{
public:
  CManifestDocument() = default;
  ~CManifestDocument() = default;

  CManifestDocument(const CManifestDocument&) = delete;
  CManifestDocument& operator=(const CManifestDocument&) = delete;
  CManifestDocument(CManifestDocument&&) = default;
  CManifestDocument& operator=(CManifestDocument&&) = default;

  /*!
   * \brief Determines if the document is a main playlist, that reference
   *        variant streams or alternate renditions.
   * \return True if main playlist, otherwise false for a media playlist
   */
  bool IsMain() const { return !m_playlists.IsEmpty() || m_mediaGroups.has_value(); }

  /*!
   * \brief Get the renditions of a media group category.
   * \return The renditions groups, otherwise nullptr if the category does not exists
   */
  RenditionGroups* GetMediaGroup(MediaGroupType type);
  const RenditionGroups* GetMediaGroup(MediaGroupType type) const;

  /*!
   * \brief Create the media groups with all the categories, if not exists.
   */
  void EnsureMediaGroups();

  std::string m_locator;
  std::string m_resolvedLocator;

  std::optional<uint32_t> m_version;
  std::optional<double> m_targetDuration; // In seconds
  uint64_t m_mediaSequence{0};
  uint64_t m_discontinuitySequence{0};
  std::string m_playlistType; // VOD or EVENT
  bool m_hasEndList{false};
  bool m_isIFramesOnly{false};
  bool m_isIndependentSegments{false};
  bool m_allowCache{true};

  std::vector<CSegment> m_segments;
  CPlaylistTable m_playlists;
  std::optional<MediaGroups> m_mediaGroups;
  // Data of custom tags that apply to the whole manifest, keyed by custom type
  std::map<std::string, std::string> m_custom;

  // Low-latency extension fields, when not set the field does not exist
  std::optional<CSegment> m_preloadSegment;
  std::optional<SkipInfo> m_skip;
  std::optional<ServerControl> m_serverControl;
  std::optional<std::vector<RenditionReport>> m_renditionReports;
  std::optional<PartInf> m_partInf;
  std::optional<double> m_partTargetDuration; // In seconds
};

} // namespace PLAYLIST
