/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "PlaylistUtils.h"

#include "MediaGroupWalker.h"
#include "utils/StringUtils.h"
#include "utils/Utils.h"

#include <algorithm>
#include <iterator>

using namespace playlistgraph;
using namespace PLAYLIST;
using namespace UTILS;

namespace
{
bool HasOnlyAudioCodecs(const CMediaPlaylist& playlist)
{
  const std::string codecs = playlist.GetAttribute("CODECS");
  if (codecs.empty())
    return false;

  const std::vector<std::string> codecList = STRING::SplitToVec(codecs, ',');
  return std::all_of(codecList.cbegin(), codecList.cend(), [](const std::string& codec)
                     { return CODEC::IsAudio(STRING::Trim(codec)); });
}

// \brief Check if the variant playlist is the same stream described by the rendition
bool IsRenditionPlaylist(const CMediaPlaylist& playlist, const CRenditionDescriptor& rendition)
{
  if (!rendition.m_locator.empty() && rendition.m_locator == playlist.m_locator)
    return true;

  for (const auto& subPlaylist : rendition.m_playlists)
  {
    if (!subPlaylist->m_id.empty() && subPlaylist->m_id == playlist.m_id)
      return true;
    if (!subPlaylist->m_locator.empty() && subPlaylist->m_locator == playlist.m_locator)
      return true;
  }
  return false;
}

} // unnamed namespace

std::vector<PartialSegment> playlistgraph::GetLastParts(const CManifestDocument& doc)
{
  std::vector<PartialSegment> parts;

  auto runStart = doc.m_segments.cend();
  while (runStart != doc.m_segments.cbegin() && std::prev(runStart)->HasParts())
  {
    --runStart;
  }

  for (auto it = runStart; it != doc.m_segments.cend(); ++it)
  {
    parts.insert(parts.end(), it->m_parts->cbegin(), it->m_parts->cend());
  }

  // The preload segment continues the run only when the run is not interrupted
  if (doc.m_preloadSegment.has_value() && doc.m_preloadSegment->HasParts() &&
      (doc.m_segments.empty() || doc.m_segments.back().HasParts()))
  {
    const auto& preloadParts = *doc.m_preloadSegment->m_parts;
    parts.insert(parts.end(), preloadParts.cbegin(), preloadParts.cend());
  }

  return parts;
}

bool playlistgraph::IsAudioOnly(const CManifestDocument& doc)
{
  if (doc.m_playlists.IsEmpty())
  {
    bool hasAudioRendition{false};
    ForEachMediaGroup(doc, [&hasAudioRendition](const CRenditionDescriptor& rendition,
                                                MediaGroupType type, const std::string&,
                                                const std::string&)
                      {
                        if (type == MediaGroupType::AUDIO &&
                            (rendition.HasPlaylists() || !rendition.m_locator.empty()))
                          hasAudioRendition = true;
                      });
    return hasAudioRendition;
  }

  for (const auto& playlist : doc.m_playlists)
  {
    if (HasOnlyAudioCodecs(*playlist))
      continue;

    bool isRendition{false};
    ForEachMediaGroup(doc, [&](const CRenditionDescriptor& rendition, MediaGroupType type,
                               const std::string&, const std::string&)
                      {
                        if (type == MediaGroupType::AUDIO &&
                            IsRenditionPlaylist(*playlist, rendition))
                          isRendition = true;
                      });
    if (!isRendition)
      return false;
  }
  return true;
}
