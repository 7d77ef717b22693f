/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "MediaGroupWalker.h"

using namespace playlistgraph;
using namespace PLAYLIST;

namespace
{
// Categories that can carry alternate renditions with their own playlists
constexpr MediaGroupType WALKED_TYPES[] = {MediaGroupType::AUDIO, MediaGroupType::SUBTITLES};
} // unnamed namespace

void playlistgraph::ForEachMediaGroup(CManifestDocument& doc, const MediaGroupVisitor& visit)
{
  for (MediaGroupType type : WALKED_TYPES)
  {
    RenditionGroups* groups = doc.GetMediaGroup(type);
    if (!groups)
      continue;

    for (auto& [groupKey, labels] : *groups)
    {
      for (auto& [labelKey, rendition] : labels)
      {
        visit(rendition, type, groupKey, labelKey);
      }
    }
  }
}

void playlistgraph::ForEachMediaGroup(const CManifestDocument& doc,
                                      const ConstMediaGroupVisitor& visit)
{
  for (MediaGroupType type : WALKED_TYPES)
  {
    const RenditionGroups* groups = doc.GetMediaGroup(type);
    if (!groups)
      continue;

    for (const auto& [groupKey, labels] : *groups)
    {
      for (const auto& [labelKey, rendition] : labels)
      {
        visit(rendition, type, groupKey, labelKey);
      }
    }
  }
}
