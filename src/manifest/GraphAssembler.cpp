/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "GraphAssembler.h"

#include "MediaGroupWalker.h"
#include "PlaylistIdentity.h"
#include "PlaylistUtils.h"
#include "utils/UrlUtils.h"
#include "utils/log.h"

using namespace playlistgraph;
using namespace PLAYLIST;
using namespace UTILS;

namespace
{
constexpr std::string_view PLACEHOLDER_PREFIX{"placeholder-locator-"};

// \brief Check if a variant playlist plays the audio of the rendition group
bool IsGroupInVariants(const CManifestDocument& doc, const std::string& groupKey)
{
  for (const auto& playlist : doc.m_playlists)
  {
    const std::string audioGroup = playlist->GetAttribute("AUDIO");
    if (!audioGroup.empty() && audioGroup == groupKey)
      return true;
  }
  return false;
}

} // unnamed namespace

std::string playlistgraph::DefaultGroupId(MediaGroupType type,
                                          const std::string& groupKey,
                                          const std::string& labelKey,
                                          const CMediaPlaylist& /*playlist*/)
{
  std::string groupId{PLACEHOLDER_PREFIX};
  groupId += ToString(type);
  groupId += '-' + groupKey + '-' + labelKey;
  return groupId;
}

void playlistgraph::ResolveMediaGroupLocators(CManifestDocument& doc)
{
  const std::string& baseLocator = doc.m_locator;

  ForEachMediaGroup(doc,
                    [&baseLocator](CRenditionDescriptor& rendition, MediaGroupType,
                                   const std::string&, const std::string&)
                    {
                      if (!rendition.m_locator.empty())
                        rendition.m_resolvedLocator = URL::Resolve(baseLocator, rendition.m_locator);
                    });
}

void playlistgraph::ResolveGraph(CManifestDocument& doc,
                                 std::string_view locator,
                                 const GroupIdFn& groupIdFn,
                                 const ResolveOptions& options)
{
  doc.m_locator = locator;

  // Playlists are referenced by locator, so the ones without it (e.g. from formats
  // that have no locator for each stream) get a placeholder
  for (size_t index = 0; index < doc.m_playlists.Size(); ++index)
  {
    CMediaPlaylist* playlist = doc.m_playlists.Get(index);
    if (playlist->m_locator.empty())
      playlist->m_locator = std::string(PLACEHOLDER_PREFIX) + std::to_string(index);
  }

  const bool isAudioOnly = IsAudioOnly(doc);

  ForEachMediaGroup(
      doc,
      [&](CRenditionDescriptor& rendition, MediaGroupType type, const std::string& groupKey,
          const std::string& labelKey)
      {
        if (!rendition.HasPlaylists())
        {
          // On audio only manifests, a rendition included in the variants is not
          // an alternate audio track
          if (isAudioOnly && type == MediaGroupType::AUDIO && rendition.m_locator.empty() &&
              IsGroupInVariants(doc, groupKey))
          {
            LOG::Log(LOGDEBUG, "Audio rendition \"%s\" of group \"%s\" included in the variants",
                     labelKey.c_str(), groupKey.c_str());
            return;
          }

          auto playlist = CMediaPlaylist::MakeUniquePtr();
          playlist->m_rendition = static_cast<const RenditionProperties&>(rendition);
          playlist->m_locator = rendition.m_locator;
          playlist->m_resolvedLocator = rendition.m_resolvedLocator;
          rendition.m_playlists.emplace_back(std::move(playlist));
        }

        for (size_t subIndex = 0; subIndex < rendition.m_playlists.size(); ++subIndex)
        {
          CMediaPlaylist& subPlaylist = *rendition.m_playlists[subIndex];
          const std::string groupId = groupIdFn(type, groupKey, labelKey, subPlaylist);
          const std::string id = MakePlaylistId(subIndex, groupId);

          if (!subPlaylist.m_locator.empty())
          {
            if (subPlaylist.m_resolvedLocator.empty())
              subPlaylist.m_resolvedLocator = URL::Resolve(doc.m_locator, subPlaylist.m_locator);
          }
          else
          {
            // The first playlist takes the group id as locator for backward compatibility
            if (subIndex == 0 && options.legacyRenditionLocator)
              subPlaylist.m_locator = groupId;
            else
              subPlaylist.m_locator = id;

            // A placeholder locator is not resolvable
            subPlaylist.m_resolvedLocator = subPlaylist.m_locator;
          }

          if (subPlaylist.m_id.empty())
            subPlaylist.m_id = id;

          doc.m_playlists.Register(&subPlaylist);
        }
      });

  SetupAllPlaylists(doc, options.onWarn);
  ResolveMediaGroupLocators(doc);
}
