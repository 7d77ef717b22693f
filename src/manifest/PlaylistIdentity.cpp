/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "PlaylistIdentity.h"

#include "utils/UrlUtils.h"
#include "utils/log.h"

using namespace playlistgraph;
using namespace PLAYLIST;
using namespace UTILS;

namespace
{
constexpr std::string_view MSG_MISSING_BANDWIDTH{
    "Invalid playlist STREAM-INF detected. Missing BANDWIDTH attribute."};
} // unnamed namespace

std::string playlistgraph::MakePlaylistId(size_t index, std::string_view locator)
{
  std::string id = std::to_string(index);
  id += '-';
  id += locator;
  return id;
}

void playlistgraph::SetupPlaylist(CMediaPlaylist& playlist,
                                  std::string_view locator,
                                  std::string_view id)
{
  if (playlist.m_id.empty())
    playlist.m_id = id;

  playlist.m_errorCount = 0;

  // A media playlist does not contain its own locator
  if (!locator.empty())
    playlist.m_locator = locator;
}

void playlistgraph::SetupAllPlaylists(CManifestDocument& doc, const EventSink& onWarn)
{
  // Walked backward, so on a locator collision the first playlist is the one registered
  for (size_t index = doc.m_playlists.Size(); index-- > 0;)
  {
    CMediaPlaylist* playlist = doc.m_playlists.Get(index);

    SetupPlaylist(*playlist, "", MakePlaylistId(index, playlist->m_locator));
    playlist->m_resolvedLocator = URL::Resolve(doc.m_locator, playlist->m_locator);
    doc.m_playlists.Register(playlist);

    // BANDWIDTH is mandatory, but the stream can be played anyway
    if (playlist->GetAttribute("BANDWIDTH").empty())
    {
      LOG::Log(LOGWARNING, "%s", MSG_MISSING_BANDWIDTH.data());
      if (onWarn)
        onWarn(MSG_MISSING_BANDWIDTH);
    }
  }
}
