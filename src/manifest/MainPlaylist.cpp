/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "MainPlaylist.h"

#include "PlaylistIdentity.h"

using namespace playlistgraph;
using namespace PLAYLIST;

CManifestDocument playlistgraph::WrapAsMain(const CManifestDocument& media,
                                            std::string_view locator,
                                            std::string_view contextLocator)
{
  CManifestDocument mainDoc;
  mainDoc.EnsureMediaGroups();
  mainDoc.m_locator = contextLocator;
  mainDoc.m_resolvedLocator = contextLocator;

  auto playlist = CMediaPlaylist::MakeUniquePtr();
  playlist->m_locator = locator;
  playlist->m_resolvedLocator = locator;
  playlist->m_id = MakePlaylistId(0, locator);
  playlist->m_segments = media.m_segments;

  mainDoc.m_playlists.Register(mainDoc.m_playlists.Add(std::move(playlist)));

  return mainDoc;
}
