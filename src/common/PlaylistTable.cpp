/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "PlaylistTable.h"

#include "utils/log.h"

using namespace PLAYLIST;

CMediaPlaylist* PLAYLIST::CPlaylistTable::Add(std::unique_ptr<CMediaPlaylist> playlist)
{
  m_playlists.push_back(std::move(playlist));
  return m_playlists.back().get();
}

void PLAYLIST::CPlaylistTable::Register(CMediaPlaylist* playlist)
{
  if (!playlist)
    return;

  if (!playlist->m_id.empty())
    m_byId[playlist->m_id] = playlist;
  else
    LOG::LogF(LOGDEBUG, "Playlist without id, not registered by id");

  if (!playlist->m_locator.empty())
    m_byLocator[playlist->m_locator] = playlist;
  else
    LOG::LogF(LOGDEBUG, "Playlist without locator, not registered by locator");
}

CMediaPlaylist* PLAYLIST::CPlaylistTable::Get(size_t index) const
{
  if (index >= m_playlists.size())
    return nullptr;
  return m_playlists[index].get();
}

CMediaPlaylist* PLAYLIST::CPlaylistTable::GetById(std::string_view id) const
{
  auto it = m_byId.find(std::string(id));
  return it != m_byId.end() ? it->second : nullptr;
}

CMediaPlaylist* PLAYLIST::CPlaylistTable::GetByLocator(std::string_view locator) const
{
  auto it = m_byLocator.find(std::string(locator));
  return it != m_byLocator.end() ? it->second : nullptr;
}
