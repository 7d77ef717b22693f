/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "MediaPlaylist.h"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace PLAYLIST
{

/*!
 * \brief Lookup table of the playlists of a manifest document.
 *        Top-level playlists are owned and addressable by position, every registered
 *        playlist (top-level or nested in a rendition) is addressable by its id and by its
 *        locator. For a registered playlist all the lookups return the same instance.
 */
class ATTR_DLL_LOCAL CPlaylistTable
{
public:
  CPlaylistTable() = default;
  ~CPlaylistTable() = default;

  CPlaylistTable(const CPlaylistTable&) = delete;
  CPlaylistTable& operator=(const CPlaylistTable&) = delete;
  CPlaylistTable(CPlaylistTable&&) = default;
  CPlaylistTable& operator=(CPlaylistTable&&) = default;

  /*!
   * \brief Add a top-level playlist, it is not registered by id or locator.
   * \param playlist The playlist
   * \return The playlist added
   */
  CMediaPlaylist* Add(std::unique_ptr<CMediaPlaylist> playlist);

  /*!
   * \brief Register the playlist under its current id and locator.
   *        Empty keys are not registered, an existing key is overwritten.
   * \param playlist The playlist, must be owned by the same document
   */
  void Register(CMediaPlaylist* playlist);

  size_t Size() const { return m_playlists.size(); }
  bool IsEmpty() const { return m_playlists.empty(); }

  /*!
   * \brief Get a top-level playlist by position.
   * \return The playlist, otherwise nullptr if out of range
   */
  CMediaPlaylist* Get(size_t index) const;

  /*!
   * \brief Get a registered playlist by id.
   * \return The playlist, otherwise nullptr if not found
   */
  CMediaPlaylist* GetById(std::string_view id) const;

  /*!
   * \brief Get a registered playlist by locator.
   * \return The playlist, otherwise nullptr if not found
   */
  CMediaPlaylist* GetByLocator(std::string_view locator) const;

  const std::map<std::string, CMediaPlaylist*>& GetIdMap() const { return m_byId; }
  const std::map<std::string, CMediaPlaylist*>& GetLocatorMap() const { return m_byLocator; }

  std::vector<std::unique_ptr<CMediaPlaylist>>::const_iterator begin() const
  {
    return m_playlists.cbegin();
  }
  std::vector<std::unique_ptr<CMediaPlaylist>>::const_iterator end() const
  {
    return m_playlists.cend();
  }

private:
  std::vector<std::unique_ptr<CMediaPlaylist>> m_playlists;
  std::map<std::string, CMediaPlaylist*> m_byId;
  std::map<std::string, CMediaPlaylist*> m_byLocator;
};

} // namespace PLAYLIST
