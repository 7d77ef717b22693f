/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "common/EventSink.h"
#include "common/ManifestDocument.h"

#include <string>
#include <string_view>

namespace playlistgraph
{

/*!
 * \brief Create the identity of a playlist from its position and locator, e.g. "0-video.m3u8"
 */
std::string MakePlaylistId(size_t index, std::string_view locator);

/*!
 * \brief Prepare a playlist for playback, modified in place.
 *        The id is assigned only if the playlist has no id, the error count is reset.
 * \param playlist The playlist
 * \param locator The locator of a standalone media playlist, or empty to keep the current one
 * \param id The id to assign
 */
void SetupPlaylist(PLAYLIST::CMediaPlaylist& playlist,
                   std::string_view locator,
                   std::string_view id);

/*!
 * \brief Prepare all the variant playlists of a main document, modified in place.
 *        Assigns the ids, resolves the locators against the document locator and registers
 *        each playlist by id and by locator. A playlist without BANDWIDTH attribute
 *        is kept but reported with a warning.
 * \param doc The main document
 * \param onWarn [OPT] Receiver of the warnings
 */
void SetupAllPlaylists(PLAYLIST::CManifestDocument& doc, const EventSink& onWarn = {});

} // namespace playlistgraph
