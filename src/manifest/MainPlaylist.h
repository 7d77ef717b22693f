/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "common/ManifestDocument.h"

#include <string_view>

namespace playlistgraph
{

/*!
 * \brief Create a main document that contains the media playlist as its only variant,
 *        so that a media playlist loaded directly can be played as a main playlist.
 *        The main document has the four media group categories empty, and the playlist is
 *        registered at position 0, by id "0-<locator>" and by locator.
 * \param media The media playlist document, its segments are copied
 * \param locator The locator of the media playlist
 * \param contextLocator The location of the playback context, used as main document locator
 * \return The new main document
 */
PLAYLIST::CManifestDocument WrapAsMain(const PLAYLIST::CManifestDocument& media,
                                       std::string_view locator,
                                       std::string_view contextLocator);

} // namespace playlistgraph
