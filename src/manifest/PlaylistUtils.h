/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "common/ManifestDocument.h"

#include <vector>

namespace playlistgraph
{

/*!
 * \brief Get the partial segments of the last segments of the manifest, that is the trailing
 *        contiguous run of segments that have parts, followed by the parts of the preload segment.
 * \param doc The manifest document
 * \return The parts in playback order, empty if the last segment has no parts
 */
std::vector<PLAYLIST::PartialSegment> GetLastParts(const PLAYLIST::CManifestDocument& doc);

/*!
 * \brief Determines if the main playlist contains only audio.
 *        Without variant playlists, it is audio only when an AUDIO rendition has a locator
 *        or playlists. Otherwise each variant playlist must declare only audio codecs or
 *        be itself one of the AUDIO renditions.
 * \param doc The manifest document
 * \return True if audio only, otherwise false
 */
bool IsAudioOnly(const PLAYLIST::CManifestDocument& doc);

} // namespace playlistgraph
