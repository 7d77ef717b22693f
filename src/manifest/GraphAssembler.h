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

#include <functional>
#include <string>
#include <string_view>

namespace playlistgraph
{

// \brief Create the group id of a rendition playlist, used to build its id and placeholder locator
using GroupIdFn = std::function<std::string(PLAYLIST::MediaGroupType type,
                                            const std::string& groupKey,
                                            const std::string& labelKey,
                                            const PLAYLIST::CMediaPlaylist& playlist)>;

/*!
 * \brief The default group id, "placeholder-locator-<TYPE>-<groupKey>-<labelKey>",
 *        the playlist is not used.
 */
std::string DefaultGroupId(PLAYLIST::MediaGroupType type,
                           const std::string& groupKey,
                           const std::string& labelKey,
                           const PLAYLIST::CMediaPlaylist& playlist);

struct ResolveOptions
{
  // Rendition playlists without locator get the group id as locator for the first playlist
  // and the playlist id for the following ones, when false all of them get the playlist id
  bool legacyRenditionLocator{true};
  // Receiver of the warnings
  EventSink onWarn;
};

/*!
 * \brief Resolve the locator of each AUDIO and SUBTITLES rendition that has one,
 *        against the document locator. The document is modified in place.
 */
void ResolveMediaGroupLocators(PLAYLIST::CManifestDocument& doc);

/*!
 * \brief Resolve the playlist graph of a main document, modified in place.
 *        Assigns placeholder locators to the variant playlists without one, creates the
 *        playlists of the renditions that have none, assigns ids, resolves locators and
 *        registers every playlist by id and by locator.
 *        On audio only documents, an AUDIO rendition without locator that is referenced
 *        by a variant playlist is not considered an alternate rendition, so it is left
 *        without playlists.
 *        Never fails, calling it again on the same document has no effect.
 * \param doc The main document
 * \param locator The locator of the main document, used as base to resolve locators
 * \param groupIdFn [OPT] The function that create the group ids
 * \param options [OPT] The resolve options
 */
void ResolveGraph(PLAYLIST::CManifestDocument& doc,
                  std::string_view locator,
                  const GroupIdFn& groupIdFn = DefaultGroupId,
                  const ResolveOptions& options = {});

} // namespace playlistgraph
