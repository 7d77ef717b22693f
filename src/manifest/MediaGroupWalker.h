/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "common/ManifestDocument.h"

#include <functional>
#include <string>

namespace playlistgraph
{

using MediaGroupVisitor = std::function<void(PLAYLIST::CRenditionDescriptor& rendition,
                                             PLAYLIST::MediaGroupType type,
                                             const std::string& groupKey,
                                             const std::string& labelKey)>;

using ConstMediaGroupVisitor = std::function<void(const PLAYLIST::CRenditionDescriptor& rendition,
                                                  PLAYLIST::MediaGroupType type,
                                                  const std::string& groupKey,
                                                  const std::string& labelKey)>;

/*!
 * \brief Call the visitor for each rendition of the AUDIO and then SUBTITLES media groups,
 *        groups and labels are visited in the order they were declared.
 *        Other categories are never visited. Does nothing when the document has no media groups.
 * \param doc The manifest document
 * \param visit The visitor, can modify the rendition but must not add or remove renditions
 */
void ForEachMediaGroup(PLAYLIST::CManifestDocument& doc, const MediaGroupVisitor& visit);

void ForEachMediaGroup(const PLAYLIST::CManifestDocument& doc,
                       const ConstMediaGroupVisitor& visit);

} // namespace playlistgraph
