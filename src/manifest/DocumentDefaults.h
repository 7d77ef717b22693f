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
#include "parser/IManifestParser.h"

#include <string_view>
#include <vector>

namespace playlistgraph
{

struct ParseOptions
{
  EventSink onWarn;
  EventSink onInfo;
  std::vector<CustomTagParser> customTagParsers;
  std::vector<CustomTagMapper> customTagMappers;
  // Keep the low-latency features, when false they are removed after parsing
  bool llhls{true};
};

/*!
 * \brief Parse the manifest data with the grammar parser, then normalize it.
 * \param parser The grammar parser, sinks and custom tags of the options are added to it
 * \param data The manifest text
 * \param options The parse options
 * \param doc[OUT] The normalized document
 * \return True if success, otherwise false if the parser rejects the data
 */
bool ParseManifest(IManifestParser& parser,
                   std::string_view data,
                   const ParseOptions& options,
                   PLAYLIST::CManifestDocument& doc);

/*!
 * \brief Normalize a parsed document, so that the mandatory fields are always set.
 *        - When low-latency is disabled, the low-latency fields are removed.
 *        - A missing target duration is set to the max segment duration, or 10 without segments.
 *        - A missing part target duration is set to the max duration of the last parts.
 *        Existing values are never overwritten.
 * \param parsed The parsed document
 * \param llhlsEnabled Keep the low-latency fields
 * \param onWarn [OPT] Receiver of the warnings for each defaulted field
 * \param onInfo [OPT] Receiver of the info messages
 * \return The normalized document
 */
PLAYLIST::CManifestDocument NormalizeDocument(PLAYLIST::CManifestDocument parsed,
                                              bool llhlsEnabled,
                                              const EventSink& onWarn = {},
                                              const EventSink& onInfo = {});

} // namespace playlistgraph
