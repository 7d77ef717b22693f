/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "DocumentDefaults.h"

#include "PlaylistUtils.h"
#include "utils/StringUtils.h"
#include "utils/log.h"

#include <algorithm>

using namespace playlistgraph;
using namespace PLAYLIST;
using namespace UTILS;

namespace
{
constexpr double DEFAULT_TARGET_DURATION{10};

// \brief Remove the low-latency fields
// \return True if any field has been removed, otherwise false
bool RemoveLowLatencyFeatures(CManifestDocument& doc)
{
  bool isRemoved = doc.m_preloadSegment.has_value() || doc.m_skip.has_value() ||
                   doc.m_serverControl.has_value() || doc.m_renditionReports.has_value() ||
                   doc.m_partInf.has_value() || doc.m_partTargetDuration.has_value();

  doc.m_preloadSegment.reset();
  doc.m_skip.reset();
  doc.m_serverControl.reset();
  doc.m_renditionReports.reset();
  doc.m_partInf.reset();
  doc.m_partTargetDuration.reset();

  for (CSegment& segment : doc.m_segments)
  {
    if (segment.m_parts.has_value() || segment.m_preloadHints.has_value())
      isRemoved = true;

    segment.m_parts.reset();
    segment.m_preloadHints.reset();
  }
  return isRemoved;
}

void Notify(const EventSink& sink, const std::string& message)
{
  if (sink)
    sink(message);
}

} // unnamed namespace

bool playlistgraph::ParseManifest(IManifestParser& parser,
                                  std::string_view data,
                                  const ParseOptions& options,
                                  CManifestDocument& doc)
{
  if (options.onWarn)
    parser.SetWarnSink(options.onWarn);
  if (options.onInfo)
    parser.SetInfoSink(options.onInfo);

  for (const CustomTagParser& tagParser : options.customTagParsers)
  {
    parser.AddTagParser(tagParser);
  }
  for (const CustomTagMapper& tagMapper : options.customTagMappers)
  {
    parser.AddTagMapper(tagMapper);
  }

  CManifestDocument parsed;
  if (!parser.Parse(data, parsed))
  {
    LOG::LogF(LOGERROR, "Cannot parse the manifest");
    return false;
  }

  doc = NormalizeDocument(std::move(parsed), options.llhls, options.onWarn, options.onInfo);
  return true;
}

CManifestDocument playlistgraph::NormalizeDocument(CManifestDocument parsed,
                                                   bool llhlsEnabled,
                                                   const EventSink& onWarn,
                                                   const EventSink& onInfo)
{
  if (!llhlsEnabled && RemoveLowLatencyFeatures(parsed))
    Notify(onInfo, "low-latency features are disabled, removed from the manifest");

  if (!parsed.m_targetDuration.has_value())
  {
    double targetDuration{DEFAULT_TARGET_DURATION};

    if (!parsed.m_segments.empty())
    {
      targetDuration = 0;
      for (const CSegment& segment : parsed.m_segments)
      {
        targetDuration = std::max(targetDuration, segment.m_duration);
      }
    }

    Notify(onWarn, "manifest has no targetDuration defaulting to " +
                       STRING::FormatDouble(targetDuration));
    parsed.m_targetDuration = targetDuration;
  }

  const std::vector<PartialSegment> parts = GetLastParts(parsed);

  if (!parts.empty() && !parsed.m_partTargetDuration.has_value())
  {
    double partTargetDuration{0};
    for (const PartialSegment& part : parts)
    {
      partTargetDuration = std::max(partTargetDuration, part.m_duration);
    }

    Notify(onWarn, "manifest has no partTargetDuration defaulting to " +
                       STRING::FormatDouble(partTargetDuration));
    LOG::Log(LOGERROR,
             "LL-HLS manifest has parts but lacks required #EXT-X-PART-INF:PART-TARGET value. "
             "Playback is not guaranteed.");
    parsed.m_partTargetDuration = partTargetDuration;
  }

  return parsed;
}
