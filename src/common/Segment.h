/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#ifdef PLAYLISTGRAPH_TEST_BUILD
#include "test/KodiStubs.h"
#else
#include <kodi/AddonBase.h>
#endif

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PLAYLIST
{

// \brief A byte range as defined by EXT-X-BYTERANGE, offset is optional
struct ByteRange
{
  uint64_t m_length{0};
  std::optional<uint64_t> m_offset;
};

// \brief Usually refer to an EXT-X-KEY tag
struct SegmentKey
{
  std::string m_method;
  std::string m_uri;
  std::string m_iv;
  std::string m_keyFormat;
  std::string m_keyFormatVersions;
};

// \brief Usually refer to an EXT-X-MAP tag
struct SegmentMap
{
  std::string m_uri;
  std::optional<ByteRange> m_byteRange;
};

// \brief Usually refer to an EXT-X-PART tag
struct PartialSegment
{
  double m_duration{0};
  std::string m_uri;
  bool m_isIndependent{false};
  bool m_isGap{false};
  std::optional<ByteRange> m_byteRange;
};

// \brief Usually refer to an EXT-X-PRELOAD-HINT tag
struct PreloadHint
{
  std::string m_type; // PART or MAP
  std::string m_uri;
  std::optional<uint64_t> m_byteRangeStart;
  std::optional<uint64_t> m_byteRangeLength;
};

class ATTR_DLL_LOCAL CSegment
{
public:
  CSegment() = default;
  ~CSegment() = default;

  double m_duration{0}; // Duration in seconds, from EXTINF
  std::string m_title;
  std::string m_uri;
  std::optional<ByteRange> m_byteRange;
  bool m_isDiscontinuity{false};
  bool m_isGap{false};
  std::string m_programDateTime;
  std::optional<SegmentKey> m_key;
  std::optional<SegmentMap> m_map;
  // Data of custom tags that apply to this segment, keyed by custom type
  std::map<std::string, std::string> m_custom;

  // Low-latency sub-records, when not set the field does not exist
  std::optional<std::vector<PartialSegment>> m_parts;
  std::optional<std::vector<PreloadHint>> m_preloadHints;

  /*!
   * \brief Determines if the segment carries at least one partial segment.
   * \return True if there are partial segments, otherwise false.
   */
  bool HasParts() const { return m_parts.has_value() && !m_parts->empty(); }
};

} // namespace PLAYLIST
