/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "M3U8Parser.h"

#include "utils/StringUtils.h"
#include "utils/log.h"

#include <sstream>

using namespace playlistgraph;
using namespace PLAYLIST;
using namespace UTILS;

namespace
{
// \brief Split a line as tag name and tag value,
//        e.g. "#EXT-X-MEDIA-SEQUENCE:2" the output will be "#EXT-X-MEDIA-SEQUENCE" and "2"
void ParseTagNameValue(const std::string& line, std::string& tagName, std::string& tagValue)
{
  tagName.clear();
  tagValue.clear();

  if (line[0] != '#')
    return;

  size_t charPos = line.find(':');
  tagName = line.substr(0, charPos);
  if (charPos != std::string::npos)
    tagValue = line.substr(charPos + 1);
}

// \brief Parse a tag value of attributes, double accent characters will be removed
//        e.g. TYPE=AUDIO,GROUP-ID="audio" the output will be TYPE -> AUDIO and GROUP-ID -> audio
std::map<std::string, std::string> ParseTagAttributes(const std::string& tagValue)
{
  std::map<std::string, std::string> tagAttribs;
  size_t offset{0};
  size_t value;
  size_t end;

  while (offset < tagValue.size() && (value = tagValue.find('=', offset)) != std::string::npos)
  {
    while (offset < tagValue.size() && tagValue[offset] == ' ')
    {
      ++offset;
    }
    end = value;
    uint8_t inValue(0);
    while (++end < tagValue.size() && ((inValue & 1) || tagValue[end] != ','))
    {
      if (tagValue[end] == '\"')
        ++inValue;
    }

    std::string attribName = STRING::Trim(tagValue.substr(offset, value - offset));
    std::string attribValue = STRING::Trim(
        tagValue.substr(value + (inValue ? 2 : 1), end - value - (inValue ? 3 : 1)));

    tagAttribs[attribName] = attribValue;
    offset = end + 1;
  }
  return tagAttribs;
}

// \brief Parse a byte range in the form of "length[@offset]"
std::optional<ByteRange> ParseByteRange(std::string_view value)
{
  ByteRange range;
  const size_t atPos = value.find('@');
  std::string_view length = value.substr(0, atPos);
  if (!STRING::IsUnsignedInteger(length))
    return std::nullopt;

  range.m_length = STRING::ToUint64(length);
  if (atPos != std::string_view::npos)
  {
    std::string_view offset = value.substr(atPos + 1);
    if (!STRING::IsUnsignedInteger(offset))
      return std::nullopt;
    range.m_offset = STRING::ToUint64(offset);
  }
  return range;
}

bool IsAttribYes(const std::map<std::string, std::string>& attribs, const std::string& name)
{
  auto it = attribs.find(name);
  return it != attribs.end() && it->second == "YES";
}

std::optional<double> GetAttribDouble(const std::map<std::string, std::string>& attribs,
                                      const std::string& name)
{
  auto it = attribs.find(name);
  if (it == attribs.end() || !STRING::IsNumber(it->second))
    return std::nullopt;
  return STRING::ToDouble(it->second);
}

std::optional<uint64_t> GetAttribUint64(const std::map<std::string, std::string>& attribs,
                                        const std::string& name)
{
  auto it = attribs.find(name);
  if (it == attribs.end() || !STRING::IsUnsignedInteger(it->second))
    return std::nullopt;
  return STRING::ToUint64(it->second);
}

std::optional<MediaGroupType> ParseMediaGroupType(std::string_view type)
{
  for (MediaGroupType groupType : {MediaGroupType::AUDIO, MediaGroupType::VIDEO,
                                   MediaGroupType::SUBTITLES, MediaGroupType::CLOSED_CAPTIONS})
  {
    if (type == ToString(groupType))
      return groupType;
  }
  return std::nullopt;
}

// Tags that are valid but not represented on the document
constexpr std::string_view UNSUPPORTED_TAGS[] = {
    "#EXT-X-DATERANGE",        "#EXT-X-SESSION-DATA", "#EXT-X-SESSION-KEY",
    "#EXT-X-I-FRAME-STREAM-INF", "#EXT-X-START",      "#EXT-X-CONTENT-STEERING",
    "#EXT-X-DEFINE",           "#EXT-X-BITRATE"};

bool IsUnsupportedTag(std::string_view tagName)
{
  for (std::string_view tag : UNSUPPORTED_TAGS)
  {
    if (tag == tagName)
      return true;
  }
  return false;
}

} // unnamed namespace

void playlistgraph::CM3U8Parser::AddTagParser(CustomTagParser parser)
{
  m_tagParsers.emplace_back(std::move(parser));
}

void playlistgraph::CM3U8Parser::AddTagMapper(CustomTagMapper mapper)
{
  m_tagMappers.emplace_back(std::move(mapper));
}

bool playlistgraph::CM3U8Parser::Parse(std::string_view data, CManifestDocument& doc)
{
  m_isExtM3Uformat = false;
  m_pendingSegment.reset();
  m_pendingStreamInf.reset();
  m_currentKey.reset();
  m_currentMap.reset();

  std::stringstream streamData{std::string(data)};
  std::string line;

  while (STRING::GetLine(streamData, line))
  {
    // The original line is parsed first, then the lines produced by the mappers
    std::vector<std::string> lines{line};
    for (const CustomTagMapper& mapper : m_tagMappers)
    {
      if (!mapper.m_mapper || !STRING::StartsWith(line, mapper.m_expression))
        continue;

      std::string mappedLine = mapper.m_mapper(line);
      if (mappedLine != line)
        lines.emplace_back(std::move(mappedLine));
    }

    for (const std::string& currLine : lines)
    {
      ParseLine(currLine, doc);
    }
  }

  if (!m_isExtM3Uformat)
  {
    LOG::LogF(LOGERROR, "Non-compliant HLS manifest, #EXTM3U tag not found.");
    return false;
  }

  if (m_pendingStreamInf.has_value())
  {
    LOG::Log(LOGDEBUG, "Skipped EXT-X-STREAM-INF tag due to missing uri");
    Warn("ignoring #EXT-X-STREAM-INF tag without uri");
  }

  // Parts and hints of a segment not yet completed by an URI
  if (m_pendingSegment.has_value() &&
      (m_pendingSegment->m_parts.has_value() || m_pendingSegment->m_preloadHints.has_value()))
  {
    doc.m_preloadSegment = std::move(*m_pendingSegment);
  }
  m_pendingSegment.reset();

  return true;
}

void playlistgraph::CM3U8Parser::ParseLine(const std::string& line, CManifestDocument& doc)
{
  if (line.empty())
    return;

  if (!m_isExtM3Uformat)
  {
    // Anything before the #EXTM3U header is ignored
    if (STRING::StartsWith(line, "#EXTM3U"))
      m_isExtM3Uformat = true;
    return;
  }

  if (ParseCustomTag(line, doc))
    return;

  if (line[0] != '#')
  {
    ParseUri(line, doc);
    return;
  }

  std::string tagName;
  std::string tagValue;
  ParseTagNameValue(line, tagName, tagValue);

  if (tagName == "#EXTM3U")
  {
    return;
  }
  else if (tagName == "#EXT-X-VERSION")
  {
    if (STRING::IsUnsignedInteger(tagValue))
      doc.m_version = STRING::ToUint32(tagValue);
    else
      Warn("ignoring invalid version: " + tagValue);
  }
  else if (tagName == "#EXT-X-TARGETDURATION")
  {
    if (STRING::IsNumber(tagValue) && STRING::ToDouble(tagValue) >= 0)
      doc.m_targetDuration = STRING::ToDouble(tagValue);
    else
      Warn("ignoring invalid target duration: " + tagValue);
  }
  else if (tagName == "#EXT-X-MEDIA-SEQUENCE")
  {
    if (STRING::IsUnsignedInteger(tagValue))
      doc.m_mediaSequence = STRING::ToUint64(tagValue);
    else
      Warn("ignoring invalid media sequence: " + tagValue);
  }
  else if (tagName == "#EXT-X-DISCONTINUITY-SEQUENCE")
  {
    if (STRING::IsUnsignedInteger(tagValue))
      doc.m_discontinuitySequence = STRING::ToUint64(tagValue);
    else
      Warn("ignoring invalid discontinuity sequence: " + tagValue);
  }
  else if (tagName == "#EXT-X-PLAYLIST-TYPE")
  {
    if (tagValue == "VOD" || tagValue == "EVENT")
      doc.m_playlistType = tagValue;
    else
      Warn("ignoring unknown playlist type: " + tagValue);
  }
  else if (tagName == "#EXT-X-ENDLIST")
  {
    doc.m_hasEndList = true;
  }
  else if (tagName == "#EXT-X-I-FRAMES-ONLY")
  {
    doc.m_isIFramesOnly = true;
  }
  else if (tagName == "#EXT-X-INDEPENDENT-SEGMENTS")
  {
    doc.m_isIndependentSegments = true;
  }
  else if (tagName == "#EXT-X-ALLOW-CACHE")
  {
    doc.m_allowCache = tagValue == "YES";
  }
  else if (tagName == "#EXTINF")
  {
    CSegment& segment = PendingSegment();
    const size_t commaPos = tagValue.find(',');
    const std::string duration = tagValue.substr(0, commaPos);

    if (STRING::IsNumber(duration))
    {
      segment.m_duration = STRING::ToDouble(duration);
    }
    else
    {
      Warn("defaulting segment duration to the target duration");
      segment.m_duration = doc.m_targetDuration.value_or(0);
    }
    if (commaPos != std::string::npos)
      segment.m_title = tagValue.substr(commaPos + 1);
  }
  else if (tagName == "#EXT-X-BYTERANGE")
  {
    auto byteRange = ParseByteRange(tagValue);
    if (byteRange.has_value())
      PendingSegment().m_byteRange = byteRange;
    else
      Warn("ignoring invalid byte range: " + tagValue);
  }
  else if (tagName == "#EXT-X-DISCONTINUITY")
  {
    PendingSegment().m_isDiscontinuity = true;
  }
  else if (tagName == "#EXT-X-GAP")
  {
    PendingSegment().m_isGap = true;
  }
  else if (tagName == "#EXT-X-PROGRAM-DATE-TIME")
  {
    PendingSegment().m_programDateTime = tagValue;
  }
  else if (tagName == "#EXT-X-KEY")
  {
    auto attribs = ParseTagAttributes(tagValue);
    auto method = attribs.find("METHOD");

    if (method == attribs.end())
    {
      Warn("ignoring key declaration without METHOD attribute");
    }
    else if (method->second == "NONE")
    {
      m_currentKey.reset();
    }
    else
    {
      SegmentKey key;
      key.m_method = method->second;
      STRING::GetMapValue(attribs, std::string("URI"), key.m_uri);
      STRING::GetMapValue(attribs, std::string("IV"), key.m_iv);
      STRING::GetMapValue(attribs, std::string("KEYFORMAT"), key.m_keyFormat);
      STRING::GetMapValue(attribs, std::string("KEYFORMATVERSIONS"), key.m_keyFormatVersions);
      m_currentKey = key;
    }
  }
  else if (tagName == "#EXT-X-MAP")
  {
    auto attribs = ParseTagAttributes(tagValue);
    SegmentMap map;
    if (!STRING::GetMapValue(attribs, std::string("URI"), map.m_uri))
    {
      Warn("ignoring #EXT-X-MAP tag without URI attribute");
      return;
    }
    auto byteRange = attribs.find("BYTERANGE");
    if (byteRange != attribs.end())
      map.m_byteRange = ParseByteRange(byteRange->second);

    m_currentMap = map;
  }
  else if (tagName == "#EXT-X-STREAM-INF")
  {
    auto attribs = ParseTagAttributes(tagValue);
    if (attribs.empty())
      Warn("ignoring empty stream-inf attributes");

    doc.EnsureMediaGroups();
    m_pendingStreamInf = std::move(attribs);
  }
  else if (tagName == "#EXT-X-MEDIA")
  {
    ParseMedia(ParseTagAttributes(tagValue), doc);
  }
  else if (tagName == "#EXT-X-PART-INF")
  {
    auto partTarget = GetAttribDouble(ParseTagAttributes(tagValue), "PART-TARGET");
    if (partTarget.has_value())
    {
      doc.m_partInf = PartInf{*partTarget};
      doc.m_partTargetDuration = *partTarget;
    }
    else
    {
      Warn("#EXT-X-PART-INF lacks required attribute(s): PART-TARGET");
    }
  }
  else if (tagName == "#EXT-X-PART")
  {
    ParsePart(ParseTagAttributes(tagValue));
  }
  else if (tagName == "#EXT-X-PRELOAD-HINT")
  {
    ParsePreloadHint(ParseTagAttributes(tagValue));
  }
  else if (tagName == "#EXT-X-SERVER-CONTROL")
  {
    auto attribs = ParseTagAttributes(tagValue);
    ServerControl serverControl;
    serverControl.m_canBlockReload = IsAttribYes(attribs, "CAN-BLOCK-RELOAD");
    serverControl.m_canSkipUntil = GetAttribDouble(attribs, "CAN-SKIP-UNTIL");
    serverControl.m_canSkipDateRanges = IsAttribYes(attribs, "CAN-SKIP-DATERANGES");
    serverControl.m_holdBack = GetAttribDouble(attribs, "HOLD-BACK");
    serverControl.m_partHoldBack = GetAttribDouble(attribs, "PART-HOLD-BACK");
    doc.m_serverControl = serverControl;
  }
  else if (tagName == "#EXT-X-SKIP")
  {
    auto attribs = ParseTagAttributes(tagValue);
    auto skippedSegments = GetAttribUint64(attribs, "SKIPPED-SEGMENTS");
    if (!skippedSegments.has_value())
    {
      Warn("#EXT-X-SKIP lacks required attribute(s): SKIPPED-SEGMENTS");
      return;
    }
    SkipInfo skip;
    skip.m_skippedSegments = *skippedSegments;
    auto removedRanges = attribs.find("RECENTLY-REMOVED-DATERANGES");
    if (removedRanges != attribs.end())
      skip.m_recentlyRemovedDateRanges = STRING::SplitToVec(removedRanges->second, '\t');

    doc.m_skip = skip;
  }
  else if (tagName == "#EXT-X-RENDITION-REPORT")
  {
    auto attribs = ParseTagAttributes(tagValue);
    RenditionReport report;
    if (!STRING::GetMapValue(attribs, std::string("URI"), report.m_uri))
      Warn("#EXT-X-RENDITION-REPORT lacks required attribute(s): URI");

    report.m_lastMsn = GetAttribUint64(attribs, "LAST-MSN");
    report.m_lastPart = GetAttribUint64(attribs, "LAST-PART");

    if (!doc.m_renditionReports.has_value())
      doc.m_renditionReports.emplace();
    doc.m_renditionReports->emplace_back(report);
  }
  else if (IsUnsupportedTag(tagName))
  {
    Info("ignoring unsupported tag: " + tagName);
  }
  else if (STRING::StartsWith(tagName, "#EXT"))
  {
    Info("ignoring unknown tag: " + tagName);
  }
  // Otherwise a comment line
}

bool playlistgraph::CM3U8Parser::ParseCustomTag(const std::string& line, CManifestDocument& doc)
{
  for (const CustomTagParser& parser : m_tagParsers)
  {
    if (!STRING::StartsWith(line, parser.m_expression))
      continue;

    std::string data = parser.m_dataParser ? parser.m_dataParser(line) : line;
    if (parser.m_isSegment)
      PendingSegment().m_custom[parser.m_customType] = std::move(data);
    else
      doc.m_custom[parser.m_customType] = std::move(data);

    return true;
  }
  return false;
}

void playlistgraph::CM3U8Parser::ParseUri(const std::string& line, CManifestDocument& doc)
{
  if (m_pendingStreamInf.has_value())
  {
    auto playlist = CMediaPlaylist::MakeUniquePtr();
    playlist->m_locator = line;
    playlist->m_attributes = std::move(*m_pendingStreamInf);
    doc.m_playlists.Add(std::move(playlist));
    m_pendingStreamInf.reset();
    return;
  }

  CSegment& segment = PendingSegment();
  segment.m_uri = line;
  segment.m_key = m_currentKey;
  segment.m_map = m_currentMap;
  doc.m_segments.emplace_back(std::move(segment));
  m_pendingSegment.reset();
}

void playlistgraph::CM3U8Parser::ParseMedia(const std::map<std::string, std::string>& attribs,
                                            CManifestDocument& doc)
{
  std::string type;
  std::string groupId;
  std::string name;
  STRING::GetMapValue(attribs, std::string("TYPE"), type);
  STRING::GetMapValue(attribs, std::string("GROUP-ID"), groupId);
  STRING::GetMapValue(attribs, std::string("NAME"), name);

  auto groupType = ParseMediaGroupType(type);
  if (!groupType.has_value() || groupId.empty() || name.empty())
  {
    Warn("ignoring incomplete or missing media group");
    return;
  }

  doc.EnsureMediaGroups();

  CRenditionDescriptor rendition;
  rendition.m_name = name;
  rendition.m_isDefault = IsAttribYes(attribs, "DEFAULT");
  rendition.m_isAutoselect = IsAttribYes(attribs, "AUTOSELECT");
  rendition.m_isForced = IsAttribYes(attribs, "FORCED");
  STRING::GetMapValue(attribs, std::string("LANGUAGE"), rendition.m_language);
  STRING::GetMapValue(attribs, std::string("ASSOC-LANGUAGE"), rendition.m_assocLanguage);
  STRING::GetMapValue(attribs, std::string("CHARACTERISTICS"), rendition.m_characteristics);
  STRING::GetMapValue(attribs, std::string("CHANNELS"), rendition.m_channels);

  if (*groupType == MediaGroupType::CLOSED_CAPTIONS)
    STRING::GetMapValue(attribs, std::string("INSTREAM-ID"), rendition.m_instreamId);
  else
    STRING::GetMapValue(attribs, std::string("URI"), rendition.m_locator);

  // A rendition with the same name in the same group replace the previous one
  (*doc.GetMediaGroup(*groupType))[groupId][name] = std::move(rendition);
}

void playlistgraph::CM3U8Parser::ParsePart(const std::map<std::string, std::string>& attribs)
{
  PartialSegment part;
  auto duration = GetAttribDouble(attribs, "DURATION");
  const bool hasUri = STRING::GetMapValue(attribs, std::string("URI"), part.m_uri);

  if (!duration.has_value() || !hasUri)
    Warn("#EXT-X-PART lacks required attribute(s): DURATION, URI");

  part.m_duration = duration.value_or(0);
  part.m_isIndependent = IsAttribYes(attribs, "INDEPENDENT");
  part.m_isGap = IsAttribYes(attribs, "GAP");

  auto byteRange = attribs.find("BYTERANGE");
  if (byteRange != attribs.end())
    part.m_byteRange = ParseByteRange(byteRange->second);

  CSegment& segment = PendingSegment();
  if (!segment.m_parts.has_value())
    segment.m_parts.emplace();
  segment.m_parts->emplace_back(part);
}

void playlistgraph::CM3U8Parser::ParsePreloadHint(
    const std::map<std::string, std::string>& attribs)
{
  PreloadHint hint;
  const bool hasType = STRING::GetMapValue(attribs, std::string("TYPE"), hint.m_type);
  const bool hasUri = STRING::GetMapValue(attribs, std::string("URI"), hint.m_uri);

  if (!hasType || !hasUri)
  {
    Warn("#EXT-X-PRELOAD-HINT lacks required attribute(s): TYPE, URI");
    return;
  }
  hint.m_byteRangeStart = GetAttribUint64(attribs, "BYTERANGE-START");
  hint.m_byteRangeLength = GetAttribUint64(attribs, "BYTERANGE-LENGTH");

  CSegment& segment = PendingSegment();
  if (!segment.m_preloadHints.has_value())
    segment.m_preloadHints.emplace();
  segment.m_preloadHints->emplace_back(hint);
}

CSegment& playlistgraph::CM3U8Parser::PendingSegment()
{
  if (!m_pendingSegment.has_value())
    m_pendingSegment.emplace();
  return *m_pendingSegment;
}

void playlistgraph::CM3U8Parser::Warn(std::string_view message) const
{
  if (m_onWarn)
    m_onWarn(message);
}

void playlistgraph::CM3U8Parser::Info(std::string_view message) const
{
  if (m_onInfo)
    m_onInfo(message);
}
