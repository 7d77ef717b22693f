/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TestHelper.h"
#include "../manifest/DocumentDefaults.h"
#include "../manifest/PlaylistUtils.h"
#include "../parser/M3U8Parser.h"

#include <gtest/gtest.h>

using namespace playlistgraph;
using namespace PLAYLIST;

class DocumentDefaultsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    m_onWarn = [this](std::string_view message) { m_warnings.emplace_back(message); };
    m_onInfo = [this](std::string_view message) { m_infos.emplace_back(message); };
  }

  void TearDown() override
  {
    m_warnings.clear();
    m_infos.clear();
  }

  bool ParseTestFile(std::string filePath, bool llhls, CManifestDocument& doc)
  {
    std::string data;
    if (!testHelper::LoadFile(filePath, data))
      return false;

    ParseOptions options;
    options.onWarn = m_onWarn;
    options.onInfo = m_onInfo;
    options.llhls = llhls;

    CM3U8Parser parser;
    return ParseManifest(parser, data, options, doc);
  }

  static CSegment MakeSegment(double duration)
  {
    CSegment segment;
    segment.m_duration = duration;
    return segment;
  }

  static CSegment MakeSegmentWithParts(std::vector<double> partDurations)
  {
    CSegment segment;
    segment.m_parts.emplace();
    for (double duration : partDurations)
    {
      PartialSegment part;
      part.m_duration = duration;
      segment.m_parts->emplace_back(part);
      segment.m_duration += duration;
    }
    return segment;
  }

  EventSink m_onWarn;
  EventSink m_onInfo;
  std::vector<std::string> m_warnings;
  std::vector<std::string> m_infos;
};


TEST_F(DocumentDefaultsTest, TargetDurationFromSegments)
{
  CManifestDocument parsed;
  parsed.m_segments.emplace_back(MakeSegment(4.004));
  parsed.m_segments.emplace_back(MakeSegment(6.006));
  parsed.m_segments.emplace_back(MakeSegment(5));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn, m_onInfo);

  ASSERT_TRUE(doc.m_targetDuration.has_value());
  EXPECT_DOUBLE_EQ(*doc.m_targetDuration, 6.006);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no targetDuration defaulting to 6.006");
}

TEST_F(DocumentDefaultsTest, TargetDurationWithFullPrecision)
{
  CManifestDocument parsed;
  parsed.m_segments.emplace_back(MakeSegment(12.345678));
  parsed.m_segments.emplace_back(MakeSegment(3.003));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn, m_onInfo);

  // The warning states exactly the value assigned
  ASSERT_TRUE(doc.m_targetDuration.has_value());
  EXPECT_EQ(*doc.m_targetDuration, 12.345678);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no targetDuration defaulting to 12.345678");
}

TEST_F(DocumentDefaultsTest, PartTargetDurationWithFullPrecision)
{
  CManifestDocument parsed;
  parsed.m_targetDuration = 4;
  parsed.m_segments.emplace_back(MakeSegmentWithParts({0.3333361, 0.3333337}));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn, m_onInfo);

  ASSERT_TRUE(doc.m_partTargetDuration.has_value());
  EXPECT_EQ(*doc.m_partTargetDuration, 0.3333361);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no partTargetDuration defaulting to 0.3333361");
}

TEST_F(DocumentDefaultsTest, TargetDurationWithoutSegments)
{
  CManifestDocument doc = NormalizeDocument(CManifestDocument(), true, m_onWarn);

  EXPECT_EQ(doc.m_targetDuration, 10);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no targetDuration defaulting to 10");
}

TEST_F(DocumentDefaultsTest, TargetDurationNotOverwritten)
{
  CManifestDocument parsed;
  parsed.m_targetDuration = 2;
  parsed.m_segments.emplace_back(MakeSegment(6));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn);

  EXPECT_EQ(doc.m_targetDuration, 2);
  EXPECT_TRUE(m_warnings.empty());
}

TEST_F(DocumentDefaultsTest, TargetDurationWithoutSink)
{
  CManifestDocument parsed;
  parsed.m_segments.emplace_back(MakeSegment(3));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), false);

  EXPECT_EQ(doc.m_targetDuration, 3);
}

TEST_F(DocumentDefaultsTest, PartTargetDurationFromLastParts)
{
  CManifestDocument parsed;
  parsed.m_targetDuration = 4;
  // Parts of segments before the trailing run are not taken into account
  parsed.m_segments.emplace_back(MakeSegmentWithParts({3.5}));
  parsed.m_segments.emplace_back(MakeSegment(4));
  parsed.m_segments.emplace_back(MakeSegmentWithParts({0.9, 1.0}));
  parsed.m_segments.emplace_back(MakeSegmentWithParts({0.5, 0.6}));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn);

  ASSERT_TRUE(doc.m_partTargetDuration.has_value());
  EXPECT_DOUBLE_EQ(*doc.m_partTargetDuration, 1.0);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no partTargetDuration defaulting to 1");
}

TEST_F(DocumentDefaultsTest, PartTargetDurationNotSetWithoutLastParts)
{
  CManifestDocument parsed;
  parsed.m_targetDuration = 4;
  parsed.m_segments.emplace_back(MakeSegmentWithParts({0.9, 1.0}));
  parsed.m_segments.emplace_back(MakeSegment(4));

  CManifestDocument doc = NormalizeDocument(std::move(parsed), true, m_onWarn);

  EXPECT_FALSE(doc.m_partTargetDuration.has_value());
  EXPECT_TRUE(m_warnings.empty());
}

TEST_F(DocumentDefaultsTest, LastParts)
{
  CManifestDocument doc;
  EXPECT_TRUE(GetLastParts(doc).empty());

  doc.m_segments.emplace_back(MakeSegmentWithParts({1.0}));
  doc.m_segments.emplace_back(MakeSegmentWithParts({0.5, 0.5}));
  EXPECT_EQ(GetLastParts(doc).size(), 3U);

  doc.m_preloadSegment = MakeSegmentWithParts({0.2});
  std::vector<PartialSegment> parts = GetLastParts(doc);
  ASSERT_EQ(parts.size(), 4U);
  EXPECT_DOUBLE_EQ(parts.back().m_duration, 0.2);

  doc.m_segments.emplace_back(MakeSegment(2));
  EXPECT_TRUE(GetLastParts(doc).empty());
}

TEST_F(DocumentDefaultsTest, ParseLowLatencyManifest)
{
  CManifestDocument doc;
  ASSERT_TRUE(ParseTestFile("hls/llhls_media.m3u8", true, doc));

  // All the mandatory fields are declared
  EXPECT_TRUE(m_warnings.empty());
  EXPECT_EQ(doc.m_targetDuration, 4);
  EXPECT_DOUBLE_EQ(*doc.m_partTargetDuration, 0.33334);
  EXPECT_TRUE(doc.m_preloadSegment.has_value());
  EXPECT_TRUE(doc.m_serverControl.has_value());
  EXPECT_TRUE(doc.m_renditionReports.has_value());
  EXPECT_TRUE(doc.m_partInf.has_value());
  EXPECT_TRUE(doc.m_segments[1].HasParts());
}

TEST_F(DocumentDefaultsTest, StripLowLatencyFeatures)
{
  CManifestDocument doc;
  ASSERT_TRUE(ParseTestFile("hls/llhls_media.m3u8", false, doc));

  EXPECT_FALSE(doc.m_preloadSegment.has_value());
  EXPECT_FALSE(doc.m_skip.has_value());
  EXPECT_FALSE(doc.m_serverControl.has_value());
  EXPECT_FALSE(doc.m_renditionReports.has_value());
  EXPECT_FALSE(doc.m_partInf.has_value());
  EXPECT_FALSE(doc.m_partTargetDuration.has_value());

  ASSERT_EQ(doc.m_segments.size(), 2U);
  for (const CSegment& segment : doc.m_segments)
  {
    EXPECT_FALSE(segment.m_parts.has_value());
    EXPECT_FALSE(segment.m_preloadHints.has_value());
  }
  EXPECT_TRUE(m_warnings.empty());
  EXPECT_EQ(m_infos.size(), 1U);
}

TEST_F(DocumentDefaultsTest, StripLowLatencyFeaturesNotParsed)
{
  // The fields are removed also when set by other means than the parser
  CManifestDocument parsed;
  parsed.m_targetDuration = 4;
  parsed.m_skip = SkipInfo{};
  parsed.m_partTargetDuration = 1;
  parsed.m_segments.emplace_back(MakeSegmentWithParts({1.0}));
  parsed.m_segments.back().m_preloadHints.emplace();

  CManifestDocument doc = NormalizeDocument(std::move(parsed), false, m_onWarn);

  EXPECT_FALSE(doc.m_skip.has_value());
  EXPECT_FALSE(doc.m_partTargetDuration.has_value());
  EXPECT_FALSE(doc.m_segments[0].m_parts.has_value());
  EXPECT_FALSE(doc.m_segments[0].m_preloadHints.has_value());
  EXPECT_TRUE(m_warnings.empty());
}

TEST_F(DocumentDefaultsTest, MissingPartTarget)
{
  CManifestDocument doc;
  ASSERT_TRUE(ParseTestFile("hls/llhls_no_partinf.m3u8", true, doc));

  ASSERT_TRUE(doc.m_partTargetDuration.has_value());
  EXPECT_DOUBLE_EQ(*doc.m_partTargetDuration, 1.0);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no partTargetDuration defaulting to 1");
}

TEST_F(DocumentDefaultsTest, MissingPartTargetLowLatencyDisabled)
{
  CManifestDocument doc;
  ASSERT_TRUE(ParseTestFile("hls/llhls_no_partinf.m3u8", false, doc));

  EXPECT_FALSE(doc.m_partTargetDuration.has_value());
  EXPECT_TRUE(m_warnings.empty());
}

TEST_F(DocumentDefaultsTest, ParseWithoutTargetDuration)
{
  CManifestDocument doc;
  ASSERT_TRUE(ParseTestFile("hls/media_no_targetduration.m3u8", true, doc));

  EXPECT_DOUBLE_EQ(*doc.m_targetDuration, 6.006);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no targetDuration defaulting to 6.006");

  doc = CManifestDocument();
  m_warnings.clear();
  ASSERT_TRUE(ParseTestFile("hls/media_empty.m3u8", true, doc));

  EXPECT_EQ(doc.m_targetDuration, 10);
  ASSERT_EQ(m_warnings.size(), 1U);
  EXPECT_EQ(m_warnings[0], "manifest has no targetDuration defaulting to 10");
}

TEST_F(DocumentDefaultsTest, ParseRejected)
{
  CManifestDocument doc;
  EXPECT_FALSE(ParseTestFile("hls/no_header.m3u8", true, doc));
}
