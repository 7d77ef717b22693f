/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "TestHelper.h"
#include "../ManifestLoader.h"
#include "../parser/M3U8Parser.h"

#include <gtest/gtest.h>

using namespace playlistgraph;
using namespace PLAYLIST;

namespace
{
// Loader with a parser that maps a proprietary tag to a standard one
class CTestManifestLoader : public CManifestLoader
{
protected:
  std::unique_ptr<IManifestParser> CreateParser() const override
  {
    auto parser = std::make_unique<CM3U8Parser>();
    CustomTagMapper mapper;
    mapper.m_expression = "#VOD-STARTTIMESTAMP";
    mapper.m_mapper = [](const std::string& line)
    { return std::string("#EXT-X-PROGRAM-DATE-TIME:2017-07-31T20:35:37.573Z"); };
    parser->AddTagMapper(mapper);
    return parser;
  }
};

} // unnamed namespace

class ManifestLoaderTest : public ::testing::Test
{
protected:
  void SetUp() override { Configure({}); }

  void TearDown() override { kodi::addon::GetStubSettings().clear(); }

  void Configure(const std::map<std::string, std::string>& props)
  {
    KODI_PROPS::CCompKodiProps kodiProps;
    kodiProps.Init(props);
    SETTINGS::CCompSettings settings;
    m_loader.Configure(kodiProps, settings);
  }

  bool OpenTestFile(std::string filePath, std::string url)
  {
    std::string data;
    if (!testHelper::LoadFile(filePath, data))
      return false;

    return m_loader.Open(url, data);
  }

  CManifestLoader m_loader;
};


TEST_F(ManifestLoaderTest, OpenMainPlaylist)
{
  ASSERT_TRUE(OpenTestFile("hls/main_renditions.m3u8", "https://foo.bar/hls/main.m3u8"));

  EXPECT_EQ(m_loader.GetMedia(), nullptr);
  // A main playlist has no segments to take the target duration from
  ASSERT_EQ(m_loader.GetWarnings().size(), 1U);
  EXPECT_EQ(m_loader.GetWarnings()[0], "manifest has no targetDuration defaulting to 10");

  const CManifestDocument& mainDoc = m_loader.GetMain();
  EXPECT_EQ(mainDoc.m_locator, "https://foo.bar/hls/main.m3u8");
  EXPECT_EQ(mainDoc.m_targetDuration, 10);
  ASSERT_EQ(mainDoc.m_playlists.Size(), 2U);
  EXPECT_EQ(mainDoc.m_playlists.GetById("0-video/360p/prog_index.m3u8"),
            mainDoc.m_playlists.Get(0));
  EXPECT_NE(mainDoc.m_playlists.GetById("0-placeholder-locator-AUDIO-aac-English"), nullptr);
  EXPECT_NE(mainDoc.m_playlists.GetByLocator("placeholder-locator-AUDIO-aac-Main"), nullptr);
}

TEST_F(ManifestLoaderTest, OpenMediaPlaylist)
{
  Configure({{"playlistgraph.context_url", "https://player.foo.bar/"}});

  ASSERT_TRUE(OpenTestFile("hls/media_vod.m3u8", "https://foo.bar/hls/media.m3u8"));

  // The synthesized playlist has no stream attributes
  ASSERT_EQ(m_loader.GetWarnings().size(), 1U);
  EXPECT_EQ(m_loader.GetWarnings()[0],
            "Invalid playlist STREAM-INF detected. Missing BANDWIDTH attribute.");

  const CManifestDocument& mainDoc = m_loader.GetMain();
  EXPECT_EQ(mainDoc.m_locator, "https://foo.bar/hls/media.m3u8");
  EXPECT_EQ(mainDoc.m_resolvedLocator, "https://player.foo.bar/");
  ASSERT_EQ(mainDoc.m_playlists.Size(), 1U);

  const CMediaPlaylist* playlist = mainDoc.m_playlists.Get(0);
  EXPECT_EQ(playlist->m_id, "0-https://foo.bar/hls/media.m3u8");
  EXPECT_EQ(mainDoc.m_playlists.GetByLocator("https://foo.bar/hls/media.m3u8"), playlist);
  EXPECT_EQ(playlist->m_segments.size(), 3U);

  const CManifestDocument* media = m_loader.GetMedia();
  ASSERT_NE(media, nullptr);
  EXPECT_FALSE(media->IsMain());
  EXPECT_EQ(media->m_targetDuration, 6);
  EXPECT_EQ(media->m_mediaSequence, 3U);
}

TEST_F(ManifestLoaderTest, OpenReplacesPreviousGraph)
{
  ASSERT_TRUE(OpenTestFile("hls/main_missing_bandwidth.m3u8", "https://foo.bar/main.m3u8"));
  EXPECT_EQ(m_loader.GetWarnings().size(), 3U);

  ASSERT_TRUE(OpenTestFile("hls/main_renditions.m3u8", "https://foo.bar/hls/main.m3u8"));
  EXPECT_EQ(m_loader.GetWarnings().size(), 1U);
  EXPECT_EQ(m_loader.GetMain().m_playlists.GetById("0-low.m3u8"), nullptr);
}

TEST_F(ManifestLoaderTest, OpenInvalidManifest)
{
  EXPECT_FALSE(OpenTestFile("hls/no_header.m3u8", "https://foo.bar/main.m3u8"));
  EXPECT_FALSE(m_loader.GetMain().IsMain());
  EXPECT_EQ(m_loader.GetMedia(), nullptr);
}

TEST_F(ManifestLoaderTest, LowLatencyFromSettings)
{
  EXPECT_TRUE(m_loader.IsLowLatencyEnabled());
  ASSERT_TRUE(OpenTestFile("hls/llhls_media.m3u8", "https://foo.bar/llhls.m3u8"));
  ASSERT_NE(m_loader.GetMedia(), nullptr);
  EXPECT_TRUE(m_loader.GetMedia()->m_preloadSegment.has_value());
  EXPECT_EQ(m_loader.GetMedia()->m_partTargetDuration, 0.33334);

  kodi::addon::SetSettingBoolean("HLS.lowlatency", false);
  Configure({});
  EXPECT_FALSE(m_loader.IsLowLatencyEnabled());

  ASSERT_TRUE(OpenTestFile("hls/llhls_media.m3u8", "https://foo.bar/llhls.m3u8"));
  const CManifestDocument* media = m_loader.GetMedia();
  ASSERT_NE(media, nullptr);
  EXPECT_FALSE(media->m_preloadSegment.has_value());
  EXPECT_FALSE(media->m_serverControl.has_value());
  EXPECT_FALSE(media->m_renditionReports.has_value());
  EXPECT_FALSE(media->m_partTargetDuration.has_value());
  for (const CSegment& segment : media->m_segments)
  {
    EXPECT_FALSE(segment.m_parts.has_value());
  }
  EXPECT_FALSE(m_loader.GetMain().m_playlists.Get(0)->m_segments.back().m_parts.has_value());
}

TEST_F(ManifestLoaderTest, LowLatencyFromProperties)
{
  // The property override the add-on setting
  kodi::addon::SetSettingBoolean("HLS.lowlatency", true);
  Configure({{"playlistgraph.manifest_config", R"({"llhls":false})"}});
  EXPECT_FALSE(m_loader.IsLowLatencyEnabled());

  kodi::addon::SetSettingBoolean("HLS.lowlatency", false);
  Configure({{"playlistgraph.manifest_config", R"({"llhls":true})"}});
  EXPECT_TRUE(m_loader.IsLowLatencyEnabled());
}

TEST_F(ManifestLoaderTest, RenditionLocatorFromProperties)
{
  Configure({{"playlistgraph.manifest_config", R"({"legacy_rendition_locator":false})"}});

  ASSERT_TRUE(OpenTestFile("hls/main_renditions.m3u8", "https://foo.bar/hls/main.m3u8"));

  const CManifestDocument& mainDoc = m_loader.GetMain();
  EXPECT_EQ(mainDoc.m_playlists.GetByLocator("placeholder-locator-AUDIO-aac-Main"), nullptr);
  const CMediaPlaylist* playlist =
      mainDoc.m_playlists.GetByLocator("0-placeholder-locator-AUDIO-aac-Main");
  ASSERT_NE(playlist, nullptr);
  EXPECT_EQ(playlist->m_id, "0-placeholder-locator-AUDIO-aac-Main");
}

TEST_F(ManifestLoaderTest, CustomTagsFromProperties)
{
  Configure({{"playlistgraph.manifest_config",
              R"({"custom_tags":[{"expression":"#EXT-X-CUE-OUT","custom_type":"cueOut","segment":true}]})"}});

  ASSERT_TRUE(OpenTestFile("hls/custom_tags.m3u8", "https://foo.bar/media.m3u8"));

  const CManifestDocument* media = m_loader.GetMedia();
  ASSERT_NE(media, nullptr);
  ASSERT_EQ(media->m_segments.size(), 2U);
  auto it = media->m_segments[0].m_custom.find("cueOut");
  ASSERT_NE(it, media->m_segments[0].m_custom.end());
  EXPECT_EQ(it->second, "#EXT-X-CUE-OUT:30");
  EXPECT_TRUE(media->m_segments[0].m_programDateTime.empty());
}

TEST_F(ManifestLoaderTest, CustomParser)
{
  CTestManifestLoader loader;
  KODI_PROPS::CCompKodiProps kodiProps;
  SETTINGS::CCompSettings settings;
  loader.Configure(kodiProps, settings);

  std::string data;
  ASSERT_TRUE(testHelper::LoadFile("hls/custom_tags.m3u8", data));
  ASSERT_TRUE(loader.Open("https://foo.bar/media.m3u8", data));

  const CManifestDocument* media = loader.GetMedia();
  ASSERT_NE(media, nullptr);
  ASSERT_EQ(media->m_segments.size(), 2U);
  EXPECT_EQ(media->m_segments[0].m_programDateTime, "2017-07-31T20:35:37.573Z");
  EXPECT_TRUE(media->m_segments[0].m_custom.empty());
}
