/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "CompKodiProps.h"

#include "utils/log.h"

#include <string_view>

#include <rapidjson/document.h>

namespace
{
constexpr std::string_view PROP_MANIFEST_CONFIG = "playlistgraph.manifest_config";
constexpr std::string_view PROP_CONTEXT_URL = "playlistgraph.context_url";

void LogProp(std::string_view name, std::string_view value)
{
  LOG::Log(LOGDEBUG, "Property found \"%s\" value: %s", name.data(), value.data());
}

bool ParseCustomTag(const rapidjson::Value& jTag, playlistgraph::KODI_PROPS::CustomTagConfig& tag)
{
  if (!jTag.IsObject() || !jTag.HasMember("expression") || !jTag["expression"].IsString() ||
      !jTag.HasMember("custom_type") || !jTag["custom_type"].IsString())
  {
    return false;
  }

  tag.expression = jTag["expression"].GetString();
  tag.customType = jTag["custom_type"].GetString();

  if (jTag.HasMember("segment"))
  {
    if (!jTag["segment"].IsBool())
      return false;
    tag.isSegment = jTag["segment"].GetBool();
  }
  return !tag.expression.empty() && !tag.customType.empty();
}

} // unnamed namespace

void playlistgraph::KODI_PROPS::CCompKodiProps::Init(
    const std::map<std::string, std::string>& props)
{
  for (auto& prop : props)
  {
    if (prop.first == PROP_MANIFEST_CONFIG)
    {
      LogProp(prop.first, prop.second);
      ParseManifestConfig(prop.second);
    }
    else if (prop.first == PROP_CONTEXT_URL)
    {
      LogProp(prop.first, prop.second);
      m_contextUrl = prop.second;
    }
    else
    {
      LOG::Log(LOGWARNING, "Property found \"%s\" is not supported", prop.first.c_str());
    }
  }
}

void playlistgraph::KODI_PROPS::CCompKodiProps::ParseManifestConfig(const std::string& data)
{
  /*
   * Expected JSON structure:
   * { "config_name": "value", ... }
   */
  rapidjson::Document jDoc;
  jDoc.Parse(data.c_str(), data.size());

  if (!jDoc.IsObject())
  {
    LOG::LogF(LOGERROR, "Malformed JSON data in to \"%s\" property", PROP_MANIFEST_CONFIG.data());
    return;
  }

  // Iterate dictionary
  for (auto& jChildObj : jDoc.GetObject())
  {
    const std::string configName = jChildObj.name.GetString();
    rapidjson::Value& jDictVal = jChildObj.value;

    if (configName == "llhls" && jDictVal.IsBool())
    {
      m_manifestConfig.llhls = jDictVal.GetBool();
    }
    else if (configName == "legacy_rendition_locator" && jDictVal.IsBool())
    {
      m_manifestConfig.legacyRenditionLocator = jDictVal.GetBool();
    }
    else if (configName == "custom_tags" && jDictVal.IsArray())
    {
      /*
       * Expected JSON structure:
       * [ { "expression": "#TAG", "custom_type": "name", "segment": false }, ... ]
       */
      for (auto& jTag : jDictVal.GetArray())
      {
        CustomTagConfig tag;
        if (ParseCustomTag(jTag, tag))
          m_manifestConfig.customTags.emplace_back(tag);
        else
          LOG::LogF(LOGERROR, "Skipped malformed custom tag on \"%s\" property",
                    PROP_MANIFEST_CONFIG.data());
      }
    }
    else
    {
      LOG::LogF(LOGERROR, "Unsupported \"%s\" config or wrong data type on \"%s\" property",
                configName.c_str(), PROP_MANIFEST_CONFIG.data());
    }
  }
}
