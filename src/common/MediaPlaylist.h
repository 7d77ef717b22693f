/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "Segment.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PLAYLIST
{

// \brief The own fields of an alternate rendition, usually refer to an EXT-X-MEDIA tag
struct RenditionProperties
{
  std::string m_name;
  std::string m_language;
  std::string m_assocLanguage;
  bool m_isDefault{false};
  bool m_isAutoselect{false};
  bool m_isForced{false};
  std::string m_characteristics;
  std::string m_instreamId;
  std::string m_channels;
  std::string m_locator; // URI attribute, empty when the rendition is included in the variant
  std::string m_resolvedLocator;
};

class ATTR_DLL_LOCAL CMediaPlaylist
{
public:
  CMediaPlaylist() = default;
  ~CMediaPlaylist() = default;

  static std::unique_ptr<CMediaPlaylist> MakeUniquePtr()
  {
    return std::make_unique<CMediaPlaylist>();
  }

  std::string m_locator;
  std::string m_resolvedLocator;
  std::string m_id; // Set once by the identity assignment, never recomputed
  // Stream level attributes e.g. BANDWIDTH, CODECS, AUDIO from EXT-X-STREAM-INF
  std::map<std::string, std::string> m_attributes;
  std::vector<CSegment> m_segments;
  uint32_t m_errorCount{0};
  // Copy of the rendition fields, when the playlist has been synthesized from an inline rendition
  std::optional<RenditionProperties> m_rendition;

  /*!
   * \brief Get an attribute value.
   * \param name The attribute name
   * \return The attribute value, otherwise empty string if not exists
   */
  std::string GetAttribute(const std::string& name) const
  {
    auto it = m_attributes.find(name);
    return it != m_attributes.end() ? it->second : "";
  }

  bool HasAttribute(const std::string& name) const
  {
    return m_attributes.find(name) != m_attributes.end();
  }
};

} // namespace PLAYLIST
