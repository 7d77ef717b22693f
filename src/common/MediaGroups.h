/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "MediaPlaylist.h"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PLAYLIST
{

// \brief Media group categories, from the TYPE attribute of EXT-X-MEDIA tag
enum class MediaGroupType
{
  AUDIO,
  VIDEO,
  SUBTITLES,
  CLOSED_CAPTIONS
};

/*!
 * \brief Get the manifest name of a media group category, e.g. "CLOSED-CAPTIONS"
 */
constexpr const char* ToString(MediaGroupType type)
{
  switch (type)
  {
    case MediaGroupType::AUDIO:
      return "AUDIO";
    case MediaGroupType::VIDEO:
      return "VIDEO";
    case MediaGroupType::SUBTITLES:
      return "SUBTITLES";
    case MediaGroupType::CLOSED_CAPTIONS:
      return "CLOSED-CAPTIONS";
  }
  return "";
}

/*!
 * \brief Map of values keyed by string that keeps the insertion order.
 *        Media groups and their labels are few, so a linear lookup is used.
 */
template<typename T>
class CKeyedList
{
public:
  using Entry = std::pair<std::string, T>;

  // \brief Get the value of the key, the value is default constructed and appended if not exists
  T& operator[](const std::string& key)
  {
    T* value = Find(key);
    if (value)
      return *value;
    m_entries.emplace_back(key, T{});
    return m_entries.back().second;
  }

  T* Find(std::string_view key)
  {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&key](const Entry& entry) { return entry.first == key; });
    return it != m_entries.end() ? &it->second : nullptr;
  }

  const T* Find(std::string_view key) const
  {
    auto it = std::find_if(m_entries.cbegin(), m_entries.cend(),
                           [&key](const Entry& entry) { return entry.first == key; });
    return it != m_entries.cend() ? &it->second : nullptr;
  }

  size_t Size() const { return m_entries.size(); }
  bool IsEmpty() const { return m_entries.empty(); }

  typename std::vector<Entry>::iterator begin() { return m_entries.begin(); }
  typename std::vector<Entry>::iterator end() { return m_entries.end(); }
  typename std::vector<Entry>::const_iterator begin() const { return m_entries.cbegin(); }
  typename std::vector<Entry>::const_iterator end() const { return m_entries.cend(); }

private:
  std::vector<Entry> m_entries;
};

// \brief An alternate rendition with its own locator, or the nested playlists that describe it
class ATTR_DLL_LOCAL CRenditionDescriptor : public RenditionProperties
{
public:
  CRenditionDescriptor() = default;
  ~CRenditionDescriptor() = default;

  CRenditionDescriptor(const CRenditionDescriptor&) = delete;
  CRenditionDescriptor& operator=(const CRenditionDescriptor&) = delete;
  CRenditionDescriptor(CRenditionDescriptor&&) = default;
  CRenditionDescriptor& operator=(CRenditionDescriptor&&) = default;

  bool HasPlaylists() const { return !m_playlists.empty(); }

  std::vector<std::unique_ptr<CMediaPlaylist>> m_playlists;
};

// Label-key (the NAME attribute) to rendition
using RenditionLabels = CKeyedList<CRenditionDescriptor>;
// Group-key (the GROUP-ID attribute) to labels
using RenditionGroups = CKeyedList<RenditionLabels>;
// Category to groups
using MediaGroups = std::map<MediaGroupType, RenditionGroups>;

} // namespace PLAYLIST
