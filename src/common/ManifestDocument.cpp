/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "ManifestDocument.h"

using namespace PLAYLIST;

RenditionGroups* PLAYLIST::CManifestDocument::GetMediaGroup(MediaGroupType type)
{
  if (!m_mediaGroups.has_value())
    return nullptr;

  auto it = m_mediaGroups->find(type);
  return it != m_mediaGroups->end() ? &it->second : nullptr;
}

const RenditionGroups* PLAYLIST::CManifestDocument::GetMediaGroup(MediaGroupType type) const
{
  if (!m_mediaGroups.has_value())
    return nullptr;

  auto it = m_mediaGroups->find(type);
  return it != m_mediaGroups->cend() ? &it->second : nullptr;
}

void PLAYLIST::CManifestDocument::EnsureMediaGroups()
{
  if (!m_mediaGroups.has_value())
    m_mediaGroups.emplace();

  for (MediaGroupType type : {MediaGroupType::AUDIO, MediaGroupType::VIDEO,
                              MediaGroupType::CLOSED_CAPTIONS, MediaGroupType::SUBTITLES})
  {
    (*m_mediaGroups)[type];
  }
}
