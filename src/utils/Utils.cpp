/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#include "Utils.h"

#include "StringUtils.h"

#include "kodi/tools/StringUtils.h"

using namespace UTILS;
using namespace kodi::tools;

bool UTILS::CODEC::IsAudio(std::string_view codec)
{
  // The sample entry is the part before the first dot, the rest are profile parameters
  std::string fourcc{codec.substr(0, codec.find('.'))};
  StringUtils::ToLower(fourcc);

  for (const char* audioFourcc : CODEC::AUDIO_FOURCC_LIST)
  {
    if (STRING::StartsWith(fourcc, audioFourcc))
      return true;
  }
  return false;
}
