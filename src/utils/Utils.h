/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <array>
#include <string_view>

namespace UTILS
{
namespace CODEC
{
// Fourcc of the audio sample entries, as they appear at the start of a CODECS
// attribute entry (RFC 6381). Some are generic prefixes e.g. "dts" for dtsc, dtse, dtsx

constexpr const char* FOURCC_MP4A = "mp4a";
constexpr const char* FOURCC_AAC_ = "aac";
constexpr const char* FOURCC_AC_3 = "ac-3";
constexpr const char* FOURCC_EC_3 = "ec-3"; // Enhanced AC-3
constexpr const char* FOURCC_AC_4 = "ac-4";
constexpr const char* FOURCC_OPUS = "opus";
constexpr const char* FOURCC_FLAC = "flac";
constexpr const char* FOURCC_VORB = "vorb"; // Vorbis
constexpr const char* FOURCC_DTS_ = "dts";
constexpr const char* FOURCC_ALAC = "alac";

constexpr std::array AUDIO_FOURCC_LIST = {FOURCC_MP4A, FOURCC_AAC_, FOURCC_AC_3, FOURCC_EC_3,
                                          FOURCC_AC_4, FOURCC_OPUS, FOURCC_FLAC, FOURCC_VORB,
                                          FOURCC_DTS_, FOURCC_ALAC};

/*!
 * \brief Determines if a codec string of a CODECS attribute is of type audio.
 * \param codec The codec string e.g. "mp4a.40.2", case insensitive
 * \return True if it is audio type, otherwise false
 */
bool IsAudio(std::string_view codec);

} // namespace CODEC
} // namespace UTILS
