/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include "common/EventSink.h"
#include "common/ManifestDocument.h"

#include <functional>
#include <string>
#include <string_view>

namespace playlistgraph
{

// \brief Parse the lines that start with the expression as custom data
struct CustomTagParser
{
  std::string m_expression; // Line prefix e.g. "#VOD-TIMING"
  std::string m_customType; // Key where the data is stored
  // Convert the line to the data to store, when empty the whole line is stored
  std::function<std::string(const std::string& line)> m_dataParser;
  // True to store the data on the segment that follow the tag, false on the document
  bool m_isSegment{false};
};

// \brief Map the lines that start with the expression to a new line, parsed after the original one
struct CustomTagMapper
{
  std::string m_expression;
  std::function<std::string(const std::string& line)> m_mapper;
};

/*!
 * \brief Interface of the manifest grammar parsers, that convert the manifest text
 *        to the structure of a manifest document without any normalization.
 */
class IManifestParser
{
public:
  virtual ~IManifestParser() = default;

  virtual void SetWarnSink(EventSink sink) = 0;
  virtual void SetInfoSink(EventSink sink) = 0;

  virtual void AddTagParser(CustomTagParser parser) = 0;
  virtual void AddTagMapper(CustomTagMapper mapper) = 0;

  /*!
   * \brief Parse the manifest data.
   * \param data The manifest text
   * \param doc[OUT] The parsed document
   * \return True if success, otherwise false if the data is not a manifest
   */
  virtual bool Parse(std::string_view data, PLAYLIST::CManifestDocument& doc) = 0;
};

} // namespace playlistgraph
