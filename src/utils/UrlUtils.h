/*
 *  Copyright (C) 2022 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <string>
#include <string_view>

namespace UTILS
{
namespace URL
{

/*! \brief Check if it is an absolute URL
 *  \return True if it is an absolute URL, false otherwise
 */
bool IsUrlAbsolute(std::string_view url);

/*! \brief Check if it is a relative URL to a level e.g. "../something/"
 *  \param url An URL
 *  \return True if it is a relative URL to a level, false otherwise
 */
bool IsUrlRelativeLevel(std::string_view url);

/*! \brief Get the base domain of an absolute URL e.g. "https://foo.bar"
 *  \param url An URL
 *  \return The base domain, or empty string for relative URLs
 */
std::string GetBaseDomain(std::string url);

/*! 
 * \brief Combine two URLs as per RFC 3986 specification.
 * \param baseUrl The base URL, absolute or relative.
 * \param relativeUrl The other relative URL to be combined.
 * \return The final URL.
 */
std::string Join(std::string baseUrl, std::string relativeUrl);

/*!
 * \brief Resolve a locator against a base locator. Absolute locators are
 *        returned unchanged, relative ones are joined to the base.
 * \param baseUrl The base URL, can be empty.
 * \param url The URL to be resolved.
 * \return The resolved URL.
 */
std::string Resolve(std::string_view baseUrl, std::string_view url);

} // namespace URL
} // namespace UTILS
