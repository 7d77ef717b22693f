/*
 *  Copyright (C) 2023 Team Kodi
 *  This file is part of Kodi - https://kodi.tv
 *
 *  SPDX-License-Identifier: GPL-2.0-or-later
 *  See LICENSES/README.md for more information.
 */

#pragma once

#include <functional>
#include <string_view>

namespace playlistgraph
{
/*!
 * \brief Receiver of non-fatal diagnostic messages (warnings or info).
 *        An empty sink means the messages are not delivered.
 *        When manifests are parsed in parallel, the sink can be called
 *        concurrently and must take care of its own synchronization.
 */
using EventSink = std::function<void(std::string_view message)>;

} // namespace playlistgraph
