/*
 * Copyright (C) 2026 Canonical Ltd.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 3 as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <QDebug>

#include <string>

namespace appicons
{

namespace internal
{

// Installs a Qt message handler that writes timestamped messages,
// prefixed with prog_name, to stderr. Messages below log_level are dropped:
//     0: critical and fatal only
//     1: warnings and above
//     2: everything, including debug traces
// The previous handler is restored by the destructor.

class TraceMessageHandler final
{
public:
    TraceMessageHandler(std::string const& prog_name, int log_level);
    ~TraceMessageHandler();

    TraceMessageHandler(TraceMessageHandler const&) = delete;
    TraceMessageHandler& operator=(TraceMessageHandler const&) = delete;

private:
    QtMessageHandler old_message_handler_;
};

}  // namespace internal

}  // namespace appicons
