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

#include <appicons/internal/trace.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>

using namespace std;

namespace appicons
{

namespace internal
{

namespace
{

string prog_prefix;
int verbosity = 1;

// Lowest log level at which messages of the given type are shown.
int required_level(QtMsgType type)
{
    switch (type)
    {
        case QtDebugMsg:
        case QtInfoMsg:
            return 2;
        case QtWarningMsg:
            return 1;
        default:
            return 0;
    }
}

char const* label(QtMsgType type)
{
    switch (type)
    {
        case QtWarningMsg:
            return " Warning:";
        case QtCriticalMsg:
            return " Critical:";
        case QtFatalMsg:
            return " Fatal:";  // LCOV_EXCL_LINE
        default:
            return "";
    }
}

// Local wall-clock time as HH:MM:SS.mmm
string timestamp()
{
    using namespace std::chrono;

    auto const now = system_clock::now();
    time_t const secs = system_clock::to_time_t(now);
    struct tm local_time;
    localtime_r(&secs, &local_time);
    int const msecs = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    char buf[32];
    size_t len = strftime(buf, sizeof(buf), "%T", &local_time);
    snprintf(buf + len, sizeof(buf) - len, ".%03d", msecs);
    return buf;
}

void write_message(QtMsgType type, QMessageLogContext const& /*context*/, QString const& msg)
{
    if (verbosity < required_level(type))
    {
        return;
    }

    string line;
    if (!prog_prefix.empty())
    {
        line = prog_prefix + ": ";
    }
    line += "[" + timestamp() + "]" + label(type) + " " + msg.toLocal8Bit().constData() + "\n";

    // One write per message so lines from different sources do not interleave.
    fwrite(line.data(), 1, line.size(), stderr);

    if (type == QtFatalMsg)
    {
        abort();  // LCOV_EXCL_LINE
    }
}

}  // namespace

TraceMessageHandler::TraceMessageHandler(string const& prog_name, int log_level)
{
    prog_prefix = prog_name;
    verbosity = log_level;
    old_message_handler_ = qInstallMessageHandler(write_message);
}

TraceMessageHandler::~TraceMessageHandler()
{
    qInstallMessageHandler(old_message_handler_);
}

}  // namespace internal

}  // namespace appicons
