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
 *
 * Authored by: Michi Henning <michi.henning@canonical.com>
 */

// Get XSI-compliant strerror_r(). This must stay in a source file of its own
// so the feature macros cannot leak into anything else.

#undef _GNU_SOURCE
#define _XOPEN_SOURCE 700
#include <string.h>

#include <appicons/internal/safe_strerror.h>

#include <cerrno>

using namespace std;

namespace appicons
{

namespace internal
{

string safe_strerror(int errnum)
{
    char buf[512];
    int rc = strerror_r(errnum, buf, sizeof(buf));
    if (rc == 0)
    {
        return buf;
    }
    // Older glibc versions return -1 and set errno instead of returning the error.
    if (rc == -1)
    {
        rc = errno;  // LCOV_EXCL_LINE
    }
    if (rc == EINVAL)
    {
        return "unknown error " + to_string(errnum);
    }
    // LCOV_EXCL_START
    return "strerror_r() failed with " + to_string(rc) + " for errnum " + to_string(errnum);
    // LCOV_EXCL_STOP
}

}  // namespace internal

}  // namespace appicons
