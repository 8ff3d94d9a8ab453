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

#include <appicons/internal/file_io.h>

#include <appicons/internal/raii.h>
#include <appicons/internal/safe_strerror.h>

#include <cerrno>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

using namespace std;

namespace appicons
{

namespace internal
{

string read_file(string const& filename)
{
    int fd = open(filename.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        throw runtime_error("read_file(): cannot open \"" + filename + "\": " + safe_strerror(errno));
    }
    FdPtr fd_ptr(fd, do_close);

    string contents;
    char buf[16 * 1024];
    ssize_t rc;
    while ((rc = read(fd_ptr.get(), buf, sizeof(buf))) != 0)
    {
        if (rc == -1)
        {
            throw runtime_error("read_file(): cannot read from \"" + filename + "\": " + safe_strerror(errno));
        }
        contents.append(buf, rc);
    }
    return contents;
}

void write_file(string const& filename, string const& contents)
{
    // The file is created with the process umask, like any other file the user writes.
    int fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd == -1)
    {
        throw runtime_error("write_file(): cannot open \"" + filename + "\": " + safe_strerror(errno));
    }
    FdPtr fd_ptr(fd, do_close);

    char const* p = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0)
    {
        ssize_t rc = write(fd_ptr.get(), p, remaining);
        if (rc == -1)
        {
            if (errno == EINTR)
            {
                continue;  // LCOV_EXCL_LINE
            }
            throw runtime_error("write_file(): cannot write to \"" + filename + "\": " + safe_strerror(errno));
        }
        p += rc;
        remaining -= rc;
    }

    // Deferred write errors are reported by close().
    if (close(fd_ptr.dismiss()) == -1)
    {
        // LCOV_EXCL_START
        throw runtime_error("write_file(): cannot close \"" + filename + "\": " + safe_strerror(errno));
        // LCOV_EXCL_STOP
    }
}

}  // namespace internal

}  // namespace appicons
