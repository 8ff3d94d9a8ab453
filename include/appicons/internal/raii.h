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
 * Authored by: Michi Henning <michi@canonical.com>
 */

#pragma once

#include <unity/util/ResourcePtr.h>

#include <unistd.h>

namespace appicons
{

namespace internal
{

auto do_close = [](int fd)
{
    if (fd >= 0)
    {
        ::close(fd);
    }
};
typedef unity::util::ResourcePtr<int, decltype(do_close)> FdPtr;

}  // namespace internal

}  // namespace appicons
