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

#pragma once

#include <string>

namespace appicons
{

namespace internal
{

// Read entire file and return contents as a string.
std::string read_file(std::string const& filename);

// Replace filename with contents. The file is truncated and written in
// place; nothing else in its directory is created or removed.
void write_file(std::string const& filename, std::string const& contents);

}  // namespace internal

}  // namespace appicons
