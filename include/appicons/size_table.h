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

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace appicons
{

/**
\brief One row of the size table.

An icon of `size` x `size` pixels is written to `filename`, relative to the
output directory. Rows without a filename describe sizes that are
currently not needed and are skipped.
*/

struct SizeEntry
{
    int size;
    boost::optional<std::string> filename;
};

/**
\brief Ordered list of icon sizes.

Rows are processed in order. Several rows may name the same file; the
row processed last determines its contents.
*/

typedef std::vector<SizeEntry> SizeTable;

/**
\brief Returns the icon sizes required by the app icon asset catalog.
*/

SizeTable const& canonical_size_table();

}  // namespace appicons
