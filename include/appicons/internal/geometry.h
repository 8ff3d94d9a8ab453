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

#include <QPoint>
#include <QRect>

namespace appicons
{

namespace internal
{

// Side length of the square the source is resized to before it is
// cropped to an icon of the given size: floor(size * scale_factor).
// Throws invalid_argument for a non-positive size or scale factor,
// or if the result does not fit into an int or is less than one pixel.
int content_size(int size, double scale_factor);

// Width of the strip removed from each edge when content_size > size.
// Zero if the content is not larger than the icon.
int crop_margin(int size, int content_size);

// Centered size x size square within content of side content_size.
// Requires content_size >= size.
QRect crop_rect(int size, int content_size);

// Position at which content is placed on a size x size canvas: the origin
// if the content was cropped, centered otherwise.
QPoint paste_offset(int size, int content_size);

}  // namespace internal

}  // namespace appicons
