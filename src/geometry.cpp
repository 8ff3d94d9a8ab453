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

#include <appicons/internal/geometry.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace std;

namespace appicons
{

namespace internal
{

int content_size(int size, double scale_factor)
{
    if (size <= 0)
    {
        throw invalid_argument("content_size(): invalid icon size: " + to_string(size));
    }
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0)
    {
        throw invalid_argument("content_size(): invalid scale factor: " + to_string(scale_factor));
    }
    double scaled = std::floor(size * scale_factor);
    if (scaled > numeric_limits<int>::max())
    {
        throw invalid_argument("content_size(): scaled size out of range for size " + to_string(size) +
                               " and scale factor " + to_string(scale_factor));
    }
    if (scaled < 1.0)
    {
        throw invalid_argument("content_size(): scaled size is empty for size " + to_string(size) +
                               " and scale factor " + to_string(scale_factor));
    }
    return static_cast<int>(scaled);
}

int crop_margin(int size, int content_size)
{
    return content_size > size ? (content_size - size) / 2 : 0;
}

QRect crop_rect(int size, int content_size)
{
    if (content_size < size)
    {
        throw invalid_argument("crop_rect(): content size " + to_string(content_size) +
                               " is smaller than icon size " + to_string(size));
    }
    int margin = crop_margin(size, content_size);
    return QRect(margin, margin, size, size);
}

QPoint paste_offset(int size, int content_size)
{
    if (content_size >= size)
    {
        return QPoint(0, 0);
    }
    int offset = (size - content_size) / 2;
    return QPoint(offset, offset);
}

}  // namespace internal

}  // namespace appicons
