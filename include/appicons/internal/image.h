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

#include <appicons/internal/gobj_memory.h>

#include <QPoint>
#include <QRect>
#include <QSize>

#include <cstdint>
#include <string>

struct _GdkPixbuf;

namespace appicons
{

namespace internal
{

// Immutable raster. All operations leave the image unchanged and
// return a new Image. Errors are reported as exceptions; operations
// on a default-constructed (empty) image throw logic_error.

class Image
{
public:
    class Reader;

    // Default constructor creates an empty image.
    Image() = default;

    // Decodes image data in any format gdk-pixbuf can load.
    explicit Image(std::string const& data);
    explicit Image(int fd);

    // Copies share the pixbuf. This is safe because no operation
    // modifies the pixels of an existing pixbuf.
    Image(Image const& other);
    Image& operator=(Image const& other);
    Image(Image&&) = default;
    Image& operator=(Image&&) = default;

    // Returns a fully transparent RGBA image of the given size.
    static Image transparent(QSize size);

    bool empty() const;
    int width() const;
    int height() const;
    QSize size() const;

    bool has_alpha() const;  // Returns true if the image has an alpha channel, even if transparency is not used.

    // Return the pixel value at the (x,y) coordinates as
    //     r << 24 | g << 16 | b << 8 | a
    // Images without alpha channel report a == 0xFF.
    uint32_t pixel(int x, int y) const;

    // Returns a copy with an alpha channel. Images that already have one
    // are returned as is.
    Image to_rgba() const;

    // Returns the image scaled to exactly the given size, ignoring
    // the aspect ratio.
    Image resize(QSize size) const;

    // Returns the part of the image inside rect, which must lie within
    // the image bounds.
    Image crop(QRect const& rect) const;

    // Returns a copy of this image with overlay blended on top, its
    // top-left corner placed at offset. The overlay's alpha channel is
    // the blend mask for all channels of the image, alpha included, so a
    // semi-transparent overlay pixel on a transparent image ends up with
    // alpha a * a / 255. Parts of the overlay outside the image are clipped.
    Image composite(Image const& overlay, QPoint offset = QPoint(0, 0)) const;

    // Returns image as PNG data. compression is the zlib level (0-9).
    std::string png_data(int compression = 9) const;

private:
    void load(Reader& reader);
    void check_valid(char const* func) const;

    gobj_ptr<struct _GdkPixbuf> pixbuf_;
};

}  // namespace internal

}  // namespace appicons
