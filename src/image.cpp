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

#include <appicons/internal/image.h>
#include <appicons/internal/safe_strerror.h>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wcast-qual"
#include <gdk-pixbuf/gdk-pixbuf.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <unistd.h>

using namespace std;

namespace appicons
{

namespace internal
{

class Image::Reader
{
public:
    Reader() = default;
    virtual ~Reader() = default;

    Reader(const Reader&) = delete;
    Reader& operator=(Reader&) = delete;

    // Returns true if (data, length) have been set to a segment of data
    virtual bool read(unsigned char const** data, size_t* length) = 0;
};

namespace
{

class BufferReader : public Image::Reader
{
public:
    BufferReader(unsigned char const* data, size_t length)
        : data_(data)
        , length_(length)
    {
    }

    bool read(unsigned char const** data, size_t* length) override
    {
        if (first_read_)
        {
            *data = data_;
            *length = length_;
            first_read_ = false;
            return length_ > 0;
        }
        return false;
    }

private:
    unsigned char const* const data_;
    size_t const length_;
    bool first_read_ = true;
};

class FdReader : public Image::Reader
{
public:
    FdReader(int fd)
        : fd_(fd)
    {
    }

    bool read(unsigned char const** data, size_t* length) override
    {
        ssize_t n_read;
        do
        {
            n_read = ::read(fd_, buffer_, sizeof(buffer_));
        } while (n_read < 0 && errno == EINTR);
        if (n_read < 0)
        {
            throw runtime_error("FdReader::read() failed: " + safe_strerror(errno));
        }
        *data = buffer_;
        *length = n_read;
        return n_read > 0;
    }

private:
    int fd_;
    unsigned char buffer_[64 * 1024];
};

auto do_loader_close = [](GdkPixbufLoader* loader)
{
    if (loader)
    {
        gdk_pixbuf_loader_close(loader, NULL);
        g_object_unref(loader);
    }
};
typedef unique_ptr<GdkPixbufLoader, decltype(do_loader_close)> LoaderPtr;

// Converts err into an exception message and frees it.
string take_error(string const& prefix, GError* err)
{
    string msg = prefix + (err ? err->message : "unknown error");
    if (err)
    {
        g_error_free(err);
    }
    return msg;
}

gobj_ptr<GdkPixbuf> load_image(Image::Reader& reader)
{
    LoaderPtr loader(gdk_pixbuf_loader_new(), do_loader_close);
    if (!loader.get())
    {
        throw runtime_error("load_image(): cannot allocate GdkPixbufLoader");  // LCOV_EXCL_LINE
    }

    unsigned char const* data = nullptr;
    size_t length = 0;
    GError* err = nullptr;
    bool have_data = false;
    while (reader.read(&data, &length))
    {
        have_data = true;
        if (!gdk_pixbuf_loader_write(loader.get(), data, length, &err))
        {
            throw runtime_error(take_error("load_image(): cannot write to pixbuf loader: ", err));
        }
    }
    if (!have_data)
    {
        throw runtime_error("load_image(): image data is empty");
    }
    if (!gdk_pixbuf_loader_close(loader.get(), &err))
    {
        throw runtime_error(take_error("load_image(): cannot close pixbuf loader: ", err));
    }

    gobj_ptr<GdkPixbuf> pixbuf;
    GdkPixbuf* borrowed = gdk_pixbuf_loader_get_pixbuf(loader.get());
    if (!borrowed)
    {
        throw runtime_error("load_image(): cannot create pixbuf");  // LCOV_EXCL_LINE
    }
    // gdk_pixbuf_loader_get_pixbuf() returns a borrowed reference
    g_object_ref(borrowed);
    pixbuf.reset(borrowed);
    return pixbuf;
}

void check_size(char const* func, QSize size)
{
    if (size.width() <= 0 || size.height() <= 0)
    {
        throw invalid_argument(string(func) + ": invalid size: " + to_string(size.width()) + "x" +
                               to_string(size.height()));
    }
}

}  // namespace

Image::Image(string const& data)
{
    BufferReader reader(reinterpret_cast<unsigned char const*>(data.data()), data.size());
    load(reader);
}

Image::Image(int fd)
{
    FdReader reader(fd);
    load(reader);
}

Image::Image(Image const& other)
{
    if (other.pixbuf_)
    {
        g_object_ref(other.pixbuf_.get());
        pixbuf_.reset(other.pixbuf_.get());
    }
}

Image& Image::operator=(Image const& other)
{
    if (this != &other)
    {
        Image tmp(other);
        pixbuf_ = move(tmp.pixbuf_);
    }
    return *this;
}

void Image::load(Reader& reader)
{
    pixbuf_ = load_image(reader);
}

void Image::check_valid(char const* func) const
{
    if (!pixbuf_)
    {
        throw logic_error(string(func) + ": empty image");
    }
}

Image Image::transparent(QSize size)
{
    check_size("Image::transparent()", size);

    Image canvas;
    canvas.pixbuf_.reset(gdk_pixbuf_new(GDK_COLORSPACE_RGB, true, 8, size.width(), size.height()));
    if (!canvas.pixbuf_)
    {
        throw runtime_error("Image::transparent(): cannot allocate " + to_string(size.width()) + "x" +
                            to_string(size.height()) + " pixbuf");  // LCOV_EXCL_LINE
    }
    gdk_pixbuf_fill(canvas.pixbuf_.get(), 0x00000000);
    return canvas;
}

bool Image::empty() const
{
    return !pixbuf_;
}

int Image::width() const
{
    check_valid("Image::width()");

    auto w = gdk_pixbuf_get_width(pixbuf_.get());
    if (w < 1)
    {
        throw runtime_error("Image::width(): invalid image width: " + to_string(w));  // LCOV_EXCL_LINE
    }
    return w;
}

int Image::height() const
{
    check_valid("Image::height()");

    auto h = gdk_pixbuf_get_height(pixbuf_.get());
    if (h < 1)
    {
        throw runtime_error("Image::height(): invalid image height: " + to_string(h));  // LCOV_EXCL_LINE
    }
    return h;
}

QSize Image::size() const
{
    return QSize(width(), height());
}

bool Image::has_alpha() const
{
    check_valid("Image::has_alpha()");
    return gdk_pixbuf_get_has_alpha(pixbuf_.get());
}

uint32_t Image::pixel(int x, int y) const
{
    check_valid("Image::pixel()");

    if (x < 0 || x >= width())
    {
        throw out_of_range("Image::pixel(): invalid x coordinate: " + to_string(x));
    }
    if (y < 0 || y >= height())
    {
        throw out_of_range("Image::pixel(): invalid y coordinate: " + to_string(y));
    }

    int n_channels = gdk_pixbuf_get_n_channels(pixbuf_.get());
    int rowstride = gdk_pixbuf_get_rowstride(pixbuf_.get());
    guchar const* data = gdk_pixbuf_read_pixels(pixbuf_.get());

    guchar const* p = data + y * rowstride + x * n_channels;
    uint32_t alpha = n_channels == 4 ? p[3] : 0xFF;
    return uint32_t(p[0]) << 24 | uint32_t(p[1]) << 16 | uint32_t(p[2]) << 8 | alpha;
}

Image Image::to_rgba() const
{
    check_valid("Image::to_rgba()");

    if (has_alpha())
    {
        return *this;
    }
    Image rgba;
    rgba.pixbuf_.reset(gdk_pixbuf_add_alpha(pixbuf_.get(), false, 0, 0, 0));
    if (!rgba.pixbuf_)
    {
        throw runtime_error("Image::to_rgba(): cannot add alpha channel");  // LCOV_EXCL_LINE
    }
    return rgba;
}

Image Image::resize(QSize size) const
{
    check_valid("Image::resize()");
    check_size("Image::resize()", size);

    Image scaled;
    scaled.pixbuf_.reset(
        gdk_pixbuf_scale_simple(pixbuf_.get(), size.width(), size.height(), GDK_INTERP_BILINEAR));
    if (!scaled.pixbuf_)
    {
        throw runtime_error("Image::resize(): could not create scaled image");  // LCOV_EXCL_LINE
    }
    return scaled;
}

Image Image::crop(QRect const& rect) const
{
    check_valid("Image::crop()");
    check_size("Image::crop()", rect.size());

    QRect bounds(QPoint(0, 0), size());
    if (!bounds.contains(rect))
    {
        throw out_of_range("Image::crop(): rectangle (" + to_string(rect.x()) + "," + to_string(rect.y()) + " " +
                           to_string(rect.width()) + "x" + to_string(rect.height()) +
                           ") exceeds image bounds " + to_string(width()) + "x" + to_string(height()));
    }

    // The sub-pixbuf shares pixels with its parent; copy it so the result
    // does not keep the full-size parent alive.
    gobj_ptr<GdkPixbuf> sub(
        gdk_pixbuf_new_subpixbuf(pixbuf_.get(), rect.x(), rect.y(), rect.width(), rect.height()));
    if (!sub)
    {
        throw runtime_error("Image::crop(): cannot create sub-image");  // LCOV_EXCL_LINE
    }
    Image cropped;
    cropped.pixbuf_.reset(gdk_pixbuf_copy(sub.get()));
    if (!cropped.pixbuf_)
    {
        throw runtime_error("Image::crop(): cannot copy sub-image");  // LCOV_EXCL_LINE
    }
    return cropped;
}

Image Image::composite(Image const& overlay, QPoint offset) const
{
    check_valid("Image::composite()");
    overlay.check_valid("Image::composite()");

    Image result;
    result.pixbuf_.reset(gdk_pixbuf_copy(pixbuf_.get()));
    if (!result.pixbuf_)
    {
        throw runtime_error("Image::composite(): cannot copy image");  // LCOV_EXCL_LINE
    }

    QRect area = QRect(QPoint(0, 0), size()).intersected(QRect(offset, overlay.size()));
    if (area.isEmpty())
    {
        return result;
    }

    // Every channel of the destination, alpha included, is blended with the
    // overlay using the overlay's alpha as the mask:
    //     out = (in * m + out * (255 - m)) / 255
    // On a transparent canvas this premultiplies the overlay by its own alpha.
    GdkPixbuf* dst = result.pixbuf_.get();
    GdkPixbuf const* src = overlay.pixbuf_.get();
    int const dst_channels = gdk_pixbuf_get_n_channels(dst);
    int const dst_rowstride = gdk_pixbuf_get_rowstride(dst);
    guchar* dst_pixels = gdk_pixbuf_get_pixels(dst);
    int const src_channels = gdk_pixbuf_get_n_channels(src);
    int const src_rowstride = gdk_pixbuf_get_rowstride(src);
    guchar const* src_pixels = gdk_pixbuf_read_pixels(src);

    for (int y = area.top(); y <= area.bottom(); ++y)
    {
        guchar* d = dst_pixels + y * dst_rowstride + area.left() * dst_channels;
        guchar const* s = src_pixels + (y - offset.y()) * src_rowstride + (area.left() - offset.x()) * src_channels;
        for (int x = area.left(); x <= area.right(); ++x)
        {
            unsigned const m = src_channels == 4 ? s[3] : 0xFF;
            for (int c = 0; c < dst_channels; ++c)
            {
                unsigned const in = c < 3 ? s[c] : (src_channels == 4 ? s[3] : 0xFF);
                d[c] = guchar((in * m + d[c] * (0xFF - m) + 127) / 0xFF);
            }
            d += dst_channels;
            s += src_channels;
        }
    }
    return result;
}

string Image::png_data(int compression) const
{
    check_valid("Image::png_data()");

    if (compression < 0 || compression > 9)
    {
        throw invalid_argument("Image::png_data(): compression out of range [0..9]: " + to_string(compression));
    }
    string s_compression = to_string(compression);

    gchar* buf;
    gsize size;
    GError* err = nullptr;
    if (!gdk_pixbuf_save_to_buffer(pixbuf_.get(), &buf, &size, "png", &err,
                                   "compression", s_compression.c_str(), NULL))
    {
        throw runtime_error(take_error("Image::png_data(): cannot convert to png: ", err));
    }
    string s(buf, size);
    g_free(buf);
    return s;
}

}  // namespace internal

}  // namespace appicons

#pragma GCC diagnostic pop
