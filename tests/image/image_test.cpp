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

#include <appicons/internal/file_io.h>
#include <appicons/internal/raii.h>
#include <testsetup.h>
#include <utils/test_images.h>

#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>

#include <fcntl.h>

using namespace std;
using namespace appicons::internal;

TEST(Image, basic)
{
    {
        Image i;
        EXPECT_TRUE(i.empty());
    }

    {
        Image i(quadrant_png(64, 32));
        EXPECT_FALSE(i.empty());
        EXPECT_EQ(64, i.width());
        EXPECT_EQ(32, i.height());
        EXPECT_EQ(QSize(64, 32), i.size());
        EXPECT_TRUE(i.has_alpha());
        EXPECT_EQ(0xFF0000FFu, i.pixel(0, 0));
        EXPECT_EQ(0x00FF00FFu, i.pixel(63, 0));
        EXPECT_EQ(0x0000FFFFu, i.pixel(0, 31));
        EXPECT_EQ(0xFFFFFFFFu, i.pixel(63, 31));

        // Copies share the pixels and stay valid independently.
        Image i2(i);
        EXPECT_EQ(64, i2.width());
        Image i3;
        i3 = i2;
        EXPECT_EQ(0xFF0000FFu, i3.pixel(0, 0));

        // Move constructor
        Image i4(move(i2));
        EXPECT_EQ(64, i4.width());
        EXPECT_EQ(32, i4.height());

        // Move assignment
        Image i5;
        i5 = move(i4);
        EXPECT_EQ(64, i5.width());
        EXPECT_EQ(32, i5.height());

        EXPECT_EQ(64, i.width());
    }
}

TEST(Image, load_from_fd)
{
    string path = TESTBINDIR "/fd_image.png";
    write_file(path, quadrant_png(20, 10));

    int fd = open(path.c_str(), O_RDONLY);
    ASSERT_NE(-1, fd);
    FdPtr fd_ptr(fd, do_close);

    Image i(fd_ptr.get());
    EXPECT_EQ(20, i.width());
    EXPECT_EQ(10, i.height());
    EXPECT_EQ(0xFFFFFFFFu, i.pixel(19, 9));
}

TEST(Image, jpeg_has_no_alpha)
{
    Image i(solid_jpeg(40, 30, 0x808080FF));
    EXPECT_EQ(40, i.width());
    EXPECT_EQ(30, i.height());
    EXPECT_FALSE(i.has_alpha());
    EXPECT_TRUE(pixels_near(0x808080FF, i.pixel(10, 10), 4)) << hex << i.pixel(10, 10);

    Image rgba = i.to_rgba();
    EXPECT_TRUE(rgba.has_alpha());
    EXPECT_EQ(40, rgba.width());
    EXPECT_EQ(30, rgba.height());
    EXPECT_EQ(0xFFu, rgba.pixel(0, 0) & 0xFF);
    EXPECT_EQ(0xFFu, rgba.pixel(39, 29) & 0xFF);

    // Already RGBA, returned unchanged.
    Image again = rgba.to_rgba();
    EXPECT_EQ(rgba.pixel(5, 5), again.pixel(5, 5));
}

TEST(Image, transparent)
{
    Image canvas = Image::transparent(QSize(7, 5));
    EXPECT_EQ(7, canvas.width());
    EXPECT_EQ(5, canvas.height());
    EXPECT_TRUE(canvas.has_alpha());
    for (int y = 0; y < 5; ++y)
    {
        for (int x = 0; x < 7; ++x)
        {
            EXPECT_EQ(0u, canvas.pixel(x, y) & 0xFF) << x << "," << y;
        }
    }
}

TEST(Image, resize)
{
    Image img(quadrant_png(100, 50));

    // Aspect ratio is not preserved.
    Image square = img.resize(QSize(40, 40));
    EXPECT_EQ(40, square.width());
    EXPECT_EQ(40, square.height());
    EXPECT_TRUE(pixels_near(0xFF0000FF, square.pixel(5, 5), 2)) << hex << square.pixel(5, 5);
    EXPECT_TRUE(pixels_near(0xFFFFFFFF, square.pixel(35, 35), 2)) << hex << square.pixel(35, 35);

    // Up-scaling works too.
    Image big = img.resize(QSize(300, 200));
    EXPECT_EQ(300, big.width());
    EXPECT_EQ(200, big.height());

    // Original is unchanged.
    EXPECT_EQ(100, img.width());
    EXPECT_EQ(50, img.height());
}

TEST(Image, crop)
{
    Image img(quadrant_png(100, 100));

    Image tl = img.crop(QRect(0, 0, 50, 50));
    EXPECT_EQ(50, tl.width());
    EXPECT_EQ(50, tl.height());
    EXPECT_EQ(0xFF0000FFu, tl.pixel(0, 0));
    EXPECT_EQ(0xFF0000FFu, tl.pixel(49, 49));

    Image center = img.crop(QRect(40, 40, 20, 20));
    EXPECT_EQ(0xFF0000FFu, center.pixel(0, 0));
    EXPECT_EQ(0x00FF00FFu, center.pixel(19, 0));
    EXPECT_EQ(0x0000FFFFu, center.pixel(0, 19));
    EXPECT_EQ(0xFFFFFFFFu, center.pixel(19, 19));

    // Whole image
    Image all = img.crop(QRect(0, 0, 100, 100));
    EXPECT_EQ(100, all.width());
}

TEST(Image, composite)
{
    Image canvas = Image::transparent(QSize(10, 10));

    // A partly transparent overlay is its own mask, so on a transparent
    // canvas all four channels are scaled by alpha / 255.
    Image overlay(bordered_png(4, 4, 1, 0x3366997F));
    Image result = canvas.composite(overlay, QPoint(3, 3));
    EXPECT_EQ(10, result.width());
    EXPECT_EQ(10, result.height());
    EXPECT_EQ(0u, result.pixel(0, 0) & 0xFF);
    EXPECT_EQ(0u, result.pixel(3, 3));  // Transparent border of the overlay
    EXPECT_TRUE(pixels_near(0x19334C3F, result.pixel(4, 4), 1)) << hex << result.pixel(4, 4);
    EXPECT_TRUE(pixels_near(0x19334C3F, result.pixel(5, 5), 1)) << hex << result.pixel(5, 5);
    EXPECT_EQ(0u, result.pixel(7, 7) & 0xFF);

    // The canvas itself is unchanged.
    EXPECT_EQ(0u, canvas.pixel(4, 4) & 0xFF);

    // Opaque overlay replaces the pixels it covers; the rest is clipped.
    Image quad(quadrant_png(4, 4));
    result = canvas.composite(quad, QPoint(8, 8));
    EXPECT_EQ(0xFF0000FFu, result.pixel(8, 8));
    EXPECT_EQ(0xFF0000FFu, result.pixel(9, 9));
    EXPECT_EQ(0u, result.pixel(7, 7) & 0xFF);

    // Negative offsets clip the top-left part of the overlay.
    result = canvas.composite(quad, QPoint(-2, -2));
    EXPECT_EQ(0xFFFFFFFFu, result.pixel(0, 0));
    EXPECT_EQ(0xFFFFFFFFu, result.pixel(1, 1));
    EXPECT_EQ(0u, result.pixel(2, 2) & 0xFF);

    // Half-transparent white over opaque black blends every channel.
    Image black = canvas.composite(Image(bordered_png(10, 10, 0, 0x000000FF)));
    EXPECT_EQ(0x000000FFu, black.pixel(5, 5));
    Image grey = black.composite(Image(bordered_png(2, 2, 0, 0xFFFFFF80)), QPoint(5, 5));
    EXPECT_TRUE(pixels_near(0x808080BF, grey.pixel(5, 5), 1)) << hex << grey.pixel(5, 5);
    EXPECT_EQ(0x000000FFu, grey.pixel(4, 4));

    // Overlay entirely outside
    result = canvas.composite(quad, QPoint(20, 20));
    EXPECT_EQ(0u, result.pixel(9, 9) & 0xFF);
}

TEST(Image, png_data)
{
    Image img(bordered_png(16, 16, 2, 0x102030FF));
    string png = img.png_data();
    EXPECT_TRUE(is_png(png));

    Image decoded(png);
    EXPECT_EQ(16, decoded.width());
    EXPECT_EQ(16, decoded.height());
    EXPECT_TRUE(decoded.has_alpha());
    EXPECT_EQ(0u, decoded.pixel(0, 0) & 0xFF);
    EXPECT_EQ(0x102030FFu, decoded.pixel(8, 8));

    // Lower compression decodes to the same pixels.
    Image fast(img.png_data(0));
    EXPECT_EQ(decoded.pixel(8, 8), fast.pixel(8, 8));
}

TEST(Image, exceptions)
{
    try
    {
        Image i(string("no image data"));
        FAIL();
    }
    catch (std::runtime_error const& e)
    {
        string msg = e.what();
        EXPECT_TRUE(boost::starts_with(msg, "load_image(): ")) << msg;
    }

    try
    {
        Image i((string()));
        FAIL();
    }
    catch (std::runtime_error const& e)
    {
        EXPECT_STREQ("load_image(): image data is empty", e.what());
    }

    {
        Image i;
        try
        {
            i.width();
            FAIL();
        }
        catch (std::logic_error const& e)
        {
            EXPECT_STREQ("Image::width(): empty image", e.what());
        }
        EXPECT_THROW(i.height(), std::logic_error);
        EXPECT_THROW(i.pixel(0, 0), std::logic_error);
        EXPECT_THROW(i.png_data(), std::logic_error);
        EXPECT_THROW(i.resize(QSize(1, 1)), std::logic_error);
    }

    Image img(quadrant_png(10, 10));

    try
    {
        img.pixel(10, 0);
        FAIL();
    }
    catch (std::out_of_range const& e)
    {
        EXPECT_STREQ("Image::pixel(): invalid x coordinate: 10", e.what());
    }
    EXPECT_THROW(img.pixel(0, -1), std::out_of_range);

    try
    {
        img.resize(QSize(0, 10));
        FAIL();
    }
    catch (std::invalid_argument const& e)
    {
        EXPECT_STREQ("Image::resize(): invalid size: 0x10", e.what());
    }

    try
    {
        img.crop(QRect(5, 5, 6, 6));
        FAIL();
    }
    catch (std::out_of_range const& e)
    {
        EXPECT_STREQ("Image::crop(): rectangle (5,5 6x6) exceeds image bounds 10x10", e.what());
    }

    EXPECT_THROW(img.crop(QRect(0, 0, 0, 0)), std::invalid_argument);
    EXPECT_THROW(Image::transparent(QSize(-1, 4)), std::invalid_argument);
    EXPECT_THROW(img.png_data(10), std::invalid_argument);
    EXPECT_THROW(img.composite(Image()), std::logic_error);
}
