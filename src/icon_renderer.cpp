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

#include <appicons/icon_renderer.h>

#include <appicons/internal/file_io.h>
#include <appicons/internal/geometry.h>
#include <appicons/internal/image.h>
#include <appicons/internal/raii.h>
#include <appicons/internal/safe_strerror.h>

#include <boost/filesystem.hpp>
#include <QDebug>

#include <cerrno>
#include <cmath>
#include <ostream>
#include <stdexcept>

#include <fcntl.h>

using namespace std;
using namespace appicons::internal;

namespace appicons
{

namespace
{

Image load_source(string const& source_path)
{
    int fd = open(source_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        throw runtime_error("cannot open \"" + source_path + "\": " + safe_strerror(errno));
    }
    FdPtr fd_ptr(fd, do_close);
    return Image(fd_ptr.get());
}

}  // namespace

ErrorKind check_paths(string const& source_path, string const& output_dir, ostream& out)
{
    boost::system::error_code ec;
    if (!boost::filesystem::exists(source_path, ec))
    {
        out << "Error: Source image '" << source_path << "' not found" << endl;
        return ErrorKind::source_missing;
    }
    if (!boost::filesystem::is_directory(output_dir, ec))
    {
        out << "Error: Output directory '" << output_dir << "' not found" << endl;
        return ErrorKind::output_dir_missing;
    }
    return ErrorKind::none;
}

IconRenderer::IconRenderer(ostream& progress)
    : progress_(progress)
{
}

RenderResult IconRenderer::render(string const& source_path,
                                  string const& output_dir,
                                  SizeTable const& table,
                                  double scale_factor) const
{
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0)
    {
        throw invalid_argument("IconRenderer::render(): invalid scale factor: " + to_string(scale_factor));
    }

    RenderResult result;

    Image source;
    try
    {
        source = load_source(source_path);
        progress_ << "Source image: " << source.width() << "x" << source.height() << " pixels" << endl;
        progress_ << "Scale factor: " << scale_factor << "x (content will be "
                  << static_cast<int>((scale_factor - 1.0) * 100) << "% bigger)" << endl;
        source = source.to_rgba();
    }
    catch (std::exception const& e)
    {
        progress_ << "Error opening source image: " << e.what() << endl;
        result.error = ErrorKind::source_unavailable;
        return result;
    }

    for (auto const& entry : table)
    {
        if (!entry.filename)
        {
            qDebug() << "skipping size" << entry.size << "(no file name)";
            continue;
        }

        try
        {
            Image icon = render_icon(source, entry.size, scale_factor);
            string png = icon.png_data();
            string path = (boost::filesystem::path(output_dir) / *entry.filename).native();
            write_file(path, png);
            qDebug() << "wrote" << png.size() << "bytes to" << path.c_str();

            progress_ << "✓ Generated " << entry.size << "x" << entry.size << " -> " << *entry.filename << endl;
            result.written.push_back(path);
        }
        catch (std::exception const& e)
        {
            progress_ << "✗ Error generating " << entry.size << "x" << entry.size << ": " << e.what() << endl;
            result.error = ErrorKind::render_failure;
            result.failed_size = entry.size;
            return result;
        }
    }

    return result;
}

Image IconRenderer::render_icon(Image const& source, int size, double scale_factor)
{
    int content = content_size(size, scale_factor);

    Image scaled = source.resize(QSize(content, content));
    Image canvas = Image::transparent(QSize(size, size));

    if (content > size)
    {
        QRect rect = crop_rect(size, content);
        qDebug().nospace() << "size " << size << ": content " << content << ", margin " << crop_margin(size, content)
                           << ", crop (" << rect.left() << "," << rect.top() << "," << rect.left() + rect.width()
                           << "," << rect.top() + rect.height() << ")";
        scaled = scaled.crop(rect);
    }
    else
    {
        qDebug().nospace() << "size " << size << ": content " << content << ", no crop";
    }

    return canvas.composite(scaled, paste_offset(size, content));
}

}  // namespace appicons
