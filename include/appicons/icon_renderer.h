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

#include <appicons/size_table.h>

#include <iosfwd>
#include <string>
#include <vector>

namespace appicons
{

namespace internal
{
class Image;
}

/**
\brief Classifies why a run failed.
*/

enum class ErrorKind
{
    none,                ///< All icons were written.
    source_missing,      ///< The source image does not exist.
    output_dir_missing,  ///< The output directory does not exist.
    source_unavailable,  ///< The source image exists but cannot be read or decoded.
    render_failure       ///< Rendering or saving one of the icons failed.
};

/**
\brief Outcome of IconRenderer::render().
*/

struct RenderResult
{
    ErrorKind error = ErrorKind::none;

    /// The size that failed if `error` is `render_failure`, zero otherwise.
    int failed_size = 0;

    /// Paths of the files written, in the order they were written.
    /// A path appears more than once if several sizes map to the same file.
    std::vector<std::string> written;

    bool ok() const
    {
        return error == ErrorKind::none;
    }
};

/**
\brief Checks that the source image and the output directory exist.

Prints an error message to `out` for the first missing path.

\return `ErrorKind::none` if both exist, `source_missing` or `output_dir_missing` otherwise.
*/

ErrorKind check_paths(std::string const& source_path, std::string const& output_dir, std::ostream& out);

/**
\brief Renders a set of square icons from a single source image.

Each icon is produced by stretching the whole source to a square that is
`scale_factor` times larger than the icon, cropping the center of that
square back to the icon size, and compositing the result onto a fully
transparent canvas. With a scale factor above 1.0, the artwork therefore
bleeds to every edge of the icon.

Progress is reported on the stream passed to the constructor, one line
per icon.
*/

class IconRenderer
{
public:
    /**
    \brief Constructs a renderer that reports progress on `progress`.

    The stream must outlive the renderer.
    */
    explicit IconRenderer(std::ostream& progress);

    IconRenderer(IconRenderer const&) = delete;
    IconRenderer& operator=(IconRenderer const&) = delete;

    /**
    \brief Writes one PNG file into `output_dir` for each row of `table` that has a filename.

    Rows are processed in order. Existing files are replaced. The first
    row that fails stops the run; later rows are not processed.
    The output directory must exist; it is not created.

    \throws std::invalid_argument if `scale_factor` is not a finite number greater than zero.
    In that case nothing is read or written.
    \return The outcome of the run. Errors other than an invalid scale factor are
    reported in the result (and on the progress stream), not thrown.
    */
    RenderResult render(std::string const& source_path,
                        std::string const& output_dir,
                        SizeTable const& table,
                        double scale_factor) const;

    /**
    \brief Renders a single `size` x `size` icon from `source`.

    This is the pure image transformation used by render().
    \throws std::invalid_argument if `size` or the scaled content size is less than one pixel.
    */
    static internal::Image render_icon(internal::Image const& source, int size, double scale_factor);

private:
    std::ostream& progress_;
};

}  // namespace appicons
