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

#include <appicons/internal/config.h>

#include <string>

namespace appicons
{

namespace internal
{

// Environment overrides for the compiled-in defaults.
// Unset and empty variables both select the default.

struct EnvVars
{
    static std::string get_source();
    static std::string get_output_dir();
    static double get_scale_factor();
    static int get_log_level();

    // Converts str to a scale factor. Throws invalid_argument unless str is
    // a finite number greater than zero.
    static double parse_scale_factor(std::string const& str);

    static constexpr char const* SOURCE = "APPICONS_SOURCE";
    static constexpr char const* DFLT_SOURCE = APPICONS_DEFAULT_SOURCE;

    static constexpr char const* OUTPUT_DIR = "APPICONS_OUTPUT_DIR";
    static constexpr char const* DFLT_OUTPUT_DIR = APPICONS_DEFAULT_OUTPUT_DIR;

    static constexpr char const* SCALE_FACTOR = "APPICONS_SCALE_FACTOR";
    static constexpr double DFLT_SCALE_FACTOR = 1.2;

    static constexpr char const* LOG_LEVEL = "APPICONS_LOG_LEVEL";
    static constexpr int DFLT_LOG_LEVEL = 1;
};

}  // namespace internal

}  // namespace appicons
