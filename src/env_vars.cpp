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

#include <appicons/internal/env_vars.h>

#include <QDebug>
#include <QLocale>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

using namespace std;

namespace appicons
{

namespace internal
{

constexpr char const* EnvVars::SOURCE;
constexpr char const* EnvVars::DFLT_SOURCE;
constexpr char const* EnvVars::OUTPUT_DIR;
constexpr char const* EnvVars::DFLT_OUTPUT_DIR;
constexpr char const* EnvVars::SCALE_FACTOR;
constexpr double EnvVars::DFLT_SCALE_FACTOR;
constexpr char const* EnvVars::LOG_LEVEL;
constexpr int EnvVars::DFLT_LOG_LEVEL;

namespace
{

char const* get_env(char const* name)
{
    char const* value = getenv(name);
    return value && *value ? value : nullptr;
}

}  // namespace

string EnvVars::get_source()
{
    char const* source = get_env(SOURCE);
    return source ? source : DFLT_SOURCE;
}

string EnvVars::get_output_dir()
{
    char const* dir = get_env(OUTPUT_DIR);
    return dir ? dir : DFLT_OUTPUT_DIR;
}

double EnvVars::get_scale_factor()
{
    char const* factor = get_env(SCALE_FACTOR);
    if (!factor)
    {
        return DFLT_SCALE_FACTOR;
    }
    try
    {
        return parse_scale_factor(factor);
    }
    catch (std::invalid_argument const& e)
    {
        throw invalid_argument(string("Value for env variable ") + SCALE_FACTOR + " is invalid: " + e.what());
    }
}

int EnvVars::get_log_level()
{
    char const* level = get_env(LOG_LEVEL);
    if (!level)
    {
        return DFLT_LOG_LEVEL;
    }
    int l;
    try
    {
        size_t end;
        l = stoi(level, &end);
        if (level[end] != '\0')
        {
            throw invalid_argument("trailing characters");
        }
    }
    catch (std::exception const&)
    {
        qCritical() << "Environment variable" << LOG_LEVEL << "has invalid setting:" << level
                    << "(expected value in range 0..2) - variable ignored";
        return DFLT_LOG_LEVEL;
    }
    if (l < 0 || l > 2)
    {
        qCritical() << "Environment variable" << LOG_LEVEL << "has invalid setting:" << level
                    << "(expected value in range 0..2) - variable ignored";
        return DFLT_LOG_LEVEL;
    }
    return l;
}

double EnvVars::parse_scale_factor(string const& str)
{
    // QCoreApplication sets the locale from the environment; the factor is
    // always written with a '.' and without group separators.
    QLocale c_locale = QLocale::c();
    c_locale.setNumberOptions(QLocale::RejectGroupSeparator);

    bool ok;
    double factor = c_locale.toDouble(QString::fromStdString(str), &ok);
    if (!ok)
    {
        throw invalid_argument("parse_scale_factor(): \"" + str + "\" is not a number");
    }
    if (!std::isfinite(factor) || factor <= 0.0)
    {
        throw invalid_argument("parse_scale_factor(): \"" + str + "\" must be greater than zero");
    }
    return factor;
}

}  // namespace internal

}  // namespace appicons
