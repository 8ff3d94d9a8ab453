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
#include <appicons/internal/config.h>
#include <appicons/internal/env_vars.h>
#include <appicons/internal/trace.h>

#include <boost/filesystem.hpp>
#include <QCommandLineParser>
#include <QCoreApplication>

#include <cstdlib>
#include <iostream>

using namespace std;
using namespace appicons;
using namespace appicons::internal;

namespace
{

string prog_name;

struct Options
{
    string source;
    string output_dir;
    double scale_factor;
};

// Command line options override the environment, which overrides
// the compiled-in defaults. Throws the help text for --help.

Options parse_options()
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Generate app icons from a source image"));
    QCommandLineOption help_option = parser.addHelpOption();
    QCommandLineOption version_option = parser.addVersionOption();
    QCommandLineOption source_option(QStringList() << QStringLiteral("s") << QStringLiteral("source"),
                                     QStringLiteral("Source image (default: ") + EnvVars::DFLT_SOURCE + ")",
                                     QStringLiteral("file"));
    QCommandLineOption output_option(QStringList() << QStringLiteral("o") << QStringLiteral("output-dir"),
                                     QStringLiteral("Existing directory for the icons (default: ") +
                                         EnvVars::DFLT_OUTPUT_DIR + ")",
                                     QStringLiteral("dir"));
    QCommandLineOption scale_option(QStringList() << QStringLiteral("f") << QStringLiteral("scale"),
                                    QStringLiteral("Content scale factor (default: 1.2)"),
                                    QStringLiteral("factor"));
    parser.addOption(source_option);
    parser.addOption(output_option);
    parser.addOption(scale_option);

    if (!parser.parse(QCoreApplication::arguments()))
    {
        throw parser.errorText() + "\n\n" + parser.helpText();
    }
    if (parser.isSet(help_option))
    {
        cout << parser.helpText().toStdString();
        exit(EXIT_SUCCESS);
    }
    if (parser.isSet(version_option))
    {
        parser.showVersion();  // Exits
    }
    if (!parser.positionalArguments().isEmpty())
    {
        throw "unexpected argument: " + parser.positionalArguments().first() + "\n\n" + parser.helpText();
    }

    Options opts;
    opts.source = parser.isSet(source_option) ? parser.value(source_option).toStdString() : EnvVars::get_source();
    opts.output_dir = parser.isSet(output_option) ? parser.value(output_option).toStdString()
                                                  : EnvVars::get_output_dir();
    opts.scale_factor = parser.isSet(scale_option)
                            ? EnvVars::parse_scale_factor(parser.value(scale_option).toStdString())
                            : EnvVars::get_scale_factor();
    return opts;
}

int run()
{
    Options opts = parse_options();

    if (check_paths(opts.source, opts.output_dir, cout) != ErrorKind::none)
    {
        return EXIT_FAILURE;
    }

    cout << "Generating app icons from " << opts.source << "..." << endl;

    IconRenderer renderer(cout);
    RenderResult result = renderer.render(opts.source, opts.output_dir, canonical_size_table(), opts.scale_factor);
    if (!result.ok())
    {
        cout << "\n✗ Failed to generate some icons" << endl;
        return EXIT_FAILURE;
    }
    cout << "\n✓ All icons generated successfully!" << endl;
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[])
{
    int rc = EXIT_FAILURE;
    try
    {
        QCoreApplication app(argc, argv);
        app.setApplicationVersion(QStringLiteral(APPICONS_VERSION));
        boost::filesystem::path p = app.applicationName().toStdString();
        prog_name = p.filename().native();

        TraceMessageHandler message_handler(prog_name, EnvVars::get_log_level());
        rc = run();
    }
    catch (std::exception const& e)
    {
        cerr << prog_name << ": " << e.what() << endl;
    }
    catch (QString const& msg)
    {
        cerr << prog_name << ": " << msg.toStdString() << endl;
    }
    // No catch for ... here. It's better to dump core.
    return rc;
}
