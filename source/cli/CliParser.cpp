#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

#ifndef POSTERSTUDIO_VERSION
#define POSTERSTUDIO_VERSION "1.0.0"
#endif

namespace Cli {

// =============================================================================
// CLI Detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "render") == 0) {
        return Command::Render;
    }

    // Global flags at position 1 ("posterstudio --help")
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    // Anything else (including --test-* flags) is not a CLI command
    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Render:  return QStringLiteral("render");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "PosterStudio - Poster and collateral layout editor"));

    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd != Command::Render) {
        return;
    }

    parser.addPositionalArgument(
        QStringLiteral("content"),
        QCoreApplication::translate("CLI", "Campaign content file (.json)"),
        QStringLiteral("<content>"));

    parser.addOption(QCommandLineOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QCoreApplication::translate("CLI", "Output file (.png, .jpg or .pdf)"),
        QStringLiteral("path")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("paper"),
        QCoreApplication::translate("CLI", "Paper size: Letter, A4, A5, A6, Postcard (default: A4)"),
        QStringLiteral("size"),
        QStringLiteral("A4")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("orientation"),
        QCoreApplication::translate("CLI", "portrait or landscape (default: portrait)"),
        QStringLiteral("orientation"),
        QStringLiteral("portrait")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("overwrite"),
        QCoreApplication::translate("CLI", "Overwrite an existing output file")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed progress")));
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: posterstudio [command] [options]\n"
            "\n"
            "PosterStudio - Poster and collateral layout editor.\n"
            "\n"
            "COMMANDS:\n"
            "  render          Render a content file to PNG, JPEG or PDF\n"
            "  (no command)    Launch GUI application\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Poster rendered\n"
            "  1   Rendered without the base image (decode failed)\n"
            "  2   Rendering failed\n"
            "  3   Invalid arguments\n"
            "  4   File could not be read or written\n"
            "\n"
            "Run 'posterstudio render --help' for command-specific options.\n");
    } else if (cmd == Command::Render) {
        out << QCoreApplication::translate("CLI",
            "Usage: posterstudio render [OPTIONS] <content> -o <output>\n"
            "\n"
            "Lay out a campaign content file and export the poster.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <content>                 Campaign content file (.json)\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>       Output file [required]\n"
            "                            .png, .jpg/.jpeg or .pdf\n"
            "  --overwrite               Overwrite an existing file\n"
            "\n"
            "PAGE OPTIONS:\n"
            "  --paper <size>            Letter, A4, A5, A6 or Postcard (default: A4)\n"
            "  --orientation <o>         portrait or landscape (default: portrait)\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --verbose                 Show detailed progress\n"
            "  -h, --help                Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  posterstudio render campaign.json -o poster.png\n"
            "  posterstudio render campaign.json -o flyer.pdf --paper A5 --orientation landscape\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "PosterStudio " << POSTERSTUDIO_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands; drop the command name
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Render:
            return handleRender(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
