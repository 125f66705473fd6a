#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for headless poster rendering.
 *
 * When a CLI command is detected, the application renders without
 * launching the GUI.
 *
 * Supported commands:
 * - render: Lay out a campaign content file and export it as PNG, JPEG or PDF
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command - launch GUI
    Help,           ///< Show help message
    Version,        ///< Show version information
    Render          ///< Render a content file to an image or PDF
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Poster rendered
    constexpr int PartialFailure = 1; ///< Rendered, but the base image could not be decoded
    constexpr int TotalFailure = 2;   ///< Rendering or encoding failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
}

// =============================================================================
// CLI Detection
// =============================================================================

/**
 * @brief Quick check if the application should run in CLI mode.
 *
 * Looks at the first argument only. Must be called before creating any Qt
 * application object, since CLI mode runs without a window system.
 */
bool isCliMode(int argc, char* argv[]);

/**
 * @brief Parse the command keyword from argv[1].
 * @return The detected command, or Command::None for GUI mode
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string (e.g. "render").
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print help for a command (general help for None/Help).
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Print version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
