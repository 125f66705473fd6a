#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for headless rendering.
 *
 * The render command loads a campaign content file, lays it out on the
 * requested page exactly as the editor does on import, and exports the
 * result. The base image is decoded synchronously since there is no event
 * loop to wait on.
 */

#include "CliParser.h"
#include "../core/PageGeometry.h"

#include <QCommandLineParser>
#include <QString>

namespace Cli {

/**
 * @brief Validated options of the render command.
 */
struct RenderOptions {
    QString contentPath;
    QString outputPath;
    PageGeometry::PageSpec pageSpec;
    bool overwrite = false;
    bool verbose = false;
};

/**
 * @brief Extract and validate render options.
 *
 * @param parser Parser with parsed arguments
 * @param options Receives the options on success
 * @param errorMessage Receives a description on failure
 * @return False for missing or invalid arguments (ExitCode::InvalidArgs)
 */
bool parseRenderOptions(const QCommandLineParser& parser, RenderOptions* options,
                        QString* errorMessage);

/**
 * @brief Render a content file according to @p options.
 *
 * @param errorMessage Receives a description of a failure or of the
 *                     missing base image (optional)
 * @return Exit code (see ExitCode namespace)
 */
int renderContent(const RenderOptions& options, QString* errorMessage = nullptr);

/**
 * @brief Handle the render command.
 * @return Exit code (see ExitCode namespace)
 */
int handleRender(const QCommandLineParser& parser);

} // namespace Cli

#endif // CLIHANDLER_H
