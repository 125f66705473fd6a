#include "CliHandler.h"
#include "../core/CampaignContent.h"
#include "../core/ImageDecoder.h"
#include "../core/LayoutImporter.h"
#include "../core/Scene.h"
#include "../core/SceneExporter.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Option Parsing
// =============================================================================

bool parseRenderOptions(const QCommandLineParser& parser, RenderOptions* options,
                        QString* errorMessage)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        *errorMessage = QCoreApplication::translate("CLI",
            "No content file specified. Use 'posterstudio render --help' for usage.");
        return false;
    }
    if (positional.size() > 1) {
        *errorMessage = QCoreApplication::translate("CLI",
            "Only one content file can be rendered at a time.");
        return false;
    }

    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        *errorMessage = QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination.");
        return false;
    }

    const QString suffix = QFileInfo(outputPath).suffix().toLower();
    if (suffix != QLatin1String("png") && suffix != QLatin1String("jpg")
        && suffix != QLatin1String("jpeg") && suffix != QLatin1String("pdf")) {
        *errorMessage = QCoreApplication::translate("CLI",
            "Unsupported output format '%1'. Use .png, .jpg or .pdf.").arg(suffix);
        return false;
    }

    bool ok = false;
    const QString paperKey = parser.value(QStringLiteral("paper"));
    PageGeometry::PaperSize paper = PageGeometry::paperSizeFromKey(paperKey, &ok);
    if (!ok) {
        *errorMessage = QCoreApplication::translate("CLI",
            "Unknown paper size '%1'. Use Letter, A4, A5, A6 or Postcard.").arg(paperKey);
        return false;
    }

    const QString orientationKey = parser.value(QStringLiteral("orientation"));
    PageGeometry::Orientation orientation = PageGeometry::orientationFromKey(orientationKey, &ok);
    if (!ok) {
        *errorMessage = QCoreApplication::translate("CLI",
            "Unknown orientation '%1'. Use portrait or landscape.").arg(orientationKey);
        return false;
    }

    options->contentPath = QDir::cleanPath(QDir::current().absoluteFilePath(positional.first()));
    options->outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(outputPath));
    options->pageSpec.paperSize = paper;
    options->pageSpec.orientation = orientation;
    options->overwrite = parser.isSet(QStringLiteral("overwrite"));
    options->verbose = parser.isSet(QStringLiteral("verbose"));
    return true;
}

// =============================================================================
// Rendering
// =============================================================================

int renderContent(const RenderOptions& options, QString* errorMessage)
{
    QFileInfo outputInfo(options.outputPath);
    if (outputInfo.exists() && !options.overwrite) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("CLI",
                "%1 already exists. Use --overwrite to replace it.").arg(options.outputPath);
        }
        return ExitCode::IoError;
    }
    if (!outputInfo.absoluteDir().exists()) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("CLI",
                "Output directory %1 does not exist.").arg(outputInfo.absolutePath());
        }
        return ExitCode::IoError;
    }

    CampaignContent content;
    QString loadError;
    if (!CampaignContent::loadFromFile(options.contentPath, &content, &loadError)) {
        if (errorMessage) {
            *errorMessage = loadError;
        }
        return ExitCode::IoError;
    }

    const QSizeF pageSize = PageGeometry::resolve(options.pageSpec);

    // Decode inline: no event loop runs in CLI mode
    QImage baseImage;
    bool baseImageMissing = false;
    const QString background = content.backgroundImageB64();
    if (!background.isEmpty()) {
        baseImage = ImageDecoder::decodeBase64(background);
        baseImageMissing = baseImage.isNull();
    }

    Scene scene;
    LayoutImporter::importContent(scene, content, pageSize, baseImage);

    QString saveError;
    if (!SceneExporter::saveToFile(scene, pageSize, options.outputPath, &saveError)) {
        if (errorMessage) {
            *errorMessage = saveError;
        }
        return ExitCode::TotalFailure;
    }

    if (baseImageMissing) {
        if (errorMessage) {
            *errorMessage = QCoreApplication::translate("CLI",
                "The base image could not be decoded and was left out.");
        }
        return ExitCode::PartialFailure;
    }
    return ExitCode::Success;
}

int handleRender(const QCommandLineParser& parser)
{
    QTextStream out(stdout);
    QTextStream err(stderr);

    RenderOptions options;
    QString error;
    if (!parseRenderOptions(parser, &options, &error)) {
        err << QCoreApplication::translate("CLI", "Error: ") << error << "\n";
        return ExitCode::InvalidArgs;
    }

    if (options.verbose) {
        out << QCoreApplication::translate("CLI", "Rendering %1 (%2, %3)\n")
                   .arg(QDir::toNativeSeparators(options.contentPath),
                        PageGeometry::paperSizeKey(options.pageSpec.paperSize),
                        PageGeometry::orientationKey(options.pageSpec.orientation));
        out.flush();
    }

    const int result = renderContent(options, &error);

    switch (result) {
        case ExitCode::Success:
            out << QCoreApplication::translate("CLI", "[OK] %1\n")
                       .arg(QDir::toNativeSeparators(options.outputPath));
            break;
        case ExitCode::PartialFailure:
            out << QCoreApplication::translate("CLI", "[OK] %1\n")
                       .arg(QDir::toNativeSeparators(options.outputPath));
            err << QCoreApplication::translate("CLI", "Warning: ") << error << "\n";
            break;
        default:
            err << QCoreApplication::translate("CLI", "[FAIL] ") << error << "\n";
            break;
    }

    return result;
}

} // namespace Cli
