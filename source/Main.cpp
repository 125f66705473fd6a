// ============================================================================
// PosterStudio - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QGuiApplication>
#include <QTranslator>
#include <QLocale>
#include <QDebug>
#include <QStandardPaths>
#include <QtTest/QtTest>

#include "MainWindow.h"
#include "cli/CliParser.h"

// Test includes
#include "core/PageGeometryTests.h"
#include "core/ViewportScalerTests.h"
#include "core/SceneTests.h"
#include "core/LayoutImporterTests.h"
#include "core/EditorSessionTests.h"
#include "core/SceneExporterTests.h"
#include "objects/TextStyleTests.h"
#include "cli/CliTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator)
{
    const QString langCode = QLocale::system().name().section('_', 0, 0);

    const QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/posterstudio/translations",
        "/usr/local/share/posterstudio/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "posterstudio/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

/**
 * @brief Run one test suite (or all of them for "all").
 * @return 0 if every executed test passed.
 */
static int runTests(const QString& testType)
{
    static const QStringList suites = {
        "geometry", "viewport", "style", "scene", "importer", "session", "export", "cli"
    };
    const bool all = (testType == "all");
    if (!all && !suites.contains(testType)) {
        qWarning() << "Unknown test suite" << testType << "- available:" << suites << "all";
        return 1;
    }

    int failures = 0;

    // QTest::qExec() must not see our own --test-* flag
    QStringList testArgs = { QCoreApplication::applicationFilePath() };

    auto exec = [&](QObject* suite) {
        failures += QTest::qExec(suite, testArgs);
        delete suite;
    };

    if (all || testType == "geometry") {
        exec(new PageGeometryTests());
    }
    if (all || testType == "viewport") {
        exec(new ViewportScalerTests());
    }
    if (all || testType == "style") {
        if (!TextStyleTests::runAllTests()) {
            ++failures;
        }
    }
    if (all || testType == "scene") {
        exec(new SceneTests());
    }
    if (all || testType == "importer") {
        exec(new LayoutImporterTests());
    }
    if (all || testType == "session") {
        exec(new EditorSessionTests());
    }
    if (all || testType == "export") {
        exec(new SceneExporterTests());
    }
    if (all || testType == "cli") {
        exec(new CliTests());
    }

    return failures == 0 ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // ========== Headless CLI ==========
    if (Cli::isCliMode(argc, argv)) {
        // Rendering text needs a platform plugin, but never a display
        if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
            qputenv("QT_QPA_PLATFORM", "offscreen");
        }
        QGuiApplication app(argc, argv);
        app.setOrganizationName("PosterStudio");
        app.setApplicationName("App");

        QTranslator translator;
        loadTranslations(app, translator);

        return Cli::run(app, argc, argv);
    }

    QApplication app(argc, argv);
    app.setOrganizationName("PosterStudio");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();

    if (!inputFile.isEmpty()) {
        w->openContentFile(inputFile);
    }

    return app.exec();
}
