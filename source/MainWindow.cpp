#include "MainWindow.h"
#include "core/EditorSession.h"
#include "core/CampaignContent.h"
#include "core/SceneExporter.h"
#include "ui/CanvasWidget.h"
#include "ui/StylePanel.h"

#include <QAction>
#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QScrollArea>
#include <QSettings>
#include <QShortcut>
#include <QStatusBar>
#include <QDebug>

static constexpr int STATUS_TIMEOUT_MS = 4000;

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_session(new EditorSession(this))
{
    setWindowTitle(tr("PosterStudio"));

    // Page setup and default font must be in place before the widgets sync
    loadSettings();

    setupUi();
    setupMenus();
    setupShortcuts();

    QSettings settings("PosterStudio", "App");
    if (!restoreGeometry(settings.value("geometry").toByteArray())) {
        resize(1200, 900);
    }

    statusBar()->showMessage(tr("Open a content file to start"), STATUS_TIMEOUT_MS);
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    QWidget* central = new QWidget(this);
    QHBoxLayout* layout = new QHBoxLayout(central);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_canvas = new CanvasWidget(m_session, central);
    layout->addWidget(m_canvas, 1);

    m_stylePanel = new StylePanel(m_session, central);
    QScrollArea* panelScroll = new QScrollArea(central);
    panelScroll->setWidget(m_stylePanel);
    panelScroll->setWidgetResizable(true);
    panelScroll->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    panelScroll->setMinimumWidth(320);
    layout->addWidget(panelScroll);

    setCentralWidget(central);

    connect(m_session->decoder(), &ImageDecoder::decodeFailed, this,
            [this](quint64, ImageDecoder::Purpose, const QString& source) {
        statusBar()->showMessage(tr("Could not decode image: %1").arg(source), STATUS_TIMEOUT_MS);
    });
    connect(m_session, &EditorSession::contentLoaded, this, [this]() {
        statusBar()->showMessage(tr("Content loaded"), STATUS_TIMEOUT_MS);
    });
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));

    QAction* openAction = fileMenu->addAction(tr("&Open Content..."));
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::openContent);

    fileMenu->addSeparator();

    QAction* exportPngAction = fileMenu->addAction(tr("Export &PNG..."));
    exportPngAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(exportPngAction, &QAction::triggered, this, &MainWindow::exportPng);

    QAction* exportPdfAction = fileMenu->addAction(tr("Export P&DF..."));
    exportPdfAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_E));
    connect(exportPdfAction, &QAction::triggered, this, &MainWindow::exportPdf);

    fileMenu->addSeparator();

    QAction* quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::setupShortcuts()
{
    QShortcut* deleteShortcut = new QShortcut(QKeySequence::Delete, this);
    connect(deleteShortcut, &QShortcut::activated, this, [this]() {
        m_session->deleteSelected();
    });

    QShortcut* frontShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_BracketRight), this);
    connect(frontShortcut, &QShortcut::activated, this, [this]() {
        m_session->bringToFront(m_session->selection()->selectedId());
    });

    QShortcut* backShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_BracketLeft), this);
    connect(backShortcut, &QShortcut::activated, this, [this]() {
        m_session->sendToBack(m_session->selection()->selectedId());
    });

    QShortcut* deselectShortcut = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    connect(deselectShortcut, &QShortcut::activated, m_session, &EditorSession::clearSelection);
}

// ============================================================================
// File actions
// ============================================================================

void MainWindow::openContent()
{
    QSettings settings("PosterStudio", "App");
    QString startDir = settings.value("lastContentDir", QDir::homePath()).toString();

    QString path = QFileDialog::getOpenFileName(this, tr("Open Content"), startDir,
                                                tr("Campaign content (*.json);;All files (*)"));
    if (path.isEmpty()) {
        return;
    }

    settings.setValue("lastContentDir", QFileInfo(path).absolutePath());
    openContentFile(path);
}

bool MainWindow::openContentFile(const QString& path)
{
    CampaignContent content;
    QString error;
    if (!CampaignContent::loadFromFile(path, &content, &error)) {
        QMessageBox::warning(this, tr("Open Content"), error);
        return false;
    }

    m_session->loadContent(content);
    setWindowTitle(tr("PosterStudio - %1").arg(QFileInfo(path).fileName()));
    return true;
}

void MainWindow::exportPng()
{
    exportTo(QStringLiteral("png"), tr("PNG image (*.png);;JPEG image (*.jpg *.jpeg)"));
}

void MainWindow::exportPdf()
{
    exportTo(QStringLiteral("pdf"), tr("PDF document (*.pdf)"));
}

void MainWindow::exportTo(const QString& suffix, const QString& filter)
{
    QSettings settings("PosterStudio", "App");
    QString dir = settings.value("lastExportDir", QDir::homePath()).toString();

    QString defaultName = QFileInfo(SceneExporter::defaultFileName()).completeBaseName()
                          + QLatin1Char('.') + suffix;
    QString path = QFileDialog::getSaveFileName(this, tr("Export"),
                                                QDir(dir).filePath(defaultName), filter);
    if (path.isEmpty()) {
        return;
    }
    if (QFileInfo(path).suffix().isEmpty()) {
        path += QLatin1Char('.') + suffix;
    }

    settings.setValue("lastExportDir", QFileInfo(path).absolutePath());

    QString error;
    if (!SceneExporter::saveToFile(m_session->scene(), m_session->pageSize(), path, &error)) {
        QMessageBox::warning(this, tr("Export"), error);
        return;
    }

    statusBar()->showMessage(tr("Exported %1").arg(QDir::toNativeSeparators(path)), STATUS_TIMEOUT_MS);
}

// ============================================================================
// Settings
// ============================================================================

void MainWindow::loadSettings()
{
    QSettings settings("PosterStudio", "App");

    PageGeometry::PageSpec spec;
    bool ok = false;
    PageGeometry::PaperSize paper = PageGeometry::paperSizeFromKey(
        settings.value("paperSize", PageGeometry::paperSizeKey(spec.paperSize)).toString(), &ok);
    if (ok) {
        spec.paperSize = paper;
    }
    PageGeometry::Orientation orientation = PageGeometry::orientationFromKey(
        settings.value("orientation", PageGeometry::orientationKey(spec.orientation)).toString(), &ok);
    if (ok) {
        spec.orientation = orientation;
    }
    m_session->setPageSpec(spec);

    QString family = settings.value("defaultFontFamily").toString();
    if (!family.isEmpty()) {
        m_session->setDefaultFontFamily(family);
    }

    qDebug() << "MainWindow: restored page" << PageGeometry::paperSizeKey(spec.paperSize)
             << PageGeometry::orientationKey(spec.orientation);
}

void MainWindow::saveSettings()
{
    QSettings settings("PosterStudio", "App");
    const PageGeometry::PageSpec spec = m_session->pageSpec();
    settings.setValue("paperSize", PageGeometry::paperSizeKey(spec.paperSize));
    settings.setValue("orientation", PageGeometry::orientationKey(spec.orientation));
    settings.setValue("defaultFontFamily", m_session->selection()->templateStyle().fontFamily);
    settings.setValue("geometry", saveGeometry());
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    saveSettings();
    QMainWindow::closeEvent(event);
}
