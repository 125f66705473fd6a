#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

class EditorSession;
class CanvasWidget;
class StylePanel;
class QCloseEvent;

/**
 * @brief Top-level editor window: canvas on the left, controls on the right.
 *
 * Owns the EditorSession. Persists page setup, dialog directories and the
 * window geometry in QSettings("PosterStudio", "App").
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    EditorSession* session() const { return m_session; }

    /**
     * @brief Load a campaign content file into the editor.
     * @return False if the file could not be read (a message box is shown).
     */
    bool openContentFile(const QString& path);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void openContent();
    void exportPng();
    void exportPdf();

private:
    void setupUi();
    void setupMenus();
    void setupShortcuts();
    void loadSettings();
    void saveSettings();

    /**
     * @brief Ask for a target path and export to it.
     * @param suffix "png" or "pdf".
     */
    void exportTo(const QString& suffix, const QString& filter);

    EditorSession* m_session = nullptr;
    CanvasWidget* m_canvas = nullptr;
    StylePanel* m_stylePanel = nullptr;
};

#endif // MAINWINDOW_H
