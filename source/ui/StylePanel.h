#pragma once

// ============================================================================
// StylePanel - Page setup, object actions and text style controls
// ============================================================================
// Right-hand control column of the editor window.
//
// Sections:
// - Page: paper size and orientation
// - Objects: add text, upload image, bring to front, send to back, flip, delete
// - Text: content, font, size, weight/slant/underline, alignment, colours,
//   stroke, shadow and background
//
// The text section mirrors SelectionController::styleForm(). It is enabled
// only while a text box is selected. Updates coming from the form are
// applied with m_syncing set, so they are not echoed back as edits.
// ============================================================================

#include "../objects/TextStyle.h"
#include "../core/PageGeometry.h"

#include <QWidget>
#include <QColor>

class EditorSession;
class QComboBox;
class QFontComboBox;
class QLineEdit;
class QPushButton;
class QSlider;
class QDoubleSpinBox;
class QLabel;
class QGroupBox;

class StylePanel : public QWidget {
    Q_OBJECT

public:
    explicit StylePanel(EditorSession* session, QWidget* parent = nullptr);

    /**
     * @brief Show the given paper size and orientation in the combos without emitting edits.
     */
    void setPageSpec(const PageGeometry::PageSpec& spec);

private slots:
    void onPageControlsChanged();
    void onStyleFormChanged();
    void onSelectionChanged();
    void onTextEdited(const QString& text);
    void onUploadImageClicked();

private:
    void setupUI();
    void connectStyleControls();
    void updateButtonStates();

    QPushButton* createColorButton(StyleField field, const QString& toolTip);
    void setButtonColor(QPushButton* button, const QColor& color);
    void pickColor(StyleField field, QPushButton* button);

    /**
     * @brief Forward one style edit unless the panel is syncing from the form.
     */
    void applyStyle(StyleField field, const QVariant& value);

    EditorSession* m_session = nullptr;
    bool m_syncing = false;

    // Page
    QComboBox* m_paperCombo = nullptr;
    QComboBox* m_orientationCombo = nullptr;

    // Objects
    QPushButton* m_addTextButton = nullptr;
    QPushButton* m_uploadImageButton = nullptr;
    QPushButton* m_bringToFrontButton = nullptr;
    QPushButton* m_sendToBackButton = nullptr;
    QPushButton* m_flipHButton = nullptr;
    QPushButton* m_flipVButton = nullptr;
    QPushButton* m_deleteButton = nullptr;

    // Text
    QGroupBox* m_textGroup = nullptr;
    QLineEdit* m_textEdit = nullptr;
    QFontComboBox* m_fontCombo = nullptr;
    QSlider* m_fontSizeSlider = nullptr;
    QLabel* m_fontSizeLabel = nullptr;
    QPushButton* m_boldButton = nullptr;
    QPushButton* m_italicButton = nullptr;
    QPushButton* m_underlineButton = nullptr;
    QComboBox* m_alignCombo = nullptr;
    QPushButton* m_fillColorButton = nullptr;
    QPushButton* m_strokeColorButton = nullptr;
    QDoubleSpinBox* m_strokeWidthSpin = nullptr;
    QPushButton* m_shadowColorButton = nullptr;
    QSlider* m_shadowBlurSlider = nullptr;
    QPushButton* m_bgColorButton = nullptr;
    QSlider* m_bgOpacitySlider = nullptr;

    static constexpr int COLOR_BUTTON_SIZE = 28;
    static constexpr int OPACITY_STEPS = 100;
};
