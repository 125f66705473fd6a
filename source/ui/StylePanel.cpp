#include "StylePanel.h"
#include "../core/EditorSession.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QComboBox>
#include <QFontComboBox>
#include <QLineEdit>
#include <QPushButton>
#include <QSlider>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QColorDialog>
#include <QFileDialog>
#include <QFileInfo>
#include <QSettings>
#include <initializer_list>

// ============================================================================
// Constructor
// ============================================================================

StylePanel::StylePanel(EditorSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setupUI();
    connectStyleControls();

    SelectionController* selection = m_session->selection();
    connect(selection, &SelectionController::styleFormChanged, this, &StylePanel::onStyleFormChanged);
    connect(selection, &SelectionController::selectionChanged, this, &StylePanel::onSelectionChanged);
    connect(m_session, &EditorSession::pageSizeChanged, this, [this]() {
        setPageSpec(m_session->pageSpec());
    });

    setPageSpec(m_session->pageSpec());
    onStyleFormChanged();
    updateButtonStates();
}

// ============================================================================
// Setup
// ============================================================================

void StylePanel::setupUI()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(8);

    // ----- Page -----
    QGroupBox* pageGroup = new QGroupBox(tr("Page"), this);
    QFormLayout* pageLayout = new QFormLayout(pageGroup);

    m_paperCombo = new QComboBox(pageGroup);
    for (PageGeometry::PaperSize size : PageGeometry::allPaperSizes()) {
        m_paperCombo->addItem(PageGeometry::paperSizeKey(size), static_cast<int>(size));
    }
    pageLayout->addRow(tr("Paper size"), m_paperCombo);

    m_orientationCombo = new QComboBox(pageGroup);
    m_orientationCombo->addItem(tr("Portrait"), static_cast<int>(PageGeometry::Orientation::Portrait));
    m_orientationCombo->addItem(tr("Landscape"), static_cast<int>(PageGeometry::Orientation::Landscape));
    pageLayout->addRow(tr("Orientation"), m_orientationCombo);

    connect(m_paperCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &StylePanel::onPageControlsChanged);
    connect(m_orientationCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &StylePanel::onPageControlsChanged);

    mainLayout->addWidget(pageGroup);

    // ----- Objects -----
    QGroupBox* objectGroup = new QGroupBox(tr("Objects"), this);
    QVBoxLayout* objectLayout = new QVBoxLayout(objectGroup);

    QHBoxLayout* addLayout = new QHBoxLayout();
    m_addTextButton = new QPushButton(tr("Add Text"), objectGroup);
    m_addTextButton->setToolTip(tr("Add a text box styled like the current selection"));
    m_uploadImageButton = new QPushButton(tr("Upload Image"), objectGroup);
    m_uploadImageButton->setToolTip(tr("Insert an image file"));
    addLayout->addWidget(m_addTextButton);
    addLayout->addWidget(m_uploadImageButton);
    objectLayout->addLayout(addLayout);

    QHBoxLayout* orderLayout = new QHBoxLayout();
    m_bringToFrontButton = new QPushButton(tr("Bring to Front"), objectGroup);
    m_bringToFrontButton->setToolTip(tr("Bring to Front (Ctrl+])"));
    m_sendToBackButton = new QPushButton(tr("Send to Back"), objectGroup);
    m_sendToBackButton->setToolTip(tr("Send to Back (Ctrl+[)"));
    orderLayout->addWidget(m_bringToFrontButton);
    orderLayout->addWidget(m_sendToBackButton);
    objectLayout->addLayout(orderLayout);

    QHBoxLayout* flipLayout = new QHBoxLayout();
    m_flipHButton = new QPushButton(tr("Flip H"), objectGroup);
    m_flipHButton->setToolTip(tr("Flip horizontally"));
    m_flipVButton = new QPushButton(tr("Flip V"), objectGroup);
    m_flipVButton->setToolTip(tr("Flip vertically"));
    m_deleteButton = new QPushButton(tr("Delete"), objectGroup);
    m_deleteButton->setToolTip(tr("Delete selected object (Del)"));
    flipLayout->addWidget(m_flipHButton);
    flipLayout->addWidget(m_flipVButton);
    flipLayout->addWidget(m_deleteButton);
    objectLayout->addLayout(flipLayout);

    connect(m_addTextButton, &QPushButton::clicked, this, [this]() {
        m_session->addText();
    });
    connect(m_uploadImageButton, &QPushButton::clicked, this, &StylePanel::onUploadImageClicked);
    connect(m_bringToFrontButton, &QPushButton::clicked, this, [this]() {
        m_session->bringToFront(m_session->selection()->selectedId());
    });
    connect(m_sendToBackButton, &QPushButton::clicked, this, [this]() {
        m_session->sendToBack(m_session->selection()->selectedId());
    });
    connect(m_flipHButton, &QPushButton::clicked, this, [this]() {
        m_session->flipHorizontal(m_session->selection()->selectedId());
    });
    connect(m_flipVButton, &QPushButton::clicked, this, [this]() {
        m_session->flipVertical(m_session->selection()->selectedId());
    });
    connect(m_deleteButton, &QPushButton::clicked, this, [this]() {
        m_session->deleteSelected();
    });

    mainLayout->addWidget(objectGroup);

    // ----- Text -----
    m_textGroup = new QGroupBox(tr("Text"), this);
    QFormLayout* textLayout = new QFormLayout(m_textGroup);

    m_textEdit = new QLineEdit(m_textGroup);
    textLayout->addRow(tr("Content"), m_textEdit);

    m_fontCombo = new QFontComboBox(m_textGroup);
    textLayout->addRow(tr("Font"), m_fontCombo);

    QHBoxLayout* sizeLayout = new QHBoxLayout();
    m_fontSizeSlider = new QSlider(Qt::Horizontal, m_textGroup);
    m_fontSizeSlider->setRange(TextStyle::MIN_FONT_SIZE, TextStyle::MAX_FONT_SIZE);
    m_fontSizeLabel = new QLabel(m_textGroup);
    m_fontSizeLabel->setMinimumWidth(24);
    sizeLayout->addWidget(m_fontSizeSlider, 1);
    sizeLayout->addWidget(m_fontSizeLabel);
    textLayout->addRow(tr("Size"), sizeLayout);

    QHBoxLayout* emphasisLayout = new QHBoxLayout();
    m_boldButton = new QPushButton(QStringLiteral("B"), m_textGroup);
    m_boldButton->setToolTip(tr("Bold"));
    m_italicButton = new QPushButton(QStringLiteral("I"), m_textGroup);
    m_italicButton->setToolTip(tr("Italic"));
    m_underlineButton = new QPushButton(QStringLiteral("U"), m_textGroup);
    m_underlineButton->setToolTip(tr("Underline"));
    for (QPushButton* button : {m_boldButton, m_italicButton, m_underlineButton}) {
        button->setCheckable(true);
        button->setFixedSize(COLOR_BUTTON_SIZE, COLOR_BUTTON_SIZE);
        emphasisLayout->addWidget(button);
    }
    emphasisLayout->addStretch();
    textLayout->addRow(tr("Emphasis"), emphasisLayout);

    m_alignCombo = new QComboBox(m_textGroup);
    m_alignCombo->addItem(tr("Left"), TextStyle::alignKey(TextStyle::Align::Left));
    m_alignCombo->addItem(tr("Center"), TextStyle::alignKey(TextStyle::Align::Center));
    m_alignCombo->addItem(tr("Right"), TextStyle::alignKey(TextStyle::Align::Right));
    textLayout->addRow(tr("Alignment"), m_alignCombo);

    m_fillColorButton = createColorButton(StyleField::FillColor, tr("Font colour"));
    textLayout->addRow(tr("Colour"), m_fillColorButton);

    QHBoxLayout* strokeLayout = new QHBoxLayout();
    m_strokeColorButton = createColorButton(StyleField::StrokeColor, tr("Stroke colour"));
    m_strokeWidthSpin = new QDoubleSpinBox(m_textGroup);
    m_strokeWidthSpin->setRange(0.0, TextStyle::MAX_STROKE_WIDTH);
    m_strokeWidthSpin->setSingleStep(0.1);
    m_strokeWidthSpin->setDecimals(1);
    strokeLayout->addWidget(m_strokeColorButton);
    strokeLayout->addWidget(m_strokeWidthSpin, 1);
    textLayout->addRow(tr("Stroke"), strokeLayout);

    QHBoxLayout* shadowLayout = new QHBoxLayout();
    m_shadowColorButton = createColorButton(StyleField::ShadowColor, tr("Shadow colour"));
    m_shadowBlurSlider = new QSlider(Qt::Horizontal, m_textGroup);
    m_shadowBlurSlider->setRange(0, TextStyle::MAX_SHADOW_BLUR);
    m_shadowBlurSlider->setToolTip(tr("Shadow blur (0 = no shadow)"));
    shadowLayout->addWidget(m_shadowColorButton);
    shadowLayout->addWidget(m_shadowBlurSlider, 1);
    textLayout->addRow(tr("Shadow"), shadowLayout);

    QHBoxLayout* bgLayout = new QHBoxLayout();
    m_bgColorButton = createColorButton(StyleField::BackgroundColor, tr("Background colour"));
    m_bgOpacitySlider = new QSlider(Qt::Horizontal, m_textGroup);
    m_bgOpacitySlider->setRange(0, OPACITY_STEPS);
    m_bgOpacitySlider->setToolTip(tr("Background opacity"));
    bgLayout->addWidget(m_bgColorButton);
    bgLayout->addWidget(m_bgOpacitySlider, 1);
    textLayout->addRow(tr("Background"), bgLayout);

    mainLayout->addWidget(m_textGroup);
    mainLayout->addStretch();
}

QPushButton* StylePanel::createColorButton(StyleField field, const QString& toolTip)
{
    QPushButton* button = new QPushButton(m_textGroup);
    button->setFixedSize(COLOR_BUTTON_SIZE, COLOR_BUTTON_SIZE);
    button->setToolTip(toolTip);
    button->setCursor(Qt::PointingHandCursor);
    connect(button, &QPushButton::clicked, this, [this, field, button]() {
        pickColor(field, button);
    });
    return button;
}

void StylePanel::connectStyleControls()
{
    connect(m_textEdit, &QLineEdit::textEdited, this, &StylePanel::onTextEdited);

    connect(m_fontCombo, &QFontComboBox::currentFontChanged, this, [this](const QFont& font) {
        if (m_syncing) {
            return;
        }
        if (m_session->selection()->hasTextSelection()) {
            applyStyle(StyleField::FontFamily, font.family());
        } else {
            m_session->setDefaultFontFamily(font.family());
        }
    });

    connect(m_fontSizeSlider, &QSlider::valueChanged, this, [this](int value) {
        m_fontSizeLabel->setText(QString::number(value));
        applyStyle(StyleField::FontSize, value);
    });

    connect(m_boldButton, &QPushButton::toggled, this, [this](bool checked) {
        applyStyle(StyleField::FontWeight,
                   TextStyle::weightKey(checked ? TextStyle::Weight::Bold : TextStyle::Weight::Normal));
    });
    connect(m_italicButton, &QPushButton::toggled, this, [this](bool checked) {
        applyStyle(StyleField::FontStyle,
                   TextStyle::slantKey(checked ? TextStyle::Slant::Italic : TextStyle::Slant::Normal));
    });
    connect(m_underlineButton, &QPushButton::toggled, this, [this](bool checked) {
        applyStyle(StyleField::Underline, checked);
    });

    connect(m_alignCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
        applyStyle(StyleField::Alignment, m_alignCombo->currentData());
    });

    connect(m_strokeWidthSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            this, [this](double value) {
        applyStyle(StyleField::StrokeWidth, value);
    });
    connect(m_shadowBlurSlider, &QSlider::valueChanged, this, [this](int value) {
        applyStyle(StyleField::ShadowBlur, value);
    });
    connect(m_bgOpacitySlider, &QSlider::valueChanged, this, [this](int value) {
        applyStyle(StyleField::BackgroundOpacity, static_cast<qreal>(value) / OPACITY_STEPS);
    });
}

// ============================================================================
// Page
// ============================================================================

void StylePanel::setPageSpec(const PageGeometry::PageSpec& spec)
{
    m_syncing = true;
    int paperIndex = m_paperCombo->findData(static_cast<int>(spec.paperSize));
    if (paperIndex >= 0) {
        m_paperCombo->setCurrentIndex(paperIndex);
    }
    int orientationIndex = m_orientationCombo->findData(static_cast<int>(spec.orientation));
    if (orientationIndex >= 0) {
        m_orientationCombo->setCurrentIndex(orientationIndex);
    }
    m_syncing = false;
}

void StylePanel::onPageControlsChanged()
{
    if (m_syncing) {
        return;
    }

    PageGeometry::PageSpec spec;
    spec.paperSize = static_cast<PageGeometry::PaperSize>(m_paperCombo->currentData().toInt());
    spec.orientation = static_cast<PageGeometry::Orientation>(m_orientationCombo->currentData().toInt());
    m_session->setPageSpec(spec);
}

// ============================================================================
// Object actions
// ============================================================================

void StylePanel::onUploadImageClicked()
{
    QSettings settings("PosterStudio", "App");
    QString startDir = settings.value("lastImageDir").toString();

    QString path = QFileDialog::getOpenFileName(
        this, tr("Upload Image"), startDir,
        tr("Images (*.png *.jpg *.jpeg *.bmp *.gif *.webp)"));
    if (path.isEmpty()) {
        return;
    }

    settings.setValue("lastImageDir", QFileInfo(path).absolutePath());
    m_session->addImageFromFile(path);
}

// ============================================================================
// Style form synchronization
// ============================================================================

void StylePanel::applyStyle(StyleField field, const QVariant& value)
{
    if (m_syncing) {
        return;
    }
    m_session->editSelectedStyle(field, value);
}

void StylePanel::pickColor(StyleField field, QPushButton* button)
{
    const std::optional<TextStyle>& form = m_session->selection()->styleForm();
    if (!form) {
        return;
    }

    QColor current = form->field(field).value<QColor>();
    QColor color = QColorDialog::getColor(current, this, button->toolTip());
    if (!color.isValid()) {
        return;
    }

    setButtonColor(button, color);
    applyStyle(field, color);
}

void StylePanel::setButtonColor(QPushButton* button, const QColor& color)
{
    button->setStyleSheet(QString("background-color: %1; border: 1px solid #888; border-radius: 4px;")
                              .arg(color.name()));
}

void StylePanel::onTextEdited(const QString& text)
{
    if (m_syncing) {
        return;
    }
    SelectionController* selection = m_session->selection();
    if (selection->hasTextSelection()) {
        m_session->setText(selection->selectedId(), text);
    }
}

void StylePanel::onStyleFormChanged()
{
    const std::optional<TextStyle>& form = m_session->selection()->styleForm();

    // Without a selection the controls show the style new text will get
    const TextStyle style = form ? *form : m_session->selection()->templateStyle();

    m_syncing = true;

    m_fontCombo->setCurrentFont(QFont(style.fontFamily));
    m_fontSizeSlider->setValue(style.fontSize);
    m_fontSizeLabel->setText(QString::number(style.fontSize));
    m_boldButton->setChecked(style.weight == TextStyle::Weight::Bold);
    m_italicButton->setChecked(style.slant == TextStyle::Slant::Italic);
    m_underlineButton->setChecked(style.underline);

    int alignIndex = m_alignCombo->findData(TextStyle::alignKey(style.alignment));
    if (alignIndex >= 0) {
        m_alignCombo->setCurrentIndex(alignIndex);
    }

    setButtonColor(m_fillColorButton, style.fillColor);
    setButtonColor(m_strokeColorButton, style.strokeColor);
    m_strokeWidthSpin->setValue(style.strokeWidth);
    setButtonColor(m_shadowColorButton, style.shadowColor);
    m_shadowBlurSlider->setValue(style.shadowBlur);
    setButtonColor(m_bgColorButton, style.backgroundColor);
    m_bgOpacitySlider->setValue(qRound(style.backgroundOpacity * OPACITY_STEPS));

    const SceneObject* obj = m_session->selection()->selectedObject();
    if (obj && obj->isTextBox()) {
        const QString& text = static_cast<const TextBoxObject*>(obj)->text;
        if (m_textEdit->text() != text) {
            m_textEdit->setText(text);
        }
    } else {
        m_textEdit->clear();
    }

    m_syncing = false;

    updateButtonStates();
}

void StylePanel::onSelectionChanged()
{
    updateButtonStates();
}

void StylePanel::updateButtonStates()
{
    SelectionController* selection = m_session->selection();
    const bool hasSelection = selection->hasSelection();
    const bool hasText = selection->hasTextSelection();

    m_bringToFrontButton->setEnabled(hasSelection);
    m_sendToBackButton->setEnabled(hasSelection);
    m_flipHButton->setEnabled(hasSelection);
    m_flipVButton->setEnabled(hasSelection);
    m_deleteButton->setEnabled(hasSelection);

    // Font family stays editable: it sets the default for new text
    for (QWidget* w : std::initializer_list<QWidget*>{
             m_textEdit, m_fontSizeSlider, m_boldButton, m_italicButton, m_underlineButton,
             m_alignCombo, m_fillColorButton, m_strokeColorButton, m_strokeWidthSpin,
             m_shadowColorButton, m_shadowBlurSlider, m_bgColorButton, m_bgOpacitySlider}) {
        w->setEnabled(hasText);
    }
}
