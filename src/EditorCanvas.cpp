#include "EditorCanvas.h"

#include "annotation/AnnotationScene.h"
#include "selection/SelectionHandles.h"
#include "settings/AnnotationSettingsManager.h"
#include "tools/ToolManager.h"

#include <QCloseEvent>
#include <QColorDialog>
#include <QDebug>
#include <QFileDialog>
#include <QImageWriter>
#include <QInputDialog>
#include <QKeyEvent>
#include <QLineEdit>
#include <QMessageBox>
#include <QMouseEvent>
#include <QPainter>
#include <QTimer>

EditorCanvas::EditorCanvas(AnnotationScene* scene, QWidget* parent)
    : QWidget(parent)
    , m_scene(scene)
    , m_toolManager(new ToolManager(this))
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setFixedSize(m_scene->sceneRect().size());

    setupToolManager();

    connect(m_scene, &AnnotationScene::changed, this, QOverload<>::of(&QWidget::update));
    connect(m_scene, &AnnotationScene::dirtyChanged, this, &EditorCanvas::updateWindowTitle);
    updateWindowTitle();
}

EditorCanvas::~EditorCanvas() = default;

void EditorCanvas::setupToolManager()
{
    m_toolManager->registerDefaultHandlers();
    m_toolManager->setScene(m_scene);

    connect(m_toolManager, &ToolManager::needsRepaint, this, QOverload<>::of(&QWidget::update));
    connect(m_toolManager, &ToolManager::cursorHintChanged, this, [this](Qt::CursorShape shape) {
        setCursor(shape);
    });

    m_toolManager->setTextInputCallback([this](const QPointF& pos) {
        requestTextInput(pos, QString());
    });
    m_toolManager->setTextEditCallback([this](const QPointF& pos, const QString& text) {
        requestTextInput(pos, text);
    });
}

// Answered from the event loop so the press that opened the entry has
// fully returned before the dialog runs.
void EditorCanvas::requestTextInput(const QPointF& pos, const QString& initialText)
{
    Q_UNUSED(pos);
    QTimer::singleShot(0, this, [this, initialText]() {
        bool ok = false;
        const QString text = QInputDialog::getMultiLineText(
            this, tr("Text"), tr("Annotation text:"), initialText, &ok);
        m_toolManager->submitText(text, ok);
    });
}

// ============================================================================
// Painting
// ============================================================================

void EditorCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    painter.drawImage(QPointF(0, 0), m_scene->background());
    m_scene->layer()->draw(painter);

    // Editing chrome, never part of the export
    SelectionHandles::draw(painter, *m_scene->layer());
    m_toolManager->drawCurrentPreview(painter);
}

// ============================================================================
// Input
// ============================================================================

void EditorCanvas::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    m_lastPointerPos = event->position();
    m_toolManager->handleMousePress(event->position(), event->modifiers());
}

void EditorCanvas::mouseMoveEvent(QMouseEvent* event)
{
    m_lastPointerPos = event->position();
    m_toolManager->handleMouseMove(event->position(), event->modifiers());
}

void EditorCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    m_toolManager->handleMouseRelease(event->position(), event->modifiers());
}

void EditorCanvas::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    m_toolManager->handleDoubleClick(event->position());
}

void EditorCanvas::keyPressEvent(QKeyEvent* event)
{
    const bool ctrl = event->modifiers().testFlag(Qt::ControlModifier);

    if (ctrl && event->key() == Qt::Key_C) {
        m_toolManager->copySelected();
        return;
    }
    if (ctrl && event->key() == Qt::Key_V) {
        m_toolManager->paste(m_lastPointerPos);
        return;
    }
    if (ctrl && event->key() == Qt::Key_S) {
        save();
        return;
    }

    switch (event->key()) {
    case Qt::Key_1: m_toolManager->setCurrentTool(ToolId::Selection); break;
    case Qt::Key_2: m_toolManager->setCurrentTool(ToolId::Line); break;
    case Qt::Key_3: m_toolManager->setCurrentTool(ToolId::Arrow); break;
    case Qt::Key_4: m_toolManager->setCurrentTool(ToolId::Freehand); break;
    case Qt::Key_5: m_toolManager->setCurrentTool(ToolId::Rectangle); break;
    case Qt::Key_6: m_toolManager->setCurrentTool(ToolId::Ellipse); break;
    case Qt::Key_7: m_toolManager->setCurrentTool(ToolId::Triangle); break;
    case Qt::Key_8: m_toolManager->setCurrentTool(ToolId::Text); break;
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        m_toolManager->deleteSelected();
        break;
    case Qt::Key_Escape:
        m_toolManager->handleEscape();
        break;
    case Qt::Key_C:
        pickColor();
        break;
    case Qt::Key_W:
        pickWidth();
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }
    update();
}

// ============================================================================
// Style input
// ============================================================================

void EditorCanvas::pickColor()
{
    if (m_toolManager->isGestureActive()) {
        return;
    }

    const QColor color = QColorDialog::getColor(m_scene->defaultStyle().color(), this,
                                                tr("Annotation color"),
                                                QColorDialog::ShowAlphaChannel);
    if (!color.isValid()) {
        return;
    }
    m_scene->applyColor(color);
    saveStyle();
}

void EditorCanvas::pickWidth()
{
    if (m_toolManager->isGestureActive()) {
        return;
    }

    bool ok = false;
    const QString text = QInputDialog::getText(
        this, tr("Stroke width"), tr("Width:"), QLineEdit::Normal,
        QString::number(m_scene->defaultStyle().width()), &ok);
    if (!ok) {
        return;
    }

    if (!m_scene->applyWidthText(text)) {
        QMessageBox::warning(this, tr("Stroke width"),
                             tr("\"%1\" is not a positive number.").arg(text));
        return;
    }
    saveStyle();
}

void EditorCanvas::saveStyle()
{
    AnnotationSettingsManager::instance().saveStyle(m_scene->defaultStyle());
}

// ============================================================================
// Export
// ============================================================================

bool EditorCanvas::exportTo(const QString& path)
{
    const QImage composite = m_scene->renderComposite();
    if (composite.isNull()) {
        return false;
    }

    QImageWriter writer(path);
    if (!writer.write(composite)) {
        qWarning() << "EditorCanvas: Failed to write" << path << "-" << writer.errorString();
        return false;
    }

    m_scene->markExported();
    qDebug() << "EditorCanvas: Exported to" << path;
    return true;
}

void EditorCanvas::save()
{
    if (m_toolManager->isGestureActive()) {
        return;
    }

    QString path = m_outputPath;
    if (path.isEmpty()) {
        path = QFileDialog::getSaveFileName(this, tr("Export image"), QString(),
                                            tr("Images (*.png *.jpg *.bmp)"));
        if (path.isEmpty()) {
            return;
        }
    }

    if (!exportTo(path)) {
        QMessageBox::warning(this, tr("Export"), tr("Could not write %1").arg(path));
    }
}

void EditorCanvas::closeEvent(QCloseEvent* event)
{
    if (!m_scene->isDirty()) {
        event->accept();
        return;
    }

    const auto answer = QMessageBox::question(
        this, tr("Unsaved annotations"),
        tr("The annotations have not been exported. Export before closing?"),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel);

    if (answer == QMessageBox::Cancel) {
        event->ignore();
        return;
    }
    if (answer == QMessageBox::Save) {
        save();
        if (m_scene->isDirty()) {
            event->ignore();
            return;
        }
    }
    event->accept();
}

void EditorCanvas::updateWindowTitle()
{
    const QString marker = m_scene->isDirty() ? QStringLiteral("*") : QString();
    setWindowTitle(QStringLiteral("MarkupStudio%1").arg(marker));
}
