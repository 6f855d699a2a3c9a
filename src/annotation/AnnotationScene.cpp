#include "annotation/AnnotationScene.h"

#include "annotations/TextAnnotation.h"
#include "utils/StyleInputParser.h"

#include <QDebug>
#include <QPainter>

AnnotationScene::AnnotationScene(QObject* parent)
    : QObject(parent)
{
    connect(&m_layer, &AnnotationLayer::changed, this, &AnnotationScene::changed);
}

AnnotationScene::~AnnotationScene() = default;

void AnnotationScene::loadBackground(const QImage& image)
{
    m_background = image;
    m_layer.clear();
    setDirty(false);

    qDebug() << "AnnotationScene: Background loaded" << m_background.size();
    emit backgroundChanged();
}

QRect AnnotationScene::sceneRect() const
{
    return m_background.rect();
}

void AnnotationScene::setDirty(bool dirty)
{
    if (m_dirty == dirty) return;

    m_dirty = dirty;
    emit dirtyChanged(m_dirty);
}

void AnnotationScene::markDirty()
{
    setDirty(true);
}

void AnnotationScene::markExported()
{
    setDirty(false);
}

// ============================================================================
// Style input
// ============================================================================

bool AnnotationScene::updateSelectedStyles(const std::function<void(StrokeStyle&)>& edit)
{
    bool changedAny = false;
    for (AnnotationItem* item : m_layer.selectedItems()) {
        StrokeStyle style = item->style();
        edit(style);
        if (style != item->style()) {
            item->setStyle(style);
            changedAny = true;
        }
    }

    if (changedAny) {
        markDirty();
        m_layer.notifyChanged();
    }
    return changedAny;
}

void AnnotationScene::applyStyle(const QColor& color, qreal width)
{
    if (!color.isValid()) {
        qWarning() << "AnnotationScene: Rejecting invalid color";
        return;
    }

    m_defaultStyle.setColor(color);
    m_defaultStyle.setWidth(width);
    const StrokeStyle applied = m_defaultStyle;
    updateSelectedStyles([&applied](StrokeStyle& style) { style = applied; });
}

void AnnotationScene::applyColor(const QColor& color)
{
    if (!color.isValid()) {
        qWarning() << "AnnotationScene: Rejecting invalid color";
        return;
    }

    m_defaultStyle.setColor(color);
    updateSelectedStyles([&color](StrokeStyle& style) { style.setColor(color); });
}

void AnnotationScene::applyWidth(qreal width)
{
    m_defaultStyle.setWidth(width);
    const qreal clamped = m_defaultStyle.width();
    updateSelectedStyles([clamped](StrokeStyle& style) { style.setWidth(clamped); });
}

bool AnnotationScene::applyWidthText(const QString& text)
{
    const std::optional<qreal> width = StyleInputParser::parseWidth(text);
    if (!width) {
        qWarning() << "AnnotationScene: Ignoring invalid width input" << text;
        return false;
    }

    applyWidth(*width);
    return true;
}

// ============================================================================
// Selection operations
// ============================================================================

size_t AnnotationScene::deleteSelected()
{
    const size_t removed = m_layer.removeSelectedItems();
    if (removed > 0) {
        markDirty();
    }
    return removed;
}

bool AnnotationScene::copySelected()
{
    const std::vector<AnnotationItem*> selected = m_layer.selectedItems();
    if (selected.empty()) {
        return false;
    }

    // Topmost selected item wins
    m_clipboard.copy(*selected.back());
    return true;
}

AnnotationItem* AnnotationScene::paste(const QPointF& point)
{
    std::unique_ptr<AnnotationItem> pasted = m_clipboard.paste(point);
    if (!pasted) {
        return nullptr;
    }

    AnnotationItem* stored = m_layer.addItem(std::move(pasted));
    m_layer.selectOnly(stored);
    markDirty();
    return stored;
}

bool AnnotationScene::editText(quint64 id, const QString& text, bool confirmed)
{
    if (!confirmed || text.isEmpty()) {
        return false;
    }

    auto* textItem = dynamic_cast<TextAnnotation*>(m_layer.findItem(id));
    if (!textItem || textItem->text() == text) {
        return false;
    }

    textItem->setText(text);
    markDirty();
    m_layer.notifyChanged();
    return true;
}

// ============================================================================
// Export
// ============================================================================

QImage AnnotationScene::renderComposite() const
{
    if (m_background.isNull()) {
        qWarning() << "AnnotationScene: Nothing to render without a background";
        return QImage();
    }

    QImage composite = m_background.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    QPainter painter(&composite);
    painter.setRenderHint(QPainter::Antialiasing, true);
    m_layer.draw(painter);
    painter.end();

    return composite;
}
