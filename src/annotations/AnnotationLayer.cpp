#include "annotations/AnnotationLayer.h"
#include "annotations/HitRegion.h"
#include <QDebug>
#include <QPainterPathStroker>
#include <algorithm>

AnnotationLayer::AnnotationLayer(QObject *parent)
    : QObject(parent)
{
}

AnnotationLayer::~AnnotationLayer() = default;

AnnotationItem* AnnotationLayer::addItem(std::unique_ptr<AnnotationItem> item)
{
    if (!item) {
        qWarning() << "AnnotationLayer: Ignoring null item";
        return nullptr;
    }

    item->setId(m_nextId++);
    AnnotationItem* stored = item.get();
    m_items.push_back(std::move(item));
    emit changed();
    return stored;
}

std::unique_ptr<AnnotationItem> AnnotationLayer::takeItem(quint64 id)
{
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [id](const std::unique_ptr<AnnotationItem>& item) { return item->id() == id; });
    if (it == m_items.end()) {
        return nullptr;
    }

    std::unique_ptr<AnnotationItem> taken = std::move(*it);
    m_items.erase(it);
    const bool wasSelected = taken->isSelected();
    taken->setSelected(false);

    if (wasSelected) {
        emit selectionChanged();
    }
    emit changed();
    return taken;
}

void AnnotationLayer::clear()
{
    if (m_items.empty()) return;

    m_items.clear();
    emit selectionChanged();
    emit changed();
}

void AnnotationLayer::draw(QPainter &painter) const
{
    for (const auto &item : m_items) {
        item->draw(painter);
    }
}

AnnotationItem* AnnotationLayer::itemAt(int index)
{
    if (index >= 0 && index < static_cast<int>(m_items.size())) {
        return m_items[index].get();
    }
    return nullptr;
}

const AnnotationItem* AnnotationLayer::itemAt(int index) const
{
    if (index >= 0 && index < static_cast<int>(m_items.size())) {
        return m_items[index].get();
    }
    return nullptr;
}

AnnotationItem* AnnotationLayer::findItem(quint64 id)
{
    return itemAt(indexOf(id));
}

int AnnotationLayer::indexOf(quint64 id) const
{
    for (int i = 0; i < static_cast<int>(m_items.size()); ++i) {
        if (m_items[i]->id() == id) {
            return i;
        }
    }
    return -1;
}

int AnnotationLayer::hitTest(const QPointF &pos) const
{
    // Iterate in reverse order (top-most items first)
    for (int i = static_cast<int>(m_items.size()) - 1; i >= 0; --i) {
        if (HitRegion::containsPoint(*m_items[i], pos)) {
            return i;
        }
    }
    return -1;
}

std::vector<AnnotationItem*> AnnotationLayer::selectedItems() const
{
    std::vector<AnnotationItem*> selected;
    for (const auto &item : m_items) {
        if (item->isSelected()) {
            selected.push_back(item.get());
        }
    }
    return selected;
}

bool AnnotationLayer::hasSelection() const
{
    return std::any_of(m_items.begin(), m_items.end(),
        [](const std::unique_ptr<AnnotationItem>& item) { return item->isSelected(); });
}

size_t AnnotationLayer::selectedCount() const
{
    return static_cast<size_t>(std::count_if(m_items.begin(), m_items.end(),
        [](const std::unique_ptr<AnnotationItem>& item) { return item->isSelected(); }));
}

void AnnotationLayer::clearSelection()
{
    bool changedAny = false;
    for (auto &item : m_items) {
        if (item->isSelected()) {
            item->setSelected(false);
            changedAny = true;
        }
    }
    if (changedAny) {
        emit selectionChanged();
    }
}

void AnnotationLayer::selectOnly(AnnotationItem *item)
{
    for (auto &entry : m_items) {
        entry->setSelected(entry.get() == item);
    }
    emit selectionChanged();
}

void AnnotationLayer::setItemSelected(AnnotationItem *item, bool selected)
{
    if (!item || item->isSelected() == selected) return;

    item->setSelected(selected);
    emit selectionChanged();
}

void AnnotationLayer::selectIntersecting(const QRectF &rect, bool additive)
{
    const QRectF band = rect.normalized();
    for (auto &item : m_items) {
        const QRectF box = item->boundingBox();
        bool hit = band.intersects(box);
        if (!hit && (qFuzzyIsNull(box.width()) || qFuzzyIsNull(box.height()))) {
            // QRectF::intersects is false for zero-area boxes; test the outline itself
            QPainterPathStroker stroker;
            stroker.setWidth(1.0);
            hit = band.contains(box.topLeft())
                || stroker.createStroke(item->outlinePath()).intersects(band);
        }
        if (hit || !additive) {
            item->setSelected(hit);
        }
    }
    emit selectionChanged();
}

size_t AnnotationLayer::removeSelectedItems()
{
    const size_t before = m_items.size();
    m_items.erase(std::remove_if(m_items.begin(), m_items.end(),
        [](const std::unique_ptr<AnnotationItem>& item) { return item->isSelected(); }),
        m_items.end());

    const size_t removed = before - m_items.size();
    if (removed > 0) {
        emit selectionChanged();
        emit changed();
    }
    return removed;
}
