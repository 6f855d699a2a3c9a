#ifndef ANNOTATIONLAYER_H
#define ANNOTATIONLAYER_H

#include <QObject>
#include <QPainter>
#include <QPointF>
#include <QRectF>
#include <memory>
#include <vector>

#include "annotations/AnnotationItem.h"

// Ordered annotation collection. Insertion order is paint order.
class AnnotationLayer : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationLayer(QObject *parent = nullptr);
    ~AnnotationLayer();

    /**
     * @brief Append an item and assign it a fresh identity.
     * @return Non-owning pointer to the stored item
     */
    AnnotationItem* addItem(std::unique_ptr<AnnotationItem> item);

    // Remove and hand back an item by identity (nullptr if unknown)
    std::unique_ptr<AnnotationItem> takeItem(quint64 id);

    void clear();
    void draw(QPainter &painter) const;

    bool isEmpty() const { return m_items.empty(); }
    size_t itemCount() const { return m_items.size(); }

    AnnotationItem* itemAt(int index);
    const AnnotationItem* itemAt(int index) const;
    AnnotationItem* findItem(quint64 id);
    int indexOf(quint64 id) const;

    // Topmost item whose hit region contains pos, or -1
    int hitTest(const QPointF &pos) const;

    // Selection support
    std::vector<AnnotationItem*> selectedItems() const;
    bool hasSelection() const;
    size_t selectedCount() const;
    void clearSelection();
    void selectOnly(AnnotationItem *item);
    void setItemSelected(AnnotationItem *item, bool selected);
    void selectIntersecting(const QRectF &rect, bool additive = false);

    // Remove every selected item; returns how many were removed
    size_t removeSelectedItems();

    // Notify listeners that an item was mutated in place
    void notifyChanged() { emit changed(); }

signals:
    void changed();
    void selectionChanged();

private:
    std::vector<std::unique_ptr<AnnotationItem>> m_items;
    quint64 m_nextId = 1;
};

#endif // ANNOTATIONLAYER_H
