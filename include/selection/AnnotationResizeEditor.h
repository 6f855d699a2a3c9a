#ifndef ANNOTATIONRESIZEEDITOR_H
#define ANNOTATIONRESIZEEDITOR_H

#include <QPointF>
#include <QRectF>
#include <QVector>
#include <memory>

#include "selection/SelectionHandles.h"

class AnnotationItem;
class AnnotationLayer;

/**
 * @brief Handles handle-driven resize of one annotation.
 *
 * Every update recomputes geometry from the state captured at grab time,
 * so the result depends only on the current pointer position.
 */
class AnnotationResizeEditor
{
public:
    static constexpr qreal kMinAffineExtent = 1.0;
    static constexpr qreal kMinTextGrabDistance = 1.0;

    void setAnnotationLayer(AnnotationLayer* layer);

    bool startResize(quint64 itemId, const SelectionHandle& handle, const QPointF& pos);
    void updateResize(const QPointF& pos);
    void finishResize();

    // Restore the geometry captured at grab time
    bool cancelResize();

    bool isResizing() const { return m_isResizing; }
    HandleId activeHandle() const { return m_handle.id; }
    ResizeMode activeMode() const { return m_handle.mode; }

private:
    AnnotationItem* targetItem() const;
    void reset();

    AnnotationLayer* m_annotationLayer = nullptr;

    bool m_isResizing = false;
    quint64 m_itemId = 0;
    SelectionHandle m_handle;

    // Grab-time anchors
    QPointF m_anchor;
    QRectF m_initialRect;
    QVector<QPointF> m_initialPoints;
    qreal m_initialScale = 1.0;
    QPointF m_initialGrabDelta;
    QPointF m_grabOffset;
    std::unique_ptr<AnnotationItem> m_original;
};

#endif // ANNOTATIONRESIZEEDITOR_H
