#ifndef SELECTIONHANDLES_H
#define SELECTIONHANDLES_H

#include <QPainter>
#include <QPointF>
#include <QVector>

class AnnotationItem;
class AnnotationLayer;

// Handle identifiers for hit-testing resize handles
enum class HandleId {
    None = 0,
    P1,          // Line/arrow start point
    P2,          // Line/arrow end point
    BottomRight  // Bounding-box corner for every other kind
};

// How dragging a handle reshapes its annotation
enum class ResizeMode {
    None = 0,
    CornerResize,  // Rect/ellipse/triangle: top-left fixed, corner follows pointer
    AffineScale,   // Freehand: independent x/y scale about the bbox top-left
    EndpointMove,  // Line/arrow: the grabbed endpoint follows pointer
    UniformScale   // Text: one scale factor about the anchor
};

struct SelectionHandle {
    QPointF position;
    HandleId id = HandleId::None;
    ResizeMode mode = ResizeMode::None;
};

struct HandleHit {
    AnnotationItem *item = nullptr;
    SelectionHandle handle;

    bool isValid() const { return item != nullptr && handle.id != HandleId::None; }
};

/**
 * @brief Helper class for drawing and hit-testing resize handles.
 *
 * Handles are drawn small but grabbed within a much larger radius;
 * the two sizes are independent.
 */
class SelectionHandles
{
public:
    static constexpr qreal kHandleDrawSize = 12.0;
    static constexpr qreal kHandleGrabRadius = 30.0;

    /**
     * @brief Handle anchors for one annotation, tagged with their resize mode.
     */
    static QVector<SelectionHandle> handlesFor(const AnnotationItem &item);

    /**
     * @brief Find the handle of a selected item nearest to point.
     * @param layer The layer whose selected items are tested
     * @param point The pointer position in scene coordinates
     * @return The nearest handle within kHandleGrabRadius (Manhattan distance),
     *         or an invalid hit
     */
    static HandleHit hitTest(AnnotationLayer &layer, const QPointF &point);

    static Qt::CursorShape cursorForHandle(HandleId handle);

    /**
     * @brief Draw selection outlines and handles for every selected item.
     */
    static void draw(QPainter &painter, const AnnotationLayer &layer);

private:
    static void drawDashedBorder(QPainter &painter, const QRectF &rect);
    static void drawHandle(QPainter &painter, const QPointF &center);
};

#endif // SELECTIONHANDLES_H
