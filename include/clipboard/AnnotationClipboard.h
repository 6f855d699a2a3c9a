#ifndef ANNOTATIONCLIPBOARD_H
#define ANNOTATIONCLIPBOARD_H

#include <QPointF>
#include <memory>

class AnnotationItem;

/**
 * @brief Single-slot annotation clipboard.
 *
 * Holds a deep copy of one annotation, detached from the live item it was
 * taken from. Pasting never touches the snapshot, so the same content can
 * be pasted any number of times until the next copy.
 */
class AnnotationClipboard
{
public:
    AnnotationClipboard();
    ~AnnotationClipboard();

    void copy(const AnnotationItem& item);

    /**
     * @brief Build a new item from the snapshot, re-anchored at point.
     * @return nullptr when the clipboard is empty
     */
    std::unique_ptr<AnnotationItem> paste(const QPointF& point) const;

    bool isEmpty() const { return !m_snapshot; }
    void clear();

    const AnnotationItem* snapshot() const { return m_snapshot.get(); }

private:
    std::unique_ptr<const AnnotationItem> m_snapshot;
};

#endif // ANNOTATIONCLIPBOARD_H
