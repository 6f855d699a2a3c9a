#include "clipboard/AnnotationClipboard.h"
#include "annotations/AnnotationItem.h"

AnnotationClipboard::AnnotationClipboard() = default;

AnnotationClipboard::~AnnotationClipboard() = default;

void AnnotationClipboard::copy(const AnnotationItem& item)
{
    m_snapshot = item.clone();
}

std::unique_ptr<AnnotationItem> AnnotationClipboard::paste(const QPointF& point) const
{
    if (!m_snapshot) {
        return nullptr;
    }
    return m_snapshot->cloneWithAnchor(point);
}

void AnnotationClipboard::clear()
{
    m_snapshot.reset();
}
