#ifndef ANNOTATIONSCENE_H
#define ANNOTATIONSCENE_H

#include <QColor>
#include <QImage>
#include <QObject>
#include <QPointF>
#include <QRect>
#include <QString>
#include <functional>

#include "annotations/AnnotationLayer.h"
#include "annotations/StrokeStyle.h"
#include "clipboard/AnnotationClipboard.h"

/**
 * @brief Background raster plus the annotations drawn over it.
 *
 * The scene is the only object host code talks to: it ingests a decoded
 * raster, applies style input, runs copy/paste/delete on the selection and
 * renders the flattened composite for export. It also owns the dirty flag
 * that tracks unexported changes.
 *
 * The background lives outside the annotation layer, so no selection,
 * move or delete can ever reach it.
 */
class AnnotationScene : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationScene(QObject* parent = nullptr);
    ~AnnotationScene() override;

    // Background ingestion. Clears all annotations and resets the dirty flag.
    void loadBackground(const QImage& image);
    bool hasBackground() const { return !m_background.isNull(); }
    const QImage& background() const { return m_background; }
    QRect sceneRect() const;

    AnnotationLayer* layer() { return &m_layer; }
    const AnnotationLayer* layer() const { return &m_layer; }

    // Default style applied to newly created annotations
    StrokeStyle defaultStyle() const { return m_defaultStyle; }
    void setDefaultStyle(const StrokeStyle& style) { m_defaultStyle = style; }

    QString fontFamily() const { return m_fontFamily; }
    void setFontFamily(const QString& family) { m_fontFamily = family; }

    // Style input: updates the default style and every selected item
    void applyStyle(const QColor& color, qreal width);
    void applyColor(const QColor& color);
    void applyWidth(qreal width);
    bool applyWidthText(const QString& text);

    // Dirty tracking
    bool isDirty() const { return m_dirty; }
    void markDirty();
    void markExported();

    // Selection operations
    size_t deleteSelected();
    bool copySelected();
    AnnotationItem* paste(const QPointF& point);
    AnnotationClipboard& clipboard() { return m_clipboard; }

    // Replace a text item's content (no-op unless confirmed, non-empty and different)
    bool editText(quint64 id, const QString& text, bool confirmed);

    // Background followed by all annotations, at the scene's extent
    QImage renderComposite() const;

signals:
    void dirtyChanged(bool dirty);
    void backgroundChanged();
    void changed();

private:
    void setDirty(bool dirty);
    bool updateSelectedStyles(const std::function<void(StrokeStyle&)>& edit);

    QImage m_background;
    AnnotationLayer m_layer;
    AnnotationClipboard m_clipboard;
    StrokeStyle m_defaultStyle;
    QString m_fontFamily = QStringLiteral("Sans Serif");
    bool m_dirty = false;
};

#endif // ANNOTATIONSCENE_H
