#ifndef TOOLMANAGER_H
#define TOOLMANAGER_H

#include <QObject>
#include <QPointF>
#include <memory>
#include <map>
#include <functional>

#include "ToolId.h"
#include "ToolContext.h"
#include "IToolHandler.h"

class QPainter;
class AnnotationScene;

/**
 * @brief Central manager for tool handling.
 *
 * Manages tool handlers and dispatches pointer events to the handler of
 * the current tool. Owns the shared context and the explicit editor state,
 * and enforces that at most one gesture is in flight at a time.
 */
class ToolManager : public QObject {
    Q_OBJECT

public:
    explicit ToolManager(QObject* parent = nullptr);
    ~ToolManager() override;

    /**
     * @brief Register a tool handler.
     *
     * The manager takes ownership of the handler.
     */
    void registerHandler(std::unique_ptr<IToolHandler> handler);

    /**
     * @brief Register all default tool handlers.
     */
    void registerDefaultHandlers();

    void setScene(AnnotationScene* scene);
    AnnotationScene* scene() const { return m_context->scene; }

    /**
     * @brief Set the current active tool.
     *
     * A gesture still in flight is cancelled first.
     */
    void setCurrentTool(ToolId id);
    ToolId currentTool() const { return m_context->state.tool; }

    IToolHandler* currentHandler();
    IToolHandler* handler(ToolId id);

    // Event dispatch methods
    void handleMousePress(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    void handleMouseMove(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    void handleMouseRelease(const QPointF& pos, Qt::KeyboardModifiers modifiers = Qt::NoModifier);
    void handleDoubleClick(const QPointF& pos);

    /**
     * @brief Answer a pending text request.
     * @return true if the scene changed
     */
    bool submitText(const QString& text, bool confirmed);

    /**
     * @brief Handle Escape key press.
     *
     * Cancels the gesture in flight, otherwise clears the selection.
     * @return true if handled, false otherwise.
     */
    bool handleEscape();

    /**
     * @brief Roll back the gesture in flight.
     * @return false when no gesture is active
     */
    bool cancelGesture();

    // Selection commands, ignored while a gesture is active
    size_t deleteSelected();
    bool copySelected();
    AnnotationItem* paste(const QPointF& pos);

    bool isGestureActive() const { return !m_context->state.isIdle(); }
    GestureState gestureState() const { return m_context->state.gesture; }
    const EditorState& state() const { return m_context->state; }
    Qt::CursorShape cursorHint() const { return m_cursorHint; }

    /**
     * @brief Draw the current tool preview.
     */
    void drawCurrentPreview(QPainter& painter) const;

    // Context management
    ToolContext* context() { return m_context.get(); }

    void setTextInputCallback(std::function<void(const QPointF&)> callback);
    void setTextEditCallback(std::function<void(const QPointF&, const QString&)> callback);

signals:
    void toolChanged(ToolId newTool);

    /**
     * @brief Emitted when a gesture leaves Idle.
     */
    void gestureStarted();

    /**
     * @brief Emitted when a gesture returns to Idle, committed or cancelled.
     */
    void gestureFinished();

    void needsRepaint();
    void cursorHintChanged(Qt::CursorShape cursor);

private:
    void updateCursorHint(const QPointF& pos);
    void trackGesture(IToolHandler* owner, bool wasIdle);

    std::map<ToolId, std::unique_ptr<IToolHandler>> m_handlers;
    std::unique_ptr<ToolContext> m_context;

    // Handler that started the gesture in flight
    IToolHandler* m_gestureOwner = nullptr;
    Qt::CursorShape m_cursorHint = Qt::ArrowCursor;
};

#endif // TOOLMANAGER_H
