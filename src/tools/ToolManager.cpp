#include "tools/ToolManager.h"
#include "tools/handlers/AllHandlers.h"
#include "annotation/AnnotationScene.h"

#include <QDebug>
#include <QPainter>

ToolManager::ToolManager(QObject* parent)
    : QObject(parent)
    , m_context(std::make_unique<ToolContext>())
{
    // Set up the repaint callback to emit our signal
    m_context->requestRepaint = [this]() {
        emit needsRepaint();
    };
}

ToolManager::~ToolManager() = default;

void ToolManager::registerHandler(std::unique_ptr<IToolHandler> handler) {
    if (handler) {
        ToolId id = handler->toolId();
        m_handlers[id] = std::move(handler);
    }
}

void ToolManager::registerDefaultHandlers() {
    registerHandler(std::make_unique<SelectionToolHandler>());
    registerHandler(std::make_unique<ArrowToolHandler>(ToolId::Line));
    registerHandler(std::make_unique<ArrowToolHandler>(ToolId::Arrow));
    registerHandler(std::make_unique<PencilToolHandler>());
    registerHandler(std::make_unique<ShapeToolHandler>(ToolId::Rectangle));
    registerHandler(std::make_unique<ShapeToolHandler>(ToolId::Ellipse));
    registerHandler(std::make_unique<ShapeToolHandler>(ToolId::Triangle));
    registerHandler(std::make_unique<TextToolHandler>());
}

void ToolManager::setScene(AnnotationScene* scene) {
    cancelGesture();
    m_context->scene = scene;
    if (auto* current = currentHandler()) {
        current->onActivate(m_context.get());
    }
}

void ToolManager::setCurrentTool(ToolId id) {
    if (currentTool() == id) {
        return;
    }

    // Switching tools never commits half a gesture
    if (cancelGesture()) {
        qDebug() << "ToolManager: Gesture cancelled by tool switch";
    }

    m_context->state.tool = id;

    if (auto* newHandler = currentHandler()) {
        newHandler->onActivate(m_context.get());
        m_cursorHint = newHandler->cursor();
    }

    emit toolChanged(id);
    emit cursorHintChanged(m_cursorHint);
}

IToolHandler* ToolManager::currentHandler() {
    return handler(currentTool());
}

IToolHandler* ToolManager::handler(ToolId id) {
    auto it = m_handlers.find(id);
    if (it != m_handlers.end()) {
        return it->second.get();
    }
    return nullptr;
}

// ============================================================================
// Pointer events
// ============================================================================

void ToolManager::trackGesture(IToolHandler* owner, bool wasIdle) {
    const bool idle = m_context->state.isIdle();
    if (wasIdle && !idle) {
        m_gestureOwner = owner;
        emit gestureStarted();
    } else if (!wasIdle && idle) {
        m_gestureOwner = nullptr;
        emit gestureFinished();
    }
}

void ToolManager::handleMousePress(const QPointF& pos, Qt::KeyboardModifiers modifiers) {
    // One gesture at a time
    if (isGestureActive() || !m_context->scene) {
        return;
    }

    auto* h = currentHandler();
    if (!h) {
        return;
    }

    m_context->shiftPressed = modifiers.testFlag(Qt::ShiftModifier);
    h->onMousePress(m_context.get(), pos);
    trackGesture(h, true);
}

void ToolManager::handleMouseMove(const QPointF& pos, Qt::KeyboardModifiers modifiers) {
    if (!isGestureActive()) {
        updateCursorHint(pos);
        return;
    }

    m_context->shiftPressed = modifiers.testFlag(Qt::ShiftModifier);
    if (m_gestureOwner) {
        m_gestureOwner->onMouseMove(m_context.get(), pos);
    }
}

void ToolManager::handleMouseRelease(const QPointF& pos, Qt::KeyboardModifiers modifiers) {
    // Text entry ends through submitText(), not on release
    if (!isGestureActive() || !m_gestureOwner
        || gestureState() == GestureState::TextEntry) {
        return;
    }

    m_context->shiftPressed = modifiers.testFlag(Qt::ShiftModifier);
    IToolHandler* owner = m_gestureOwner;
    owner->onMouseRelease(m_context.get(), pos);
    trackGesture(owner, false);
    updateCursorHint(pos);
}

void ToolManager::handleDoubleClick(const QPointF& pos) {
    if (isGestureActive() || !m_context->scene) {
        return;
    }

    const ToolId tool = currentTool();
    if (tool != ToolId::Selection && tool != ToolId::Text) {
        return;
    }

    // Re-edit is reachable from both tools and always handled as text
    auto* textHandler = dynamic_cast<TextToolHandler*>(handler(ToolId::Text));
    if (textHandler && textHandler->beginReEdit(m_context.get(), pos)) {
        trackGesture(textHandler, true);
    }
}

bool ToolManager::submitText(const QString& text, bool confirmed) {
    if (gestureState() != GestureState::TextEntry) {
        qWarning() << "ToolManager: Text submitted without a pending entry";
        return false;
    }

    // Entries are only ever opened by the text handler
    auto* textHandler = dynamic_cast<TextToolHandler*>(handler(ToolId::Text));
    if (!textHandler) {
        return false;
    }

    const bool changed = textHandler->commitText(m_context.get(), text, confirmed);
    trackGesture(textHandler, false);
    return changed;
}

bool ToolManager::handleEscape() {
    if (cancelGesture()) {
        return true;
    }

    AnnotationLayer* layer = m_context->layer();
    if (layer && layer->hasSelection()) {
        layer->clearSelection();
        m_context->repaint();
        return true;
    }
    return false;
}

bool ToolManager::cancelGesture() {
    if (!isGestureActive()) {
        return false;
    }

    IToolHandler* owner = m_gestureOwner ? m_gestureOwner : currentHandler();
    if (!owner || !owner->cancelGesture(m_context.get())) {
        // Never leave the machine stuck outside Idle
        m_context->endGesture();
    }
    trackGesture(owner, false);
    return true;
}

void ToolManager::updateCursorHint(const QPointF& pos) {
    auto* h = currentHandler();
    if (!h) {
        return;
    }

    const Qt::CursorShape hint = h->hoverCursor(m_context.get(), pos);
    if (hint != m_cursorHint) {
        m_cursorHint = hint;
        emit cursorHintChanged(hint);
    }
}

// ============================================================================
// Selection commands
// ============================================================================

size_t ToolManager::deleteSelected() {
    if (isGestureActive() || !m_context->scene) {
        return 0;
    }

    const size_t removed = m_context->scene->deleteSelected();
    if (removed > 0) {
        m_context->repaint();
    }
    return removed;
}

bool ToolManager::copySelected() {
    if (isGestureActive() || !m_context->scene) {
        return false;
    }
    return m_context->scene->copySelected();
}

AnnotationItem* ToolManager::paste(const QPointF& pos) {
    if (isGestureActive() || !m_context->scene) {
        return nullptr;
    }

    AnnotationItem* item = m_context->scene->paste(pos);
    if (item) {
        m_context->repaint();
    }
    return item;
}

void ToolManager::drawCurrentPreview(QPainter& painter) const {
    auto it = m_handlers.find(m_context->state.tool);
    if (it != m_handlers.end()) {
        it->second->drawPreview(painter);
    }
}

void ToolManager::setTextInputCallback(std::function<void(const QPointF&)> callback) {
    m_context->requestTextInput = std::move(callback);
}

void ToolManager::setTextEditCallback(std::function<void(const QPointF&, const QString&)> callback) {
    m_context->requestTextEdit = std::move(callback);
}
