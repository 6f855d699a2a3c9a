#ifndef TOOLCONTEXT_H
#define TOOLCONTEXT_H

#include <QPointF>
#include <QString>
#include <functional>

#include "ToolId.h"
#include "annotation/AnnotationScene.h"

/**
 * @brief Gesture sub-state. At most one is active scene-wide.
 */
enum class GestureState {
    Idle,
    Drawing,
    Resizing,
    Moving,
    RubberBand,
    TextEntry
};

/**
 * @brief Explicit editor state threaded through every handler call.
 */
struct EditorState {
    ToolId tool = ToolId::Selection;
    GestureState gesture = GestureState::Idle;

    // Press point of the active gesture
    QPointF startPoint;
    bool hasStartPoint = false;

    // Item the active gesture is bound to (0 = none)
    quint64 targetId = 0;

    bool isIdle() const { return gesture == GestureState::Idle; }
};

/**
 * @brief Shared context passed to tool handlers.
 *
 * Contains the scene the handlers mutate, the explicit editor state and
 * the callbacks that reach host collaborators.
 */
class ToolContext {
public:
    AnnotationScene* scene = nullptr;
    EditorState state;

    // Keyboard modifier state for toggle selection
    bool shiftPressed = false;

    // Callbacks
    std::function<void()> requestRepaint;
    std::function<void(const QPointF&)> requestTextInput;
    std::function<void(const QPointF&, const QString&)> requestTextEdit;

    /**
     * @brief Enter a gesture sub-state.
     * @return false when another gesture is already in flight
     */
    bool beginGesture(GestureState gesture, const QPointF& pos) {
        if (!state.isIdle() || gesture == GestureState::Idle) {
            return false;
        }
        state.gesture = gesture;
        state.startPoint = pos;
        state.hasStartPoint = true;
        state.targetId = 0;
        return true;
    }

    void endGesture() {
        state.gesture = GestureState::Idle;
        state.hasStartPoint = false;
        state.targetId = 0;
    }

    AnnotationLayer* layer() {
        return scene ? scene->layer() : nullptr;
    }

    void markDirty() {
        if (scene) {
            scene->markDirty();
        }
    }

    /**
     * @brief Request a repaint of the canvas.
     */
    void repaint() {
        if (requestRepaint) {
            requestRepaint();
        }
    }
};

#endif // TOOLCONTEXT_H
