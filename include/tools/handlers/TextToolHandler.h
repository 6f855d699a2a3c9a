#ifndef TEXTTOOLHANDLER_H
#define TEXTTOOLHANDLER_H

#include "../IToolHandler.h"

#include <QString>

class ToolContext;

/**
 * @brief Text tool handler.
 *
 * Handles:
 * - Text creation when the Text tool is active
 * - Re-edit of an existing text item through beginReEdit()
 *
 * Both paths enter the TextEntry gesture and wait for the host to answer
 * through commitText(). ToolManager calls beginReEdit() on double click
 * while the Selection or Text tool is active.
 */
class TextToolHandler : public IToolHandler {
public:
    TextToolHandler() = default;
    ~TextToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Text; }

    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    bool cancelGesture(ToolContext* ctx) override;

    Qt::CursorShape cursor() const override { return Qt::IBeamCursor; }

    /**
     * @brief Start re-editing the topmost text item under pos.
     * @return false if no text item is hit or a gesture is already active
     */
    bool beginReEdit(ToolContext* ctx, const QPointF& pos);

    /**
     * @brief Complete the pending text entry.
     *
     * New entries create a text item at the press point when confirmed and
     * non-empty. Re-edits replace the content only when it changed.
     * The gesture always ends.
     * @return true if the scene changed
     */
    bool commitText(ToolContext* ctx, const QString& text, bool confirmed);
};

#endif // TEXTTOOLHANDLER_H
