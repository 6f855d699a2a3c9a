#include "tools/handlers/TextToolHandler.h"

#include "tools/ToolContext.h"
#include "annotations/AnnotationLayer.h"
#include "annotations/TextAnnotation.h"

#include <QDebug>
#include <memory>

void TextToolHandler::onMousePress(ToolContext* ctx, const QPointF& pos)
{
    if (!ctx->scene || !ctx->beginGesture(GestureState::TextEntry, pos)) {
        return;
    }

    // The gesture stays open until the host calls back with the text
    if (ctx->requestTextInput) {
        ctx->requestTextInput(pos);
    }
}

bool TextToolHandler::beginReEdit(ToolContext* ctx, const QPointF& pos)
{
    AnnotationLayer* layer = ctx->layer();
    if (!layer) {
        return false;
    }

    const int index = layer->hitTest(pos);
    if (index < 0) {
        return false;
    }

    auto* text = dynamic_cast<TextAnnotation*>(layer->itemAt(index));
    if (!text) {
        return false;
    }

    if (!ctx->beginGesture(GestureState::TextEntry, pos)) {
        return false;
    }
    ctx->state.targetId = text->id();
    layer->selectOnly(text);

    if (ctx->requestTextEdit) {
        ctx->requestTextEdit(text->position(), text->text());
    }
    ctx->repaint();
    return true;
}

bool TextToolHandler::commitText(ToolContext* ctx, const QString& text, bool confirmed)
{
    if (ctx->state.gesture != GestureState::TextEntry || !ctx->scene) {
        return false;
    }

    const quint64 targetId = ctx->state.targetId;
    const QPointF anchor = ctx->state.startPoint;
    ctx->endGesture();

    bool changed = false;
    if (targetId != 0) {
        changed = ctx->scene->editText(targetId, text, confirmed);
    } else if (confirmed && !text.isEmpty()) {
        AnnotationItem* item = ctx->layer()->addItem(std::make_unique<TextAnnotation>(
            anchor, text, ctx->scene->fontFamily(), ctx->scene->defaultStyle()
        ));
        ctx->layer()->selectOnly(item);
        ctx->markDirty();
        changed = true;
    } else {
        qDebug() << "TextToolHandler: Text entry dismissed";
    }

    ctx->repaint();
    return changed;
}

bool TextToolHandler::cancelGesture(ToolContext* ctx)
{
    if (ctx->state.gesture != GestureState::TextEntry) {
        return false;
    }

    ctx->endGesture();
    ctx->repaint();
    return true;
}
