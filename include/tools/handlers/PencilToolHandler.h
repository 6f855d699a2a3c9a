#ifndef PENCILTOOLHANDLER_H
#define PENCILTOOLHANDLER_H

#include "../IToolHandler.h"
#include "annotations/PencilStroke.h"

#include <QPointF>

/**
 * @brief Tool handler for freehand pencil drawing.
 */
class PencilToolHandler : public IToolHandler {
public:
    PencilToolHandler() = default;
    ~PencilToolHandler() override = default;

    ToolId toolId() const override { return ToolId::Freehand; }

    void onMousePress(ToolContext* ctx, const QPointF& pos) override;
    void onMouseMove(ToolContext* ctx, const QPointF& pos) override;
    void onMouseRelease(ToolContext* ctx, const QPointF& pos) override;
    bool cancelGesture(ToolContext* ctx) override;


private:
    PencilStroke* currentStroke(ToolContext* ctx) const;
};

#endif // PENCILTOOLHANDLER_H
