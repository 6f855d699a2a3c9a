#ifndef TOOLID_H
#define TOOLID_H

/**
 * @brief Unified tool identifier enum.
 *
 * The active tool is chosen by the host; ToolManager only drives the
 * gesture inside whichever tool is active.
 */
enum class ToolId {
    // Selection tool (select, move, resize)
    Selection = 0,

    // Drawing tools (create AnnotationItems)
    Line,
    Arrow,
    Freehand,
    Rectangle,
    Ellipse,
    Triangle,
    Text,

    Count
};

#endif // TOOLID_H
