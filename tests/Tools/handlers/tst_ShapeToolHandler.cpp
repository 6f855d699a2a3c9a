#include <QtTest/QtTest>
#include "tools/handlers/ShapeToolHandler.h"
#include "tools/ToolContext.h"
#include "annotation/AnnotationScene.h"

/**
 * @brief Tests for ShapeToolHandler class
 *
 * Covers:
 * - Tool identification per shape
 * - Live item inserted on press and updated on move
 * - Commit on release, including clicks without drag
 * - Cancellation
 * - Crosshair cursor
 */
class TestShapeToolHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Tool identification tests
    void testToolId();
    void testShapeTypeForTool();

    // Cursor tests
    void testCursor();

    // Mouse event tests
    void testOnMousePress_InsertsDegenerateShape();
    void testOnMouseMove_UpdatesNormalizedRect();
    void testOnMouseRelease_CommitsAndMarksDirty();
    void testOnMouseRelease_ClickWithoutDragKept();
    void testOnMousePress_IgnoredWhileGestureActive();
    void testUsesSceneDefaultStyle();
    void testTriangleFromRect();

    // Cancellation tests
    void testCancelGesture_RemovesItem();
    void testCancelGesture_WhenIdle();

private:
    ShapeToolHandler* m_handler = nullptr;
    ToolContext* m_context = nullptr;
    AnnotationScene* m_scene = nullptr;
    int m_repaintCount = 0;
};

void TestShapeToolHandler::init()
{
    m_handler = new ShapeToolHandler(ToolId::Rectangle);
    m_scene = new AnnotationScene();
    m_context = new ToolContext();
    m_context->scene = m_scene;
    m_repaintCount = 0;
    m_context->requestRepaint = [this]() { m_repaintCount++; };
}

void TestShapeToolHandler::cleanup()
{
    delete m_context;
    m_context = nullptr;
    delete m_scene;
    m_scene = nullptr;
    delete m_handler;
    m_handler = nullptr;
}

// ============================================================================
// Tool Identification Tests
// ============================================================================

void TestShapeToolHandler::testToolId()
{
    QCOMPARE(m_handler->toolId(), ToolId::Rectangle);
    QCOMPARE(ShapeToolHandler(ToolId::Ellipse).toolId(), ToolId::Ellipse);
    QCOMPARE(ShapeToolHandler(ToolId::Triangle).toolId(), ToolId::Triangle);
}

void TestShapeToolHandler::testShapeTypeForTool()
{
    QCOMPARE(m_handler->shapeType(), ShapeType::Rectangle);
    QCOMPARE(ShapeToolHandler(ToolId::Ellipse).shapeType(), ShapeType::Ellipse);
    QCOMPARE(ShapeToolHandler(ToolId::Triangle).shapeType(), ShapeType::Triangle);
}

void TestShapeToolHandler::testCursor()
{
    QCOMPARE(m_handler->cursor(), Qt::CrossCursor);
}

// ============================================================================
// Mouse Event Tests
// ============================================================================

void TestShapeToolHandler::testOnMousePress_InsertsDegenerateShape()
{
    m_handler->onMousePress(m_context, QPointF(40, 50));

    QCOMPARE(m_context->state.gesture, GestureState::Drawing);
    QCOMPARE(m_context->state.startPoint, QPointF(40, 50));
    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));

    AnnotationItem* item = m_scene->layer()->findItem(m_context->state.targetId);
    QVERIFY(item != nullptr);
    QCOMPARE(item->boundingBox(), QRectF(40, 50, 0, 0));
    QVERIFY(m_repaintCount > 0);
    QVERIFY(!m_scene->isDirty());
}

void TestShapeToolHandler::testOnMouseMove_UpdatesNormalizedRect()
{
    m_handler->onMousePress(m_context, QPointF(100, 100));
    m_handler->onMouseMove(m_context, QPointF(60, 130));

    AnnotationItem* item = m_scene->layer()->itemAt(0);
    QCOMPARE(item->boundingBox(), QRectF(60, 100, 40, 30));
}

void TestShapeToolHandler::testOnMouseRelease_CommitsAndMarksDirty()
{
    m_handler->onMousePress(m_context, QPointF(10, 10));
    m_handler->onMouseMove(m_context, QPointF(30, 30));
    m_handler->onMouseRelease(m_context, QPointF(50, 40));

    QVERIFY(m_context->state.isIdle());
    QVERIFY(!m_context->state.hasStartPoint);
    QVERIFY(m_scene->isDirty());
    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));
    QCOMPARE(m_scene->layer()->itemAt(0)->boundingBox(), QRectF(10, 10, 40, 30));
}

void TestShapeToolHandler::testOnMouseRelease_ClickWithoutDragKept()
{
    m_handler->onMousePress(m_context, QPointF(10, 10));
    m_handler->onMouseRelease(m_context, QPointF(10, 10));

    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));
    QCOMPARE(m_scene->layer()->itemAt(0)->boundingBox(), QRectF(10, 10, 0, 0));
}

void TestShapeToolHandler::testOnMousePress_IgnoredWhileGestureActive()
{
    m_handler->onMousePress(m_context, QPointF(10, 10));
    m_handler->onMousePress(m_context, QPointF(90, 90));

    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));
    QCOMPARE(m_context->state.startPoint, QPointF(10, 10));
}

void TestShapeToolHandler::testUsesSceneDefaultStyle()
{
    m_scene->setDefaultStyle(StrokeStyle(Qt::blue, 7.0));
    m_handler->onMousePress(m_context, QPointF(10, 10));

    const StrokeStyle style = m_scene->layer()->itemAt(0)->style();
    QCOMPARE(style.color(), QColor(Qt::blue));
    QCOMPARE(style.width(), 7.0);
}

void TestShapeToolHandler::testTriangleFromRect()
{
    ShapeToolHandler triangleHandler(ToolId::Triangle);
    triangleHandler.onMousePress(m_context, QPointF(0, 0));
    triangleHandler.onMouseRelease(m_context, QPointF(20, 10));

    auto* shape = dynamic_cast<ShapeAnnotation*>(m_scene->layer()->itemAt(0));
    QVERIFY(shape != nullptr);
    QCOMPARE(shape->kind(), AnnotationKind::Triangle);
    QCOMPARE(shape->triangleVertices()[0], QPointF(10, 0));
}

// ============================================================================
// Cancellation Tests
// ============================================================================

void TestShapeToolHandler::testCancelGesture_RemovesItem()
{
    m_handler->onMousePress(m_context, QPointF(10, 10));
    m_handler->onMouseMove(m_context, QPointF(50, 50));

    QVERIFY(m_handler->cancelGesture(m_context));
    QVERIFY(m_scene->layer()->isEmpty());
    QVERIFY(m_context->state.isIdle());
    QVERIFY(!m_scene->isDirty());
}

void TestShapeToolHandler::testCancelGesture_WhenIdle()
{
    QVERIFY(!m_handler->cancelGesture(m_context));
}

QTEST_MAIN(TestShapeToolHandler)
#include "tst_ShapeToolHandler.moc"
