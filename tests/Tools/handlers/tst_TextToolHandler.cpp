#include <QtTest/QtTest>
#include "tools/handlers/TextToolHandler.h"
#include "tools/ToolContext.h"
#include "annotation/AnnotationScene.h"
#include "annotations/TextAnnotation.h"
#include "annotations/ShapeAnnotation.h"

/**
 * @brief Tests for TextToolHandler class
 *
 * Covers:
 * - Text entry request on press
 * - Creation, dismissal and empty input
 * - Double-click re-edit of existing text
 * - Cancellation
 */
class TestTextToolHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Tool identification tests
    void testToolId();
    void testCursor();

    // Creation tests
    void testPress_RequestsTextInput();
    void testCommit_CreatesSelectedText();
    void testCommit_EmptyTextCreatesNothing();
    void testCommit_DismissedCreatesNothing();
    void testCommit_WithoutPendingEntry();
    void testCommit_UsesSceneFont();

    // Re-edit tests
    void testReEdit_RequestsEditWithCurrentText();
    void testReEdit_ReplacesText();
    void testReEdit_UnchangedTextKeepsClean();
    void testReEdit_DismissedKeepsText();
    void testReEdit_IgnoresNonTextItems();

    // Cancellation tests
    void testCancelGesture();

private:
    TextAnnotation* addText(const QPointF& pos, const QString& text);

    TextToolHandler* m_handler = nullptr;
    ToolContext* m_context = nullptr;
    AnnotationScene* m_scene = nullptr;

    int m_inputRequests = 0;
    QPointF m_lastInputPos;
    int m_editRequests = 0;
    QString m_lastEditText;
};

void TestTextToolHandler::init()
{
    m_handler = new TextToolHandler();
    m_scene = new AnnotationScene();
    m_context = new ToolContext();
    m_context->scene = m_scene;

    m_inputRequests = 0;
    m_editRequests = 0;
    m_lastEditText.clear();
    m_context->requestTextInput = [this](const QPointF& pos) {
        m_inputRequests++;
        m_lastInputPos = pos;
    };
    m_context->requestTextEdit = [this](const QPointF&, const QString& text) {
        m_editRequests++;
        m_lastEditText = text;
    };
}

void TestTextToolHandler::cleanup()
{
    delete m_context;
    m_context = nullptr;
    delete m_scene;
    m_scene = nullptr;
    delete m_handler;
    m_handler = nullptr;
}

TextAnnotation* TestTextToolHandler::addText(const QPointF& pos, const QString& text)
{
    AnnotationItem* item = m_scene->layer()->addItem(std::make_unique<TextAnnotation>(
        pos, text, QStringLiteral("Sans Serif"), StrokeStyle()));
    return static_cast<TextAnnotation*>(item);
}

// ============================================================================
// Tool Identification Tests
// ============================================================================

void TestTextToolHandler::testToolId()
{
    QCOMPARE(m_handler->toolId(), ToolId::Text);
}

void TestTextToolHandler::testCursor()
{
    QCOMPARE(m_handler->cursor(), Qt::IBeamCursor);
}

// ============================================================================
// Creation Tests
// ============================================================================

void TestTextToolHandler::testPress_RequestsTextInput()
{
    m_handler->onMousePress(m_context, QPointF(30, 40));

    QCOMPARE(m_inputRequests, 1);
    QCOMPARE(m_lastInputPos, QPointF(30, 40));
    QCOMPARE(m_context->state.gesture, GestureState::TextEntry);
    QVERIFY(m_scene->layer()->isEmpty());
}

void TestTextToolHandler::testCommit_CreatesSelectedText()
{
    m_handler->onMousePress(m_context, QPointF(30, 40));
    QVERIFY(m_handler->commitText(m_context, QStringLiteral("Hello"), true));

    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));
    auto* text = dynamic_cast<TextAnnotation*>(m_scene->layer()->itemAt(0));
    QVERIFY(text != nullptr);
    QCOMPARE(text->text(), QStringLiteral("Hello"));
    QCOMPARE(text->position(), QPointF(30, 40));
    QVERIFY(text->isSelected());
    QVERIFY(m_scene->isDirty());
    QVERIFY(m_context->state.isIdle());
}

void TestTextToolHandler::testCommit_EmptyTextCreatesNothing()
{
    m_handler->onMousePress(m_context, QPointF(30, 40));
    QVERIFY(!m_handler->commitText(m_context, QString(), true));

    QVERIFY(m_scene->layer()->isEmpty());
    QVERIFY(!m_scene->isDirty());
    QVERIFY(m_context->state.isIdle());
}

void TestTextToolHandler::testCommit_DismissedCreatesNothing()
{
    m_handler->onMousePress(m_context, QPointF(30, 40));
    QVERIFY(!m_handler->commitText(m_context, QStringLiteral("ignored"), false));

    QVERIFY(m_scene->layer()->isEmpty());
    QVERIFY(m_context->state.isIdle());
}

void TestTextToolHandler::testCommit_WithoutPendingEntry()
{
    QVERIFY(!m_handler->commitText(m_context, QStringLiteral("Hello"), true));
    QVERIFY(m_scene->layer()->isEmpty());
}

void TestTextToolHandler::testCommit_UsesSceneFont()
{
    m_scene->setFontFamily(QStringLiteral("Serif"));
    m_scene->setDefaultStyle(StrokeStyle(Qt::green, 4.0));

    m_handler->onMousePress(m_context, QPointF(0, 0));
    m_handler->commitText(m_context, QStringLiteral("A"), true);

    auto* text = dynamic_cast<TextAnnotation*>(m_scene->layer()->itemAt(0));
    QVERIFY(text != nullptr);
    QCOMPARE(text->fontFamily(), QStringLiteral("Serif"));
    QCOMPARE(text->color(), QColor(Qt::green));
    QCOMPARE(text->pointSize(), 12.0);
}

// ============================================================================
// Re-edit Tests
// ============================================================================

void TestTextToolHandler::testReEdit_RequestsEditWithCurrentText()
{
    TextAnnotation* text = addText(QPointF(100, 100), QStringLiteral("Before"));
    const QPointF inside = text->boundingBox().center();

    QVERIFY(m_handler->beginReEdit(m_context, inside));

    QCOMPARE(m_editRequests, 1);
    QCOMPARE(m_lastEditText, QStringLiteral("Before"));
    QCOMPARE(m_context->state.gesture, GestureState::TextEntry);
    QCOMPARE(m_context->state.targetId, text->id());
    QVERIFY(text->isSelected());
}

void TestTextToolHandler::testReEdit_ReplacesText()
{
    TextAnnotation* text = addText(QPointF(100, 100), QStringLiteral("Before"));

    QVERIFY(m_handler->beginReEdit(m_context, text->boundingBox().center()));
    QVERIFY(m_handler->commitText(m_context, QStringLiteral("After"), true));

    QCOMPARE(text->text(), QStringLiteral("After"));
    QCOMPARE(m_scene->layer()->itemCount(), size_t(1));
    QVERIFY(m_scene->isDirty());
}

void TestTextToolHandler::testReEdit_UnchangedTextKeepsClean()
{
    TextAnnotation* text = addText(QPointF(100, 100), QStringLiteral("Same"));

    QVERIFY(m_handler->beginReEdit(m_context, text->boundingBox().center()));
    QVERIFY(!m_handler->commitText(m_context, QStringLiteral("Same"), true));
    QVERIFY(!m_scene->isDirty());
}

void TestTextToolHandler::testReEdit_DismissedKeepsText()
{
    TextAnnotation* text = addText(QPointF(100, 100), QStringLiteral("Keep"));

    QVERIFY(m_handler->beginReEdit(m_context, text->boundingBox().center()));
    QVERIFY(!m_handler->commitText(m_context, QString(), true));

    QCOMPARE(text->text(), QStringLiteral("Keep"));
    QVERIFY(m_context->state.isIdle());
}

void TestTextToolHandler::testReEdit_IgnoresNonTextItems()
{
    m_scene->layer()->addItem(std::make_unique<ShapeAnnotation>(
        QRectF(0, 0, 100, 100), ShapeType::Rectangle, StrokeStyle()));

    QVERIFY(!m_handler->beginReEdit(m_context, QPointF(0, 50)));
    QVERIFY(!m_handler->beginReEdit(m_context, QPointF(500, 500)));
    QCOMPARE(m_editRequests, 0);
    QVERIFY(m_context->state.isIdle());
}

// ============================================================================
// Cancellation Tests
// ============================================================================

void TestTextToolHandler::testCancelGesture()
{
    QVERIFY(!m_handler->cancelGesture(m_context));

    m_handler->onMousePress(m_context, QPointF(30, 40));
    QVERIFY(m_handler->cancelGesture(m_context));
    QVERIFY(m_context->state.isIdle());
    QVERIFY(m_scene->layer()->isEmpty());
}

QTEST_MAIN(TestTextToolHandler)
#include "tst_TextToolHandler.moc"
