#include <QtTest/QtTest>
#include <QSignalSpy>
#include "annotations/AnnotationLayer.h"
#include "annotations/ArrowAnnotation.h"
#include "annotations/ShapeAnnotation.h"

/**
 * @brief Tests for AnnotationLayer class
 *
 * Covers:
 * - Identity assignment and lookup
 * - Paint order and topmost hit-testing
 * - Selection helpers, including rubber-band selection
 * - Removal of selected items
 */
class TestAnnotationLayer : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Item management tests
    void testAddItem_AssignsIncreasingIds();
    void testAddItem_NullIgnored();
    void testFindItem_AndIndexOf();
    void testTakeItem_RemovesAndReturns();
    void testTakeItem_UnknownId();
    void testClear();

    // Hit-testing tests
    void testHitTest_TopmostWins();
    void testHitTest_Miss();

    // Selection tests
    void testSelectOnly();
    void testSetItemSelected_Toggle();
    void testClearSelection_EmitsOnlyOnChange();
    void testSelectIntersecting_ReplacesSelection();
    void testSelectIntersecting_Additive();
    void testSelectIntersecting_HorizontalLine();
    void testSelectIntersecting_BandCrossesFlatLine_data();
    void testSelectIntersecting_BandCrossesFlatLine();

    // Removal tests
    void testRemoveSelectedItems();
    void testRemoveSelectedItems_NothingSelected();

private:
    std::unique_ptr<AnnotationItem> makeLine(const QPointF& p1, const QPointF& p2) const;
    std::unique_ptr<AnnotationItem> makeRect(const QRectF& rect) const;

    AnnotationLayer* m_layer = nullptr;
};

void TestAnnotationLayer::init()
{
    m_layer = new AnnotationLayer();
}

void TestAnnotationLayer::cleanup()
{
    delete m_layer;
    m_layer = nullptr;
}

std::unique_ptr<AnnotationItem> TestAnnotationLayer::makeLine(const QPointF& p1,
                                                              const QPointF& p2) const
{
    return std::make_unique<ArrowAnnotation>(p1, p2, StrokeStyle(), LineEndStyle::None);
}

std::unique_ptr<AnnotationItem> TestAnnotationLayer::makeRect(const QRectF& rect) const
{
    return std::make_unique<ShapeAnnotation>(rect, ShapeType::Rectangle, StrokeStyle());
}

// ============================================================================
// Item Management Tests
// ============================================================================

void TestAnnotationLayer::testAddItem_AssignsIncreasingIds()
{
    QSignalSpy spy(m_layer, &AnnotationLayer::changed);

    AnnotationItem* first = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    AnnotationItem* second = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));

    QVERIFY(first != nullptr);
    QVERIFY(second != nullptr);
    QVERIFY(first->id() != 0);
    QVERIFY(second->id() > first->id());
    QCOMPARE(m_layer->itemCount(), size_t(2));
    QCOMPARE(spy.count(), 2);
}

void TestAnnotationLayer::testAddItem_NullIgnored()
{
    QVERIFY(m_layer->addItem(nullptr) == nullptr);
    QVERIFY(m_layer->isEmpty());
}

void TestAnnotationLayer::testFindItem_AndIndexOf()
{
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    AnnotationItem* second = m_layer->addItem(makeRect(QRectF(0, 0, 5, 5)));

    QCOMPARE(m_layer->findItem(second->id()), second);
    QCOMPARE(m_layer->indexOf(second->id()), 1);
    QCOMPARE(m_layer->indexOf(9999), -1);
    QVERIFY(m_layer->findItem(9999) == nullptr);
}

void TestAnnotationLayer::testTakeItem_RemovesAndReturns()
{
    AnnotationItem* item = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    const quint64 id = item->id();
    m_layer->selectOnly(item);

    std::unique_ptr<AnnotationItem> taken = m_layer->takeItem(id);
    QVERIFY(taken != nullptr);
    QCOMPARE(taken->id(), id);
    QVERIFY(!taken->isSelected());
    QVERIFY(m_layer->isEmpty());
}

void TestAnnotationLayer::testTakeItem_UnknownId()
{
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));

    QVERIFY(m_layer->takeItem(12345) == nullptr);
    QCOMPARE(m_layer->itemCount(), size_t(1));
}

void TestAnnotationLayer::testClear()
{
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    m_layer->addItem(makeRect(QRectF(0, 0, 5, 5)));

    m_layer->clear();
    QVERIFY(m_layer->isEmpty());
    QVERIFY(!m_layer->hasSelection());
}

// ============================================================================
// Hit-Testing Tests
// ============================================================================

void TestAnnotationLayer::testHitTest_TopmostWins()
{
    m_layer->addItem(makeLine(QPointF(0, 50), QPointF(100, 50)));
    m_layer->addItem(makeLine(QPointF(50, 0), QPointF(50, 100)));

    // Both lines pass through (50, 50); the later one is on top
    QCOMPARE(m_layer->hitTest(QPointF(50, 50)), 1);
    QCOMPARE(m_layer->hitTest(QPointF(5, 50)), 0);
}

void TestAnnotationLayer::testHitTest_Miss()
{
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 0)));

    QCOMPARE(m_layer->hitTest(QPointF(500, 500)), -1);
}

// ============================================================================
// Selection Tests
// ============================================================================

void TestAnnotationLayer::testSelectOnly()
{
    AnnotationItem* a = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    AnnotationItem* b = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    m_layer->setItemSelected(a, true);

    QSignalSpy spy(m_layer, &AnnotationLayer::selectionChanged);
    m_layer->selectOnly(b);

    QVERIFY(!a->isSelected());
    QVERIFY(b->isSelected());
    QCOMPARE(m_layer->selectedCount(), size_t(1));
    QCOMPARE(spy.count(), 1);
}

void TestAnnotationLayer::testSetItemSelected_Toggle()
{
    AnnotationItem* a = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    AnnotationItem* b = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));

    m_layer->setItemSelected(a, true);
    m_layer->setItemSelected(b, true);
    QCOMPARE(m_layer->selectedCount(), size_t(2));

    m_layer->setItemSelected(a, false);
    QCOMPARE(m_layer->selectedCount(), size_t(1));
    QCOMPARE(m_layer->selectedItems().front(), b);
}

void TestAnnotationLayer::testClearSelection_EmitsOnlyOnChange()
{
    AnnotationItem* a = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    QSignalSpy spy(m_layer, &AnnotationLayer::selectionChanged);

    m_layer->clearSelection();
    QCOMPARE(spy.count(), 0);

    m_layer->setItemSelected(a, true);
    m_layer->clearSelection();
    QCOMPARE(spy.count(), 2);
    QVERIFY(!m_layer->hasSelection());
}

void TestAnnotationLayer::testSelectIntersecting_ReplacesSelection()
{
    AnnotationItem* inside = m_layer->addItem(makeRect(QRectF(10, 10, 20, 20)));
    AnnotationItem* outside = m_layer->addItem(makeRect(QRectF(200, 200, 20, 20)));
    m_layer->setItemSelected(outside, true);

    m_layer->selectIntersecting(QRectF(QPointF(50, 50), QPointF(0, 0)));

    QVERIFY(inside->isSelected());
    QVERIFY(!outside->isSelected());
}

void TestAnnotationLayer::testSelectIntersecting_Additive()
{
    AnnotationItem* inside = m_layer->addItem(makeRect(QRectF(10, 10, 20, 20)));
    AnnotationItem* outside = m_layer->addItem(makeRect(QRectF(200, 200, 20, 20)));
    m_layer->setItemSelected(outside, true);

    m_layer->selectIntersecting(QRectF(0, 0, 50, 50), true);

    QVERIFY(inside->isSelected());
    QVERIFY(outside->isSelected());
}

void TestAnnotationLayer::testSelectIntersecting_HorizontalLine()
{
    AnnotationItem* line = m_layer->addItem(makeLine(QPointF(10, 20), QPointF(40, 20)));

    m_layer->selectIntersecting(QRectF(0, 0, 100, 100));
    QVERIFY(line->isSelected());
}

void TestAnnotationLayer::testSelectIntersecting_BandCrossesFlatLine_data()
{
    QTest::addColumn<QPointF>("p1");
    QTest::addColumn<QPointF>("p2");
    QTest::addColumn<QRectF>("band");
    QTest::addColumn<bool>("selected");

    QTest::newRow("horizontal crossed") << QPointF(0, 50) << QPointF(200, 50)
                                        << QRectF(90, 0, 20, 100) << true;
    QTest::newRow("vertical crossed") << QPointF(50, 0) << QPointF(50, 200)
                                      << QRectF(0, 90, 100, 20) << true;
    QTest::newRow("horizontal missed") << QPointF(0, 50) << QPointF(200, 50)
                                       << QRectF(90, 60, 20, 40) << false;
    QTest::newRow("horizontal beside band") << QPointF(0, 50) << QPointF(80, 50)
                                            << QRectF(90, 0, 20, 100) << false;
}

void TestAnnotationLayer::testSelectIntersecting_BandCrossesFlatLine()
{
    QFETCH(QPointF, p1);
    QFETCH(QPointF, p2);
    QFETCH(QRectF, band);
    QFETCH(bool, selected);

    AnnotationItem* line = m_layer->addItem(makeLine(p1, p2));

    m_layer->selectIntersecting(band);
    QCOMPARE(line->isSelected(), selected);
}

// ============================================================================
// Removal Tests
// ============================================================================

void TestAnnotationLayer::testRemoveSelectedItems()
{
    AnnotationItem* a = m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    AnnotationItem* c = m_layer->addItem(makeRect(QRectF(0, 0, 5, 5)));
    m_layer->setItemSelected(a, true);
    m_layer->setItemSelected(c, true);

    QCOMPARE(m_layer->removeSelectedItems(), size_t(2));
    QCOMPARE(m_layer->itemCount(), size_t(1));
    QVERIFY(!m_layer->hasSelection());
}

void TestAnnotationLayer::testRemoveSelectedItems_NothingSelected()
{
    m_layer->addItem(makeLine(QPointF(0, 0), QPointF(10, 10)));
    QSignalSpy spy(m_layer, &AnnotationLayer::changed);

    QCOMPARE(m_layer->removeSelectedItems(), size_t(0));
    QCOMPARE(spy.count(), 0);
}

QTEST_MAIN(TestAnnotationLayer)
#include "tst_AnnotationLayer.moc"
