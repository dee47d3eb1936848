#include <QtTest/QtTest>

#include "planner/interaction/ExternalDragBridge.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"
#include "support/FakeViewportMetrics.hpp"

using namespace planner::interaction;
using planner::data::Block;
using planner::data::BlockType;
using planner::testing::FakeViewportMetrics;

namespace {

constexpr double Ppm = 1920.0 / 1440.0;

QVector<QDate> weekOf(const QDate &monday)
{
    QVector<QDate> dates;
    for (int i = 0; i < 7; ++i) {
        dates << monday.addDays(i);
    }
    return dates;
}

DragItem goalItem()
{
    DragItem item;
    item.type = BlockType::Goal;
    item.goalId = QStringLiteral("goal-fitness");
    item.goalLabel = QStringLiteral("Fitness");
    item.goalColor = QColor(Qt::darkGreen);
    return item;
}

DragItem taskItem()
{
    DragItem item;
    item.type = BlockType::Task;
    item.goalId = QStringLiteral("goal-fitness");
    item.taskId = QStringLiteral("task-run");
    item.taskLabel = QStringLiteral("Laufen");
    return item;
}

struct Drop
{
    DragItem item;
    DropPosition position;
    QVector<QDate> dates;
};

struct Fixture
{
    FakeViewportMetrics metrics;
    GridGeometryProvider provider{ metrics };
    PlacementEngine engine{ provider };
    DragSession session;
    ExternalDragBridge bridge{ session, engine };
    QVector<Drop> drops;
    bool datesAccepted = false;

    Fixture()
    {
        datesAccepted = bridge.setWeekDates(weekOf(QDate(2026, 10, 12)));
        QObject::connect(&bridge,
                         &ExternalDragBridge::externalDropped,
                         [this](const DragItem &item, const DropPosition &position, const QVector<QDate> &dates) {
                             drops.push_back({ item, position, dates });
                         });
    }

    void dragTo(const DragItem &item, const QPointF &target)
    {
        QVERIFY(bridge.beginExternalDrag(item, { QPointF(-300, 200), Qt::NoModifier }));
        session.pointerMoved({ target, Qt::NoModifier });
        session.pointerReleased({ target, Qt::NoModifier });
    }
};

} // namespace

class ExternalDragBridgeTest : public QObject
{
    Q_OBJECT

private slots:
    void rejectsInvalidWeekDates();
    void beginMarksItemExternal();
    void ghostCentresItem();
    void dropOnGridHandsOverDates();
    void dropOutsideViewportIsIgnored();
    void dropOnHeaderTargetsDay();
    void scrolledHeaderStaysHeader();
    void taskDropOnMatchingBlock();
    void dropWithoutWeekDatesIsIgnored();
};

void ExternalDragBridgeTest::rejectsInvalidWeekDates()
{
    Fixture f;
    QVERIFY(f.datesAccepted);
    const QVector<QDate> valid = f.bridge.weekDates();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("week needs 7 dates")));
    QVERIFY(!f.bridge.setWeekDates(valid.mid(0, 5)));

    QVector<QDate> gap = valid;
    gap[3] = gap[3].addDays(1);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("not consecutive")));
    QVERIFY(!f.bridge.setWeekDates(gap));

    QCOMPARE(f.bridge.weekDates(), valid);
}

void ExternalDragBridgeTest::beginMarksItemExternal()
{
    Fixture f;
    DragItem item = taskItem();
    item.source = DragSource::ExistingBlock;
    item.gesture = DragGesture::Move;

    QVERIFY(f.bridge.beginExternalDrag(item, { QPointF(10, 10), Qt::NoModifier }));
    QVERIFY(f.session.isPending());
    QCOMPARE(f.session.item()->source, DragSource::External);
    QCOMPARE(f.session.item()->gesture, DragGesture::Place);
    QCOMPARE(f.session.item()->grabOffsetMinutes, 15.0);

    QVERIFY(!f.bridge.beginExternalDrag(goalItem(), { QPointF(10, 10), Qt::NoModifier }));
}

void ExternalDragBridgeTest::ghostCentresItem()
{
    Fixture f;
    int changes = 0;
    connect(&f.bridge, &ExternalDragBridge::previewChanged, this, [&changes] { ++changes; });

    QVERIFY(f.bridge.beginExternalDrag(goalItem(), { QPointF(-300, 200), Qt::NoModifier }));
    QVERIFY(!f.bridge.preview());

    f.session.pointerMoved({ QPointF(260, 630 * Ppm), Qt::NoModifier });
    const auto ghost = f.bridge.preview();
    QVERIFY(ghost.has_value());
    QCOMPARE(ghost->dayIndex, 2);
    QCOMPARE(ghost->startMinutes, 600);
    QCOMPARE(ghost->durationMinutes, 60);
    QCOMPARE(ghost->title, QStringLiteral("Fitness"));
    QCOMPARE(ghost->color, QColor(Qt::darkGreen));
    QVERIFY(changes > 0);

    f.session.cancel();
    QVERIFY(!f.bridge.preview());
    QVERIFY(f.drops.isEmpty());
}

void ExternalDragBridgeTest::dropOnGridHandsOverDates()
{
    Fixture f;
    Block busy;
    busy.dayIndex = 4;
    busy.startMinutes = 620;
    f.engine.setBlocks({ busy });

    f.dragTo(goalItem(), QPointF(460, 600 * Ppm));

    QCOMPARE(f.drops.size(), 1);
    const Drop &drop = f.drops.first();
    QCOMPARE(drop.item.source, DragSource::External);
    QCOMPARE(drop.position.target, DropTarget::TimeGrid);
    QCOMPARE(drop.position.dayIndex, 4);
    QCOMPARE(drop.position.startMinutes, std::optional<int>(570));
    QCOMPARE(drop.position.adaptiveDuration, std::optional<int>(50));
    QCOMPARE(drop.dates.size(), 7);
    QCOMPARE(drop.dates.at(drop.position.dayIndex), QDate(2026, 10, 16));
}

void ExternalDragBridgeTest::dropOutsideViewportIsIgnored()
{
    Fixture f;
    f.metrics.setViewportRect(QRectF(0, -40, 760, 800));

    f.dragTo(goalItem(), QPointF(-120, 300));
    QVERIFY(f.drops.isEmpty());
    QVERIFY(f.session.isIdle());
}

void ExternalDragBridgeTest::dropOnHeaderTargetsDay()
{
    Fixture f;
    f.dragTo(taskItem(), QPointF(660, -20));

    QCOMPARE(f.drops.size(), 1);
    QCOMPARE(f.drops.first().position.target, DropTarget::DayHeader);
    QCOMPARE(f.drops.first().position.dayIndex, 6);
    QVERIFY(!f.drops.first().position.startMinutes);
}

void ExternalDragBridgeTest::scrolledHeaderStaysHeader()
{
    Fixture f;
    f.metrics.setScrolledHeader(40.0, 500.0);

    f.dragTo(goalItem(), QPointF(300, 20));
    QCOMPARE(f.drops.size(), 1);
    QCOMPARE(f.drops.first().position.target, DropTarget::DayHeader);
    QCOMPARE(f.drops.first().position.dayIndex, 2);

    // Below the header the body is scrolled: 300 - 40 + 500 = 760 px = 570 min.
    f.dragTo(goalItem(), QPointF(300, 300));
    QCOMPARE(f.drops.size(), 2);
    QCOMPARE(f.drops.last().position.target, DropTarget::TimeGrid);
    QCOMPARE(f.drops.last().position.startMinutes, std::optional<int>(540));
}

void ExternalDragBridgeTest::taskDropOnMatchingBlock()
{
    Fixture f;
    Block goalBlock;
    goalBlock.dayIndex = 1;
    goalBlock.startMinutes = 480;
    goalBlock.durationMinutes = 120;
    goalBlock.goalId = QStringLiteral("goal-fitness");
    f.engine.setBlocks({ goalBlock });

    f.dragTo(taskItem(), QPointF(160, 540 * Ppm));

    QCOMPARE(f.drops.size(), 1);
    QCOMPARE(f.drops.first().position.target, DropTarget::ExistingBlock);
    QCOMPARE(f.drops.first().position.targetBlockId, goalBlock.id);
}

void ExternalDragBridgeTest::dropWithoutWeekDatesIsIgnored()
{
    FakeViewportMetrics metrics;
    GridGeometryProvider provider(metrics);
    PlacementEngine engine(provider);
    DragSession session;
    ExternalDragBridge bridge(session, engine);
    int drops = 0;
    connect(&bridge, &ExternalDragBridge::externalDropped, this, [&drops] { ++drops; });

    QVERIFY(bridge.beginExternalDrag(goalItem(), { QPointF(-300, 200), Qt::NoModifier }));
    session.pointerMoved({ QPointF(300, 600), Qt::NoModifier });
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("week dates not set")));
    session.pointerReleased({ QPointF(300, 600), Qt::NoModifier });
    QCOMPARE(drops, 0);
}

QTEST_GUILESS_MAIN(ExternalDragBridgeTest)
#include "ExternalDragBridgeTest.moc"
