#include <QtTest/QtTest>

#include <algorithm>

#include "planner/core/ScheduleController.hpp"
#include "planner/core/UndoStack.hpp"
#include "planner/data/InMemoryBlockRepository.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"
#include "planner/interaction/ResizeInteraction.hpp"
#include "support/FakeViewportMetrics.hpp"

using namespace planner;
using planner::data::Block;

namespace {

constexpr double Ppm = 1920.0 / 1440.0;

Block makeBlock(int day, int start, int duration)
{
    Block block;
    block.title = QStringLiteral("Planung");
    block.dayIndex = day;
    block.startMinutes = start;
    block.durationMinutes = duration;
    block.goalId = QStringLiteral("goal-work");
    return block;
}

QVector<QDate> week()
{
    QVector<QDate> dates;
    for (int i = 0; i < 7; ++i) {
        dates << QDate(2026, 10, 12).addDays(i);
    }
    return dates;
}

interaction::DragItem backlogTask()
{
    interaction::DragItem item;
    item.type = data::BlockType::Task;
    item.goalId = QStringLiteral("goal-work");
    item.goalLabel = QStringLiteral("Arbeit");
    item.goalColor = QColor(Qt::blue);
    item.taskId = QStringLiteral("task-report");
    item.taskLabel = QStringLiteral("Bericht");
    return item;
}

QVector<QtMsgType> scheduleMessages;

void recordScheduleMessage(QtMsgType type, const QMessageLogContext &context, const QString &)
{
    if (qstrcmp(context.category, "planner.schedule") == 0) {
        scheduleMessages << type;
    }
}

} // namespace

class ScheduleControllerTest : public QObject
{
    Q_OBJECT

private slots:
    void moveIsUndoable();
    void moveWithoutChangeIsSkipped();
    void unknownBlockIsReported();
    void duplicateAddsCopy();
    void createAddsNewBlock();
    void resizeRecordsOneEntry();
    void resizeEscapeLeavesNoEntry();
    void externalGridDropCreatesBlock();
    void externalBlockDropAssignsTask();
    void externalHeaderDropRequestsDeadline();
    void deadlineTraceIsDebugOnly();
};

void ScheduleControllerTest::moveIsUndoable()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(0, 540, 60));

    int changes = 0;
    connect(&controller, &core::ScheduleController::blocksChanged, this, [&changes] { ++changes; });

    QVERIFY(controller.moveBlock(block.id, 2, 600, 30));
    QCOMPARE(changes, 1);
    QCOMPARE(undoStack.undoText(), QStringLiteral("Block verschieben"));
    auto moved = repository.findById(block.id);
    QVERIFY(moved.has_value());
    QCOMPARE(moved->dayIndex, 2);
    QCOMPARE(moved->startMinutes, 600);
    QCOMPARE(moved->durationMinutes, 30);

    undoStack.undo();
    moved = repository.findById(block.id);
    QCOMPARE(moved->dayIndex, 0);
    QCOMPARE(moved->startMinutes, 540);
    QCOMPARE(moved->durationMinutes, 60);

    undoStack.redo();
    QCOMPARE(repository.findById(block.id)->startMinutes, 600);
    QCOMPARE(changes, 3);
}

void ScheduleControllerTest::moveWithoutChangeIsSkipped()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(3, 600, 60));

    QVERIFY(!controller.moveBlock(block.id, 3, 600, 60));
    QCOMPARE(undoStack.count(), std::size_t(0));
}

void ScheduleControllerTest::unknownBlockIsReported()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("move ignored, unknown block")));
    QVERIFY(!controller.moveBlock(QUuid::createUuid(), 1, 60, 60));
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("duplicate ignored, unknown block")));
    QVERIFY(!controller.duplicateBlock(QUuid::createUuid(), 1, 60));
    QVERIFY(!undoStack.canUndo());
}

void ScheduleControllerTest::duplicateAddsCopy()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(0, 540, 90));

    QVERIFY(controller.duplicateBlock(block.id, 4, 720));
    const auto blocks = controller.blocks();
    QCOMPARE(blocks.size(), std::size_t(2));

    const auto copy = std::find_if(blocks.begin(), blocks.end(), [&block](const Block &b) { return b.id != block.id; });
    QVERIFY(copy != blocks.end());
    QCOMPARE(copy->title, block.title);
    QCOMPARE(copy->dayIndex, 4);
    QCOMPARE(copy->startMinutes, 720);
    QCOMPARE(copy->durationMinutes, 90);
    QCOMPARE(repository.findById(block.id)->startMinutes, 540);

    undoStack.undo();
    QCOMPARE(controller.blocks().size(), std::size_t(1));
}

void ScheduleControllerTest::createAddsNewBlock()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);

    QVERIFY(controller.createBlock(5, 1425, 60));
    const auto blocks = controller.blocks();
    QCOMPARE(blocks.size(), std::size_t(1));
    QCOMPARE(blocks.front().title, QStringLiteral("Neuer Block"));
    QCOMPARE(blocks.front().dayIndex, 5);
    QVERIFY(blocks.front().endMinutes() <= data::MinutesPerDay);
    QCOMPARE(undoStack.undoText(), QStringLiteral("Block anlegen"));
}

void ScheduleControllerTest::resizeRecordsOneEntry()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(1, 600, 90));

    testing::FakeViewportMetrics metrics;
    interaction::GridGeometryProvider provider(metrics);
    interaction::PlacementEngine engine(provider);
    interaction::DragSession session;
    interaction::ResizeInteraction resize(session, engine);
    controller.attach(resize);

    const double bottomY = 690 * Ppm;
    QVERIFY(resize.beginResize(block, interaction::ResizeEdge::Bottom, { QPointF(200, bottomY), Qt::NoModifier }));
    session.pointerMoved({ QPointF(200, bottomY + 30 * Ppm), Qt::NoModifier });
    QVERIFY(controller.isResizing(block.id));
    QCOMPARE(repository.findById(block.id)->durationMinutes, 120);
    session.pointerMoved({ QPointF(200, bottomY + 60 * Ppm), Qt::NoModifier });
    QCOMPARE(repository.findById(block.id)->durationMinutes, 150);
    QVERIFY(!undoStack.canUndo());

    session.pointerReleased({ QPointF(200, bottomY + 60 * Ppm), Qt::NoModifier });
    QVERIFY(!controller.isResizing(block.id));
    QCOMPARE(undoStack.count(), std::size_t(1));
    QCOMPARE(undoStack.undoText(), QStringLiteral("Blockdauer ändern"));

    undoStack.undo();
    QCOMPARE(repository.findById(block.id)->durationMinutes, 90);
    undoStack.redo();
    QCOMPARE(repository.findById(block.id)->durationMinutes, 150);
}

void ScheduleControllerTest::resizeEscapeLeavesNoEntry()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(1, 600, 90));

    testing::FakeViewportMetrics metrics;
    interaction::GridGeometryProvider provider(metrics);
    interaction::PlacementEngine engine(provider);
    interaction::DragSession session;
    interaction::ResizeInteraction resize(session, engine);
    controller.attach(resize);

    QVERIFY(resize.beginResize(block, interaction::ResizeEdge::Top, { QPointF(200, 800), Qt::NoModifier }));
    session.pointerMoved({ QPointF(200, 800 - 60 * Ppm), Qt::NoModifier });
    QCOMPARE(repository.findById(block.id)->startMinutes, 540);

    QVERIFY(session.keyPressed(Qt::Key_Escape));
    QCOMPARE(repository.findById(block.id)->startMinutes, 600);
    QCOMPARE(repository.findById(block.id)->durationMinutes, 90);
    QVERIFY(!controller.isResizing(block.id));
    QVERIFY(!undoStack.canUndo());
}

void ScheduleControllerTest::externalGridDropCreatesBlock()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);

    interaction::DragItem item = backlogTask();
    item.source = interaction::DragSource::External;
    interaction::DropPosition position;
    position.dayIndex = 3;
    position.startMinutes = 480;
    position.adaptiveDuration = 20;

    QVERIFY(controller.placeExternal(item, position, week()));
    const auto blocks = controller.blocks();
    QCOMPARE(blocks.size(), std::size_t(1));
    QCOMPARE(blocks.front().title, QStringLiteral("Bericht"));
    QCOMPARE(blocks.front().type, data::BlockType::Task);
    QCOMPARE(blocks.front().dayIndex, 3);
    QCOMPARE(blocks.front().startMinutes, 480);
    QCOMPARE(blocks.front().durationMinutes, 20);
    QCOMPARE(blocks.front().goalId, QStringLiteral("goal-work"));
    QCOMPARE(blocks.front().taskIds, QStringList{ QStringLiteral("task-report") });
    QCOMPARE(undoStack.undoText(), QStringLiteral("Block einplanen"));
}

void ScheduleControllerTest::externalBlockDropAssignsTask()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    const Block block = repository.addBlock(makeBlock(2, 540, 120));

    interaction::DragItem item = backlogTask();
    item.source = interaction::DragSource::External;
    interaction::DropPosition position;
    position.target = interaction::DropTarget::ExistingBlock;
    position.dayIndex = 2;
    position.targetBlockId = block.id;

    QVERIFY(controller.placeExternal(item, position, week()));
    QCOMPARE(repository.findById(block.id)->taskIds, QStringList{ QStringLiteral("task-report") });
    QCOMPARE(controller.blocks().size(), std::size_t(1));

    // Assigning the same task twice changes nothing.
    QVERIFY(!controller.placeExternal(item, position, week()));
    QCOMPARE(undoStack.count(), std::size_t(1));

    undoStack.undo();
    QVERIFY(repository.findById(block.id)->taskIds.isEmpty());
}

void ScheduleControllerTest::externalHeaderDropRequestsDeadline()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);

    QVector<QDate> requested;
    connect(&controller,
            &core::ScheduleController::deadlineRequested,
            this,
            [&requested](const interaction::DragItem &, const QDate &date) { requested << date; });

    interaction::DropPosition position;
    position.target = interaction::DropTarget::DayHeader;
    position.dayIndex = 5;

    QVERIFY(controller.placeExternal(backlogTask(), position, week()));
    QCOMPARE(requested, QVector<QDate>{ QDate(2026, 10, 17) });
    QVERIFY(controller.blocks().empty());
    QVERIFY(!undoStack.canUndo());
}

void ScheduleControllerTest::deadlineTraceIsDebugOnly()
{
    data::InMemoryBlockRepository repository;
    core::UndoStack undoStack;
    core::ScheduleController controller(repository, undoStack);
    interaction::DropPosition position;
    position.target = interaction::DropTarget::DayHeader;
    position.dayIndex = 5;

    scheduleMessages.clear();
    QLoggingCategory::setFilterRules(QStringLiteral("planner.schedule.info=true"));
    QtMessageHandler previous = qInstallMessageHandler(recordScheduleMessage);
    const bool placed = controller.placeExternal(backlogTask(), position, week());
    qInstallMessageHandler(previous);
    QLoggingCategory::setFilterRules(QString());

    QVERIFY(placed);
    QVERIFY(!scheduleMessages.contains(QtInfoMsg));
}

QTEST_GUILESS_MAIN(ScheduleControllerTest)
#include "ScheduleControllerTest.moc"
