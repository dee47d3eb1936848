#include <QtTest/QtTest>

#include "planner/interaction/DragSession.hpp"

using namespace planner::interaction;

namespace {

DragItem externalGoal()
{
    DragItem item;
    item.source = DragSource::External;
    item.type = planner::data::BlockType::Goal;
    item.goalLabel = QStringLiteral("Buch schreiben");
    return item;
}

PointerEvent at(double x, double y, Qt::KeyboardModifiers modifiers = Qt::NoModifier)
{
    return { QPointF(x, y), modifiers };
}

} // namespace

class DragSessionTest : public QObject
{
    Q_OBJECT

private slots:
    void beginEntersPending();
    void activatesAtThreshold();
    void customThreshold();
    void releaseBeforeThresholdCommitsNothing();
    void releaseAfterActivationDrops();
    void escapeCancels();
    void overlapModeFollowsModifier();
    void previewOnlyWhileDragging();
};

void DragSessionTest::beginEntersPending()
{
    DragSession session;
    QVERIFY(session.isIdle());
    QVERIFY(session.begin(externalGoal(), at(10, 10)));
    QVERIFY(session.isPending());
    QVERIFY(session.item().has_value());
    QCOMPARE(session.pointerStart(), QPointF(10, 10));

    QVERIFY(!session.begin(externalGoal(), at(50, 50)));
    QCOMPARE(session.pointerStart(), QPointF(10, 10));
}

void DragSessionTest::activatesAtThreshold()
{
    DragSession session;
    int activations = 0;
    QVector<QPointF> updates;
    connect(&session, &DragSession::activated, this, [&activations](const DragItem &) { ++activations; });
    connect(&session, &DragSession::pointerUpdated, this, [&updates](const QPointF &pos) { updates << pos; });

    session.begin(externalGoal(), at(0, 0));
    session.pointerMoved(at(3, 0));
    QVERIFY(session.isPending());
    QCOMPARE(activations, 0);
    QVERIFY(updates.isEmpty());

    session.pointerMoved(at(4, 0));
    QVERIFY(session.isDragging());
    QCOMPARE(activations, 1);
    QCOMPARE(updates.size(), 1);
    QCOMPARE(session.pointerCurrent(), QPointF(4, 0));

    session.pointerMoved(at(40, 20));
    QCOMPARE(activations, 1);
    QCOMPARE(updates.size(), 2);
    QCOMPARE(updates.last(), QPointF(40, 20));
}

void DragSessionTest::customThreshold()
{
    DragSession session;
    session.setDragThreshold(10.0);
    session.begin(externalGoal(), at(0, 0));
    session.pointerMoved(at(6, 6));
    QVERIFY(session.isPending());
    session.pointerMoved(at(8, 6));
    QVERIFY(session.isDragging());
}

void DragSessionTest::releaseBeforeThresholdCommitsNothing()
{
    DragSession session;
    int drops = 0;
    int cancels = 0;
    connect(&session, &DragSession::dropped, this, [&drops](const DragDrop &) { ++drops; });
    connect(&session, &DragSession::cancelled, this, [&cancels](const DragItem &) { ++cancels; });

    session.begin(externalGoal(), at(0, 0));
    session.pointerMoved(at(1, 1));
    session.pointerReleased(at(1, 1));
    QVERIFY(session.isIdle());
    QVERIFY(!session.item().has_value());
    QCOMPARE(drops, 0);
    QCOMPARE(cancels, 0);
}

void DragSessionTest::releaseAfterActivationDrops()
{
    DragSession session;
    std::optional<DragDrop> received;
    bool idleDuringDrop = false;
    connect(&session, &DragSession::dropped, this, [&](const DragDrop &drop) {
        received = drop;
        idleDuringDrop = session.isIdle();
    });

    session.begin(externalGoal(), at(0, 0));
    session.pointerMoved(at(0, 20));
    DropPosition preview;
    preview.dayIndex = 2;
    preview.startMinutes = 600;
    session.setPreviewPosition(preview);
    session.pointerReleased(at(0, 25, Qt::ControlModifier));

    QVERIFY(received.has_value());
    QVERIFY(idleDuringDrop);
    QCOMPARE(received->pointerStart, QPointF(0, 0));
    QCOMPARE(received->pointerCurrent, QPointF(0, 25));
    QVERIFY(received->previewPosition.has_value());
    QCOMPARE(*received->previewPosition, preview);
    QVERIFY(received->modifiers.testFlag(Qt::ControlModifier));
    QCOMPARE(received->item.goalLabel, QStringLiteral("Buch schreiben"));

    // A second release is ignored.
    received.reset();
    session.pointerReleased(at(0, 30));
    QVERIFY(!received.has_value());
}

void DragSessionTest::escapeCancels()
{
    DragSession session;
    int drops = 0;
    int cancels = 0;
    connect(&session, &DragSession::dropped, this, [&drops](const DragDrop &) { ++drops; });
    connect(&session, &DragSession::cancelled, this, [&cancels](const DragItem &) { ++cancels; });

    QVERIFY(!session.keyPressed(Qt::Key_Escape));

    session.begin(externalGoal(), at(0, 0));
    session.pointerMoved(at(0, 50));
    QVERIFY(session.keyPressed(Qt::Key_Escape));
    QVERIFY(session.isIdle());
    QCOMPARE(cancels, 1);

    session.pointerReleased(at(0, 60));
    QCOMPARE(drops, 0);

    // Escape while pending also cancels.
    session.begin(externalGoal(), at(0, 0));
    QVERIFY(session.keyPressed(Qt::Key_Escape));
    QCOMPARE(cancels, 2);
}

void DragSessionTest::overlapModeFollowsModifier()
{
    DragSession session;
    QVector<bool> changes;
    connect(&session, &DragSession::overlapModeChanged, this, [&changes](bool enabled) { changes << enabled; });

    session.begin(externalGoal(), at(0, 0, Qt::ShiftModifier));
    QVERIFY(session.overlapModeEnabled());
    QVERIFY(!session.keyPressed(Qt::Key_Shift));

    // Re-sampled on activation.
    session.pointerMoved(at(0, 10));
    QVERIFY(!session.overlapModeEnabled());

    QVERIFY(session.keyPressed(Qt::Key_Shift));
    QVERIFY(session.overlapModeEnabled());
    QVERIFY(session.keyReleased(Qt::Key_Shift));
    QVERIFY(!session.overlapModeEnabled());
    QVERIFY(!session.keyPressed(Qt::Key_Control));

    session.setOverlapModifier(Qt::AltModifier);
    QVERIFY(session.keyPressed(Qt::Key_Alt));
    QVERIFY(session.overlapModeEnabled());

    session.cancel();
    QVERIFY(!session.overlapModeEnabled());
    QCOMPARE(changes, (QVector<bool>{ true, false, true, false, true, false }));
}

void DragSessionTest::previewOnlyWhileDragging()
{
    DragSession session;
    int changes = 0;
    connect(&session, &DragSession::previewPositionChanged, this, [&changes]() { ++changes; });

    DropPosition position;
    position.startMinutes = 120;
    session.setPreviewPosition(position);
    QVERIFY(!session.previewPosition().has_value());

    session.begin(externalGoal(), at(0, 0));
    session.setPreviewPosition(position);
    QVERIFY(!session.previewPosition().has_value());

    session.pointerMoved(at(10, 0));
    session.setPreviewPosition(position);
    session.setPreviewPosition(position);
    QCOMPARE(changes, 1);

    session.setPreviewPosition(std::nullopt);
    QCOMPARE(changes, 2);
    QVERIFY(!session.previewPosition().has_value());
}

QTEST_GUILESS_MAIN(DragSessionTest)
#include "DragSessionTest.moc"
