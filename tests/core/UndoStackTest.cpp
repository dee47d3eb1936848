#include <QtTest/QtTest>

#include "planner/core/UndoCommand.hpp"
#include "planner/core/UndoStack.hpp"

namespace {

class CounterCommand : public planner::core::UndoCommand
{
public:
    CounterCommand(int delta, int &value)
        : m_delta(delta)
        , m_value(value)
    {
    }

    void redo() override { m_value += m_delta; }
    void undo() override { m_value -= m_delta; }
    QString text() const override { return QStringLiteral("add %1").arg(m_delta); }

private:
    int m_delta;
    int &m_value;
};

} // namespace

class UndoStackTest : public QObject
{
    Q_OBJECT

private slots:
    void pushUndoRedo();
    void respectsLimit();
    void pushDiscardsRedoTail();
    void reportsTextsAndChanges();
};

void UndoStackTest::pushUndoRedo()
{
    planner::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(5, value));
    QCOMPARE(value, 5);
    QVERIFY(stack.canUndo());

    stack.undo();
    QCOMPARE(value, 0);
    QVERIFY(stack.canRedo());

    stack.redo();
    QCOMPARE(value, 5);
}

void UndoStackTest::respectsLimit()
{
    planner::core::UndoStack stack(2);
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(1, value)); // first cmd dropped
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));

    stack.undo();
    stack.undo();
    // First command already dropped, so only two undo operations affect value.
    QCOMPARE(value, 1);
}

void UndoStackTest::pushDiscardsRedoTail()
{
    planner::core::UndoStack stack;
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(1, value));
    stack.push(std::make_unique<CounterCommand>(10, value));
    stack.undo();
    QCOMPARE(value, 1);

    stack.push(std::make_unique<CounterCommand>(100, value));
    QCOMPARE(value, 101);
    QVERIFY(!stack.canRedo());
    QCOMPARE(stack.count(), static_cast<std::size_t>(2));
}

void UndoStackTest::reportsTextsAndChanges()
{
    planner::core::UndoStack stack;
    QSignalSpy changed(&stack, &planner::core::UndoStack::changed);
    int value = 0;
    stack.push(std::make_unique<CounterCommand>(3, value));
    QCOMPARE(stack.undoText(), QStringLiteral("add 3"));
    QVERIFY(stack.redoText().isEmpty());

    stack.undo();
    QCOMPARE(stack.redoText(), QStringLiteral("add 3"));
    stack.undo(); // nothing left
    QCOMPARE(changed.count(), 2);

    stack.clear();
    QCOMPARE(changed.count(), 3);
    QVERIFY(!stack.canRedo());
}

QTEST_GUILESS_MAIN(UndoStackTest)
#include "UndoStackTest.moc"
