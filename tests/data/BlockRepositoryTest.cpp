#include <QtTest/QtTest>

#include "planner/data/InMemoryBlockRepository.hpp"

using namespace planner::data;

class BlockRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void updateAndRemove();
    void sortsByDayAndStart();
    void normalizesOutOfRangeBlocks();
    void updateUnknownBlockFails();
};

void BlockRepositoryTest::addAndFetch()
{
    InMemoryBlockRepository repo;
    Block block;
    block.title = "Deep Work";
    block.dayIndex = 2;
    block.startMinutes = 540;
    block.durationMinutes = 90;
    const auto stored = repo.addBlock(block);

    QVERIFY(!stored.id.isNull());

    const auto list = repo.fetchBlocks();
    QCOMPARE(list.size(), static_cast<std::size_t>(1));
    QCOMPARE(list.front().title, QStringLiteral("Deep Work"));
    QCOMPARE(list.front().endMinutes(), 630);

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->dayIndex, 2);
}

void BlockRepositoryTest::updateAndRemove()
{
    InMemoryBlockRepository repo;
    Block block;
    block.title = "Initial";
    const auto stored = repo.addBlock(block);

    Block toUpdate = stored;
    toUpdate.title = "Updated";
    toUpdate.startMinutes = 600;
    QVERIFY(repo.updateBlock(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Updated"));
    QCOMPARE(fetched->startMinutes, 600);

    QVERIFY(repo.removeBlock(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(!repo.removeBlock(stored.id));
}

void BlockRepositoryTest::sortsByDayAndStart()
{
    InMemoryBlockRepository repo;
    Block late;
    late.dayIndex = 1;
    late.startMinutes = 900;
    Block early;
    early.dayIndex = 1;
    early.startMinutes = 480;
    Block monday;
    monday.dayIndex = 0;
    monday.startMinutes = 1000;
    repo.addBlock(late);
    repo.addBlock(early);
    repo.addBlock(monday);

    const auto all = repo.fetchBlocks();
    QCOMPARE(all.size(), static_cast<std::size_t>(3));
    QCOMPARE(all[0].dayIndex, 0);
    QCOMPARE(all[1].startMinutes, 480);
    QCOMPARE(all[2].startMinutes, 900);

    const auto tuesday = repo.blocksForDay(1);
    QCOMPARE(tuesday.size(), static_cast<std::size_t>(2));
    QCOMPARE(tuesday.front().startMinutes, 480);
}

void BlockRepositoryTest::normalizesOutOfRangeBlocks()
{
    InMemoryBlockRepository repo;
    Block block;
    block.dayIndex = 9;
    block.startMinutes = 1430;
    block.durationMinutes = 5;
    const auto stored = repo.addBlock(block);

    QCOMPARE(stored.dayIndex, DaysPerWeek - 1);
    QCOMPARE(stored.durationMinutes, MinBlockDurationMinutes);
    QCOMPARE(stored.startMinutes, MinutesPerDay - MinBlockDurationMinutes);
}

void BlockRepositoryTest::updateUnknownBlockFails()
{
    InMemoryBlockRepository repo;
    Block block;
    QVERIFY(!repo.updateBlock(block));
    QVERIFY(repo.fetchBlocks().empty());
}

QTEST_GUILESS_MAIN(BlockRepositoryTest)
#include "BlockRepositoryTest.moc"
