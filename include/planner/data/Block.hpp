#pragma once

#include <QColor>
#include <QString>
#include <QStringList>
#include <QUuid>

namespace planner {
namespace data {

constexpr int MinutesPerDay = 24 * 60;
constexpr int DaysPerWeek = 7;
constexpr int MinBlockDurationMinutes = 15;

enum class BlockType
{
    Goal,
    Task,
    Essential,
};

struct Block
{
    QUuid id = QUuid::createUuid();
    QString title;
    QColor color;
    BlockType type = BlockType::Goal;
    int dayIndex = 0;
    int startMinutes = 0;
    int durationMinutes = 60;
    QString goalId;
    QStringList taskIds;

    int endMinutes() const { return startMinutes + durationMinutes; }
};

QString blockTypeName(BlockType type);

// Clamps day, start and duration into the ranges every block must satisfy.
Block normalizedBlock(Block block);

} // namespace data
} // namespace planner
