#include "planner/data/Block.hpp"

#include <QtGlobal>

namespace planner {
namespace data {

QString blockTypeName(BlockType type)
{
    switch (type) {
    case BlockType::Goal:
        return QStringLiteral("goal");
    case BlockType::Task:
        return QStringLiteral("task");
    case BlockType::Essential:
        return QStringLiteral("essential");
    }
    return QStringLiteral("goal");
}

Block normalizedBlock(Block block)
{
    block.dayIndex = qBound(0, block.dayIndex, DaysPerWeek - 1);
    block.durationMinutes = qBound(MinBlockDurationMinutes, block.durationMinutes, MinutesPerDay);
    block.startMinutes = qBound(0, block.startMinutes, MinutesPerDay - block.durationMinutes);
    return block;
}

} // namespace data
} // namespace planner
