#include "planner/interaction/DragItem.hpp"

#include <QtGlobal>

namespace planner {
namespace interaction {

namespace {
constexpr int LargePlacementThresholdMinutes = 16 * 60;
constexpr int LargePlacementOffsetMinutes = 8 * 60;
}

QString DragItem::title() const
{
    if (source == DragSource::ExistingBlock) {
        return blockTitle;
    }
    switch (type) {
    case data::BlockType::Task:
        return !taskLabel.isEmpty() ? taskLabel : goalLabel;
    case data::BlockType::Essential:
        return essentialLabel;
    case data::BlockType::Goal:
        break;
    }
    return goalLabel;
}

QColor DragItem::color() const
{
    if (source == DragSource::ExistingBlock) {
        return blockColor;
    }
    return type == data::BlockType::Essential ? essentialColor : goalColor;
}

int DragItem::defaultDuration() const
{
    if (source == DragSource::External) {
        return defaultDurationFor(type);
    }
    return qBound(data::MinBlockDurationMinutes, durationMinutes, data::MinutesPerDay);
}

DragItem DragItem::fromBlock(const data::Block &block, DragGesture gesture)
{
    const data::Block normalized = data::normalizedBlock(block);
    DragItem item;
    item.source = DragSource::ExistingBlock;
    item.gesture = gesture;
    item.type = normalized.type;
    item.blockId = normalized.id;
    item.dayIndex = normalized.dayIndex;
    item.startMinutes = normalized.startMinutes;
    item.durationMinutes = normalized.durationMinutes;
    item.blockTitle = normalized.title;
    item.blockColor = normalized.color;
    item.goalId = normalized.goalId;
    return item;
}

bool DropPosition::operator==(const DropPosition &other) const
{
    return target == other.target
        && dayIndex == other.dayIndex
        && startMinutes == other.startMinutes
        && adaptiveDuration == other.adaptiveDuration
        && targetBlockId == other.targetBlockId;
}

int defaultDurationFor(data::BlockType type)
{
    return type == data::BlockType::Task ? 30 : 60;
}

int resolvedDuration(const DragItem &item, const DropPosition &position)
{
    return position.adaptiveDuration.value_or(item.defaultDuration());
}

int placementOffsetMinutes(int durationMinutes)
{
    if (durationMinutes <= 0) {
        return 0;
    }
    if (durationMinutes > LargePlacementThresholdMinutes) {
        return LargePlacementOffsetMinutes;
    }
    return durationMinutes / 2;
}

QString dropTargetName(DropTarget target)
{
    switch (target) {
    case DropTarget::TimeGrid:
        return QStringLiteral("time-grid");
    case DropTarget::DayHeader:
        return QStringLiteral("day-header");
    case DropTarget::ExistingBlock:
        return QStringLiteral("existing-block");
    }
    return QStringLiteral("time-grid");
}

} // namespace interaction
} // namespace planner
