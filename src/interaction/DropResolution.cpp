#include "planner/interaction/DropResolution.hpp"

#include <QtGlobal>
#include <cmath>

#include "planner/core/Logging.hpp"

namespace planner {
namespace interaction {

namespace {

std::optional<int> columnForDay(int dayIndex, const GridGeometry &geometry, const DropConstraints &constraints)
{
    if (constraints.pinnedDayIndex) {
        if (dayIndex != *constraints.pinnedDayIndex) {
            return std::nullopt;
        }
        return 0;
    }
    if (dayIndex < 0 || dayIndex >= geometry.columns) {
        return std::nullopt;
    }
    return dayIndex;
}

int targetDay(const QPointF &gridPos, const GridGeometry &geometry, const DropConstraints &constraints)
{
    if (constraints.pinnedDayIndex) {
        return qBound(0, *constraints.pinnedDayIndex, data::DaysPerWeek - 1);
    }
    return qBound(0, geometry.dayIndexFromX(gridPos.x()), data::DaysPerWeek - 1);
}

} // namespace

bool acceptsDrop(const DragItem &item, const data::Block &block)
{
    if (item.type != data::BlockType::Task || item.source != DragSource::External) {
        return false;
    }
    if (block.type != data::BlockType::Goal && block.type != data::BlockType::Task) {
        return false;
    }
    return !item.goalId.isEmpty() && block.goalId == item.goalId;
}

std::optional<QUuid> blockTargetAt(const DragItem &item,
                                   const QPointF &gridPos,
                                   const GridGeometry &geometry,
                                   const std::vector<data::Block> &blocks,
                                   const DropConstraints &constraints)
{
    if (!geometry.isMeasured()) {
        return std::nullopt;
    }
    for (const auto &block : blocks) {
        if (block.id == constraints.excludedBlockId || !acceptsDrop(item, block)) {
            continue;
        }
        const auto column = columnForDay(block.dayIndex, geometry, constraints);
        if (!column) {
            continue;
        }
        const QRectF rect = geometry.blockRect(*column, block.startMinutes, block.durationMinutes);
        if (gridPos.x() >= rect.left() && gridPos.x() <= rect.right()
            && gridPos.y() >= rect.top() && gridPos.y() <= rect.bottom()) {
            return block.id;
        }
    }
    return std::nullopt;
}

std::optional<int> gapFilledDuration(int startMinutes,
                                     int defaultDurationMinutes,
                                     const std::vector<data::Block> &dayBlocks,
                                     const QUuid &excludedBlockId)
{
    const int windowEnd = startMinutes + defaultDurationMinutes;
    std::optional<int> nextStart;
    for (const auto &block : dayBlocks) {
        if (block.id == excludedBlockId) {
            continue;
        }
        if (block.startMinutes <= startMinutes || block.startMinutes >= windowEnd) {
            continue;
        }
        if (!nextStart || block.startMinutes < *nextStart) {
            nextStart = block.startMinutes;
        }
    }
    if (!nextStart) {
        return std::nullopt;
    }
    const int gap = *nextStart - startMinutes;
    if (gap < data::MinBlockDurationMinutes) {
        return std::nullopt;
    }
    return gap;
}

std::optional<DropPosition> resolveDrop(const DragItem &item,
                                        const QPointF &gridPos,
                                        const GridGeometry &geometry,
                                        bool overlapModeEnabled,
                                        const std::vector<data::Block> &blocks,
                                        const DropConstraints &constraints)
{
    if (!geometry.isMeasured()) {
        qCDebug(lcDrop) << "geometry unmeasured, no drop position";
        return std::nullopt;
    }
    if (!std::isfinite(gridPos.x()) || !std::isfinite(gridPos.y())) {
        return std::nullopt;
    }

    DropPosition position;
    position.dayIndex = targetDay(gridPos, geometry, constraints);

    if (gridPos.y() < 0.0 && constraints.allowDayHeader) {
        position.target = DropTarget::DayHeader;
        return position;
    }

    if (constraints.allowBlockTargets) {
        if (const auto blockId = blockTargetAt(item, gridPos, geometry, blocks, constraints)) {
            position.target = DropTarget::ExistingBlock;
            position.targetBlockId = *blockId;
            return position;
        }
    }

    const int duration = item.defaultDuration();
    const double topPx = gridPos.y() - geometry.minutesToPixels(item.grabOffsetMinutes);
    const int start = geometry.pixelsToMinutes(topPx, duration);
    position.target = DropTarget::TimeGrid;
    position.startMinutes = start;

    if (!overlapModeEnabled) {
        std::vector<data::Block> dayBlocks;
        for (const auto &block : blocks) {
            if (block.dayIndex == position.dayIndex) {
                dayBlocks.push_back(block);
            }
        }
        position.adaptiveDuration = gapFilledDuration(start, duration, dayBlocks, constraints.excludedBlockId);
    }
    return position;
}

} // namespace interaction
} // namespace planner
