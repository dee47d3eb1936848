#pragma once

#include <QPointF>
#include <optional>
#include <vector>

#include "planner/data/Block.hpp"
#include "planner/interaction/DragItem.hpp"
#include "planner/interaction/GridGeometry.hpp"

namespace planner {
namespace interaction {

struct DropConstraints
{
    // Single-day view: the resolved day is always this one.
    std::optional<int> pinnedDayIndex;
    bool allowDayHeader = true;
    bool allowBlockTargets = true;
    // Block that is being moved; ignored for hit tests and gap filling.
    QUuid excludedBlockId;
};

// True when a dragged item may be dropped onto an existing block: only a
// task onto a goal or task block of the same goal.
bool acceptsDrop(const DragItem &item, const data::Block &block);

// Block under gridPos that accepts the item, if any.
std::optional<QUuid> blockTargetAt(const DragItem &item,
                                   const QPointF &gridPos,
                                   const GridGeometry &geometry,
                                   const std::vector<data::Block> &blocks,
                                   const DropConstraints &constraints = {});

// Gap filling: the duration shortened so that an item starting at
// startMinutes ends where the next block of dayBlocks begins. Returns
// std::nullopt when no block starts inside the default window or when the
// gap is shorter than the minimum block duration.
std::optional<int> gapFilledDuration(int startMinutes,
                                     int defaultDurationMinutes,
                                     const std::vector<data::Block> &dayBlocks,
                                     const QUuid &excludedBlockId = {});

// Resolves a grid-space pointer into a snapped, clamped drop position.
// Returns std::nullopt while the column width is unmeasured.
std::optional<DropPosition> resolveDrop(const DragItem &item,
                                        const QPointF &gridPos,
                                        const GridGeometry &geometry,
                                        bool overlapModeEnabled,
                                        const std::vector<data::Block> &blocks,
                                        const DropConstraints &constraints = {});

} // namespace interaction
} // namespace planner
