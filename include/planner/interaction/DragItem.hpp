#pragma once

#include <QColor>
#include <QDate>
#include <QString>
#include <QUuid>
#include <optional>

#include "planner/data/Block.hpp"

namespace planner {
namespace interaction {

enum class DragSource
{
    ExistingBlock,
    External,
    EmptyGrid,
};

enum class DragGesture
{
    Move,
    ResizeTop,
    ResizeBottom,
    Place,
    Create,
};

// Payload of a pending or active drag. Existing blocks carry their identity
// and current placement; external items carry the backlog references the
// schedule layer needs to create a block from them.
struct DragItem
{
    DragSource source = DragSource::External;
    DragGesture gesture = DragGesture::Place;
    data::BlockType type = data::BlockType::Goal;

    QUuid blockId;
    int dayIndex = 0;
    int startMinutes = 0;
    int durationMinutes = 0;
    QString blockTitle;
    QColor blockColor;

    QString goalId;
    QString goalLabel;
    QColor goalColor;
    QString taskId;
    QString taskLabel;
    QString essentialId;
    QString essentialLabel;
    QColor essentialColor;
    QDate sourceDeadline;

    // Minutes between the item's top edge and the pointer, unsnapped so only
    // the resulting top edge is rounded to the grid.
    double grabOffsetMinutes = 0.0;

    QString title() const;
    QColor color() const;
    int defaultDuration() const;

    static DragItem fromBlock(const data::Block &block, DragGesture gesture);
};

enum class DropTarget
{
    TimeGrid,
    DayHeader,
    ExistingBlock,
};

struct DropPosition
{
    DropTarget target = DropTarget::TimeGrid;
    int dayIndex = 0;
    std::optional<int> startMinutes;
    std::optional<int> adaptiveDuration;
    QUuid targetBlockId;

    bool operator==(const DropPosition &other) const;
    bool operator!=(const DropPosition &other) const { return !(*this == other); }
};

int defaultDurationFor(data::BlockType type);

// Duration the consumer should use for a drop: the adapted one if present,
// otherwise the item's default.
int resolvedDuration(const DragItem &item, const DropPosition &position);

// Pointer offset used to centre a new item under the cursor.
int placementOffsetMinutes(int durationMinutes);

QString dropTargetName(DropTarget target);

} // namespace interaction
} // namespace planner
