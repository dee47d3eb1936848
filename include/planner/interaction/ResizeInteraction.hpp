#pragma once

#include <QObject>
#include <QUuid>

#include "planner/interaction/DragSession.hpp"

namespace planner {
namespace interaction {

class PlacementEngine;
struct GridGeometry;

enum class ResizeEdge
{
    Top,
    Bottom,
};

struct ResizeResult
{
    int startMinutes = 0;
    int durationMinutes = 0;

    bool operator==(const ResizeResult &other) const
    {
        return startMinutes == other.startMinutes && durationMinutes == other.durationMinutes;
    }
    bool operator!=(const ResizeResult &other) const { return !(*this == other); }
};

// Applies a vertical pointer delta to a block edge. The top edge moves the
// start and keeps the end; the bottom edge changes the duration only. The
// result is snapped, never shorter than the minimum duration and never
// past midnight.
ResizeResult computeResize(int startMinutes,
                           int durationMinutes,
                           ResizeEdge edge,
                           double deltaPixels,
                           const GridGeometry &geometry);

// Edge-handle dragging for rendered blocks. Reports every change through
// resized() while the gesture runs and a single resizeEnded() on release.
// Escape restores the original geometry through resized() and does not emit
// resizeEnded().
class ResizeInteraction : public QObject
{
    Q_OBJECT

public:
    ResizeInteraction(DragSession &session, PlacementEngine &engine, QObject *parent = nullptr);

    bool beginResize(const data::Block &block, ResizeEdge edge, const PointerEvent &event);
    bool isResizing() const;
    const ResizeResult &current() const { return m_current; }

signals:
    void resized(const QUuid &blockId, int startMinutes, int durationMinutes);
    void resizeEnded(const QUuid &blockId);

private:
    bool ownsItem(const DragItem &item) const;
    void handlePointerUpdated(const QPointF &position);
    void handleDropped(const DragDrop &drop);
    void handleCancelled(const DragItem &item);
    void apply(const DragItem &item, const QPointF &start, const QPointF &current);

    DragSession &m_session;
    PlacementEngine &m_engine;
    ResizeResult m_current;
};

} // namespace interaction
} // namespace planner
