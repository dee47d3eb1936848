#pragma once

#include <QObject>
#include <optional>

#include "planner/interaction/DragSession.hpp"

namespace planner {
namespace interaction {

class PlacementEngine;
struct GridGeometry;

struct BlockSpan
{
    int dayIndex = 0;
    int startMinutes = 0;
    int durationMinutes = 0;
};

// Span between the snapped press minute and the snapped pointer minute, in
// either direction, at least the minimum duration and inside the day.
// With fineEnd the pointer end is rounded to whole minutes instead.
BlockSpan spanBetween(int dayIndex, int anchorMinutes, double pointerMinutes, const GridGeometry &geometry,
                      bool fineEnd = false);

// Press on empty grid space and drag to draw a new block.
class GridCreateInteraction : public QObject
{
    Q_OBJECT

public:
    GridCreateInteraction(DragSession &session, PlacementEngine &engine, QObject *parent = nullptr);

    void setPinnedDayIndex(std::optional<int> dayIndex);
    bool beginCreate(const PointerEvent &event);
    std::optional<BlockSpan> preview() const;

signals:
    void previewChanged();
    void createRequested(int dayIndex, int startMinutes, int durationMinutes);

private:
    bool ownsItem(const DragItem &item) const;
    BlockSpan spanFor(const DragItem &item, const QPointF &globalPos, bool fineEnd) const;
    void refreshPreview();
    void handleDropped(const DragDrop &drop);

    DragSession &m_session;
    PlacementEngine &m_engine;
    std::optional<int> m_pinnedDay;
};

} // namespace interaction
} // namespace planner
