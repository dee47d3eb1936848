#include "planner/interaction/ViewportMetrics.hpp"

namespace planner {
namespace interaction {

GridPoint gridPointFromViewport(const QPointF &local,
                                const QRectF &viewportRect,
                                double headerHeight,
                                double scrollOffset)
{
    GridPoint point;
    const double y = local.y() - headerHeight;
    point.position = QPointF(local.x(), y < 0.0 ? y : y + scrollOffset);
    point.insideViewport = viewportRect.contains(local);
    return point;
}

} // namespace interaction
} // namespace planner
