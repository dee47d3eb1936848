#include "planner/interaction/PlacementEngine.hpp"

#include "planner/core/Logging.hpp"
#include "planner/interaction/GridGeometry.hpp"

namespace planner {
namespace interaction {

PlacementEngine::PlacementEngine(GridGeometryProvider &geometry, QObject *parent)
    : QObject(parent)
    , m_geometry(geometry)
{
    connect(&m_geometry, &GridGeometryProvider::geometryChanged, this, &PlacementEngine::geometryChanged);
}

const GridGeometry &PlacementEngine::geometry() const
{
    return m_geometry.geometry();
}

GridPoint PlacementEngine::gridPoint(const QPointF &globalPos) const
{
    return m_geometry.metrics().mapToGrid(globalPos);
}

void PlacementEngine::setBlocks(std::vector<data::Block> blocks)
{
    m_blocks = std::move(blocks);
    emit blocksChanged();
}

std::optional<data::Block> PlacementEngine::blockById(const QUuid &id) const
{
    for (const auto &block : m_blocks) {
        if (block.id == id) {
            return block;
        }
    }
    return std::nullopt;
}

std::optional<DropPosition> PlacementEngine::resolve(const DragItem &item,
                                                     const QPointF &globalPos,
                                                     bool overlapModeEnabled,
                                                     const DropConstraints &constraints,
                                                     bool requireInsideViewport) const
{
    const GridPoint point = gridPoint(globalPos);
    if (requireInsideViewport && !point.insideViewport) {
        return std::nullopt;
    }
    auto position = resolveDrop(item, point.position, geometry(), overlapModeEnabled, m_blocks, constraints);
    if (position) {
        qCDebug(lcDrop) << dropTargetName(position->target) << "day" << position->dayIndex
                        << "start" << position->startMinutes.value_or(-1)
                        << "adaptive" << position->adaptiveDuration.value_or(-1);
    }
    return position;
}

} // namespace interaction
} // namespace planner
