#pragma once

#include <QObject>
#include <QPointF>
#include <optional>
#include <vector>

#include "planner/data/Block.hpp"
#include "planner/interaction/DropResolution.hpp"
#include "planner/interaction/ViewportMetrics.hpp"

namespace planner {
namespace interaction {

class GridGeometryProvider;

// Shared by every interaction on one grid: the current geometry, the blocks
// currently rendered and the mapping from global pointer coordinates into
// grid space.
class PlacementEngine : public QObject
{
    Q_OBJECT

public:
    explicit PlacementEngine(GridGeometryProvider &geometry, QObject *parent = nullptr);

    const GridGeometry &geometry() const;
    GridPoint gridPoint(const QPointF &globalPos) const;

    void setBlocks(std::vector<data::Block> blocks);
    const std::vector<data::Block> &blocks() const { return m_blocks; }
    std::optional<data::Block> blockById(const QUuid &id) const;

    // requireInsideViewport: pointers outside the rendered grid resolve to
    // nothing instead of being clamped onto the nearest cell.
    std::optional<DropPosition> resolve(const DragItem &item,
                                        const QPointF &globalPos,
                                        bool overlapModeEnabled,
                                        const DropConstraints &constraints,
                                        bool requireInsideViewport) const;

signals:
    void geometryChanged();
    void blocksChanged();

private:
    GridGeometryProvider &m_geometry;
    std::vector<data::Block> m_blocks;
};

} // namespace interaction
} // namespace planner
