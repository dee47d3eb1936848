#include "planner/interaction/BlockCapabilities.hpp"

#include "planner/interaction/GridGeometry.hpp"

namespace planner {
namespace interaction {

BlockCapabilities resolveCapabilities(const data::Block &block,
                                      bool hasResizeConsumer,
                                      bool hasDragConsumer,
                                      const GridGeometry &geometry)
{
    BlockCapabilities caps;
    if (block.id.isNull()) {
        return caps;
    }
    caps.resizable = hasResizeConsumer;
    caps.draggable = hasDragConsumer && geometry.isMeasured();
    return caps;
}

} // namespace interaction
} // namespace planner
