#pragma once

#include "planner/data/Block.hpp"

namespace planner {
namespace interaction {

struct GridGeometry;

struct BlockCapabilities
{
    bool resizable = false;
    bool draggable = false;
};

// A block shows resize handles only when someone consumes resize results,
// and can be dragged only when someone consumes moves or duplicates and the
// column width is known.
BlockCapabilities resolveCapabilities(const data::Block &block,
                                      bool hasResizeConsumer,
                                      bool hasDragConsumer,
                                      const GridGeometry &geometry);

} // namespace interaction
} // namespace planner
