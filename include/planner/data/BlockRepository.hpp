#pragma once

#include <optional>
#include <vector>

#include "planner/data/Block.hpp"

namespace planner {
namespace data {

class BlockRepository
{
public:
    virtual ~BlockRepository() = default;

    virtual std::vector<Block> fetchBlocks() const = 0;
    virtual std::vector<Block> blocksForDay(int dayIndex) const = 0;
    virtual std::optional<Block> findById(const QUuid &id) const = 0;
    virtual Block addBlock(Block block) = 0;
    virtual bool updateBlock(const Block &block) = 0;
    virtual bool removeBlock(const QUuid &id) = 0;
};

} // namespace data
} // namespace planner
