#pragma once

#include <QHash>

#include "planner/data/BlockRepository.hpp"

namespace planner {
namespace data {

class InMemoryBlockRepository : public BlockRepository
{
public:
    InMemoryBlockRepository();
    ~InMemoryBlockRepository() override;

    std::vector<Block> fetchBlocks() const override;
    std::vector<Block> blocksForDay(int dayIndex) const override;
    std::optional<Block> findById(const QUuid &id) const override;
    Block addBlock(Block block) override;
    bool updateBlock(const Block &block) override;
    bool removeBlock(const QUuid &id) override;

private:
    QHash<QUuid, Block> m_blocks;
};

} // namespace data
} // namespace planner
