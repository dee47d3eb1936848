#include "planner/data/InMemoryBlockRepository.hpp"

#include <algorithm>

namespace planner {
namespace data {

namespace {

void sortByTime(std::vector<Block> &blocks)
{
    std::sort(blocks.begin(), blocks.end(), [](const Block &a, const Block &b) {
        if (a.dayIndex != b.dayIndex) {
            return a.dayIndex < b.dayIndex;
        }
        if (a.startMinutes != b.startMinutes) {
            return a.startMinutes < b.startMinutes;
        }
        return a.id < b.id;
    });
}

} // namespace

InMemoryBlockRepository::InMemoryBlockRepository() = default;
InMemoryBlockRepository::~InMemoryBlockRepository() = default;

std::vector<Block> InMemoryBlockRepository::fetchBlocks() const
{
    std::vector<Block> blocks;
    blocks.reserve(static_cast<std::size_t>(m_blocks.size()));
    for (const auto &block : m_blocks) {
        blocks.push_back(block);
    }
    sortByTime(blocks);
    return blocks;
}

std::vector<Block> InMemoryBlockRepository::blocksForDay(int dayIndex) const
{
    std::vector<Block> blocks;
    for (const auto &block : m_blocks) {
        if (block.dayIndex == dayIndex) {
            blocks.push_back(block);
        }
    }
    sortByTime(blocks);
    return blocks;
}

std::optional<Block> InMemoryBlockRepository::findById(const QUuid &id) const
{
    const auto it = m_blocks.constFind(id);
    if (it == m_blocks.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

Block InMemoryBlockRepository::addBlock(Block block)
{
    if (block.id.isNull()) {
        block.id = QUuid::createUuid();
    }
    block = normalizedBlock(block);
    m_blocks.insert(block.id, block);
    return block;
}

bool InMemoryBlockRepository::updateBlock(const Block &block)
{
    if (!m_blocks.contains(block.id)) {
        return false;
    }
    m_blocks.insert(block.id, normalizedBlock(block));
    return true;
}

bool InMemoryBlockRepository::removeBlock(const QUuid &id)
{
    return m_blocks.remove(id) > 0;
}

} // namespace data
} // namespace planner
