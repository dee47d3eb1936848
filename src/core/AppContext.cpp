#include "planner/core/AppContext.hpp"

#include "planner/data/InMemoryBlockRepository.hpp"

#include "planner/core/ScheduleController.hpp"
#include "planner/core/UndoStack.hpp"

namespace planner {
namespace core {

AppContext::AppContext()
    : m_blockRepository(std::make_unique<data::InMemoryBlockRepository>())
    , m_undoStack(std::make_unique<UndoStack>())
    , m_scheduleController(std::make_unique<ScheduleController>(*m_blockRepository, *m_undoStack))
{
}

AppContext::~AppContext() = default;

data::BlockRepository &AppContext::blockRepository()
{
    return *m_blockRepository;
}

UndoStack &AppContext::undoStack()
{
    return *m_undoStack;
}

ScheduleController &AppContext::scheduleController()
{
    return *m_scheduleController;
}

} // namespace core
} // namespace planner
