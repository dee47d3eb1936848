#pragma once

#include <memory>

namespace planner {
namespace data {
class BlockRepository;
}

namespace core {

class ScheduleController;
class UndoStack;

class AppContext
{
public:
    AppContext();
    ~AppContext();

    data::BlockRepository &blockRepository();
    UndoStack &undoStack();
    ScheduleController &scheduleController();

private:
    std::unique_ptr<data::BlockRepository> m_blockRepository;
    std::unique_ptr<UndoStack> m_undoStack;
    std::unique_ptr<ScheduleController> m_scheduleController;
};

} // namespace core
} // namespace planner
