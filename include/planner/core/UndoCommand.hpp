#pragma once

#include <QString>

namespace planner {
namespace core {

class UndoCommand
{
public:
    virtual ~UndoCommand() = default;
    virtual void redo() = 0;
    virtual void undo() = 0;
    // Short label for menus, e.g. "Block verschieben".
    virtual QString text() const { return {}; }
};

} // namespace core
} // namespace planner
