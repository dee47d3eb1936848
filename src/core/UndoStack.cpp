#include "planner/core/UndoStack.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/UndoCommand.hpp"

namespace planner {
namespace core {

UndoStack::UndoStack(std::size_t limit, QObject *parent)
    : QObject(parent)
    , m_limit(limit > 0 ? limit : 1)
{
    m_commands.reserve(m_limit);
}

UndoStack::~UndoStack() = default;

void UndoStack::push(std::unique_ptr<UndoCommand> command)
{
    if (!command) {
        return;
    }
    if (m_index < m_commands.size()) {
        m_commands.erase(m_commands.begin() + static_cast<long>(m_index), m_commands.end());
    }

    if (m_commands.size() == m_limit) {
        m_commands.erase(m_commands.begin());
        if (m_index > 0) {
            --m_index;
        }
    }

    command->redo();
    qCDebug(lcSchedule) << "undo push" << command->text();
    m_commands.push_back(std::move(command));
    m_index = m_commands.size();
    emit changed();
}

bool UndoStack::canUndo() const
{
    return m_index > 0;
}

bool UndoStack::canRedo() const
{
    return m_index < m_commands.size();
}

QString UndoStack::undoText() const
{
    return canUndo() ? m_commands[m_index - 1]->text() : QString();
}

QString UndoStack::redoText() const
{
    return canRedo() ? m_commands[m_index]->text() : QString();
}

void UndoStack::undo()
{
    if (!canUndo()) {
        return;
    }
    m_commands[m_index - 1]->undo();
    --m_index;
    emit changed();
}

void UndoStack::redo()
{
    if (!canRedo()) {
        return;
    }
    m_commands[m_index]->redo();
    ++m_index;
    emit changed();
}

void UndoStack::clear()
{
    if (m_commands.empty()) {
        return;
    }
    m_commands.clear();
    m_index = 0;
    emit changed();
}

std::size_t UndoStack::count() const
{
    return m_commands.size();
}

} // namespace core
} // namespace planner
