#pragma once

#include <QObject>
#include <QString>
#include <cstddef>
#include <memory>
#include <vector>

namespace planner {
namespace core {

class UndoCommand;

// Linear undo history. Pushing executes the command; pushing after an undo
// discards the redoable tail. The oldest entry is dropped once the limit is
// reached.
class UndoStack : public QObject
{
    Q_OBJECT

public:
    explicit UndoStack(std::size_t limit = 100, QObject *parent = nullptr);
    ~UndoStack() override;

    void push(std::unique_ptr<UndoCommand> command);
    bool canUndo() const;
    bool canRedo() const;
    QString undoText() const;
    QString redoText() const;
    void undo();
    void redo();
    void clear();
    std::size_t count() const;
    std::size_t index() const { return m_index; }

signals:
    void changed();

private:
    std::vector<std::unique_ptr<UndoCommand>> m_commands;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace planner
