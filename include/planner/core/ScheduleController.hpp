#pragma once

#include <QDate>
#include <QHash>
#include <QObject>
#include <QUuid>
#include <QVector>
#include <vector>

#include "planner/data/Block.hpp"
#include "planner/interaction/DragItem.hpp"

namespace planner {
namespace data {
class BlockRepository;
}

namespace interaction {
class ExternalDragBridge;
class GridCreateInteraction;
class RepositionInteraction;
class ResizeInteraction;
}

namespace core {

class UndoStack;

// Applies committed gestures to the block repository. Every gesture becomes
// one undo entry; a resize updates the repository live and is recorded once
// when the gesture ends.
class ScheduleController : public QObject
{
    Q_OBJECT

public:
    ScheduleController(data::BlockRepository &repository, UndoStack &undoStack, QObject *parent = nullptr);

    void attach(interaction::RepositionInteraction &reposition);
    void attach(interaction::ResizeInteraction &resize);
    void attach(interaction::GridCreateInteraction &create);
    void attach(interaction::ExternalDragBridge &bridge);

    std::vector<data::Block> blocks() const;

    bool moveBlock(const QUuid &id, int dayIndex, int startMinutes, int durationMinutes);
    bool duplicateBlock(const QUuid &id, int dayIndex, int startMinutes);
    bool createBlock(int dayIndex, int startMinutes, int durationMinutes);
    bool previewResize(const QUuid &id, int startMinutes, int durationMinutes);
    bool finishResize(const QUuid &id);
    bool placeExternal(const interaction::DragItem &item,
                       const interaction::DropPosition &position,
                       const QVector<QDate> &weekDates);

    bool isResizing(const QUuid &id) const { return m_resizeOrigins.contains(id); }

signals:
    void blocksChanged();
    // A backlog item was dropped on a day header; the date is the column's
    // date in the visible week.
    void deadlineRequested(const planner::interaction::DragItem &item, const QDate &date);

private:
    bool replaceBlock(const data::Block &before, const data::Block &after, const QString &text);

    data::BlockRepository &m_repository;
    UndoStack &m_undoStack;
    QHash<QUuid, data::Block> m_resizeOrigins;
};

} // namespace core
} // namespace planner
