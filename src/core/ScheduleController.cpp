#include "planner/core/ScheduleController.hpp"

#include <memory>
#include <utility>

#include "planner/core/Logging.hpp"
#include "planner/core/UndoCommand.hpp"
#include "planner/core/UndoStack.hpp"
#include "planner/data/BlockRepository.hpp"
#include "planner/interaction/ExternalDragBridge.hpp"
#include "planner/interaction/GridCreateInteraction.hpp"
#include "planner/interaction/RepositionInteraction.hpp"
#include "planner/interaction/ResizeInteraction.hpp"

namespace {

class AddBlockCommand : public planner::core::UndoCommand
{
public:
    AddBlockCommand(planner::data::BlockRepository &repository, planner::data::Block block, QString text)
        : m_repository(repository)
        , m_block(std::move(block))
        , m_text(std::move(text))
    {
    }

    void redo() override { m_block = m_repository.addBlock(m_block); }

    void undo() override
    {
        if (!m_repository.removeBlock(m_block.id)) {
            qCWarning(lcSchedule) << "undo failed, block missing" << m_block.id;
        }
    }

    QString text() const override { return m_text; }

private:
    planner::data::BlockRepository &m_repository;
    planner::data::Block m_block;
    QString m_text;
};

class ReplaceBlockCommand : public planner::core::UndoCommand
{
public:
    ReplaceBlockCommand(planner::data::BlockRepository &repository,
                        planner::data::Block before,
                        planner::data::Block after,
                        QString text)
        : m_repository(repository)
        , m_before(std::move(before))
        , m_after(std::move(after))
        , m_text(std::move(text))
    {
    }

    void redo() override
    {
        if (!m_repository.updateBlock(m_after)) {
            qCWarning(lcSchedule) << "redo failed, block missing" << m_after.id;
        }
    }

    void undo() override
    {
        if (!m_repository.updateBlock(m_before)) {
            qCWarning(lcSchedule) << "undo failed, block missing" << m_before.id;
        }
    }

    QString text() const override { return m_text; }

private:
    planner::data::BlockRepository &m_repository;
    planner::data::Block m_before;
    planner::data::Block m_after;
    QString m_text;
};

bool samePlacement(const planner::data::Block &a, const planner::data::Block &b)
{
    return a.dayIndex == b.dayIndex && a.startMinutes == b.startMinutes && a.durationMinutes == b.durationMinutes;
}

} // namespace

namespace planner {
namespace core {

ScheduleController::ScheduleController(data::BlockRepository &repository, UndoStack &undoStack, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_undoStack(undoStack)
{
    connect(&m_undoStack, &UndoStack::changed, this, &ScheduleController::blocksChanged);
}

void ScheduleController::attach(interaction::RepositionInteraction &reposition)
{
    connect(&reposition, &interaction::RepositionInteraction::dragEnded, this, &ScheduleController::moveBlock);
    connect(&reposition,
            &interaction::RepositionInteraction::duplicateRequested,
            this,
            &ScheduleController::duplicateBlock);
}

void ScheduleController::attach(interaction::ResizeInteraction &resize)
{
    connect(&resize, &interaction::ResizeInteraction::resized, this, &ScheduleController::previewResize);
    connect(&resize, &interaction::ResizeInteraction::resizeEnded, this, &ScheduleController::finishResize);
}

void ScheduleController::attach(interaction::GridCreateInteraction &create)
{
    connect(&create, &interaction::GridCreateInteraction::createRequested, this, &ScheduleController::createBlock);
}

void ScheduleController::attach(interaction::ExternalDragBridge &bridge)
{
    connect(&bridge, &interaction::ExternalDragBridge::externalDropped, this, &ScheduleController::placeExternal);
}

std::vector<data::Block> ScheduleController::blocks() const
{
    return m_repository.fetchBlocks();
}

bool ScheduleController::moveBlock(const QUuid &id, int dayIndex, int startMinutes, int durationMinutes)
{
    const auto before = m_repository.findById(id);
    if (!before) {
        qCWarning(lcSchedule) << "move ignored, unknown block" << id;
        return false;
    }
    data::Block after = *before;
    after.dayIndex = dayIndex;
    after.startMinutes = startMinutes;
    after.durationMinutes = durationMinutes;
    after = data::normalizedBlock(after);
    if (samePlacement(*before, after)) {
        return false;
    }
    return replaceBlock(*before, after, tr("Block verschieben"));
}

bool ScheduleController::duplicateBlock(const QUuid &id, int dayIndex, int startMinutes)
{
    const auto source = m_repository.findById(id);
    if (!source) {
        qCWarning(lcSchedule) << "duplicate ignored, unknown block" << id;
        return false;
    }
    data::Block copy = *source;
    copy.id = QUuid::createUuid();
    copy.dayIndex = dayIndex;
    copy.startMinutes = startMinutes;
    m_undoStack.push(std::make_unique<AddBlockCommand>(m_repository, data::normalizedBlock(copy), tr("Block duplizieren")));
    return true;
}

bool ScheduleController::createBlock(int dayIndex, int startMinutes, int durationMinutes)
{
    data::Block block;
    block.title = tr("Neuer Block");
    block.dayIndex = dayIndex;
    block.startMinutes = startMinutes;
    block.durationMinutes = durationMinutes;
    m_undoStack.push(std::make_unique<AddBlockCommand>(m_repository, data::normalizedBlock(block), tr("Block anlegen")));
    return true;
}

bool ScheduleController::previewResize(const QUuid &id, int startMinutes, int durationMinutes)
{
    const auto current = m_repository.findById(id);
    if (!current) {
        qCWarning(lcSchedule) << "resize ignored, unknown block" << id;
        return false;
    }
    if (!m_resizeOrigins.contains(id)) {
        m_resizeOrigins.insert(id, *current);
    }
    data::Block next = *current;
    next.startMinutes = startMinutes;
    next.durationMinutes = durationMinutes;
    if (!m_repository.updateBlock(next)) {
        return false;
    }
    // Back at the origin, e.g. after Escape: nothing left to record.
    if (samePlacement(m_resizeOrigins.value(id), next)) {
        m_resizeOrigins.remove(id);
    }
    emit blocksChanged();
    return true;
}

bool ScheduleController::finishResize(const QUuid &id)
{
    if (!m_resizeOrigins.contains(id)) {
        return false;
    }
    const data::Block before = m_resizeOrigins.take(id);
    const auto after = m_repository.findById(id);
    if (!after) {
        qCWarning(lcSchedule) << "resize end for removed block" << id;
        return false;
    }
    if (samePlacement(before, *after)) {
        return false;
    }
    return replaceBlock(before, *after, tr("Blockdauer ändern"));
}

bool ScheduleController::placeExternal(const interaction::DragItem &item,
                                       const interaction::DropPosition &position,
                                       const QVector<QDate> &weekDates)
{
    switch (position.target) {
    case interaction::DropTarget::DayHeader: {
        const QDate date = weekDates.value(position.dayIndex);
        if (!date.isValid()) {
            qCWarning(lcSchedule) << "day header drop without a date" << position.dayIndex;
            return false;
        }
        qCDebug(lcSchedule) << "deadline requested for" << item.title() << date;
        emit deadlineRequested(item, date);
        return true;
    }
    case interaction::DropTarget::ExistingBlock: {
        const auto before = m_repository.findById(position.targetBlockId);
        if (!before || item.taskId.isEmpty()) {
            qCWarning(lcSchedule) << "block drop ignored" << position.targetBlockId;
            return false;
        }
        if (before->taskIds.contains(item.taskId)) {
            return false;
        }
        data::Block after = *before;
        after.taskIds.append(item.taskId);
        return replaceBlock(*before, after, tr("Aufgabe zuordnen"));
    }
    case interaction::DropTarget::TimeGrid:
        break;
    }

    if (!position.startMinutes) {
        qCWarning(lcSchedule) << "time grid drop without a start";
        return false;
    }
    data::Block block;
    block.title = item.title();
    block.color = item.color();
    block.type = item.type;
    block.dayIndex = position.dayIndex;
    block.startMinutes = *position.startMinutes;
    block.durationMinutes = interaction::resolvedDuration(item, position);
    block.goalId = item.goalId;
    if (item.type == data::BlockType::Task && !item.taskId.isEmpty()) {
        block.taskIds.append(item.taskId);
    }
    m_undoStack.push(std::make_unique<AddBlockCommand>(m_repository, data::normalizedBlock(block), tr("Block einplanen")));
    return true;
}

bool ScheduleController::replaceBlock(const data::Block &before, const data::Block &after, const QString &text)
{
    m_undoStack.push(std::make_unique<ReplaceBlockCommand>(m_repository, before, after, text));
    return true;
}

} // namespace core
} // namespace planner
