#pragma once

#include <QObject>
#include <QUuid>
#include <optional>

#include "planner/interaction/DragSession.hpp"

namespace planner {
namespace interaction {

class PlacementEngine;

// Whole-block dragging. The preview lives in the shared session; a release
// emits exactly one of dragEnded() or duplicateRequested(), or nothing when
// the block would land where it already is.
class RepositionInteraction : public QObject
{
    Q_OBJECT

public:
    RepositionInteraction(DragSession &session, PlacementEngine &engine, QObject *parent = nullptr);

    // Single-day view: every drop lands on this day.
    void setPinnedDayIndex(std::optional<int> dayIndex);
    std::optional<int> pinnedDayIndex() const { return m_pinnedDay; }
    void setDuplicateModifier(Qt::KeyboardModifier modifier);

    bool beginDrag(const data::Block &block, const PointerEvent &event);
    bool isDragging() const;

signals:
    // durationMinutes differs from the block's duration only when gap
    // filling shortened it.
    void dragEnded(const QUuid &blockId, int dayIndex, int startMinutes, int durationMinutes);
    void duplicateRequested(const QUuid &blockId, int dayIndex, int startMinutes);

private:
    bool ownsItem(const DragItem &item) const;
    DropConstraints constraintsFor(const DragItem &item) const;
    void refreshPreview();
    void handleDropped(const DragDrop &drop);

    DragSession &m_session;
    PlacementEngine &m_engine;
    std::optional<int> m_pinnedDay;
    Qt::KeyboardModifier m_duplicateModifier = Qt::AltModifier;
};

} // namespace interaction
} // namespace planner
