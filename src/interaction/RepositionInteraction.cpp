#include "planner/interaction/RepositionInteraction.hpp"

#include <QtGlobal>

#include "planner/core/Logging.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"

namespace planner {
namespace interaction {

RepositionInteraction::RepositionInteraction(DragSession &session, PlacementEngine &engine, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_engine(engine)
{
    connect(&m_session, &DragSession::pointerUpdated, this, &RepositionInteraction::refreshPreview);
    connect(&m_session, &DragSession::overlapModeChanged, this, &RepositionInteraction::refreshPreview);
    connect(&m_engine, &PlacementEngine::geometryChanged, this, &RepositionInteraction::refreshPreview);
    connect(&m_engine, &PlacementEngine::blocksChanged, this, &RepositionInteraction::refreshPreview);
    connect(&m_session, &DragSession::dropped, this, &RepositionInteraction::handleDropped);
}

void RepositionInteraction::setPinnedDayIndex(std::optional<int> dayIndex)
{
    if (dayIndex) {
        dayIndex = qBound(0, *dayIndex, data::DaysPerWeek - 1);
    }
    m_pinnedDay = dayIndex;
}

void RepositionInteraction::setDuplicateModifier(Qt::KeyboardModifier modifier)
{
    m_duplicateModifier = modifier;
}

bool RepositionInteraction::beginDrag(const data::Block &block, const PointerEvent &event)
{
    const GridGeometry &geometry = m_engine.geometry();
    if (!geometry.isMeasured()) {
        qCDebug(lcDrag) << "reposition disabled, geometry unmeasured";
        return false;
    }
    DragItem item = DragItem::fromBlock(block, DragGesture::Move);
    const GridPoint point = m_engine.gridPoint(event.position);
    const double pointerMinutes = geometry.pixelDeltaToMinutes(point.position.y());
    item.grabOffsetMinutes = qBound(0.0, pointerMinutes - item.startMinutes, double(item.durationMinutes));
    return m_session.begin(item, event);
}

bool RepositionInteraction::isDragging() const
{
    return m_session.isDragging() && m_session.item() && ownsItem(*m_session.item());
}

bool RepositionInteraction::ownsItem(const DragItem &item) const
{
    return item.source == DragSource::ExistingBlock && item.gesture == DragGesture::Move;
}

DropConstraints RepositionInteraction::constraintsFor(const DragItem &item) const
{
    DropConstraints constraints;
    constraints.pinnedDayIndex = m_pinnedDay;
    constraints.allowDayHeader = false;
    constraints.allowBlockTargets = false;
    constraints.excludedBlockId = item.blockId;
    return constraints;
}

void RepositionInteraction::refreshPreview()
{
    if (!isDragging()) {
        return;
    }
    const DragItem &item = *m_session.item();
    m_session.setPreviewPosition(m_engine.resolve(item,
                                                  m_session.pointerCurrent(),
                                                  m_session.overlapModeEnabled(),
                                                  constraintsFor(item),
                                                  false));
}

void RepositionInteraction::handleDropped(const DragDrop &drop)
{
    if (!ownsItem(drop.item)) {
        return;
    }
    const auto position = m_engine.resolve(drop.item,
                                           drop.pointerCurrent,
                                           drop.overlapModeEnabled,
                                           constraintsFor(drop.item),
                                           false);
    if (!position || !position->startMinutes) {
        qCDebug(lcDrag) << "reposition dropped without a position";
        return;
    }
    const int day = position->dayIndex;
    const int start = *position->startMinutes;
    if (drop.modifiers.testFlag(m_duplicateModifier)) {
        qCDebug(lcDrag) << "duplicate" << drop.item.blockId << "to day" << day << "start" << start;
        emit duplicateRequested(drop.item.blockId, day, start);
        return;
    }
    const int duration = resolvedDuration(drop.item, *position);
    if (day == drop.item.dayIndex && start == drop.item.startMinutes && duration == drop.item.durationMinutes) {
        return;
    }
    qCDebug(lcDrag) << "move" << drop.item.blockId << "to day" << day << "start" << start;
    emit dragEnded(drop.item.blockId, day, start, duration);
}

} // namespace interaction
} // namespace planner
