#include "planner/interaction/GridCreateInteraction.hpp"

#include <QtGlobal>

#include "planner/core/Logging.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"

namespace planner {
namespace interaction {

BlockSpan spanBetween(int dayIndex, int anchorMinutes, double pointerMinutes, const GridGeometry &geometry,
                      bool fineEnd)
{
    const int minDuration = data::MinBlockDurationMinutes;
    const int anchor = geometry.clampStart(anchorMinutes, minDuration);
    const int pointer = fineEnd ? qRound(pointerMinutes) : geometry.snapMinutes(pointerMinutes);
    const int current = qBound(0, pointer, data::MinutesPerDay);

    int start = anchor;
    int end = current;
    if (current < anchor) {
        start = current;
        end = anchor;
    }
    if (end - start < minDuration) {
        end = start + minDuration;
    }
    if (end > data::MinutesPerDay) {
        start -= end - data::MinutesPerDay;
        end = data::MinutesPerDay;
    }
    return { dayIndex, start, end - start };
}

GridCreateInteraction::GridCreateInteraction(DragSession &session, PlacementEngine &engine, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_engine(engine)
{
    connect(&m_session, &DragSession::pointerUpdated, this, &GridCreateInteraction::refreshPreview);
    connect(&m_session, &DragSession::overlapModeChanged, this, &GridCreateInteraction::refreshPreview);
    connect(&m_engine, &PlacementEngine::geometryChanged, this, &GridCreateInteraction::refreshPreview);
    connect(&m_session, &DragSession::previewPositionChanged, this, &GridCreateInteraction::previewChanged);
    connect(&m_session, &DragSession::dropped, this, &GridCreateInteraction::handleDropped);
}

void GridCreateInteraction::setPinnedDayIndex(std::optional<int> dayIndex)
{
    if (dayIndex) {
        dayIndex = qBound(0, *dayIndex, data::DaysPerWeek - 1);
    }
    m_pinnedDay = dayIndex;
}

bool GridCreateInteraction::beginCreate(const PointerEvent &event)
{
    const GridGeometry &geometry = m_engine.geometry();
    if (!geometry.isMeasured()) {
        return false;
    }
    const GridPoint point = m_engine.gridPoint(event.position);
    if (!point.insideViewport || point.position.y() < 0.0) {
        return false;
    }
    DragItem item;
    item.source = DragSource::EmptyGrid;
    item.gesture = DragGesture::Create;
    item.dayIndex = m_pinnedDay.value_or(geometry.dayIndexFromX(point.position.x()));
    item.startMinutes = geometry.pixelsToMinutes(point.position.y(), data::MinBlockDurationMinutes);
    item.durationMinutes = data::MinBlockDurationMinutes;
    return m_session.begin(item, event);
}

std::optional<BlockSpan> GridCreateInteraction::preview() const
{
    const auto &item = m_session.item();
    const auto &position = m_session.previewPosition();
    if (!m_session.isDragging() || !item || !ownsItem(*item) || !position || !position->startMinutes) {
        return std::nullopt;
    }
    return BlockSpan{ position->dayIndex, *position->startMinutes, resolvedDuration(*item, *position) };
}

bool GridCreateInteraction::ownsItem(const DragItem &item) const
{
    return item.source == DragSource::EmptyGrid && item.gesture == DragGesture::Create;
}

BlockSpan GridCreateInteraction::spanFor(const DragItem &item, const QPointF &globalPos, bool fineEnd) const
{
    const GridGeometry &geometry = m_engine.geometry();
    const GridPoint point = m_engine.gridPoint(globalPos);
    return spanBetween(item.dayIndex, item.startMinutes, geometry.pixelDeltaToMinutes(point.position.y()), geometry,
                       fineEnd);
}

void GridCreateInteraction::refreshPreview()
{
    const auto &item = m_session.item();
    if (!m_session.isDragging() || !item || !ownsItem(*item)) {
        return;
    }
    if (!m_engine.geometry().isMeasured()) {
        m_session.setPreviewPosition(std::nullopt);
        return;
    }
    const BlockSpan span = spanFor(*item, m_session.pointerCurrent(), m_session.overlapModeEnabled());
    DropPosition position;
    position.dayIndex = span.dayIndex;
    position.startMinutes = span.startMinutes;
    position.adaptiveDuration = span.durationMinutes;
    m_session.setPreviewPosition(position);
}

void GridCreateInteraction::handleDropped(const DragDrop &drop)
{
    if (!ownsItem(drop.item) || !m_engine.geometry().isMeasured()) {
        return;
    }
    const BlockSpan span = spanFor(drop.item, drop.pointerCurrent, drop.overlapModeEnabled);
    qCDebug(lcDrag) << "create on day" << span.dayIndex << "start" << span.startMinutes << "duration"
                    << span.durationMinutes;
    emit createRequested(span.dayIndex, span.startMinutes, span.durationMinutes);
}

} // namespace interaction
} // namespace planner
