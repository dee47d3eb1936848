#include "planner/interaction/ExternalDragBridge.hpp"

#include <QtGlobal>

#include "planner/core/Logging.hpp"
#include "planner/interaction/PlacementEngine.hpp"

namespace planner {
namespace interaction {

ExternalDragBridge::ExternalDragBridge(DragSession &session, PlacementEngine &engine, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_engine(engine)
{
    connect(&m_session, &DragSession::pointerUpdated, this, &ExternalDragBridge::refreshPreview);
    connect(&m_session, &DragSession::overlapModeChanged, this, &ExternalDragBridge::refreshPreview);
    connect(&m_engine, &PlacementEngine::geometryChanged, this, &ExternalDragBridge::refreshPreview);
    connect(&m_engine, &PlacementEngine::blocksChanged, this, &ExternalDragBridge::refreshPreview);
    connect(&m_session, &DragSession::previewPositionChanged, this, &ExternalDragBridge::previewChanged);
    connect(&m_session, &DragSession::dropped, this, &ExternalDragBridge::handleDropped);
}

bool ExternalDragBridge::setWeekDates(const QVector<QDate> &dates)
{
    if (dates.size() != data::DaysPerWeek) {
        qCWarning(lcDrop) << "week needs" << data::DaysPerWeek << "dates, got" << dates.size();
        return false;
    }
    for (int i = 0; i < dates.size(); ++i) {
        if (!dates.at(i).isValid() || (i > 0 && dates.at(i - 1).daysTo(dates.at(i)) != 1)) {
            qCWarning(lcDrop) << "week dates are not consecutive" << dates;
            return false;
        }
    }
    m_weekDates = dates;
    return true;
}

void ExternalDragBridge::setPinnedDayIndex(std::optional<int> dayIndex)
{
    if (dayIndex) {
        dayIndex = qBound(0, *dayIndex, data::DaysPerWeek - 1);
    }
    m_pinnedDay = dayIndex;
}

bool ExternalDragBridge::beginExternalDrag(DragItem item, const PointerEvent &event)
{
    item.source = DragSource::External;
    item.gesture = DragGesture::Place;
    item.grabOffsetMinutes = placementOffsetMinutes(item.defaultDuration());
    return m_session.begin(item, event);
}

std::optional<GhostPreview> ExternalDragBridge::preview() const
{
    if (!m_session.isDragging() || !m_session.item() || !ownsItem(*m_session.item())) {
        return std::nullopt;
    }
    const auto &position = m_session.previewPosition();
    if (!position || position->target != DropTarget::TimeGrid || !position->startMinutes) {
        return std::nullopt;
    }
    const DragItem &item = *m_session.item();
    GhostPreview ghost;
    ghost.dayIndex = position->dayIndex;
    ghost.startMinutes = *position->startMinutes;
    ghost.durationMinutes = resolvedDuration(item, *position);
    ghost.title = item.title();
    ghost.color = item.color();
    return ghost;
}

bool ExternalDragBridge::ownsItem(const DragItem &item) const
{
    return item.source == DragSource::External;
}

DropConstraints ExternalDragBridge::constraints() const
{
    DropConstraints constraints;
    constraints.pinnedDayIndex = m_pinnedDay;
    return constraints;
}

void ExternalDragBridge::refreshPreview()
{
    if (!m_session.isDragging() || !m_session.item() || !ownsItem(*m_session.item())) {
        return;
    }
    m_session.setPreviewPosition(m_engine.resolve(*m_session.item(),
                                                  m_session.pointerCurrent(),
                                                  m_session.overlapModeEnabled(),
                                                  constraints(),
                                                  true));
}

void ExternalDragBridge::handleDropped(const DragDrop &drop)
{
    if (!ownsItem(drop.item)) {
        return;
    }
    if (m_weekDates.size() != data::DaysPerWeek) {
        qCWarning(lcDrop) << "external drop ignored, week dates not set";
        return;
    }
    const auto position = m_engine.resolve(drop.item, drop.pointerCurrent, drop.overlapModeEnabled, constraints(), true);
    if (!position) {
        qCDebug(lcDrop) << "external item released outside the grid";
        return;
    }
    emit externalDropped(drop.item, *position, m_weekDates);
}

} // namespace interaction
} // namespace planner
