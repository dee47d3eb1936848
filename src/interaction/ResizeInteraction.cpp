#include "planner/interaction/ResizeInteraction.hpp"

#include <QtGlobal>

#include "planner/core/Logging.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"

namespace planner {
namespace interaction {

ResizeResult computeResize(int startMinutes,
                           int durationMinutes,
                           ResizeEdge edge,
                           double deltaPixels,
                           const GridGeometry &geometry)
{
    data::Block original;
    original.startMinutes = startMinutes;
    original.durationMinutes = durationMinutes;
    original = data::normalizedBlock(original);

    const double deltaMinutes = geometry.pixelDeltaToMinutes(deltaPixels);
    const int interval = qMax(1, geometry.snapIntervalMinutes);
    ResizeResult result{ original.startMinutes, original.durationMinutes };

    if (edge == ResizeEdge::Top) {
        const int end = original.endMinutes();
        const int latest = ((end - data::MinBlockDurationMinutes) / interval) * interval;
        const int proposed = geometry.snapMinutes(original.startMinutes + deltaMinutes);
        result.startMinutes = qBound(0, proposed, latest);
        result.durationMinutes = end - result.startMinutes;
    } else {
        const int proposed = geometry.snapMinutes(original.durationMinutes + deltaMinutes);
        result.durationMinutes = qBound(data::MinBlockDurationMinutes,
                                        proposed,
                                        data::MinutesPerDay - original.startMinutes);
    }
    return result;
}

ResizeInteraction::ResizeInteraction(DragSession &session, PlacementEngine &engine, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_engine(engine)
{
    connect(&m_session, &DragSession::pointerUpdated, this, &ResizeInteraction::handlePointerUpdated);
    connect(&m_session, &DragSession::dropped, this, &ResizeInteraction::handleDropped);
    connect(&m_session, &DragSession::cancelled, this, &ResizeInteraction::handleCancelled);
}

bool ResizeInteraction::beginResize(const data::Block &block, ResizeEdge edge, const PointerEvent &event)
{
    if (!m_engine.geometry().isMeasured()) {
        qCDebug(lcResize) << "resize disabled, geometry unmeasured";
        return false;
    }
    const DragItem item = DragItem::fromBlock(block, edge == ResizeEdge::Top ? DragGesture::ResizeTop
                                                                             : DragGesture::ResizeBottom);
    if (!m_session.begin(item, event)) {
        return false;
    }
    m_current = { item.startMinutes, item.durationMinutes };
    return true;
}

bool ResizeInteraction::isResizing() const
{
    return m_session.isDragging() && m_session.item() && ownsItem(*m_session.item());
}

bool ResizeInteraction::ownsItem(const DragItem &item) const
{
    return item.gesture == DragGesture::ResizeTop || item.gesture == DragGesture::ResizeBottom;
}

void ResizeInteraction::handlePointerUpdated(const QPointF &position)
{
    const auto &item = m_session.item();
    if (!item || !ownsItem(*item)) {
        return;
    }
    apply(*item, m_session.pointerStart(), position);
}

void ResizeInteraction::handleDropped(const DragDrop &drop)
{
    if (!ownsItem(drop.item)) {
        return;
    }
    apply(drop.item, drop.pointerStart, drop.pointerCurrent);
    qCDebug(lcResize) << "resize ended" << drop.item.blockId << m_current.startMinutes << m_current.durationMinutes;
    emit resizeEnded(drop.item.blockId);
}

void ResizeInteraction::handleCancelled(const DragItem &item)
{
    if (!ownsItem(item)) {
        return;
    }
    const ResizeResult original{ item.startMinutes, item.durationMinutes };
    if (m_current != original) {
        m_current = original;
        emit resized(item.blockId, original.startMinutes, original.durationMinutes);
    }
}

void ResizeInteraction::apply(const DragItem &item, const QPointF &start, const QPointF &current)
{
    const GridGeometry &geometry = m_engine.geometry();
    if (!geometry.isMeasured()) {
        return;
    }
    const ResizeEdge edge = item.gesture == DragGesture::ResizeTop ? ResizeEdge::Top : ResizeEdge::Bottom;
    const double delta = current.y() - start.y();
    const ResizeResult next = computeResize(item.startMinutes, item.durationMinutes, edge, delta, geometry);
    if (next == m_current) {
        return;
    }
    m_current = next;
    emit resized(item.blockId, next.startMinutes, next.durationMinutes);
}

} // namespace interaction
} // namespace planner
