#include "planner/interaction/DragSession.hpp"

#include <cmath>

#include "planner/core/Logging.hpp"
#include "planner/core/PlannerSettings.hpp"

namespace planner {
namespace interaction {

DragSession::DragSession(QObject *parent)
    : QObject(parent)
{
}

void DragSession::setDragThreshold(double pixels)
{
    if (pixels < 0.0 || !std::isfinite(pixels)) {
        return;
    }
    m_threshold = pixels;
}

void DragSession::setOverlapModifier(Qt::KeyboardModifier modifier)
{
    if (core::keyForModifier(modifier) == 0) {
        return;
    }
    m_overlapModifier = modifier;
}

bool DragSession::begin(const DragItem &item, const PointerEvent &event)
{
    if (m_phase != DragPhase::Idle) {
        qCDebug(lcDrag) << "begin ignored, session is" << dragPhaseName(m_phase);
        return false;
    }
    m_item = item;
    m_pointerStart = event.position;
    m_pointerCurrent = event.position;
    m_previewPosition.reset();
    setOverlapMode(event.modifiers.testFlag(m_overlapModifier));
    qCDebug(lcDrag) << "pending at" << event.position << "overlap" << m_overlapMode;
    setPhase(DragPhase::Pending);
    return true;
}

void DragSession::pointerMoved(const PointerEvent &event)
{
    switch (m_phase) {
    case DragPhase::Idle:
        return;
    case DragPhase::Pending: {
        const QPointF delta = event.position - m_pointerStart;
        if (std::hypot(delta.x(), delta.y()) < m_threshold) {
            return;
        }
        m_pointerCurrent = event.position;
        // Sampled again here because the modifier is often pressed just after
        // the button.
        setOverlapMode(event.modifiers.testFlag(m_overlapModifier));
        setPhase(DragPhase::Dragging);
        qCDebug(lcDrag) << "activated at" << event.position << "overlap" << m_overlapMode;
        emit activated(*m_item);
        if (m_phase != DragPhase::Dragging) {
            return;
        }
        emit pointerUpdated(m_pointerCurrent);
        return;
    }
    case DragPhase::Dragging:
        m_pointerCurrent = event.position;
        emit pointerUpdated(m_pointerCurrent);
        return;
    }
}

void DragSession::pointerReleased(const PointerEvent &event)
{
    if (m_phase == DragPhase::Idle) {
        return;
    }
    if (m_phase == DragPhase::Pending) {
        qCDebug(lcDrag) << "released below threshold";
        reset();
        return;
    }

    DragDrop drop;
    drop.item = *m_item;
    drop.pointerStart = m_pointerStart;
    drop.pointerCurrent = event.position;
    drop.previewPosition = m_previewPosition;
    drop.overlapModeEnabled = m_overlapMode;
    drop.modifiers = event.modifiers;
    qCDebug(lcDrag) << "dropped at" << event.position;
    reset();
    emit dropped(drop);
}

bool DragSession::keyPressed(int key)
{
    if (key == Qt::Key_Escape && m_phase != DragPhase::Idle) {
        cancel();
        return true;
    }
    if (m_phase == DragPhase::Dragging && key == core::keyForModifier(m_overlapModifier)) {
        setOverlapMode(true);
        return true;
    }
    return false;
}

bool DragSession::keyReleased(int key)
{
    if (m_phase == DragPhase::Dragging && key == core::keyForModifier(m_overlapModifier)) {
        setOverlapMode(false);
        return true;
    }
    return false;
}

void DragSession::cancel()
{
    if (m_phase == DragPhase::Idle) {
        return;
    }
    const DragItem item = *m_item;
    qCDebug(lcDrag) << "cancelled from" << dragPhaseName(m_phase);
    reset();
    emit cancelled(item);
}

void DragSession::setPreviewPosition(const std::optional<DropPosition> &position)
{
    if (m_phase != DragPhase::Dragging) {
        return;
    }
    if (m_previewPosition == position) {
        return;
    }
    m_previewPosition = position;
    emit previewPositionChanged();
}

void DragSession::setPhase(DragPhase phase)
{
    if (m_phase == phase) {
        return;
    }
    m_phase = phase;
    emit phaseChanged(phase);
}

void DragSession::setOverlapMode(bool enabled)
{
    if (m_overlapMode == enabled) {
        return;
    }
    m_overlapMode = enabled;
    if (m_phase == DragPhase::Dragging) {
        qCDebug(lcDrag) << "overlap mode" << enabled;
    }
    emit overlapModeChanged(enabled);
}

void DragSession::reset()
{
    const bool hadPreview = m_previewPosition.has_value();
    m_item.reset();
    m_previewPosition.reset();
    m_pointerStart = QPointF();
    m_pointerCurrent = QPointF();
    setOverlapMode(false);
    setPhase(DragPhase::Idle);
    if (hadPreview) {
        emit previewPositionChanged();
    }
}

QString dragPhaseName(DragPhase phase)
{
    switch (phase) {
    case DragPhase::Idle:
        return QStringLiteral("idle");
    case DragPhase::Pending:
        return QStringLiteral("pending");
    case DragPhase::Dragging:
        return QStringLiteral("dragging");
    }
    return QStringLiteral("idle");
}

} // namespace interaction
} // namespace planner
