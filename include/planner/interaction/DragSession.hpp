#pragma once

#include <QObject>
#include <QPointF>
#include <optional>

#include "planner/interaction/DragItem.hpp"

namespace planner {
namespace interaction {

enum class DragPhase
{
    Idle,
    Pending,
    Dragging,
};

struct PointerEvent
{
    QPointF position;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

// Snapshot handed to the owners when a drag is released after activation.
struct DragDrop
{
    DragItem item;
    QPointF pointerStart;
    QPointF pointerCurrent;
    std::optional<DropPosition> previewPosition;
    bool overlapModeEnabled = false;
    Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

// The one drag gesture shared by the grid, the resize handles and the
// backlog sidebar. Idle -> Pending on begin(), Pending -> Dragging once the
// pointer has travelled the threshold, back to Idle on release or Escape.
// Requests that do not fit the current phase are ignored.
//
// The session only tracks pointer and modifier state; owners resolve the
// preview themselves and store it with setPreviewPosition().
class DragSession : public QObject
{
    Q_OBJECT

public:
    static constexpr double DefaultDragThresholdPx = 4.0;

    explicit DragSession(QObject *parent = nullptr);

    void setDragThreshold(double pixels);
    double dragThreshold() const { return m_threshold; }
    void setOverlapModifier(Qt::KeyboardModifier modifier);
    Qt::KeyboardModifier overlapModifier() const { return m_overlapModifier; }

    // Returns false when a gesture is already pending or active. On true the
    // caller should accept the press so no text selection or native drag
    // starts.
    bool begin(const DragItem &item, const PointerEvent &event);
    void pointerMoved(const PointerEvent &event);
    void pointerReleased(const PointerEvent &event);
    // Escape cancels; the overlap modifier key toggles overlap mode while
    // dragging. Returns true when the key was consumed.
    bool keyPressed(int key);
    bool keyReleased(int key);
    void cancel();

    void setPreviewPosition(const std::optional<DropPosition> &position);

    DragPhase phase() const { return m_phase; }
    bool isIdle() const { return m_phase == DragPhase::Idle; }
    bool isPending() const { return m_phase == DragPhase::Pending; }
    bool isDragging() const { return m_phase == DragPhase::Dragging; }
    const std::optional<DragItem> &item() const { return m_item; }
    QPointF pointerStart() const { return m_pointerStart; }
    QPointF pointerCurrent() const { return m_pointerCurrent; }
    const std::optional<DropPosition> &previewPosition() const { return m_previewPosition; }
    bool overlapModeEnabled() const { return m_overlapMode; }

signals:
    void phaseChanged(planner::interaction::DragPhase phase);
    void activated(const planner::interaction::DragItem &item);
    void pointerUpdated(const QPointF &position);
    void overlapModeChanged(bool enabled);
    void previewPositionChanged();
    void dropped(const planner::interaction::DragDrop &drop);
    void cancelled(const planner::interaction::DragItem &item);

private:
    void setPhase(DragPhase phase);
    void setOverlapMode(bool enabled);
    void reset();

    DragPhase m_phase = DragPhase::Idle;
    std::optional<DragItem> m_item;
    QPointF m_pointerStart;
    QPointF m_pointerCurrent;
    std::optional<DropPosition> m_previewPosition;
    bool m_overlapMode = false;
    double m_threshold = DefaultDragThresholdPx;
    Qt::KeyboardModifier m_overlapModifier = Qt::ShiftModifier;
};

QString dragPhaseName(DragPhase phase);

} // namespace interaction
} // namespace planner

Q_DECLARE_METATYPE(planner::interaction::DragItem)
Q_DECLARE_METATYPE(planner::interaction::DropPosition)
Q_DECLARE_METATYPE(planner::interaction::DragDrop)
Q_DECLARE_METATYPE(planner::interaction::DragPhase)
