#pragma once

#include <QColor>
#include <QDate>
#include <QObject>
#include <QString>
#include <QVector>
#include <optional>

#include "planner/interaction/DragSession.hpp"

namespace planner {
namespace interaction {

class PlacementEngine;

// Ghost block drawn while an external item hovers the time grid.
struct GhostPreview
{
    int dayIndex = 0;
    int startMinutes = 0;
    int durationMinutes = 0;
    QString title;
    QColor color;
};

// Connects drags that start outside the grid (backlog, sidebar) to the grid's
// placement rules. The bridge never creates blocks itself; releasing over
// the grid hands item, position and week dates to externalDropped().
class ExternalDragBridge : public QObject
{
    Q_OBJECT

public:
    ExternalDragBridge(DragSession &session, PlacementEngine &engine, QObject *parent = nullptr);

    // Expects the 7 dates of the visible week, in display order.
    bool setWeekDates(const QVector<QDate> &dates);
    const QVector<QDate> &weekDates() const { return m_weekDates; }
    void setPinnedDayIndex(std::optional<int> dayIndex);

    // Starts a drag for an external item, centred under the pointer.
    bool beginExternalDrag(DragItem item, const PointerEvent &event);

    std::optional<GhostPreview> preview() const;

signals:
    void previewChanged();
    void externalDropped(const planner::interaction::DragItem &item,
                         const planner::interaction::DropPosition &position,
                         const QVector<QDate> &weekDates);

private:
    bool ownsItem(const DragItem &item) const;
    DropConstraints constraints() const;
    void refreshPreview();
    void handleDropped(const DragDrop &drop);

    DragSession &m_session;
    PlacementEngine &m_engine;
    QVector<QDate> m_weekDates;
    std::optional<int> m_pinnedDay;
};

} // namespace interaction
} // namespace planner
