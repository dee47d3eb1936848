#pragma once

#include <Qt>

class QSettings;

namespace planner {
namespace core {

enum class ViewMode
{
    Week,
    Day,
};

struct PlannerSettings
{
    static constexpr int BasePixelsPerHour = 80;
    static constexpr int MinZoomPercent = 50;
    static constexpr int MaxZoomPercent = 200;

    int zoomPercent = 100;
    int snapMinutes = 15;
    int dragThresholdPx = 4;
    Qt::KeyboardModifier overlapModifier = Qt::ShiftModifier;
    Qt::KeyboardModifier duplicateModifier = Qt::AltModifier;
    Qt::DayOfWeek weekStartsOn = Qt::Monday;
    ViewMode viewMode = ViewMode::Week;
    int dayViewIndex = 0;

    double gridHeightPx() const;
    int visibleColumns() const { return viewMode == ViewMode::Week ? 7 : 1; }

    static PlannerSettings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

// Maps a modifier flag to the key that produces it, e.g. Shift -> Key_Shift.
int keyForModifier(Qt::KeyboardModifier modifier);

} // namespace core
} // namespace planner
