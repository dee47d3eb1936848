#include "planner/core/PlannerSettings.hpp"

#include <QSettings>
#include <QtGlobal>
#include <array>

#include "planner/core/Logging.hpp"

namespace planner {
namespace core {

namespace {

constexpr std::array<int, 5> AllowedSnapMinutes = { 5, 10, 15, 30, 60 };

Qt::KeyboardModifier modifierFromValue(int value, Qt::KeyboardModifier fallback)
{
    switch (value) {
    case Qt::ShiftModifier:
    case Qt::ControlModifier:
    case Qt::AltModifier:
    case Qt::MetaModifier:
        return static_cast<Qt::KeyboardModifier>(value);
    default:
        return fallback;
    }
}

int nearestSnap(int value)
{
    int best = AllowedSnapMinutes.front();
    for (int candidate : AllowedSnapMinutes) {
        if (qAbs(candidate - value) < qAbs(best - value)) {
            best = candidate;
        }
    }
    return best;
}

} // namespace

double PlannerSettings::gridHeightPx() const
{
    return BasePixelsPerHour * (zoomPercent / 100.0) * 24.0;
}

PlannerSettings PlannerSettings::load(const QSettings &settings)
{
    PlannerSettings result;

    const int zoom = settings.value(QStringLiteral("grid/zoomPercent"), result.zoomPercent).toInt();
    result.zoomPercent = qBound(MinZoomPercent, zoom, MaxZoomPercent);
    if (result.zoomPercent != zoom) {
        qCWarning(lcSettings) << "zoomPercent out of range, clamped" << zoom << "->" << result.zoomPercent;
    }

    const int snap = settings.value(QStringLiteral("grid/snapMinutes"), result.snapMinutes).toInt();
    result.snapMinutes = nearestSnap(snap);
    if (result.snapMinutes != snap) {
        qCWarning(lcSettings) << "unsupported snap interval" << snap << "->" << result.snapMinutes;
    }

    const int threshold = settings.value(QStringLiteral("interaction/dragThresholdPx"), result.dragThresholdPx).toInt();
    result.dragThresholdPx = qBound(1, threshold, 32);

    result.overlapModifier = modifierFromValue(
        settings.value(QStringLiteral("interaction/overlapModifier"), static_cast<int>(result.overlapModifier)).toInt(),
        Qt::ShiftModifier);
    result.duplicateModifier = modifierFromValue(
        settings.value(QStringLiteral("interaction/duplicateModifier"), static_cast<int>(result.duplicateModifier)).toInt(),
        Qt::AltModifier);
    if (result.duplicateModifier == result.overlapModifier) {
        qCWarning(lcSettings) << "overlap and duplicate modifier collide, using defaults";
        result.overlapModifier = Qt::ShiftModifier;
        result.duplicateModifier = Qt::AltModifier;
    }

    const int weekStart = settings.value(QStringLiteral("calendar/weekStartsOn"), static_cast<int>(Qt::Monday)).toInt();
    result.weekStartsOn = weekStart == Qt::Sunday ? Qt::Sunday : Qt::Monday;

    const QString mode = settings.value(QStringLiteral("calendar/viewMode"), QStringLiteral("week")).toString();
    result.viewMode = mode == QLatin1String("day") ? ViewMode::Day : ViewMode::Week;
    result.dayViewIndex = qBound(0, settings.value(QStringLiteral("calendar/dayViewIndex"), 0).toInt(), 6);

    return result;
}

void PlannerSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("grid/zoomPercent"), zoomPercent);
    settings.setValue(QStringLiteral("grid/snapMinutes"), snapMinutes);
    settings.setValue(QStringLiteral("interaction/dragThresholdPx"), dragThresholdPx);
    settings.setValue(QStringLiteral("interaction/overlapModifier"), static_cast<int>(overlapModifier));
    settings.setValue(QStringLiteral("interaction/duplicateModifier"), static_cast<int>(duplicateModifier));
    settings.setValue(QStringLiteral("calendar/weekStartsOn"), static_cast<int>(weekStartsOn));
    settings.setValue(QStringLiteral("calendar/viewMode"),
                      viewMode == ViewMode::Day ? QStringLiteral("day") : QStringLiteral("week"));
    settings.setValue(QStringLiteral("calendar/dayViewIndex"), dayViewIndex);
}

int keyForModifier(Qt::KeyboardModifier modifier)
{
    switch (modifier) {
    case Qt::ShiftModifier:
        return Qt::Key_Shift;
    case Qt::ControlModifier:
        return Qt::Key_Control;
    case Qt::AltModifier:
        return Qt::Key_Alt;
    case Qt::MetaModifier:
        return Qt::Key_Meta;
    default:
        return 0;
    }
}

} // namespace core
} // namespace planner
