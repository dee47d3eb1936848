#include "planner/interaction/GridGeometry.hpp"

#include <QtGlobal>
#include <cmath>

#include "planner/core/Logging.hpp"
#include "planner/interaction/ViewportMetrics.hpp"

namespace planner {
namespace interaction {

namespace {
// Keeps qRound inside int range for absurd pointer coordinates.
constexpr double MinuteRangeLimit = 1.0e6;
}

bool GridGeometry::isMeasured() const
{
    return dayColumnWidthPx > 0.0 && std::isfinite(dayColumnWidthPx) && pixelsPerMinute > 0.0 && columns > 0;
}

double GridGeometry::minutesToPixels(double minutes) const
{
    return minutes * pixelsPerMinute;
}

double GridGeometry::pixelDeltaToMinutes(double pixels) const
{
    if (pixelsPerMinute <= 0.0) {
        return 0.0;
    }
    return pixels / pixelsPerMinute;
}

int GridGeometry::snapMinutes(double minutes) const
{
    if (!std::isfinite(minutes)) {
        return 0;
    }
    const int interval = qMax(1, snapIntervalMinutes);
    const double bounded = qBound(-MinuteRangeLimit, minutes, MinuteRangeLimit);
    return qRound(bounded / interval) * interval;
}

int GridGeometry::latestStart(int durationMinutes) const
{
    const int interval = qMax(1, snapIntervalMinutes);
    const int room = data::MinutesPerDay - qBound(0, durationMinutes, data::MinutesPerDay);
    return (room / interval) * interval;
}

int GridGeometry::clampStart(int startMinutes, int durationMinutes) const
{
    return qBound(0, startMinutes, latestStart(durationMinutes));
}

int GridGeometry::pixelsToMinutes(double pixels, int durationMinutes) const
{
    return clampStart(snapMinutes(pixelDeltaToMinutes(pixels)), durationMinutes);
}

int GridGeometry::dayIndexFromX(double x) const
{
    if (dayColumnWidthPx <= 0.0 || columns <= 0) {
        return 0;
    }
    const double column = std::floor((x - gutterWidthPx) / dayColumnWidthPx);
    if (!(column > 0.0)) {
        return 0;
    }
    if (column >= columns - 1) {
        return columns - 1;
    }
    return static_cast<int>(column);
}

double GridGeometry::columnLeft(int column) const
{
    return gutterWidthPx + column * dayColumnWidthPx;
}

QRectF GridGeometry::blockRect(int column, int startMinutes, int durationMinutes) const
{
    return QRectF(columnLeft(column),
                  minutesToPixels(startMinutes),
                  dayColumnWidthPx,
                  minutesToPixels(durationMinutes));
}

GridGeometryProvider::GridGeometryProvider(ViewportMetrics &metrics, double gridHeightPx, QObject *parent)
    : QObject(parent)
    , m_metrics(metrics)
{
    if (gridHeightPx > 0.0) {
        m_geometry.pixelsPerMinute = pixelsPerMinuteFor(gridHeightPx);
    }
    connect(&m_metrics, &ViewportMetrics::metricsChanged, this, &GridGeometryProvider::refresh);
    refresh();
}

void GridGeometryProvider::setGridHeight(double gridHeightPx)
{
    if (gridHeightPx <= 0.0) {
        return;
    }
    const double ppm = pixelsPerMinuteFor(gridHeightPx);
    if (qFuzzyCompare(ppm, m_geometry.pixelsPerMinute)) {
        return;
    }
    m_geometry.pixelsPerMinute = ppm;
    emit geometryChanged(m_geometry);
}

void GridGeometryProvider::setSnapInterval(int minutes)
{
    if (minutes <= 0 || data::MinutesPerDay % minutes != 0) {
        qCWarning(lcGeometry) << "ignoring snap interval" << minutes;
        return;
    }
    if (m_geometry.snapIntervalMinutes == minutes) {
        return;
    }
    m_geometry.snapIntervalMinutes = minutes;
    emit geometryChanged(m_geometry);
}

void GridGeometryProvider::refresh()
{
    const int columns = qMax(1, m_metrics.visibleColumns());
    const double gutter = qMax(0.0, m_metrics.gutterWidth());
    const double available = m_metrics.columnsContainerWidth() - gutter;
    const double width = available > 0.0 ? available / columns : 0.0;

    if (columns == m_geometry.columns
        && qFuzzyCompare(1.0 + width, 1.0 + m_geometry.dayColumnWidthPx)
        && qFuzzyCompare(1.0 + gutter, 1.0 + m_geometry.gutterWidthPx)) {
        return;
    }
    m_geometry.columns = columns;
    m_geometry.gutterWidthPx = gutter;
    m_geometry.dayColumnWidthPx = width;
    if (width <= 0.0) {
        qCDebug(lcGeometry) << "day columns not measured yet";
    } else {
        qCDebug(lcGeometry) << "day column width" << width << "columns" << columns;
    }
    emit geometryChanged(m_geometry);
}

} // namespace interaction
} // namespace planner
