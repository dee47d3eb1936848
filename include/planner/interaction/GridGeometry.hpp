#pragma once

#include <QObject>
#include <QRectF>

#include "planner/data/Block.hpp"

namespace planner {
namespace interaction {

class ViewportMetrics;

constexpr double DefaultGridHeightPx = 1920.0;
constexpr int DefaultSnapMinutes = 15;

constexpr double pixelsPerMinuteFor(double gridHeightPx)
{
    return gridHeightPx / data::MinutesPerDay;
}

constexpr double DefaultPixelsPerMinute = pixelsPerMinuteFor(DefaultGridHeightPx);

struct GridGeometry
{
    double pixelsPerMinute = DefaultPixelsPerMinute;
    double dayColumnWidthPx = 0.0;
    double gutterWidthPx = 0.0;
    int columns = data::DaysPerWeek;
    int snapIntervalMinutes = DefaultSnapMinutes;

    bool isMeasured() const;

    double minutesToPixels(double minutes) const;
    // Unsnapped, unclamped conversion for pointer deltas.
    double pixelDeltaToMinutes(double pixels) const;
    // Nearest multiple of the snap interval.
    int snapMinutes(double minutes) const;
    // Largest start that keeps [start, start + duration) inside the day and
    // on the snap grid.
    int latestStart(int durationMinutes) const;
    int clampStart(int startMinutes, int durationMinutes) const;
    // Pixel row to a snapped start minute for an item of the given duration.
    int pixelsToMinutes(double pixels, int durationMinutes = 0) const;
    int dayIndexFromX(double x) const;
    double columnLeft(int column) const;
    QRectF blockRect(int column, int startMinutes, int durationMinutes) const;
};

// Owns the current GridGeometry and keeps the column width in sync with the
// viewport measurements.
class GridGeometryProvider : public QObject
{
    Q_OBJECT

public:
    explicit GridGeometryProvider(ViewportMetrics &metrics,
                                  double gridHeightPx = DefaultGridHeightPx,
                                  QObject *parent = nullptr);

    const GridGeometry &geometry() const { return m_geometry; }
    ViewportMetrics &metrics() const { return m_metrics; }

    void setGridHeight(double gridHeightPx);
    void setSnapInterval(int minutes);
    void refresh();

signals:
    void geometryChanged(const planner::interaction::GridGeometry &geometry);

private:
    ViewportMetrics &m_metrics;
    GridGeometry m_geometry;
};

} // namespace interaction
} // namespace planner
