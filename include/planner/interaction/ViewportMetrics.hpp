#pragma once

#include <QObject>
#include <QPointF>
#include <QRectF>

namespace planner {
namespace interaction {

// A pointer position translated into grid space: x includes the hour-label
// gutter, y is minutes-scaled pixels from midnight. A negative y lies in the
// day-header band above the time grid.
struct GridPoint
{
    QPointF position;
    bool insideViewport = false;
};

// Maps a viewport-local point of a vertically scrolled grid whose day header
// stays pinned to the top headerHeight pixels. Header points are not
// scrolled and keep a negative y.
GridPoint gridPointFromViewport(const QPointF &local,
                                const QRectF &viewportRect,
                                double headerHeight,
                                double scrollOffset);

// Layout measurements of the rendered day columns. Implementations emit
// metricsChanged() whenever the rendered size changes (resize, zoom, view
// switch); until the first positive width is reported the grid is treated as
// unmeasured.
class ViewportMetrics : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;
    ~ViewportMetrics() override = default;

    virtual double columnsContainerWidth() const = 0;
    virtual int visibleColumns() const = 0;
    virtual double gutterWidth() const = 0;
    virtual GridPoint mapToGrid(const QPointF &globalPos) const = 0;

signals:
    void metricsChanged();
};

} // namespace interaction
} // namespace planner
