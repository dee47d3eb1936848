#pragma once

#include <QAbstractScrollArea>
#include <QDate>
#include <QUuid>
#include <QVector>
#include <memory>
#include <optional>
#include <vector>

#include "planner/core/PlannerSettings.hpp"
#include "planner/data/Block.hpp"
#include "planner/interaction/ViewportMetrics.hpp"

namespace planner {
namespace interaction {
class DragSession;
class ExternalDragBridge;
class GridCreateInteraction;
class GridGeometryProvider;
class PlacementEngine;
class RepositionInteraction;
class ResizeInteraction;
struct GridGeometry;
}

namespace ui {

class WeekGridView;

// Measurements of the rendered day columns, taken from the view's viewport.
class WeekGridMetrics : public interaction::ViewportMetrics
{
    Q_OBJECT

public:
    explicit WeekGridMetrics(WeekGridView &view);

    double columnsContainerWidth() const override;
    int visibleColumns() const override;
    double gutterWidth() const override;
    interaction::GridPoint mapToGrid(const QPointF &globalPos) const override;

private:
    WeekGridView &m_view;
};

class WeekGridView : public QAbstractScrollArea
{
    Q_OBJECT

public:
    explicit WeekGridView(interaction::DragSession &session, QWidget *parent = nullptr);
    ~WeekGridView() override;

    void setWeekDates(const QVector<QDate> &dates);
    void setBlocks(std::vector<data::Block> blocks);
    void setViewMode(core::ViewMode mode, int dayIndex);
    void setGridHeight(double heightPx);
    void setSnapInterval(int minutes);
    void setInteractionConsumers(bool hasResizeConsumer, bool hasDragConsumer);

    interaction::PlacementEngine &placementEngine() { return *m_engine; }
    interaction::RepositionInteraction &repositionInteraction() { return *m_reposition; }
    interaction::ResizeInteraction &resizeInteraction() { return *m_resize; }
    interaction::GridCreateInteraction &createInteraction() { return *m_create; }
    interaction::ExternalDragBridge &externalBridge() { return *m_bridge; }

    double headerHeight() const { return m_headerHeight; }
    double timeAxisWidth() const { return m_timeAxisWidth; }
    int columnCount() const { return m_viewMode == core::ViewMode::Week ? data::DaysPerWeek : 1; }

signals:
    void zoomRequested(bool zoomIn);
    void blockActivated(const QUuid &blockId);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void leaveEvent(QEvent *event) override;
    void scrollContentsBy(int dx, int dy) override;

private:
    enum class HitPart
    {
        None,
        Body,
        TopHandle,
        BottomHandle,
    };

    struct Hit
    {
        const data::Block *block = nullptr;
        HitPart part = HitPart::None;
    };

    const interaction::GridGeometry &geometry() const;
    std::optional<int> pinnedDay() const;
    int columnForDay(int dayIndex) const;
    int dayForColumn(int column) const;
    QRectF viewRectFor(int dayIndex, int startMinutes, int durationMinutes) const;
    double bodyOriginY() const;
    Hit hitTest(const QPointF &viewportPos) const;
    void updateScrollBars();
    void paintHeader(QPainter &painter) const;
    void paintTimeAxis(QPainter &painter) const;
    void paintBlock(QPainter &painter, const data::Block &block) const;
    void paintPreview(QPainter &painter,
                      int dayIndex,
                      int startMinutes,
                      int durationMinutes,
                      const QString &label,
                      const QColor &color) const;
    void paintDropTargets(QPainter &painter) const;

    interaction::DragSession &m_session;
    std::unique_ptr<WeekGridMetrics> m_metrics;
    std::unique_ptr<interaction::GridGeometryProvider> m_geometry;
    std::unique_ptr<interaction::PlacementEngine> m_engine;
    std::unique_ptr<interaction::RepositionInteraction> m_reposition;
    std::unique_ptr<interaction::ResizeInteraction> m_resize;
    std::unique_ptr<interaction::GridCreateInteraction> m_create;
    std::unique_ptr<interaction::ExternalDragBridge> m_bridge;

    QVector<QDate> m_weekDates;
    core::ViewMode m_viewMode = core::ViewMode::Week;
    int m_dayViewIndex = 0;
    double m_headerHeight = 40.0;
    double m_timeAxisWidth = 60.0;
    bool m_hasResizeConsumer = false;
    bool m_hasDragConsumer = false;
    QUuid m_hoveredBlockId;
    HitPart m_hoveredPart = HitPart::None;
};

} // namespace ui
} // namespace planner
