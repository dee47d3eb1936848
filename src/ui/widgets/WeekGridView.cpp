#include "planner/ui/widgets/WeekGridView.hpp"

#include <QLocale>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScrollBar>
#include <QTextOption>
#include <QTime>
#include <QWheelEvent>
#include <QtMath>

#include "planner/interaction/BlockCapabilities.hpp"
#include "planner/interaction/DragSession.hpp"
#include "planner/interaction/ExternalDragBridge.hpp"
#include "planner/interaction/GridCreateInteraction.hpp"
#include "planner/interaction/GridGeometry.hpp"
#include "planner/interaction/PlacementEngine.hpp"
#include "planner/interaction/RepositionInteraction.hpp"
#include "planner/interaction/ResizeInteraction.hpp"

namespace planner {
namespace ui {

namespace {
constexpr double HandleZone = 6.0;
constexpr double BlockCornerRadius = 6.0;

QString formatMinutes(int minutes)
{
    return QTime(0, 0).addSecs(minutes * 60).toString(QStringLiteral("hh:mm"));
}

QString durationText(int totalMinutes)
{
    const int hours = totalMinutes / 60;
    const int minutes = totalMinutes % 60;
    if (hours > 0 && minutes > 0) {
        return QObject::tr("%1h %2m").arg(hours).arg(minutes);
    }
    if (hours > 0) {
        return QObject::tr("%1h").arg(hours);
    }
    return QObject::tr("%1m").arg(minutes);
}

QPainterPath roundedPath(const QRectF &rect)
{
    QPainterPath path;
    const double radius = qMin(BlockCornerRadius, qMin(rect.width(), rect.height()) / 2.0);
    path.addRoundedRect(rect, radius, radius);
    return path;
}
} // namespace

WeekGridMetrics::WeekGridMetrics(WeekGridView &view)
    : m_view(view)
{
}

double WeekGridMetrics::columnsContainerWidth() const
{
    return m_view.viewport()->width();
}

int WeekGridMetrics::visibleColumns() const
{
    return m_view.columnCount();
}

double WeekGridMetrics::gutterWidth() const
{
    return m_view.timeAxisWidth();
}

interaction::GridPoint WeekGridMetrics::mapToGrid(const QPointF &globalPos) const
{
    const QWidget *viewport = m_view.viewport();
    return interaction::gridPointFromViewport(viewport->mapFromGlobal(globalPos),
                                              QRectF(viewport->rect()),
                                              m_view.headerHeight(),
                                              m_view.verticalScrollBar()->value());
}

WeekGridView::WeekGridView(interaction::DragSession &session, QWidget *parent)
    : QAbstractScrollArea(parent)
    , m_session(session)
{
    setMouseTracking(true);
    viewport()->setMouseTracking(true);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);

    m_metrics = std::make_unique<WeekGridMetrics>(*this);
    m_geometry = std::make_unique<interaction::GridGeometryProvider>(*m_metrics);
    m_engine = std::make_unique<interaction::PlacementEngine>(*m_geometry);
    m_reposition = std::make_unique<interaction::RepositionInteraction>(m_session, *m_engine);
    m_resize = std::make_unique<interaction::ResizeInteraction>(m_session, *m_engine);
    m_create = std::make_unique<interaction::GridCreateInteraction>(m_session, *m_engine);
    m_bridge = std::make_unique<interaction::ExternalDragBridge>(m_session, *m_engine);

    const auto repaint = [this]() { viewport()->update(); };
    connect(&m_session, &interaction::DragSession::phaseChanged, this, repaint);
    connect(&m_session, &interaction::DragSession::previewPositionChanged, this, repaint);
    connect(m_engine.get(), &interaction::PlacementEngine::geometryChanged, this, [this]() {
        updateScrollBars();
        viewport()->update();
    });

    updateScrollBars();
}

WeekGridView::~WeekGridView() = default;

void WeekGridView::setWeekDates(const QVector<QDate> &dates)
{
    if (!m_bridge->setWeekDates(dates)) {
        return;
    }
    m_weekDates = dates;
    viewport()->update();
}

void WeekGridView::setBlocks(std::vector<data::Block> blocks)
{
    m_engine->setBlocks(std::move(blocks));
    viewport()->update();
}

void WeekGridView::setViewMode(core::ViewMode mode, int dayIndex)
{
    m_viewMode = mode;
    m_dayViewIndex = qBound(0, dayIndex, data::DaysPerWeek - 1);
    const std::optional<int> pinned = pinnedDay();
    m_reposition->setPinnedDayIndex(pinned);
    m_create->setPinnedDayIndex(pinned);
    m_bridge->setPinnedDayIndex(pinned);
    emit m_metrics->metricsChanged();
    viewport()->update();
}

void WeekGridView::setGridHeight(double heightPx)
{
    m_geometry->setGridHeight(heightPx);
}

void WeekGridView::setSnapInterval(int minutes)
{
    m_geometry->setSnapInterval(minutes);
}

void WeekGridView::setInteractionConsumers(bool hasResizeConsumer, bool hasDragConsumer)
{
    m_hasResizeConsumer = hasResizeConsumer;
    m_hasDragConsumer = hasDragConsumer;
}

const interaction::GridGeometry &WeekGridView::geometry() const
{
    return m_engine->geometry();
}

std::optional<int> WeekGridView::pinnedDay() const
{
    if (m_viewMode == core::ViewMode::Day) {
        return m_dayViewIndex;
    }
    return std::nullopt;
}

int WeekGridView::columnForDay(int dayIndex) const
{
    if (m_viewMode == core::ViewMode::Day) {
        return dayIndex == m_dayViewIndex ? 0 : -1;
    }
    return dayIndex;
}

int WeekGridView::dayForColumn(int column) const
{
    return m_viewMode == core::ViewMode::Day ? m_dayViewIndex : column;
}

double WeekGridView::bodyOriginY() const
{
    return m_headerHeight - verticalScrollBar()->value();
}

QRectF WeekGridView::viewRectFor(int dayIndex, int startMinutes, int durationMinutes) const
{
    const int column = columnForDay(dayIndex);
    if (column < 0 || !geometry().isMeasured()) {
        return {};
    }
    return geometry().blockRect(column, startMinutes, durationMinutes).translated(0.0, bodyOriginY());
}

WeekGridView::Hit WeekGridView::hitTest(const QPointF &viewportPos) const
{
    Hit hit;
    if (viewportPos.y() < m_headerHeight) {
        return hit;
    }
    const auto &blocks = m_engine->blocks();
    // Later blocks are painted on top.
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
        const QRectF rect = viewRectFor(it->dayIndex, it->startMinutes, it->durationMinutes);
        if (rect.isEmpty()) {
            continue;
        }
        const QRectF zone = rect.adjusted(0.0, -HandleZone, 0.0, HandleZone);
        if (!zone.contains(viewportPos)) {
            continue;
        }
        const auto caps = interaction::resolveCapabilities(*it, m_hasResizeConsumer, m_hasDragConsumer, geometry());
        if (caps.resizable && qAbs(viewportPos.y() - rect.top()) <= HandleZone) {
            return { &*it, HitPart::TopHandle };
        }
        if (caps.resizable && qAbs(viewportPos.y() - rect.bottom()) <= HandleZone) {
            return { &*it, HitPart::BottomHandle };
        }
        if (rect.contains(viewportPos)) {
            return { &*it, HitPart::Body };
        }
    }
    return hit;
}

void WeekGridView::updateScrollBars()
{
    const double bodyHeight = geometry().minutesToPixels(data::MinutesPerDay);
    const int visibleBody = qMax(0, viewport()->height() - static_cast<int>(m_headerHeight));
    verticalScrollBar()->setRange(0, qMax(0, qCeil(bodyHeight) - visibleBody));
    verticalScrollBar()->setPageStep(visibleBody);
    verticalScrollBar()->setSingleStep(qMax(1, qRound(geometry().minutesToPixels(15))));
}

void WeekGridView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(viewport());
    painter.fillRect(viewport()->rect(), palette().base());

    const auto &geo = geometry();
    const double originY = bodyOriginY();
    const double bodyHeight = geo.minutesToPixels(data::MinutesPerDay);
    const int columns = columnCount();

    painter.save();
    painter.setClipRect(QRectF(0.0, m_headerHeight, viewport()->width(), viewport()->height() - m_headerHeight));

    paintTimeAxis(painter);

    if (geo.isMeasured()) {
        painter.setPen(palette().mid().color());
        for (int hour = 0; hour <= 24; ++hour) {
            const double y = originY + geo.minutesToPixels(hour * 60);
            painter.drawLine(QPointF(m_timeAxisWidth, y), QPointF(viewport()->width(), y));
        }
        painter.setPen(palette().dark().color());
        for (int column = 0; column < columns; ++column) {
            painter.drawRect(QRectF(geo.columnLeft(column), originY, geo.dayColumnWidthPx, bodyHeight));
        }

        painter.setRenderHint(QPainter::Antialiasing, true);
        const QUuid activeId = m_session.item() ? m_session.item()->blockId : QUuid();
        for (const auto &block : m_engine->blocks()) {
            if (m_reposition->isDragging() && block.id == activeId) {
                continue;
            }
            paintBlock(painter, block);
        }
        if (m_reposition->isDragging()) {
            // The dragged block stays faded at its origin.
            const auto source = m_engine->blockById(activeId);
            if (source) {
                painter.setOpacity(0.35);
                paintBlock(painter, *source);
                painter.setOpacity(1.0);
            }
        }

        paintDropTargets(painter);

        const auto &item = m_session.item();
        const auto &position = m_session.previewPosition();
        if (m_reposition->isDragging() && item && position && position->startMinutes) {
            paintPreview(painter,
                         position->dayIndex,
                         *position->startMinutes,
                         interaction::resolvedDuration(*item, *position),
                         item->title(),
                         item->color());
        }
        if (const auto span = m_create->preview()) {
            paintPreview(painter, span->dayIndex, span->startMinutes, span->durationMinutes, tr("Neuer Block"), QColor());
        }
        if (const auto ghost = m_bridge->preview()) {
            paintPreview(painter, ghost->dayIndex, ghost->startMinutes, ghost->durationMinutes, ghost->title, ghost->color);
        }

        const QDate today = QDate::currentDate();
        const int todayIndex = m_weekDates.indexOf(today);
        const int todayColumn = todayIndex >= 0 ? columnForDay(todayIndex) : -1;
        if (todayColumn >= 0) {
            const QTime now = QTime::currentTime();
            const double y = originY + geo.minutesToPixels(now.hour() * 60 + now.minute());
            painter.setPen(QPen(Qt::red, 2));
            const double x = geo.columnLeft(todayColumn);
            painter.drawLine(QPointF(x, y), QPointF(x + geo.dayColumnWidthPx, y));
        }
    }
    painter.restore();

    paintHeader(painter);
}

void WeekGridView::paintHeader(QPainter &painter) const
{
    const auto &geo = geometry();
    painter.fillRect(QRectF(0, 0, viewport()->width(), m_headerHeight), palette().alternateBase());
    painter.setPen(palette().dark().color());
    painter.drawLine(QPointF(0, m_headerHeight - 0.5), QPointF(viewport()->width(), m_headerHeight - 0.5));
    if (!geo.isMeasured()) {
        return;
    }

    const auto &item = m_session.item();
    const auto &position = m_session.previewPosition();
    const bool headerTargeted = m_session.isDragging() && item && item->source == interaction::DragSource::External
        && position && position->target == interaction::DropTarget::DayHeader;

    const QDate today = QDate::currentDate();
    const QFont originalFont = painter.font();
    for (int column = 0; column < columnCount(); ++column) {
        const int day = dayForColumn(column);
        const QRectF headerRect(geo.columnLeft(column), 0.0, geo.dayColumnWidthPx, m_headerHeight);
        const QDate date = m_weekDates.value(day);
        QColor headerColor = palette().alternateBase().color();
        QColor textColor = palette().windowText().color();
        if (date.isValid() && date.dayOfWeek() == Qt::Sunday) {
            headerColor = QColor(255, 235, 235);
            textColor = QColor(200, 40, 40);
        }
        if (headerTargeted && position->dayIndex == day) {
            headerColor = palette().highlight().color().lighter(160);
        }
        painter.fillRect(headerRect, headerColor);
        painter.setPen(palette().dark().color());
        painter.drawRect(headerRect);

        QFont font = originalFont;
        font.setBold(date == today);
        painter.setFont(font);
        painter.setPen(textColor);
        const QString label = date.isValid()
            ? QLocale().toString(date, QStringLiteral("ddd dd.MM."))
            : tr("Tag %1").arg(day + 1);
        painter.drawText(headerRect.adjusted(6, 0, -6, 0), Qt::AlignLeft | Qt::AlignVCenter, label);
    }
    painter.setFont(originalFont);
}

void WeekGridView::paintTimeAxis(QPainter &painter) const
{
    const auto &geo = geometry();
    const double originY = bodyOriginY();
    const double hourHeight = geo.minutesToPixels(60);
    painter.setPen(palette().windowText().color());
    for (int hour = 0; hour <= 24; ++hour) {
        const double y = originY + hour * hourHeight;
        if (y < m_headerHeight - hourHeight || y > viewport()->height() + hourHeight) {
            continue;
        }
        QRectF labelRect(0, y - hourHeight / 2.0, m_timeAxisWidth - 6.0, hourHeight);
        Qt::Alignment alignment = Qt::AlignRight | Qt::AlignVCenter;
        if (hour == 0) {
            alignment = Qt::AlignRight | Qt::AlignTop;
            labelRect.setTop(y);
            labelRect.setBottom(y + hourHeight);
        } else if (hour == 24) {
            alignment = Qt::AlignRight | Qt::AlignBottom;
            labelRect.setTop(y - hourHeight);
            labelRect.setBottom(y);
        }
        painter.drawText(labelRect, alignment, QStringLiteral("%1:00").arg(hour, 2, 10, QLatin1Char('0')));
    }
}

void WeekGridView::paintBlock(QPainter &painter, const data::Block &block) const
{
    const QRectF rect = viewRectFor(block.dayIndex, block.startMinutes, block.durationMinutes);
    if (rect.isEmpty()) {
        return;
    }
    QColor color = block.color.isValid() ? block.color : palette().highlight().color();
    if (block.id == m_hoveredBlockId && m_hoveredPart == HitPart::Body) {
        color = color.darker(115);
    }
    const QPainterPath path = roundedPath(rect.adjusted(1, 0, -1, 0));
    painter.setPen(QPen(color.darker(140), 1.2));
    painter.setBrush(color);
    painter.drawPath(path);

    painter.setPen(Qt::white);
    const QString title = block.title.trimmed().isEmpty() ? tr("(Ohne Titel)") : block.title;
    const QString info = tr("%1 (%2)").arg(formatMinutes(block.startMinutes), durationText(block.durationMinutes));
    QTextOption option(Qt::AlignLeft | Qt::AlignTop);
    option.setWrapMode(QTextOption::WrapAtWordBoundaryOrAnywhere);
    painter.drawText(rect.adjusted(4, 2, -4, -2), tr("%1\n%2").arg(title, info), option);

    if (block.id != m_hoveredBlockId
        || (m_hoveredPart != HitPart::TopHandle && m_hoveredPart != HitPart::BottomHandle)) {
        return;
    }
    QColor handleColor = color.lighter(130);
    handleColor.setAlpha(160);
    const double handleHeight = 6.0;
    const double y = m_hoveredPart == HitPart::TopHandle ? rect.top() : rect.bottom();
    const QRectF handle(rect.x() + 6, y - handleHeight / 2, rect.width() - 12, handleHeight);
    painter.setPen(Qt::NoPen);
    painter.setBrush(handleColor);
    painter.drawRoundedRect(handle, 3, 3);
}

void WeekGridView::paintPreview(QPainter &painter,
                                int dayIndex,
                                int startMinutes,
                                int durationMinutes,
                                const QString &label,
                                const QColor &color) const
{
    const QRectF rect = viewRectFor(dayIndex, startMinutes, durationMinutes);
    if (rect.isEmpty()) {
        return;
    }
    QColor fill = color.isValid() ? color : QColor(100, 149, 237);
    fill.setAlpha(120);
    painter.setBrush(fill);
    painter.setPen(QPen(palette().highlight().color(), 1, Qt::DashLine));
    painter.drawPath(roundedPath(rect.adjusted(1, 0, -1, 0)));

    painter.setPen(palette().windowText().color());
    const QString range = tr("%1 - %2").arg(formatMinutes(startMinutes), formatMinutes(startMinutes + durationMinutes));
    QTextOption option(Qt::AlignLeft | Qt::AlignTop);
    option.setWrapMode(QTextOption::NoWrap);
    painter.drawText(rect.adjusted(4, 2, -4, -2), tr("%1\n%2").arg(label, range), option);
}

void WeekGridView::paintDropTargets(QPainter &painter) const
{
    const auto &item = m_session.item();
    const auto &position = m_session.previewPosition();
    if (!m_session.isDragging() || !item || !position || position->target != interaction::DropTarget::ExistingBlock) {
        return;
    }
    const auto target = m_engine->blockById(position->targetBlockId);
    if (!target) {
        return;
    }
    const QRectF rect = viewRectFor(target->dayIndex, target->startMinutes, target->durationMinutes);
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(palette().highlight().color(), 3));
    painter.drawPath(roundedPath(rect.adjusted(1, 0, -1, 0)));
}

void WeekGridView::resizeEvent(QResizeEvent *event)
{
    QAbstractScrollArea::resizeEvent(event);
    emit m_metrics->metricsChanged();
    updateScrollBars();
}

void WeekGridView::wheelEvent(QWheelEvent *event)
{
    if (event->modifiers() & Qt::ControlModifier) {
        const int delta = event->angleDelta().y();
        if (delta != 0) {
            emit zoomRequested(delta > 0);
        }
        event->accept();
        return;
    }
    QAbstractScrollArea::wheelEvent(event);
}

void WeekGridView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mousePressEvent(event);
        return;
    }
    const interaction::PointerEvent pointer{ event->globalPosition(), event->modifiers() };
    const Hit hit = hitTest(event->position());
    bool started = false;
    switch (hit.part) {
    case HitPart::TopHandle:
        started = m_resize->beginResize(*hit.block, interaction::ResizeEdge::Top, pointer);
        break;
    case HitPart::BottomHandle:
        started = m_resize->beginResize(*hit.block, interaction::ResizeEdge::Bottom, pointer);
        break;
    case HitPart::Body: {
        const auto caps = interaction::resolveCapabilities(*hit.block, m_hasResizeConsumer, m_hasDragConsumer, geometry());
        if (caps.draggable) {
            started = m_reposition->beginDrag(*hit.block, pointer);
        }
        break;
    }
    case HitPart::None:
        started = m_create->beginCreate(pointer);
        break;
    }
    if (started || hit.part != HitPart::None) {
        event->accept();
        return;
    }
    QAbstractScrollArea::mousePressEvent(event);
}

void WeekGridView::mouseMoveEvent(QMouseEvent *event)
{
    if (!m_session.isIdle()) {
        event->accept();
        return;
    }
    const Hit hit = hitTest(event->position());
    const QUuid hoveredId = hit.block ? hit.block->id : QUuid();
    if (hoveredId != m_hoveredBlockId || hit.part != m_hoveredPart) {
        m_hoveredBlockId = hoveredId;
        m_hoveredPart = hit.part;
        switch (hit.part) {
        case HitPart::TopHandle:
        case HitPart::BottomHandle:
            viewport()->setCursor(Qt::SizeVerCursor);
            break;
        case HitPart::Body:
            viewport()->setCursor(Qt::OpenHandCursor);
            break;
        case HitPart::None:
            viewport()->unsetCursor();
            break;
        }
        viewport()->update();
    }
    QAbstractScrollArea::mouseMoveEvent(event);
}

void WeekGridView::mouseDoubleClickEvent(QMouseEvent *event)
{
    const Hit hit = hitTest(event->position());
    if (hit.block) {
        emit blockActivated(hit.block->id);
        event->accept();
        return;
    }
    QAbstractScrollArea::mouseDoubleClickEvent(event);
}

void WeekGridView::leaveEvent(QEvent *event)
{
    if (!m_hoveredBlockId.isNull()) {
        m_hoveredBlockId = QUuid();
        m_hoveredPart = HitPart::None;
        viewport()->unsetCursor();
        viewport()->update();
    }
    QAbstractScrollArea::leaveEvent(event);
}

void WeekGridView::scrollContentsBy(int dx, int dy)
{
    QAbstractScrollArea::scrollContentsBy(dx, dy);
    viewport()->update();
}

} // namespace ui
} // namespace planner
