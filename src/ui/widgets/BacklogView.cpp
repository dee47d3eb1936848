#include "planner/ui/widgets/BacklogView.hpp"

#include <QIcon>
#include <QLocale>
#include <QMouseEvent>
#include <QPainter>
#include <QPixmap>

#include "planner/interaction/ExternalDragBridge.hpp"

namespace planner {
namespace ui {

namespace {
constexpr int ItemIndexRole = Qt::UserRole + 1;

QIcon swatch(const QColor &color)
{
    QPixmap pixmap(12, 12);
    pixmap.fill(Qt::transparent);
    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(color.isValid() ? color : QColor(Qt::gray));
    painter.drawEllipse(QRectF(1, 1, 10, 10));
    return QIcon(pixmap);
}
} // namespace

BacklogView::BacklogView(interaction::ExternalDragBridge &bridge, QWidget *parent)
    : QListWidget(parent)
    , m_bridge(bridge)
{
    setDragEnabled(false);
    setSelectionMode(QAbstractItemView::SingleSelection);
    setUniformItemSizes(true);
}

void BacklogView::setItems(const QVector<interaction::DragItem> &items)
{
    m_items = items;
    clear();
    for (int i = 0; i < m_items.size(); ++i) {
        const auto &item = m_items.at(i);
        auto *entry = new QListWidgetItem(swatch(item.color()), labelFor(item), this);
        entry->setData(ItemIndexRole, i);
        if (item.sourceDeadline.isValid()) {
            entry->setToolTip(tr("Fällig am %1").arg(QLocale().toString(item.sourceDeadline, QLocale::ShortFormat)));
        }
    }
}

void BacklogView::mousePressEvent(QMouseEvent *event)
{
    QListWidget::mousePressEvent(event);
    if (event->button() != Qt::LeftButton) {
        return;
    }
    const QListWidgetItem *entry = itemAt(event->position().toPoint());
    if (!entry) {
        return;
    }
    const int index = entry->data(ItemIndexRole).toInt();
    if (index < 0 || index >= m_items.size()) {
        return;
    }
    if (m_bridge.beginExternalDrag(m_items.at(index), { event->globalPosition(), event->modifiers() })) {
        event->accept();
    }
}

QString BacklogView::labelFor(const interaction::DragItem &item) const
{
    QString label = item.title().isEmpty() ? tr("(Ohne Titel)") : item.title();
    switch (item.type) {
    case data::BlockType::Goal:
        return tr("Ziel: %1").arg(label);
    case data::BlockType::Task:
        if (!item.goalLabel.isEmpty() && item.goalLabel != label) {
            label = tr("%1 (%2)").arg(label, item.goalLabel);
        }
        return tr("Aufgabe: %1").arg(label);
    case data::BlockType::Essential:
        return tr("Fix: %1").arg(label);
    }
    return label;
}

} // namespace ui
} // namespace planner
