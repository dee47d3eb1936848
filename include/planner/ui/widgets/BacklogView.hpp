#pragma once

#include <QListWidget>
#include <QVector>

#include "planner/interaction/DragItem.hpp"

namespace planner {
namespace interaction {
class ExternalDragBridge;
}

namespace ui {

// Sidebar list of goals, tasks and essentials that can be dragged onto the
// week grid.
class BacklogView : public QListWidget
{
    Q_OBJECT

public:
    explicit BacklogView(interaction::ExternalDragBridge &bridge, QWidget *parent = nullptr);

    void setItems(const QVector<interaction::DragItem> &items);
    const QVector<interaction::DragItem> &items() const { return m_items; }

protected:
    void mousePressEvent(QMouseEvent *event) override;

private:
    QString labelFor(const interaction::DragItem &item) const;

    interaction::ExternalDragBridge &m_bridge;
    QVector<interaction::DragItem> m_items;
};

} // namespace ui
} // namespace planner
