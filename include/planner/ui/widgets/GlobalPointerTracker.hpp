#pragma once

#include <QObject>

namespace planner {
namespace interaction {
class DragSession;
}

namespace ui {

// Application-wide event filter that feeds pointer and key events to the
// drag session while a gesture is pending or active, so a drag keeps
// tracking when the pointer leaves the widget it started on.
class GlobalPointerTracker : public QObject
{
    Q_OBJECT

public:
    explicit GlobalPointerTracker(interaction::DragSession &session, QObject *parent = nullptr);
    ~GlobalPointerTracker() override;

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    interaction::DragSession &m_session;
};

} // namespace ui
} // namespace planner
