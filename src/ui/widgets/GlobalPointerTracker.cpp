#include "planner/ui/widgets/GlobalPointerTracker.hpp"

#include <QApplication>
#include <QKeyEvent>
#include <QMouseEvent>

#include "planner/interaction/DragSession.hpp"

namespace planner {
namespace ui {

GlobalPointerTracker::GlobalPointerTracker(interaction::DragSession &session, QObject *parent)
    : QObject(parent)
    , m_session(session)
{
    if (qApp) {
        qApp->installEventFilter(this);
    }
}

GlobalPointerTracker::~GlobalPointerTracker()
{
    if (qApp) {
        qApp->removeEventFilter(this);
    }
}

bool GlobalPointerTracker::eventFilter(QObject *watched, QEvent *event)
{
    if (m_session.isIdle()) {
        return QObject::eventFilter(watched, event);
    }
    if (event->type() == QEvent::ApplicationDeactivate) {
        m_session.cancel();
        return QObject::eventFilter(watched, event);
    }
    // Mouse and key events also reach the QWindow; only the widget delivery
    // is forwarded.
    if (!watched->isWidgetType()) {
        return QObject::eventFilter(watched, event);
    }
    switch (event->type()) {
    case QEvent::MouseMove: {
        auto *mouse = static_cast<QMouseEvent *>(event);
        m_session.pointerMoved({ mouse->globalPosition(), mouse->modifiers() });
        break;
    }
    case QEvent::MouseButtonRelease: {
        auto *mouse = static_cast<QMouseEvent *>(event);
        if (mouse->button() == Qt::LeftButton) {
            m_session.pointerReleased({ mouse->globalPosition(), mouse->modifiers() });
            return true;
        }
        break;
    }
    case QEvent::KeyPress: {
        auto *key = static_cast<QKeyEvent *>(event);
        if (!key->isAutoRepeat() && m_session.keyPressed(key->key())) {
            return true;
        }
        break;
    }
    case QEvent::KeyRelease: {
        auto *key = static_cast<QKeyEvent *>(event);
        if (!key->isAutoRepeat() && m_session.keyReleased(key->key())) {
            return true;
        }
        break;
    }
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

} // namespace ui
} // namespace planner
