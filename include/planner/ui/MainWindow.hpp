#pragma once

#include <QDate>
#include <QMainWindow>
#include <QVector>
#include <memory>

#include "planner/core/PlannerSettings.hpp"
#include "planner/interaction/DragItem.hpp"

class QAction;
class QLabel;
class QToolBar;

namespace planner {
namespace core {
class AppContext;
}

namespace interaction {
class DragSession;
}

namespace ui {

class BacklogView;
class GlobalPointerTracker;
class SettingsDialog;
class WeekGridView;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QToolBar *createNavigationBar();
    void restoreSettings();
    void saveSettings() const;
    void applySettings();
    void refreshBlocks();
    void updateWeekDates();
    void updateUndoActions();
    void goToday();
    void navigateBackward();
    void navigateForward();
    void toggleViewMode();
    void zoomGrid(bool zoomIn);
    void performUndo();
    void performRedo();
    void openSettingsDialog();
    void handleDeadlineRequested(const interaction::DragItem &item, const QDate &date);
    QVector<interaction::DragItem> sampleBacklog() const;

    std::unique_ptr<core::AppContext> m_appContext;
    std::unique_ptr<interaction::DragSession> m_dragSession;
    std::unique_ptr<GlobalPointerTracker> m_pointerTracker;
    std::unique_ptr<SettingsDialog> m_settingsDialog;
    WeekGridView *m_gridView = nullptr;
    BacklogView *m_backlogView = nullptr;
    QLabel *m_viewInfoLabel = nullptr;
    QAction *m_undoAction = nullptr;
    QAction *m_redoAction = nullptr;
    QAction *m_viewModeAction = nullptr;
    core::PlannerSettings m_settings;
    QDate m_anchorDate;
    QVector<QDate> m_weekDates;
};

} // namespace ui
} // namespace planner
