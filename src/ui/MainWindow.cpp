#include "planner/ui/MainWindow.hpp"

#include <QAction>
#include <QLabel>
#include <QLocale>
#include <QSettings>
#include <QSizePolicy>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QToolButton>
#include <QVBoxLayout>

#include "planner/core/AppContext.hpp"
#include "planner/core/Logging.hpp"
#include "planner/core/ScheduleController.hpp"
#include "planner/core/UndoStack.hpp"
#include "planner/interaction/DragSession.hpp"
#include "planner/interaction/WeekDates.hpp"
#include "planner/ui/dialogs/SettingsDialog.hpp"
#include "planner/ui/widgets/BacklogView.hpp"
#include "planner/ui/widgets/GlobalPointerTracker.hpp"
#include "planner/ui/widgets/WeekGridView.hpp"

namespace {

planner::interaction::DragItem backlogItem(planner::data::BlockType type,
                                           const QString &goalId,
                                           const QString &goalLabel,
                                           const QColor &goalColor)
{
    planner::interaction::DragItem item;
    item.source = planner::interaction::DragSource::External;
    item.type = type;
    item.goalId = goalId;
    item.goalLabel = goalLabel;
    item.goalColor = goalColor;
    return item;
}

} // namespace

namespace planner {
namespace ui {

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(std::make_unique<core::AppContext>())
    , m_dragSession(std::make_unique<interaction::DragSession>())
{
    m_pointerTracker = std::make_unique<GlobalPointerTracker>(*m_dragSession);
    m_anchorDate = QDate::currentDate();
    restoreSettings();
    setupUi();
    applySettings();
    refreshBlocks();
}

MainWindow::~MainWindow()
{
    saveSettings();
}

void MainWindow::setupUi()
{
    setWindowTitle(tr("Block Planner"));
    resize(1200, 800);

    addToolBar(Qt::TopToolBarArea, createNavigationBar());

    auto *splitter = new QSplitter(Qt::Horizontal, this);
    m_gridView = new WeekGridView(*m_dragSession, splitter);
    m_backlogView = new BacklogView(m_gridView->externalBridge(), splitter);
    m_backlogView->setItems(sampleBacklog());

    splitter->addWidget(m_backlogView);
    splitter->addWidget(m_gridView);
    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    splitter->setCollapsible(0, true);
    splitter->setCollapsible(1, false);

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(splitter);
    setCentralWidget(centralWidget);

    auto &controller = m_appContext->scheduleController();
    controller.attach(m_gridView->repositionInteraction());
    controller.attach(m_gridView->resizeInteraction());
    controller.attach(m_gridView->createInteraction());
    controller.attach(m_gridView->externalBridge());
    m_gridView->setInteractionConsumers(true, true);

    connect(&controller, &core::ScheduleController::blocksChanged, this, &MainWindow::refreshBlocks);
    connect(&controller, &core::ScheduleController::deadlineRequested, this, &MainWindow::handleDeadlineRequested);
    connect(&m_appContext->undoStack(), &core::UndoStack::changed, this, &MainWindow::updateUndoActions);
    connect(m_gridView, &WeekGridView::zoomRequested, this, &MainWindow::zoomGrid);
    connect(m_dragSession.get(), &interaction::DragSession::cancelled, this, [this]() {
        statusBar()->showMessage(tr("Ziehen abgebrochen"), 1500);
    });
    connect(m_dragSession.get(), &interaction::DragSession::overlapModeChanged, this, [this](bool enabled) {
        if (enabled) {
            statusBar()->showMessage(tr("Überlappen erlaubt"));
        } else {
            statusBar()->clearMessage();
        }
    });
    updateUndoActions();
}

QToolBar *MainWindow::createNavigationBar()
{
    auto *toolbar = new QToolBar(tr("Navigation"), this);
    toolbar->setMovable(false);

    auto *todayAction = toolbar->addAction(tr("Heute"));
    todayAction->setShortcut(QKeySequence(Qt::Key_T));
    connect(todayAction, &QAction::triggered, this, &MainWindow::goToday);

    auto *backAction = toolbar->addAction(tr("Zurück"));
    backAction->setShortcut(QKeySequence(Qt::Key_Left));
    connect(backAction, &QAction::triggered, this, &MainWindow::navigateBackward);

    auto *forwardAction = toolbar->addAction(tr("Weiter"));
    forwardAction->setShortcut(QKeySequence(Qt::Key_Right));
    connect(forwardAction, &QAction::triggered, this, &MainWindow::navigateForward);

    toolbar->addSeparator();

    m_viewModeAction = toolbar->addAction(tr("Tagesansicht"));
    m_viewModeAction->setCheckable(true);
    m_viewModeAction->setShortcut(QKeySequence(Qt::Key_D));
    connect(m_viewModeAction, &QAction::triggered, this, &MainWindow::toggleViewMode);

    auto *zoomIn = toolbar->addAction(tr("Zeit-Zoom +"));
    zoomIn->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Plus));
    connect(zoomIn, &QAction::triggered, this, [this]() { zoomGrid(true); });

    auto *zoomOut = toolbar->addAction(tr("Zeit-Zoom -"));
    zoomOut->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Minus));
    connect(zoomOut, &QAction::triggered, this, [this]() { zoomGrid(false); });

    toolbar->addSeparator();

    m_undoAction = toolbar->addAction(tr("Rückgängig"));
    m_undoAction->setShortcut(QKeySequence::Undo);
    connect(m_undoAction, &QAction::triggered, this, &MainWindow::performUndo);

    m_redoAction = toolbar->addAction(tr("Wiederholen"));
    m_redoAction->setShortcut(QKeySequence::Redo);
    connect(m_redoAction, &QAction::triggered, this, &MainWindow::performRedo);

    toolbar->addSeparator();
    m_viewInfoLabel = new QLabel(toolbar);
    toolbar->addWidget(m_viewInfoLabel);

    auto *spacer = new QWidget(toolbar);
    spacer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
    toolbar->addWidget(spacer);

    auto *settingsButton = new QToolButton(toolbar);
    settingsButton->setText(QString::fromUtf8("\xE2\x98\xB0"));
    settingsButton->setToolTip(tr("Einstellungen"));
    settingsButton->setAutoRaise(true);
    connect(settingsButton, &QToolButton::clicked, this, &MainWindow::openSettingsDialog);
    toolbar->addWidget(settingsButton);

    return toolbar;
}

void MainWindow::restoreSettings()
{
    QSettings settings;
    m_settings = core::PlannerSettings::load(settings);
    const QDate storedAnchor = settings.value(QStringLiteral("calendar/anchorDate")).toDate();
    if (storedAnchor.isValid()) {
        m_anchorDate = storedAnchor;
    }
}

void MainWindow::saveSettings() const
{
    QSettings settings;
    m_settings.save(settings);
    settings.setValue(QStringLiteral("calendar/anchorDate"), m_anchorDate);
}

void MainWindow::applySettings()
{
    m_dragSession->setDragThreshold(m_settings.dragThresholdPx);
    m_dragSession->setOverlapModifier(m_settings.overlapModifier);
    m_gridView->repositionInteraction().setDuplicateModifier(m_settings.duplicateModifier);
    m_gridView->setGridHeight(m_settings.gridHeightPx());
    m_gridView->setSnapInterval(m_settings.snapMinutes);
    m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
    m_viewModeAction->setChecked(m_settings.viewMode == core::ViewMode::Day);
    updateWeekDates();
}

void MainWindow::refreshBlocks()
{
    if (!m_gridView) {
        return;
    }
    m_gridView->setBlocks(m_appContext->scheduleController().blocks());
}

void MainWindow::updateWeekDates()
{
    m_weekDates = interaction::weekDatesFor(m_anchorDate, m_settings.weekStartsOn);
    m_gridView->setWeekDates(m_weekDates);
    if (m_weekDates.isEmpty()) {
        m_viewInfoLabel->clear();
        return;
    }
    if (m_settings.viewMode == core::ViewMode::Day) {
        const QDate day = m_weekDates.value(m_settings.dayViewIndex);
        m_viewInfoLabel->setText(QLocale().toString(day, QLocale::LongFormat));
        return;
    }
    m_viewInfoLabel->setText(tr("KW %1: %2 - %3")
                                 .arg(m_weekDates.first().weekNumber())
                                 .arg(QLocale().toString(m_weekDates.first(), QLocale::ShortFormat),
                                      QLocale().toString(m_weekDates.last(), QLocale::ShortFormat)));
}

void MainWindow::updateUndoActions()
{
    auto &stack = m_appContext->undoStack();
    m_undoAction->setEnabled(stack.canUndo());
    m_redoAction->setEnabled(stack.canRedo());
    m_undoAction->setToolTip(stack.canUndo() ? tr("Rückgängig: %1").arg(stack.undoText()) : tr("Rückgängig"));
    m_redoAction->setToolTip(stack.canRedo() ? tr("Wiederholen: %1").arg(stack.redoText()) : tr("Wiederholen"));
}

void MainWindow::goToday()
{
    m_anchorDate = QDate::currentDate();
    const auto dates = interaction::weekDatesFor(m_anchorDate, m_settings.weekStartsOn);
    const int todayIndex = interaction::dayIndexOf(dates, m_anchorDate);
    if (todayIndex >= 0) {
        m_settings.dayViewIndex = todayIndex;
        m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
    }
    updateWeekDates();
}

void MainWindow::navigateBackward()
{
    if (m_settings.viewMode == core::ViewMode::Day && m_settings.dayViewIndex > 0) {
        --m_settings.dayViewIndex;
        m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
    } else {
        m_anchorDate = m_anchorDate.addDays(-7);
        if (m_settings.viewMode == core::ViewMode::Day) {
            m_settings.dayViewIndex = data::DaysPerWeek - 1;
            m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
        }
    }
    updateWeekDates();
}

void MainWindow::navigateForward()
{
    if (m_settings.viewMode == core::ViewMode::Day && m_settings.dayViewIndex < data::DaysPerWeek - 1) {
        ++m_settings.dayViewIndex;
        m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
    } else {
        m_anchorDate = m_anchorDate.addDays(7);
        if (m_settings.viewMode == core::ViewMode::Day) {
            m_settings.dayViewIndex = 0;
            m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
        }
    }
    updateWeekDates();
}

void MainWindow::toggleViewMode()
{
    m_dragSession->cancel();
    m_settings.viewMode = m_settings.viewMode == core::ViewMode::Week ? core::ViewMode::Day : core::ViewMode::Week;
    m_viewModeAction->setChecked(m_settings.viewMode == core::ViewMode::Day);
    m_gridView->setViewMode(m_settings.viewMode, m_settings.dayViewIndex);
    updateWeekDates();
}

void MainWindow::zoomGrid(bool zoomIn)
{
    const int step = zoomIn ? 10 : -10;
    const int next = qBound(core::PlannerSettings::MinZoomPercent,
                            m_settings.zoomPercent + step,
                            core::PlannerSettings::MaxZoomPercent);
    if (next == m_settings.zoomPercent) {
        return;
    }
    m_settings.zoomPercent = next;
    m_gridView->setGridHeight(m_settings.gridHeightPx());
    statusBar()->showMessage(tr("Zoom %1 %").arg(next), 1000);
}

void MainWindow::performUndo()
{
    auto &stack = m_appContext->undoStack();
    if (!stack.canUndo()) {
        statusBar()->showMessage(tr("Nichts zum Rückgängig machen"), 1500);
        return;
    }
    stack.undo();
    statusBar()->showMessage(tr("Aktion rückgängig gemacht"), 2000);
}

void MainWindow::performRedo()
{
    auto &stack = m_appContext->undoStack();
    if (!stack.canRedo()) {
        statusBar()->showMessage(tr("Nichts zum Wiederholen"), 1500);
        return;
    }
    stack.redo();
    statusBar()->showMessage(tr("Aktion wiederholt"), 2000);
}

void MainWindow::openSettingsDialog()
{
    if (!m_settingsDialog) {
        m_settingsDialog = std::make_unique<SettingsDialog>(this);
    }
    m_settingsDialog->setSettings(m_settings);
    if (m_settingsDialog->exec() != QDialog::Accepted) {
        return;
    }
    m_settings = m_settingsDialog->settings();
    qCInfo(lcSettings) << "settings changed, zoom" << m_settings.zoomPercent << "snap" << m_settings.snapMinutes;
    applySettings();
    saveSettings();
}

void MainWindow::handleDeadlineRequested(const interaction::DragItem &item, const QDate &date)
{
    statusBar()->showMessage(tr("Frist für \"%1\": %2")
                                 .arg(item.title(), QLocale().toString(date, QLocale::ShortFormat)),
                             3000);
}

QVector<interaction::DragItem> MainWindow::sampleBacklog() const
{
    const QColor bookColor(70, 130, 180);
    const QColor fitnessColor(60, 160, 90);

    QVector<interaction::DragItem> items;
    auto book = backlogItem(data::BlockType::Goal, QStringLiteral("goal-book"), tr("Buch schreiben"), bookColor);
    book.sourceDeadline = QDate::currentDate().addDays(30);
    items << book;

    auto chapter = backlogItem(data::BlockType::Task, QStringLiteral("goal-book"), tr("Buch schreiben"), bookColor);
    chapter.taskId = QStringLiteral("task-chapter-3");
    chapter.taskLabel = tr("Kapitel 3 überarbeiten");
    items << chapter;

    auto outline = backlogItem(data::BlockType::Task, QStringLiteral("goal-book"), tr("Buch schreiben"), bookColor);
    outline.taskId = QStringLiteral("task-outline");
    items << outline;

    items << backlogItem(data::BlockType::Goal, QStringLiteral("goal-fitness"), tr("Fitness"), fitnessColor);

    auto lunch = backlogItem(data::BlockType::Essential, {}, {}, {});
    lunch.essentialId = QStringLiteral("essential-lunch");
    lunch.essentialLabel = tr("Mittagessen");
    lunch.essentialColor = QColor(230, 160, 60);
    items << lunch;

    auto sleep = backlogItem(data::BlockType::Essential, {}, {}, {});
    sleep.essentialId = QStringLiteral("essential-sleep");
    sleep.essentialLabel = tr("Schlafen");
    sleep.essentialColor = QColor(120, 110, 170);
    items << sleep;
    return items;
}

} // namespace ui
} // namespace planner
