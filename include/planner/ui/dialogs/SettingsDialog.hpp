#pragma once

#include <QDialog>

#include "planner/core/PlannerSettings.hpp"

class QComboBox;
class QListWidget;
class QSpinBox;
class QStackedWidget;

namespace planner {
namespace ui {

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget *parent = nullptr);

    void setSettings(const core::PlannerSettings &settings);
    core::PlannerSettings settings() const;

private:
    void setupUi();
    QWidget *createGridPage();
    QWidget *createInteractionPage();
    QWidget *createCalendarPage();
    QComboBox *createModifierCombo(QWidget *parent) const;

    QListWidget *m_categoryList = nullptr;
    QStackedWidget *m_pages = nullptr;
    QSpinBox *m_zoomSpin = nullptr;
    QComboBox *m_snapCombo = nullptr;
    QSpinBox *m_thresholdSpin = nullptr;
    QComboBox *m_overlapCombo = nullptr;
    QComboBox *m_duplicateCombo = nullptr;
    QComboBox *m_weekStartCombo = nullptr;
    core::PlannerSettings m_settings;
};

} // namespace ui
} // namespace planner
