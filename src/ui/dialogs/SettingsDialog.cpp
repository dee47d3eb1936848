#include "planner/ui/dialogs/SettingsDialog.hpp"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QStackedWidget>
#include <QVBoxLayout>

namespace planner {
namespace ui {

namespace {
QLabel *pageTitle(const QString &text, QWidget *parent)
{
    auto *title = new QLabel(text, parent);
    QFont titleFont = title->font();
    titleFont.setBold(true);
    title->setFont(titleFont);
    return title;
}

void selectData(QComboBox *combo, int value)
{
    const int index = combo->findData(value);
    if (index >= 0) {
        combo->setCurrentIndex(index);
    }
}
} // namespace

SettingsDialog::SettingsDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Einstellungen"));
    resize(640, 360);
    setupUi();
    setSettings(m_settings);
}

void SettingsDialog::setupUi()
{
    auto *outer = new QVBoxLayout(this);
    outer->setContentsMargins(16, 16, 16, 16);
    outer->setSpacing(12);

    auto *layout = new QHBoxLayout;
    layout->setSpacing(12);

    m_categoryList = new QListWidget(this);
    m_categoryList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_categoryList->setFixedWidth(180);
    m_categoryList->addItem(tr("Raster"));
    m_categoryList->addItem(tr("Interaktion"));
    m_categoryList->addItem(tr("Kalender"));

    m_pages = new QStackedWidget(this);
    m_pages->addWidget(createGridPage());
    m_pages->addWidget(createInteractionPage());
    m_pages->addWidget(createCalendarPage());

    layout->addWidget(m_categoryList);
    layout->addWidget(m_pages, 1);
    outer->addLayout(layout, 1);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel
                                             | QDialogButtonBox::RestoreDefaults,
                                         this);
    outer->addWidget(buttons);

    connect(m_categoryList, &QListWidget::currentRowChanged, m_pages, &QStackedWidget::setCurrentIndex);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(buttons, &QDialogButtonBox::accepted, this, [this]() {
        const auto overlap = m_overlapCombo->currentData().toInt();
        const auto duplicate = m_duplicateCombo->currentData().toInt();
        if (overlap == duplicate) {
            QMessageBox::warning(this,
                                 tr("Einstellungen"),
                                 tr("Überlappen und Duplizieren brauchen verschiedene Tasten."));
            return;
        }
        accept();
    });
    connect(buttons->button(QDialogButtonBox::RestoreDefaults), &QPushButton::clicked, this, [this]() {
        core::PlannerSettings defaults;
        defaults.viewMode = m_settings.viewMode;
        defaults.dayViewIndex = m_settings.dayViewIndex;
        setSettings(defaults);
    });
    m_categoryList->setCurrentRow(0);
}

QWidget *SettingsDialog::createGridPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(pageTitle(tr("Zeitraster"), page));

    auto *form = new QFormLayout;
    m_zoomSpin = new QSpinBox(page);
    m_zoomSpin->setRange(core::PlannerSettings::MinZoomPercent, core::PlannerSettings::MaxZoomPercent);
    m_zoomSpin->setSingleStep(10);
    m_zoomSpin->setSuffix(QStringLiteral(" %"));
    form->addRow(tr("Zoom"), m_zoomSpin);

    m_snapCombo = new QComboBox(page);
    for (int minutes : { 5, 10, 15, 30, 60 }) {
        m_snapCombo->addItem(tr("%1 Minuten").arg(minutes), minutes);
    }
    form->addRow(tr("Einrasten"), m_snapCombo);
    layout->addLayout(form);
    layout->addStretch(1);
    return page;
}

QWidget *SettingsDialog::createInteractionPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(pageTitle(tr("Ziehen und Ablegen"), page));

    auto *form = new QFormLayout;
    m_thresholdSpin = new QSpinBox(page);
    m_thresholdSpin->setRange(1, 32);
    m_thresholdSpin->setSuffix(QStringLiteral(" px"));
    form->addRow(tr("Startschwelle"), m_thresholdSpin);

    m_overlapCombo = createModifierCombo(page);
    form->addRow(tr("Überlappen erlauben"), m_overlapCombo);
    m_duplicateCombo = createModifierCombo(page);
    form->addRow(tr("Duplizieren"), m_duplicateCombo);
    layout->addLayout(form);

    auto *hint = new QLabel(tr("Die Taste kann während des Ziehens gedrückt oder losgelassen werden."), page);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    layout->addStretch(1);
    return page;
}

QWidget *SettingsDialog::createCalendarPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(pageTitle(tr("Kalendereinstellungen"), page));

    auto *form = new QFormLayout;
    m_weekStartCombo = new QComboBox(page);
    m_weekStartCombo->addItem(tr("Montag"), static_cast<int>(Qt::Monday));
    m_weekStartCombo->addItem(tr("Sonntag"), static_cast<int>(Qt::Sunday));
    form->addRow(tr("Woche beginnt am"), m_weekStartCombo);
    layout->addLayout(form);
    layout->addStretch(1);
    return page;
}

QComboBox *SettingsDialog::createModifierCombo(QWidget *parent) const
{
    auto *combo = new QComboBox(parent);
    combo->addItem(tr("Umschalt"), static_cast<int>(Qt::ShiftModifier));
    combo->addItem(tr("Strg"), static_cast<int>(Qt::ControlModifier));
    combo->addItem(tr("Alt"), static_cast<int>(Qt::AltModifier));
    return combo;
}

void SettingsDialog::setSettings(const core::PlannerSettings &settings)
{
    m_settings = settings;
    m_zoomSpin->setValue(settings.zoomPercent);
    selectData(m_snapCombo, settings.snapMinutes);
    m_thresholdSpin->setValue(settings.dragThresholdPx);
    selectData(m_overlapCombo, static_cast<int>(settings.overlapModifier));
    selectData(m_duplicateCombo, static_cast<int>(settings.duplicateModifier));
    selectData(m_weekStartCombo, static_cast<int>(settings.weekStartsOn));
}

core::PlannerSettings SettingsDialog::settings() const
{
    core::PlannerSettings result = m_settings;
    result.zoomPercent = m_zoomSpin->value();
    result.snapMinutes = m_snapCombo->currentData().toInt();
    result.dragThresholdPx = m_thresholdSpin->value();
    result.overlapModifier = static_cast<Qt::KeyboardModifier>(m_overlapCombo->currentData().toInt());
    result.duplicateModifier = static_cast<Qt::KeyboardModifier>(m_duplicateCombo->currentData().toInt());
    result.weekStartsOn = static_cast<Qt::DayOfWeek>(m_weekStartCombo->currentData().toInt());
    return result;
}

} // namespace ui
} // namespace planner
