#pragma once

#include <QDate>
#include <QVector>

namespace planner {
namespace interaction {

// The 7 consecutive dates of the week containing anchor, starting on
// weekStartsOn. Empty for an invalid anchor.
QVector<QDate> weekDatesFor(const QDate &anchor, Qt::DayOfWeek weekStartsOn = Qt::Monday);

// Column of date inside dates, or -1.
int dayIndexOf(const QVector<QDate> &dates, const QDate &date);

} // namespace interaction
} // namespace planner
