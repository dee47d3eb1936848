#include "planner/interaction/WeekDates.hpp"

namespace planner {
namespace interaction {

QVector<QDate> weekDatesFor(const QDate &anchor, Qt::DayOfWeek weekStartsOn)
{
    QVector<QDate> dates;
    if (!anchor.isValid()) {
        return dates;
    }
    const int offset = (anchor.dayOfWeek() - static_cast<int>(weekStartsOn) + 7) % 7;
    const QDate first = anchor.addDays(-offset);
    dates.reserve(7);
    for (int i = 0; i < 7; ++i) {
        dates.append(first.addDays(i));
    }
    return dates;
}

int dayIndexOf(const QVector<QDate> &dates, const QDate &date)
{
    return dates.indexOf(date);
}

} // namespace interaction
} // namespace planner
