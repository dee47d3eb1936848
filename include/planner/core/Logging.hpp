#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcDrag)
Q_DECLARE_LOGGING_CATEGORY(lcDrop)
Q_DECLARE_LOGGING_CATEGORY(lcResize)
Q_DECLARE_LOGGING_CATEGORY(lcGeometry)
Q_DECLARE_LOGGING_CATEGORY(lcSchedule)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
