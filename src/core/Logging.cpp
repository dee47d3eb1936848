#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcDrag, "planner.drag", QtWarningMsg)
Q_LOGGING_CATEGORY(lcDrop, "planner.drop", QtWarningMsg)
Q_LOGGING_CATEGORY(lcResize, "planner.resize", QtWarningMsg)
Q_LOGGING_CATEGORY(lcGeometry, "planner.geometry", QtWarningMsg)
Q_LOGGING_CATEGORY(lcSchedule, "planner.schedule", QtWarningMsg)
Q_LOGGING_CATEGORY(lcSettings, "planner.settings", QtWarningMsg)
