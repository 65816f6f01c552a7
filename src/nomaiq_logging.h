#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(coordinatorLog)
Q_DECLARE_LOGGING_CATEGORY(schedulerLog)
Q_DECLARE_LOGGING_CATEGORY(aylaLog)
Q_DECLARE_LOGGING_CATEGORY(lightLog)
Q_DECLARE_LOGGING_CATEGORY(coverLog)
Q_DECLARE_LOGGING_CATEGORY(sidecarLog)
