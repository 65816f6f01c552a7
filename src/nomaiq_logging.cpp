#include "nomaiq_logging.h"

Q_LOGGING_CATEGORY(coordinatorLog, "phi-adapter.nomaiq.coordinator")
Q_LOGGING_CATEGORY(schedulerLog, "phi-adapter.nomaiq.scheduler")
Q_LOGGING_CATEGORY(aylaLog, "phi-adapter.nomaiq.ayla")
Q_LOGGING_CATEGORY(lightLog, "phi-adapter.nomaiq.light")
Q_LOGGING_CATEGORY(coverLog, "phi-adapter.nomaiq.cover")
Q_LOGGING_CATEGORY(sidecarLog, "phi-adapter.nomaiq.sidecar")
