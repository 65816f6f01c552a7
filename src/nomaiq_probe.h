#pragma once

#include <QString>

#include "nomaiq_config.h"
#include "nomaiq_http.h"

namespace phicore::nomaiq {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString message;
    int deviceCount = 0;
};

// Validates credentials by signing in to the Ayla cloud and listing the
// account's devices. The temporary session is signed out afterwards.
ProbeResult runProbe(HttpClient &http, const AdapterSettings &settings);

} // namespace phicore::nomaiq
