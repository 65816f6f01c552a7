#include "nomaiq_probe.h"

#include "nomaiq_ayla.h"

namespace phicore::nomaiq {

ProbeResult runProbe(HttpClient &http, const AdapterSettings &settings)
{
    ProbeResult out;

    const AylaCredentials &credentials = settings.credentials;
    if (credentials.username.isEmpty() || credentials.password.isEmpty()) {
        out.error = QStringLiteral("Username and password are required");
        return out;
    }
    if (credentials.clientId.isEmpty() || credentials.clientSecret.isEmpty()) {
        out.error = QStringLiteral("Client id and client secret are required");
        return out;
    }

    AylaSession session(&http, hostsForRegion(settings.region), credentials, settings.requestTimeoutMs);

    Failure failure;
    if (!session.signIn(&failure)) {
        out.error = failure.kind == FailureKind::Auth ? QStringLiteral("Invalid credentials: %1").arg(failure.message)
                                                      : failure.message;
        return out;
    }

    DeviceRoster devices;
    if (!session.fetchDevices(&devices, &failure)) {
        out.error = failure.message;
        session.signOut();
        return out;
    }

    session.signOut();
    out.ok = true;
    out.deviceCount = static_cast<int>(devices.size());
    out.message = QStringLiteral("Signed in, %1 device(s) found").arg(out.deviceCount);
    return out;
}

} // namespace phicore::nomaiq
