#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <QCoreApplication>
#include <QEventLoop>

#include "nomaiq_schema.h"
#include "nomaiq_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class NomaiqFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return phicore::nomaiq::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<phicore::nomaiq::NomaiqSidecar>();
    }
};

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const char *envSocketPath = std::getenv("PHI_ADAPTER_SOCKET_PATH");
    const v1::Utf8String socketPath = (argc > 1)
        ? argv[1]
        : (envSocketPath ? envSocketPath : v1::Utf8String("/tmp/phi-adapter-nomaiq-ipc.sock"));

    std::cerr << "starting phi-adapter-nomaiq for pluginType=" << phicore::nomaiq::kPluginType
              << " socket=" << socketPath << '\n';

    NomaiqFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    // pollOnce blocks up to 100 ms before the next Qt event pass, which
    // bounds how late a queued refresh or a 2 s transition poll can run.
    while (g_running.load()) {
        if (!host.pollOnce(std::chrono::milliseconds(100), &error)) {
            std::cerr << "poll failed: " << error << '\n';
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        if (auto *adapter = dynamic_cast<phicore::nomaiq::NomaiqSidecar *>(host.adapter()))
            adapter->tick();

        // The coordinator's poll timer and queued refreshes run here.
        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }

    host.stop();
    std::cerr << "stopping phi-adapter-nomaiq" << '\n';
    return 0;
}
