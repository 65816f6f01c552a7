#include "garage_door_controller.h"

#include "device_source_mock.h"
#include "fake_device.h"
#include "update_coordinator.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{

using namespace phicore::nomaiq;
using namespace phicore::nomaiq::test;

using testing::_;
using testing::ElementsAre;
using testing::NiceMock;
using testing::Return;

class TestGarageDoorController : public testing::Test
{
protected:
    void SetUp() override
    {
        ON_CALL(m_source, checkAuth(_)).WillByDefault(Return(true));
        ON_CALL(m_source, fetchDevices(_, _)).WillByDefault([this](DeviceRoster *devices, Failure *) {
            *devices = m_cloud.roster();
            return true;
        });
        m_coordinator.setClock([this]() { return m_nowMs; });
        m_door.setUnixClock([]() { return std::int64_t(1700000000); });

        PropertyMap properties;
        properties.insert(QStringLiteral("door_status"), textValue("closed"));
        m_remote = m_cloud.add(QStringLiteral("G1"), properties, QStringLiteral("gdo"), QStringLiteral("Garage"));

        ASSERT_TRUE(m_coordinator.runTick());
    }

    void poll()
    {
        m_nowMs += 2000;
        ASSERT_TRUE(m_coordinator.runTick());
    }

    void setStatus(const char *status)
    {
        m_remote->properties.insert(QStringLiteral("door_status"), textValue(status));
    }

    NiceMock<MockDeviceSource> m_source;
    FakeCloud m_cloud;
    std::int64_t m_nowMs = 1000;
    UpdateCoordinator m_coordinator{&m_source};
    std::shared_ptr<FakeRemote> m_remote;
    GarageDoorController m_door{&m_coordinator, QStringLiteral("G1")};
};

// MARK: - Tests:

TEST_F(TestGarageDoorController, status_reads_from_roster)
{
    EXPECT_EQ(m_door.uniqueId(), QStringLiteral("nomaiq_cover_G1"));
    EXPECT_EQ(m_door.name(), QStringLiteral("Garage"));
    EXPECT_TRUE(m_door.isAvailable());
    EXPECT_EQ(m_door.doorStatus(), QStringLiteral("closed"));
    EXPECT_TRUE(m_door.isClosed());
    EXPECT_FALSE(m_door.isOpening());
    EXPECT_FALSE(m_door.isClosing());
}

TEST_F(TestGarageDoorController, open_pulses_toggle_with_unix_time)
{
    ASSERT_TRUE(m_door.open());

    ASSERT_THAT(m_remote->writtenNames(), ElementsAre(QStringLiteral("door_toggle")));
    EXPECT_EQ(propertyAsString(m_remote->writes.at(0).value), QStringLiteral("1700000000"));
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));
    EXPECT_FALSE(m_coordinator.tracker().intendedValue(QStringLiteral("G1")).has_value());
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Fast);
    EXPECT_TRUE(m_coordinator.isRefreshQueued());
}

TEST_F(TestGarageDoorController, close_and_stop_pulse_the_same_toggle)
{
    ASSERT_TRUE(m_door.close());
    ASSERT_TRUE(m_door.stop());
    EXPECT_THAT(m_remote->writtenNames(), ElementsAre(QStringLiteral("door_toggle"), QStringLiteral("door_toggle")));
}

TEST_F(TestGarageDoorController, rejected_toggle_does_not_start_transition)
{
    m_remote->failWriteOn = QStringLiteral("door_toggle");

    Failure failure;
    EXPECT_FALSE(m_door.open(&failure));
    EXPECT_EQ(failure.kind, FailureKind::Command);
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("G1")));
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Normal);
    EXPECT_TRUE(m_coordinator.isRefreshQueued());
}

TEST_F(TestGarageDoorController, open_runs_fast_until_door_reports_opened)
{
    ASSERT_TRUE(m_door.open());

    setStatus("opening");
    poll();
    EXPECT_TRUE(m_door.isOpening());
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Fast);

    setStatus("opened");
    poll();
    EXPECT_EQ(m_door.doorStatus(), QStringLiteral("opened"));
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("G1")));
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Normal);
}

TEST_F(TestGarageDoorController, update_waits_for_next_roster_before_syncing)
{
    ASSERT_TRUE(m_door.open());
    ASSERT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));

    // The published roster still says closed; that must not end the
    // transition the toggle just started.
    m_door.update();
    EXPECT_TRUE(m_door.isSyncPending());
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));
    EXPECT_TRUE(m_coordinator.isRefreshQueued());

    setStatus("opening");
    poll();
    m_door.reconcile();
    EXPECT_FALSE(m_door.isSyncPending());
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));
}

TEST_F(TestGarageDoorController, update_clears_transition_once_roster_shows_door_stopped)
{
    setStatus("closing");
    m_nowMs += 30000;
    ASSERT_TRUE(m_coordinator.runTick());
    m_coordinator.clearTransition(QStringLiteral("G1"));

    m_door.update();
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("G1")));

    m_door.reconcile();
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));

    setStatus("closed");
    m_door.update();
    poll();
    m_door.reconcile();
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("G1")));
}

TEST_F(TestGarageDoorController, reconcile_without_update_leaves_transition_alone)
{
    ASSERT_TRUE(m_door.open());
    m_door.reconcile();
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("G1")));
}

TEST_F(TestGarageDoorController, missing_door_rejects_commands)
{
    GarageDoorController missing(&m_coordinator, QStringLiteral("G9"));
    EXPECT_FALSE(missing.isAvailable());
    EXPECT_FALSE(missing.doorStatus().has_value());
    EXPECT_EQ(missing.name(), QStringLiteral("G9"));

    Failure failure;
    EXPECT_FALSE(missing.open(&failure));
    EXPECT_EQ(failure.kind, FailureKind::Command);
}

} // namespace
