#include "light_controller.h"

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

class TestLightController : public testing::Test
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

        PropertyMap color;
        color.insert(QStringLiteral("power"), intValue(0));
        color.insert(QStringLiteral("brightness"), intValue(50));
        color.insert(QStringLiteral("voice_data"), textValue(" Porch "));
        color.insert(QStringLiteral("mode"), textValue("white"));
        color.insert(QStringLiteral("color_temp"), intValue(100));
        color.insert(QStringLiteral("color_select"), intValue(120));
        color.insert(QStringLiteral("color_saturation"), intValue(80));
        m_remote = m_cloud.add(QStringLiteral("L1"), color, QStringLiteral("light"), QStringLiteral("Smart Bulb"));

        PropertyMap plain;
        plain.insert(QStringLiteral("power"), intValue(1));
        plain.insert(QStringLiteral("voice_data"), textValue(""));
        m_plainRemote = m_cloud.add(QStringLiteral("L2"), plain, QStringLiteral("light"), QStringLiteral("Plug"));

        ASSERT_TRUE(m_coordinator.runTick());
    }

    void poll(std::int64_t advanceMs = 2000)
    {
        m_nowMs += advanceMs;
        ASSERT_TRUE(m_coordinator.runTick());
        m_light.reconcile();
    }

    NiceMock<MockDeviceSource> m_source;
    FakeCloud m_cloud;
    std::int64_t m_nowMs = 1000;
    UpdateCoordinator m_coordinator{&m_source};
    std::shared_ptr<FakeRemote> m_remote;
    std::shared_ptr<FakeRemote> m_plainRemote;
    LightController m_light{&m_coordinator, QStringLiteral("L1")};
};

// MARK: - Tests:

TEST_F(TestLightController, identity_prefers_voice_name)
{
    EXPECT_EQ(m_light.uniqueId(), QStringLiteral("nomaiq_light_L1"));
    EXPECT_EQ(m_light.name(), QStringLiteral("Porch"));

    const LightController plain(&m_coordinator, QStringLiteral("L2"));
    EXPECT_EQ(plain.name(), QStringLiteral("Plug"));

    const LightController missing(&m_coordinator, QStringLiteral("L9"));
    EXPECT_EQ(missing.name(), QStringLiteral("L9"));
    EXPECT_FALSE(missing.isAvailable());
    EXPECT_FALSE(missing.isOn().has_value());
}

TEST_F(TestLightController, reads_follow_the_roster)
{
    EXPECT_TRUE(m_light.isAvailable());
    EXPECT_TRUE(m_light.isColorCapable());
    EXPECT_TRUE(m_light.isWhiteCapable());
    EXPECT_EQ(m_light.isOn(), false);
    EXPECT_EQ(m_light.brightness(), 128);
    EXPECT_EQ(m_light.colorTempMired(), kMinMired);
    EXPECT_FALSE(m_light.hsColor().has_value());
    EXPECT_EQ(m_light.colorMode(), LightColorMode::OnOff);
}

TEST_F(TestLightController, color_mode_follows_device_mode)
{
    m_remote->properties.insert(QStringLiteral("power"), intValue(1));
    poll(30000);
    EXPECT_EQ(m_light.colorMode(), LightColorMode::ColorTemp);

    m_remote->properties.insert(QStringLiteral("mode"), textValue("colour"));
    poll(30000);
    EXPECT_EQ(m_light.colorMode(), LightColorMode::Hs);
    EXPECT_FALSE(m_light.colorTempMired().has_value());
    const std::optional<HsColor> hs = m_light.hsColor();
    ASSERT_TRUE(hs.has_value());
    EXPECT_DOUBLE_EQ(hs->hue, 120.0);
    EXPECT_DOUBLE_EQ(hs->saturation, 80.0);

    const LightController plain(&m_coordinator, QStringLiteral("L2"));
    EXPECT_FALSE(plain.isColorCapable());
    EXPECT_FALSE(plain.isWhiteCapable());
    EXPECT_EQ(plain.colorMode(), LightColorMode::OnOff);
}

TEST_F(TestLightController, turn_on_reads_optimistically_until_invalidated)
{
    ASSERT_TRUE(m_light.turnOn());
    EXPECT_EQ(m_light.isOn(), true);
    EXPECT_EQ(propertyAsInt(m_coordinator.device(QStringLiteral("L1"))->property(QStringLiteral("power"))), 0);

    m_light.update();
    EXPECT_TRUE(m_light.overlay().isEmpty());
    EXPECT_EQ(m_light.isOn(), false);
}

TEST_F(TestLightController, turn_on_marks_transition_with_intended_power)
{
    ASSERT_TRUE(m_light.turnOn());
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("L1")));
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Fast);
    EXPECT_EQ(propertyAsInt(m_coordinator.tracker().intendedValue(QStringLiteral("L1"))), 1);
    EXPECT_TRUE(m_coordinator.isRefreshQueued());
    EXPECT_THAT(m_remote->writtenNames(), ElementsAre(QStringLiteral("power")));
}

TEST_F(TestLightController, turn_on_with_white_sends_power_brightness_mode_temperature)
{
    LightTurnOnRequest request;
    request.brightness = 255;
    request.colorTempMired = kMaxMired;
    ASSERT_TRUE(m_light.turnOn(request));

    EXPECT_THAT(m_remote->writtenNames(),
                ElementsAre(QStringLiteral("power"), QStringLiteral("brightness"), QStringLiteral("mode"),
                            QStringLiteral("color_temp")));
    EXPECT_EQ(propertyAsInt(m_remote->writes.at(1).value), 100);
    EXPECT_EQ(propertyAsString(m_remote->writes.at(2).value), QStringLiteral("white"));
    EXPECT_EQ(propertyAsInt(m_remote->writes.at(3).value), 0);

    EXPECT_EQ(m_light.brightness(), 255);
    EXPECT_EQ(m_light.colorTempMired(), kMaxMired);
}

TEST_F(TestLightController, turn_on_with_colour_sends_hue_and_saturation)
{
    LightTurnOnRequest request;
    request.hsColor = HsColor{400.0, 55.0};
    ASSERT_TRUE(m_light.turnOn(request));

    EXPECT_THAT(m_remote->writtenNames(),
                ElementsAre(QStringLiteral("power"), QStringLiteral("mode"), QStringLiteral("color_select"),
                            QStringLiteral("color_saturation")));
    EXPECT_EQ(propertyAsString(m_remote->writes.at(1).value), QStringLiteral("colour"));
    EXPECT_EQ(propertyAsInt(m_remote->writes.at(2).value), 40);
    EXPECT_EQ(propertyAsInt(m_remote->writes.at(3).value), 55);

    const std::optional<HsColor> hs = m_light.hsColor();
    ASSERT_TRUE(hs.has_value());
    EXPECT_DOUBLE_EQ(hs->hue, 40.0);
}

TEST_F(TestLightController, failed_write_falls_back_to_roster_on_state)
{
    m_remote->failWriteOn = QStringLiteral("brightness");
    LightTurnOnRequest request;
    request.brightness = 10;

    Failure failure;
    EXPECT_FALSE(m_light.turnOn(request, &failure));
    EXPECT_EQ(failure.kind, FailureKind::Command);
    EXPECT_EQ(m_light.isOn(), false);
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("L1")));
    EXPECT_TRUE(m_coordinator.isRefreshQueued());
}

TEST_F(TestLightController, turn_off_marks_intended_zero)
{
    m_remote->properties.insert(QStringLiteral("power"), intValue(1));
    poll(30000);
    ASSERT_EQ(m_light.isOn(), true);

    ASSERT_TRUE(m_light.turnOff());
    EXPECT_EQ(m_light.isOn(), false);
    EXPECT_EQ(propertyAsInt(m_coordinator.tracker().intendedValue(QStringLiteral("L1"))), 0);
    ASSERT_EQ(m_remote->writes.size(), 1);
    EXPECT_EQ(propertyAsInt(m_remote->writes.at(0).value), 0);
}

TEST_F(TestLightController, asserted_values_survive_until_transition_completes)
{
    ASSERT_TRUE(m_light.turnOn());

    poll();
    EXPECT_TRUE(m_coordinator.isInTransition(QStringLiteral("L1")));
    EXPECT_FALSE(m_light.overlay().isEmpty());
    EXPECT_EQ(m_light.isOn(), true);

    m_remote->properties.insert(QStringLiteral("power"), intValue(1));
    poll();
    EXPECT_FALSE(m_coordinator.isInTransition(QStringLiteral("L1")));
    EXPECT_TRUE(m_light.overlay().isEmpty());
    EXPECT_EQ(m_light.isOn(), true);
    EXPECT_EQ(m_coordinator.currentPeriod(), SchedulerPeriod::Normal);
}

TEST_F(TestLightController, unavailable_light_rejects_commands)
{
    LightController missing(&m_coordinator, QStringLiteral("L9"));
    Failure failure;
    EXPECT_FALSE(missing.turnOn(LightTurnOnRequest(), &failure));
    EXPECT_EQ(failure.kind, FailureKind::Command);
    EXPECT_FALSE(missing.turnOff());
}

} // namespace
