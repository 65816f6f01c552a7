#include "transition_tracker.h"

#include "fake_device.h"
#include "interval_scheduler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{

using namespace phicore::nomaiq;
using namespace phicore::nomaiq::test;

using testing::ElementsAre;

class TestTransitionTracker : public testing::Test
{
protected:
    static std::shared_ptr<FakeDevice> light(const QString &serial, std::int64_t power)
    {
        PropertyMap properties;
        properties.insert(QStringLiteral("power"), PropertyValue(power));
        return FakeDevice::withProperties(serial, properties);
    }

    static std::shared_ptr<FakeDevice> door(const QString &serial, const char *status)
    {
        PropertyMap properties;
        properties.insert(QStringLiteral("door_status"), textValue(status));
        return FakeDevice::withProperties(serial, properties, QStringLiteral("gdo"));
    }

    IntervalScheduler m_scheduler;
    TransitionTracker m_tracker{&m_scheduler};
};

// MARK: - Tests:

TEST_F(TestTransitionTracker, period_is_fast_exactly_while_serials_are_tracked)
{
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Normal);

    m_tracker.mark(QStringLiteral("A"));
    m_tracker.mark(QStringLiteral("B"), intValue(1));
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Fast);

    m_tracker.clear(QStringLiteral("A"));
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Fast);

    m_tracker.clear(QStringLiteral("B"));
    EXPECT_TRUE(m_tracker.isEmpty());
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Normal);

    m_tracker.mark(QStringLiteral("C"));
    m_tracker.reset();
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Normal);
}

TEST_F(TestTransitionTracker, clearing_unknown_serial_is_harmless)
{
    m_tracker.clear(QStringLiteral("nope"));
    m_tracker.mark(QString());
    EXPECT_TRUE(m_tracker.isEmpty());
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Normal);
}

TEST_F(TestTransitionTracker, serials_are_listed_sorted)
{
    m_tracker.mark(QStringLiteral("C"));
    m_tracker.mark(QStringLiteral("A"));
    m_tracker.mark(QStringLiteral("B"));
    EXPECT_THAT(m_tracker.serials(), ElementsAre(QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")));
    EXPECT_EQ(m_tracker.size(), 3);
}

TEST_F(TestTransitionTracker, intended_value_completes_only_on_match)
{
    m_tracker.mark(QStringLiteral("L1"), intValue(1));

    EXPECT_FALSE(m_tracker.inspect(*light(QStringLiteral("L1"), 0)));
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("L1")));

    EXPECT_TRUE(m_tracker.inspect(*light(QStringLiteral("L1"), 1)));
    EXPECT_FALSE(m_tracker.contains(QStringLiteral("L1")));
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Normal);
}

TEST_F(TestTransitionTracker, intended_off_completes_on_zero)
{
    m_tracker.mark(QStringLiteral("L1"), PropertyValue(false));
    EXPECT_FALSE(m_tracker.inspect(*light(QStringLiteral("L1"), 1)));
    EXPECT_TRUE(m_tracker.inspect(*light(QStringLiteral("L1"), 0)));
}

TEST_F(TestTransitionTracker, intended_value_ignores_door_status)
{
    PropertyMap properties;
    properties.insert(QStringLiteral("power"), intValue(0));
    properties.insert(QStringLiteral("door_status"), textValue("closed"));
    const auto device = FakeDevice::withProperties(QStringLiteral("X"), properties);

    m_tracker.mark(QStringLiteral("X"), intValue(1));
    EXPECT_FALSE(m_tracker.inspect(*device));
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("X")));
}

TEST_F(TestTransitionTracker, remarking_without_value_drops_intended_value)
{
    m_tracker.mark(QStringLiteral("X"), intValue(1));
    ASSERT_TRUE(m_tracker.intendedValue(QStringLiteral("X")).has_value());

    m_tracker.mark(QStringLiteral("X"));
    EXPECT_FALSE(m_tracker.intendedValue(QStringLiteral("X")).has_value());
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("X")));
}

TEST_F(TestTransitionTracker, door_completes_on_terminal_status)
{
    m_tracker.mark(QStringLiteral("G1"));

    EXPECT_FALSE(m_tracker.inspect(*door(QStringLiteral("G1"), "opening")));
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("G1")));

    EXPECT_TRUE(m_tracker.inspect(*door(QStringLiteral("G1"), "opened")));
    EXPECT_FALSE(m_tracker.contains(QStringLiteral("G1")));

    m_tracker.mark(QStringLiteral("G1"));
    EXPECT_TRUE(m_tracker.inspect(*door(QStringLiteral("G1"), "closed")));
}

TEST_F(TestTransitionTracker, moving_door_is_tracked_without_a_command)
{
    EXPECT_FALSE(m_tracker.inspect(*door(QStringLiteral("G1"), "closing")));
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("G1")));
    EXPECT_EQ(m_scheduler.currentPeriod(), SchedulerPeriod::Fast);

    EXPECT_FALSE(m_tracker.inspect(*door(QStringLiteral("G2"), "closed")));
    EXPECT_FALSE(m_tracker.contains(QStringLiteral("G2")));
}

TEST_F(TestTransitionTracker, device_without_status_or_value_stays_tracked)
{
    m_tracker.mark(QStringLiteral("L1"));
    EXPECT_FALSE(m_tracker.inspect(*light(QStringLiteral("L1"), 1)));
    EXPECT_TRUE(m_tracker.contains(QStringLiteral("L1")));
}

} // namespace
