#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "alarm_broadcaster.hpp"
#include "alarm_bus.hpp"
#include "alarm_listener.hpp"

using namespace std::chrono_literals;

class AlarmHandlesTest : public ::testing::Test
{
protected:
  AlarmBus bus_{std::make_shared<rclcpp::Clock>(RCL_SYSTEM_TIME), rclcpp::get_logger("test_alarm_handles")};
};

TEST_F(AlarmHandlesTest, BroadcasterRejectsEmptyName)
{
  EXPECT_THROW(AlarmBroadcaster("", "someone", bus_), std::invalid_argument);
}

TEST_F(AlarmHandlesTest, BroadcasterDefaultsRaisedBy)
{
  AlarmBroadcaster kill("kill", "", bus_);
  EXPECT_EQ(kill.alarmName(), "kill");
  EXPECT_EQ(kill.raisedBy(), "broadcaster/kill");

  auto record = kill.raiseAlarm();
  EXPECT_EQ(record->raisedBy(), "broadcaster/kill");
}

TEST_F(AlarmHandlesTest, BroadcasterRaiseAndClear)
{
  AlarmBroadcaster kill("kill", "operator_panel", bus_);

  auto raised = kill.raiseAlarm({{"button", "red"}}, std::string("e-stop pressed"));
  EXPECT_TRUE(raised->raised());
  EXPECT_EQ(raised->parameter("button"), "red");
  EXPECT_EQ(raised->problemDescription().value_or(""), "e-stop pressed");

  auto cleared = kill.clearAlarm();
  EXPECT_FALSE(cleared->raised());
  EXPECT_FALSE(cleared->problemDescription().has_value());
  EXPECT_EQ(cleared->sequence(), raised->sequence() + 1);
  EXPECT_EQ(bus_.getOrCreate("kill"), cleared);
}

TEST_F(AlarmHandlesTest, ListenerSeesPreExistingRaise)
{
  AlarmBroadcaster hw_kill("hw-kill", "board", bus_);
  hw_kill.raiseAlarm();

  AlarmListener listener("hw-kill", {}, bus_);
  EXPECT_TRUE(listener.active());
  EXPECT_TRUE(listener.isRaised());
  ASSERT_NE(listener.lastRecord(), nullptr);
  EXPECT_EQ(listener.lastRecord()->sequence(), 1u);
}

TEST_F(AlarmHandlesTest, ListenerTracksTransitionsAndInvokesCallback)
{
  std::vector<bool> states;
  AlarmListener listener(
    "network-loss",
    [&](const AlarmRecord::ConstSharedPtr & r) {states.push_back(r->raised());},
    bus_);
  AlarmBroadcaster network("network-loss", "watchdog", bus_);

  EXPECT_FALSE(listener.isRaised());
  network.raiseAlarm();
  EXPECT_TRUE(listener.isRaised());
  network.clearAlarm();
  EXPECT_FALSE(listener.isRaised());

  EXPECT_EQ(states, (std::vector<bool>{false, true, false}));
}

TEST_F(AlarmHandlesTest, CancelIsIdempotentAndStopsCallbacks)
{
  int calls = 0;
  AlarmListener listener(
    "kill", [&](const AlarmRecord::ConstSharedPtr &) {++calls;}, bus_);
  AlarmBroadcaster kill("kill", "test", bus_);

  listener.cancel();
  listener.cancel();
  EXPECT_FALSE(listener.active());
  EXPECT_EQ(bus_.listenerCount("kill"), 0u);

  kill.raiseAlarm();
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(listener.isRaised());  // Cached record is frozen at cancel time
}

TEST_F(AlarmHandlesTest, DestructionUnsubscribes)
{
  {
    AlarmListener listener("kill", {}, bus_);
    EXPECT_EQ(bus_.listenerCount("kill"), 1u);
  }
  EXPECT_EQ(bus_.listenerCount("kill"), 0u);
}

TEST_F(AlarmHandlesTest, ListenerWithThrowingCallbackBecomesInactive)
{
  AlarmListener listener(
    "kill",
    [](const AlarmRecord::ConstSharedPtr & r) {
      if (r->raised()) {
        throw std::runtime_error("consumer failed");
      }
    },
    bus_);
  AlarmBroadcaster kill("kill", "test", bus_);

  EXPECT_TRUE(listener.active());
  EXPECT_NO_THROW(kill.raiseAlarm());
  EXPECT_FALSE(listener.active());
  EXPECT_EQ(bus_.listenerCount("kill"), 0u);

  // The record that failed is still what the listener last saw
  EXPECT_TRUE(listener.isRaised());
}

TEST_F(AlarmHandlesTest, ListenerThrowingOnInitialDeliveryIsInactive)
{
  AlarmBroadcaster kill("kill", "test", bus_);
  kill.raiseAlarm();

  AlarmListener listener(
    "kill",
    [](const AlarmRecord::ConstSharedPtr &) {throw std::runtime_error("not ready");},
    bus_);

  EXPECT_FALSE(listener.active());
  EXPECT_EQ(bus_.listenerCount("kill"), 0u);
}

namespace
{
struct SelfCancellingListener
{
  explicit SelfCancellingListener(AlarmBus & bus)
  : listener("kill", [this](const AlarmRecord::ConstSharedPtr &) {
        ++deliveries;
        listener.cancel();
      }, bus)
  {
  }

  int deliveries{0};
  AlarmListener listener;
};
}  // namespace

TEST_F(AlarmHandlesTest, CancelDuringInitialDeliveryStaysCancelled)
{
  AlarmBroadcaster kill("kill", "test", bus_);
  kill.raiseAlarm();

  SelfCancellingListener holder(bus_);
  EXPECT_EQ(holder.deliveries, 1);
  EXPECT_FALSE(holder.listener.active());
  EXPECT_EQ(bus_.listenerCount("kill"), 0u);

  kill.clearAlarm();
  kill.raiseAlarm();
  EXPECT_EQ(holder.deliveries, 1);
  EXPECT_TRUE(holder.listener.isRaised());  // Still the record seen before cancel
  EXPECT_EQ(holder.listener.lastRecord()->sequence(), 1u);
}

TEST_F(AlarmHandlesTest, ListenerWaitForUpdate)
{
  AlarmListener listener("kill", {}, bus_);
  AlarmBroadcaster kill("kill", "test", bus_);

  EXPECT_EQ(listener.waitForUpdate(0, 10ms), nullptr);

  kill.raiseAlarm();
  auto record = listener.waitForUpdate(0, 10ms);
  ASSERT_NE(record, nullptr);
  EXPECT_TRUE(record->raised());
}

TEST_F(AlarmHandlesTest, ListenerRejectsEmptyName)
{
  EXPECT_THROW(AlarmListener("", {}, bus_), std::invalid_argument);
}
