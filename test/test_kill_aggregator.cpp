#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "alarm_broadcaster.hpp"
#include "alarm_bus.hpp"
#include "alarm_listener.hpp"
#include "kill_aggregator.hpp"

class KillAggregatorTest : public ::testing::Test
{
protected:
  std::unique_ptr<KillAggregator> makeAggregator(bool latching = true)
  {
    KillAggregatorConfig config;
    config.latching = latching;
    return std::make_unique<KillAggregator>(
      config, bus_, rclcpp::get_logger("test_kill_aggregator"));
  }

  AlarmBus bus_{std::make_shared<rclcpp::Clock>(RCL_SYSTEM_TIME), rclcpp::get_logger("test_bus")};
  AlarmBroadcaster hw_kill_{"hw-kill", "kill_board", bus_};
  AlarmBroadcaster network_loss_{"network-loss", "watchdog", bus_};
};

TEST_F(KillAggregatorTest, DefaultsMatchTheVehicleKillChain)
{
  KillAggregatorConfig config;
  EXPECT_EQ(config.kill_alarm, "kill");
  EXPECT_EQ(config.members, (std::vector<std::string>{"hw-kill", "network-loss"}));
  EXPECT_TRUE(config.latching);
}

TEST_F(KillAggregatorTest, RejectsInvalidConfig)
{
  KillAggregatorConfig config;
  config.kill_alarm = "";
  EXPECT_THROW(KillAggregator(config, bus_), std::invalid_argument);

  config = KillAggregatorConfig{};
  config.members.clear();
  EXPECT_THROW(KillAggregator(config, bus_), std::invalid_argument);

  config = KillAggregatorConfig{};
  config.members.push_back("");
  EXPECT_THROW(KillAggregator(config, bus_), std::invalid_argument);

  config = KillAggregatorConfig{};
  config.members.push_back("kill");
  EXPECT_THROW(KillAggregator(config, bus_), std::invalid_argument);
}

TEST_F(KillAggregatorTest, DuplicateMembersAreMerged)
{
  KillAggregatorConfig config;
  config.members = {"network-loss", "hw-kill", "network-loss"};
  KillAggregator aggregator(config, bus_);
  EXPECT_EQ(aggregator.config().members, (std::vector<std::string>{"hw-kill", "network-loss"}));
  EXPECT_EQ(bus_.listenerCount("network-loss"), 1u);
}

TEST_F(KillAggregatorTest, QuietMembersLeaveKillUntouched)
{
  auto aggregator = makeAggregator();
  EXPECT_EQ(bus_.getOrCreate("kill")->sequence(), 0u);
  EXPECT_TRUE(aggregator->raisedMembers().empty());
}

TEST_F(KillAggregatorTest, MemberRaiseRaisesKillWithSource)
{
  auto aggregator = makeAggregator();
  network_loss_.raiseAlarm({}, std::string("no signal for > 8.000 s"));

  auto kill = bus_.getOrCreate("kill");
  EXPECT_TRUE(kill->raised());
  EXPECT_EQ(kill->raisedBy(), "kill_aggregator/kill");
  EXPECT_EQ(kill->parameter("source"), "network-loss");
  EXPECT_EQ(kill->parameter("source_sequence"), "1");
  EXPECT_EQ(kill->problemDescription().value_or(""), "'network-loss': no signal for > 8.000 s");
  EXPECT_EQ(aggregator->raisedMembers(), std::vector<std::string>{"network-loss"});
}

TEST_F(KillAggregatorTest, AlreadyRaisedMemberAtStartupRaisesKill)
{
  hw_kill_.raiseAlarm();
  auto aggregator = makeAggregator();

  auto kill = bus_.getOrCreate("kill");
  EXPECT_TRUE(kill->raised());
  EXPECT_EQ(kill->problemDescription().value_or(""), "'hw-kill' raised");
}

TEST_F(KillAggregatorTest, RaiseIsEdgeTriggeredPerMember)
{
  auto aggregator = makeAggregator();
  hw_kill_.raiseAlarm();
  const auto sequence = bus_.getOrCreate("kill")->sequence();

  hw_kill_.raiseAlarm();  // Repeat confirmation from the same member
  EXPECT_EQ(bus_.getOrCreate("kill")->sequence(), sequence);

  network_loss_.raiseAlarm();  // A second member is a new edge
  EXPECT_EQ(bus_.getOrCreate("kill")->sequence(), sequence + 1);
  EXPECT_EQ(bus_.getOrCreate("kill")->parameter("source"), "network-loss");
}

TEST_F(KillAggregatorTest, LatchingKillStaysRaisedUntilForceCleared)
{
  auto aggregator = makeAggregator(true);
  network_loss_.raiseAlarm();
  network_loss_.clearAlarm();

  EXPECT_TRUE(bus_.getOrCreate("kill")->raised());
  EXPECT_TRUE(aggregator->raisedMembers().empty());

  bus_.forceClear("kill");
  EXPECT_FALSE(bus_.getOrCreate("kill")->raised());

  // A fresh member raise after the override raises kill again
  network_loss_.raiseAlarm();
  EXPECT_TRUE(bus_.getOrCreate("kill")->raised());
}

TEST_F(KillAggregatorTest, NonLatchingKillClearsWhenAllMembersClear)
{
  auto aggregator = makeAggregator(false);
  hw_kill_.raiseAlarm();
  network_loss_.raiseAlarm();

  hw_kill_.clearAlarm();
  EXPECT_TRUE(bus_.getOrCreate("kill")->raised());

  network_loss_.clearAlarm();
  auto kill = bus_.getOrCreate("kill");
  EXPECT_FALSE(kill->raised());
  EXPECT_EQ(kill->parameter("reason"), "all members clear");
  EXPECT_EQ(kill->parameter("source"), "network-loss");
}

TEST_F(KillAggregatorTest, KillCanBeRaisedDirectlyAlongsideAggregator)
{
  auto aggregator = makeAggregator(false);
  AlarmBroadcaster operator_kill("kill", "operator", bus_);
  operator_kill.raiseAlarm();

  // No member ever raised, so member clears must not touch the operator's kill
  network_loss_.clearAlarm();
  EXPECT_TRUE(bus_.getOrCreate("kill")->raised());
  EXPECT_EQ(bus_.getOrCreate("kill")->raisedBy(), "operator");
}

TEST_F(KillAggregatorTest, KillListenersNotifiedBeforeMemberRaiseReturns)
{
  auto aggregator = makeAggregator();
  int kill_raises = 0;
  AlarmListener kill_listener(
    "kill",
    [&](const AlarmRecord::ConstSharedPtr & r) {
      if (r->raised()) {
        ++kill_raises;
      }
    },
    bus_);

  hw_kill_.raiseAlarm();
  EXPECT_EQ(kill_raises, 1);
  EXPECT_TRUE(kill_listener.isRaised());
}

TEST_F(KillAggregatorTest, DestroyedAggregatorStopsFollowing)
{
  {
    auto aggregator = makeAggregator();
    EXPECT_EQ(bus_.listenerCount("hw-kill"), 1u);
  }
  EXPECT_EQ(bus_.listenerCount("hw-kill"), 0u);

  hw_kill_.raiseAlarm();
  EXPECT_FALSE(bus_.getOrCreate("kill")->raised());
}
