#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "alarm_config.hpp"

using namespace std::chrono_literals;

namespace
{
constexpr const char * kFullConfig = R"(
heartbeats:
  - alarm: network-loss
    topic: /network
    deadline: 8.0
    tick_interval: 0.5
  - alarm: telemetry-loss
    topic: /telemetry/heartbeat
    deadline: 2.5
    raise_on_silent_start: false
kill:
  alarm: kill
  members: [hw-kill, network-loss]
  latching: false
alarms: [hw-kill, thruster-fault]
audit_log: /tmp/overrides.yaml
diagnostics_period: 2.0
)";

AlarmServerConfig parse(const std::string & text)
{
  return parseAlarmServerConfig(YAML::Load(text));
}
}  // namespace

TEST(AlarmConfigTest, ParsesFullConfig)
{
  const auto config = parse(kFullConfig);

  ASSERT_EQ(config.heartbeats.size(), 2u);
  EXPECT_EQ(config.heartbeats[0].alarm, "network-loss");
  EXPECT_EQ(config.heartbeats[0].topic, "/network");
  EXPECT_DOUBLE_EQ(config.heartbeats[0].deadline, 8.0);
  EXPECT_DOUBLE_EQ(config.heartbeats[0].tick_interval, 0.5);
  EXPECT_TRUE(config.heartbeats[0].raise_on_silent_start);

  EXPECT_DOUBLE_EQ(config.heartbeats[1].deadline, 2.5);
  EXPECT_DOUBLE_EQ(config.heartbeats[1].tick_interval, 0.5);  // default
  EXPECT_FALSE(config.heartbeats[1].raise_on_silent_start);

  ASSERT_TRUE(config.kill.has_value());
  EXPECT_EQ(config.kill->kill_alarm, "kill");
  EXPECT_FALSE(config.kill->latching);

  EXPECT_EQ(config.audit_log, "/tmp/overrides.yaml");
  EXPECT_DOUBLE_EQ(config.diagnostics_period, 2.0);

  EXPECT_EQ(config.allAlarmNames(), (std::vector<std::string>{
    "hw-kill", "kill", "network-loss", "telemetry-loss", "thruster-fault"}));
}

TEST(AlarmConfigTest, EmptyDocumentYieldsDefaults)
{
  const auto config = parse("");
  EXPECT_TRUE(config.heartbeats.empty());
  EXPECT_FALSE(config.kill.has_value());
  EXPECT_TRUE(config.audit_log.empty());
  EXPECT_DOUBLE_EQ(config.diagnostics_period, 1.0);
  EXPECT_TRUE(config.allAlarmNames().empty());
}

TEST(AlarmConfigTest, KillSectionDefaults)
{
  const auto config = parse("kill: {}\n");
  ASSERT_TRUE(config.kill.has_value());
  EXPECT_EQ(config.kill->kill_alarm, "kill");
  EXPECT_EQ(config.kill->members, (std::vector<std::string>{"hw-kill", "network-loss"}));
  EXPECT_TRUE(config.kill->latching);
}

TEST(AlarmConfigTest, ConvertsToWatchdogConfig)
{
  HeartbeatSourceConfig source;
  source.alarm = "network-loss";
  source.topic = "/network";
  source.deadline = 0.8;
  source.tick_interval = 0.1;
  source.raise_on_silent_start = false;

  const auto watchdog = source.toWatchdogConfig();
  EXPECT_EQ(watchdog.alarm_name, "network-loss");
  EXPECT_EQ(watchdog.deadline, 800ms);
  EXPECT_EQ(watchdog.tick_interval, 100ms);
  EXPECT_FALSE(watchdog.raise_on_silent_start);
  EXPECT_TRUE(watchdog.start_timer);
}

TEST(AlarmConfigTest, RejectsMalformedDocuments)
{
  EXPECT_THROW(parse("- just\n- a list\n"), std::invalid_argument);
  EXPECT_THROW(parse("heartbeats: /network\n"), std::invalid_argument);
  EXPECT_THROW(parse("alarms: hw-kill\n"), std::invalid_argument);
  EXPECT_THROW(
    parse("heartbeats:\n  - alarm: a\n    topic: /a\n    deadline: soon\n"),
    std::invalid_argument);
}

TEST(AlarmConfigTest, RejectsUnsafeValues)
{
  // Missing topic
  EXPECT_THROW(parse("heartbeats:\n  - alarm: a\n"), std::invalid_argument);
  // Missing alarm
  EXPECT_THROW(parse("heartbeats:\n  - topic: /a\n"), std::invalid_argument);
  // Non-positive timing
  EXPECT_THROW(
    parse("heartbeats:\n  - {alarm: a, topic: /a, deadline: 0}\n"), std::invalid_argument);
  EXPECT_THROW(
    parse("heartbeats:\n  - {alarm: a, topic: /a, tick_interval: -0.5}\n"),
    std::invalid_argument);
  // One alarm driven by two heartbeats
  EXPECT_THROW(
    parse("heartbeats:\n  - {alarm: a, topic: /a}\n  - {alarm: a, topic: /b}\n"),
    std::invalid_argument);
  // Kill alarm listed as its own member
  EXPECT_THROW(parse("kill: {alarm: kill, members: [kill, hw-kill]}\n"), std::invalid_argument);
  // Kill alarm also driven by a heartbeat
  EXPECT_THROW(
    parse("heartbeats:\n  - {alarm: kill, topic: /a}\nkill: {alarm: kill}\n"),
    std::invalid_argument);
  EXPECT_THROW(parse("kill: {members: []}\n"), std::invalid_argument);
  EXPECT_THROW(parse("alarms: ['']\n"), std::invalid_argument);
  EXPECT_THROW(parse("diagnostics_period: 0\n"), std::invalid_argument);
}

TEST(AlarmConfigTest, LoadsFromFile)
{
  const auto path = std::filesystem::temp_directory_path() /
    ("killswitch_config_test_" +
    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".yaml");
  {
    std::ofstream out(path);
    out << kFullConfig;
  }

  const auto config = loadAlarmServerConfig(path.string());
  EXPECT_EQ(config.heartbeats.size(), 2u);

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(AlarmConfigTest, MissingFileThrowsRuntimeError)
{
  EXPECT_THROW(
    loadAlarmServerConfig("/nonexistent/killswitch/alarm_server.yaml"), std::runtime_error);
}

TEST(AlarmConfigTest, ShippedConfigIsValid)
{
  const auto config =
    loadAlarmServerConfig(std::string(KILLSWITCH_TEST_CONFIG_DIR) + "/alarm_server.yaml");

  ASSERT_EQ(config.heartbeats.size(), 1u);
  EXPECT_EQ(config.heartbeats[0].alarm, "network-loss");
  EXPECT_EQ(config.heartbeats[0].topic, "/network");
  EXPECT_DOUBLE_EQ(config.heartbeats[0].deadline, 8.0);
  ASSERT_TRUE(config.kill.has_value());
  EXPECT_TRUE(config.kill->latching);
  EXPECT_EQ(config.allAlarmNames(), (std::vector<std::string>{"hw-kill", "kill", "network-loss"}));
}
