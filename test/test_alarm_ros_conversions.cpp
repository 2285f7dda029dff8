#include <gtest/gtest.h>

#include <map>
#include <string>

#include "alarm_record.hpp"
#include "alarm_ros_conversions.hpp"

namespace
{
std::map<std::string, std::string> valuesOf(const diagnostic_msgs::msg::DiagnosticStatus & status)
{
  std::map<std::string, std::string> values;
  for (const auto & kv : status.values) {
    values[kv.key] = kv.value;
  }
  return values;
}
}  // namespace

TEST(AlarmRosConversionsTest, RaisedRecordIsError)
{
  const AlarmRecord record(
    "network-loss", true, std::string("no signal for > 8.000 s"),
    {{"deadline_s", "8.000"}, {"silence_s", "8.500"}},
    "heartbeat_watchdog/network-loss", 4, rclcpp::Time(12, 500000000, RCL_SYSTEM_TIME));

  const auto status = toDiagnosticStatus(record);
  EXPECT_EQ(status.name, "network-loss");
  EXPECT_EQ(status.level, diagnostic_msgs::msg::DiagnosticStatus::ERROR);
  EXPECT_EQ(status.message, "no signal for > 8.000 s");
  EXPECT_EQ(status.hardware_id, "heartbeat_watchdog/network-loss");

  const auto values = valuesOf(status);
  EXPECT_EQ(values.at("raised"), "true");
  EXPECT_EQ(values.at("sequence"), "4");
  EXPECT_EQ(values.at("observed_at"), "12.500000000");
  EXPECT_EQ(values.at("deadline_s"), "8.000");
  EXPECT_EQ(values.at("silence_s"), "8.500");
}

TEST(AlarmRosConversionsTest, ParametersNeverShadowRecordFields)
{
  const AlarmRecord record(
    "kill", true, std::nullopt,
    {{"raised", "maybe"}, {"sequence", "99"}, {"observed_at", "yesterday"}, {"source", "hw-kill"}},
    "operator", 3, rclcpp::Time(5, 0, RCL_SYSTEM_TIME));

  const auto status = toDiagnosticStatus(record);
  ASSERT_EQ(status.values.size(), 7u);

  const auto values = valuesOf(status);
  ASSERT_EQ(values.size(), 7u);
  EXPECT_EQ(values.at("raised"), "true");
  EXPECT_EQ(values.at("sequence"), "3");
  EXPECT_EQ(values.at("observed_at"), "5.000000000");
  EXPECT_EQ(values.at("param.raised"), "maybe");
  EXPECT_EQ(values.at("param.sequence"), "99");
  EXPECT_EQ(values.at("param.observed_at"), "yesterday");
  EXPECT_EQ(values.at("source"), "hw-kill");
}

TEST(AlarmRosConversionsTest, ClearedRecordIsOk)
{
  const auto record = AlarmRecord::makeDefault("kill", rclcpp::Time(0, 0, RCL_SYSTEM_TIME));

  const auto status = toDiagnosticStatus(*record);
  EXPECT_EQ(status.level, diagnostic_msgs::msg::DiagnosticStatus::OK);
  EXPECT_EQ(status.message, "clear");
  EXPECT_EQ(valuesOf(status).at("raised"), "false");
}

TEST(AlarmRosConversionsTest, ArrayCarriesObservationStamp)
{
  const AlarmRecord record(
    "kill", true, std::nullopt, {}, "operator", 1, rclcpp::Time(42, 7, RCL_SYSTEM_TIME));

  const auto array = toDiagnosticArray(record);
  EXPECT_EQ(array.header.stamp.sec, 42);
  EXPECT_EQ(array.header.stamp.nanosec, 7u);
  ASSERT_EQ(array.status.size(), 1u);
  EXPECT_EQ(array.status[0].message, "raised");
}

TEST(AlarmRosConversionsTest, TopicTokenSanitizesNames)
{
  EXPECT_EQ(alarmTopicToken("kill"), "kill");
  EXPECT_EQ(alarmTopicToken("network-loss"), "network_loss");
  EXPECT_EQ(alarmTopicToken("hw kill!!"), "hw_kill");
  EXPECT_EQ(alarmTopicToken("--odd--name--"), "odd_name");
  EXPECT_EQ(alarmTopicToken("3d-lidar"), "a_3d_lidar");
  EXPECT_EQ(alarmTopicToken("---"), "unnamed");
  EXPECT_EQ(alarmTopicToken(""), "unnamed");
}
