#include "alarm_config.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>

namespace
{
std::chrono::nanoseconds secondsToNanoseconds(double seconds)
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::duration<double>(seconds));
}

template<typename T>
T readOr(const YAML::Node & node, const char * key, const T & fallback)
{
  const YAML::Node value = node[key];
  if (!value) {
    return fallback;
  }
  return value.as<T>();
}

std::vector<std::string> readStringList(const YAML::Node & node, const std::string & what)
{
  if (!node) {
    return {};
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("'" + what + "' must be a list of alarm names");
  }
  return node.as<std::vector<std::string>>();
}
}  // namespace

HeartbeatWatchdogConfig HeartbeatSourceConfig::toWatchdogConfig() const
{
  HeartbeatWatchdogConfig config;
  config.alarm_name = alarm;
  config.deadline = secondsToNanoseconds(deadline);
  config.tick_interval = secondsToNanoseconds(tick_interval);
  config.raise_on_silent_start = raise_on_silent_start;
  return config;
}

std::vector<std::string> AlarmServerConfig::allAlarmNames() const
{
  std::set<std::string> names(extra_alarms.begin(), extra_alarms.end());
  for (const auto & hb : heartbeats) {
    names.insert(hb.alarm);
  }
  if (kill) {
    names.insert(kill->kill_alarm);
    names.insert(kill->members.begin(), kill->members.end());
  }
  return {names.begin(), names.end()};
}

AlarmServerConfig parseAlarmServerConfig(const YAML::Node & root)
{
  AlarmServerConfig config;
  if (!root || root.IsNull()) {
    validateAlarmServerConfig(config);
    return config;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument("alarm server config must be a YAML map");
  }

  try {
    if (const YAML::Node heartbeats = root["heartbeats"]) {
      if (!heartbeats.IsSequence()) {
        throw std::invalid_argument("'heartbeats' must be a list");
      }
      for (const auto & entry : heartbeats) {
        HeartbeatSourceConfig hb;
        hb.alarm = readOr<std::string>(entry, "alarm", "");
        hb.topic = readOr<std::string>(entry, "topic", "");
        hb.deadline = readOr<double>(entry, "deadline", hb.deadline);
        hb.tick_interval = readOr<double>(entry, "tick_interval", hb.tick_interval);
        hb.raise_on_silent_start =
          readOr<bool>(entry, "raise_on_silent_start", hb.raise_on_silent_start);
        config.heartbeats.push_back(hb);
      }
    }

    if (const YAML::Node kill = root["kill"]) {
      KillAggregatorConfig kill_config;
      kill_config.kill_alarm = readOr<std::string>(kill, "alarm", kill_config.kill_alarm);
      if (kill["members"]) {
        kill_config.members = readStringList(kill["members"], "kill.members");
      }
      kill_config.latching = readOr<bool>(kill, "latching", kill_config.latching);
      config.kill = kill_config;
    }

    config.extra_alarms = readStringList(root["alarms"], "alarms");
    config.audit_log = readOr<std::string>(root, "audit_log", config.audit_log);
    config.diagnostics_period =
      readOr<double>(root, "diagnostics_period", config.diagnostics_period);
  } catch (const YAML::Exception & e) {
    throw std::invalid_argument(std::string("alarm server config: ") + e.what());
  }

  validateAlarmServerConfig(config);
  return config;
}

AlarmServerConfig loadAlarmServerConfig(const std::string & path)
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception & e) {
    throw std::runtime_error("Failed to load alarm server config '" + path + "': " + e.what());
  }
  return parseAlarmServerConfig(root);
}

void validateAlarmServerConfig(const AlarmServerConfig & config)
{
  std::set<std::string> seen;
  for (const auto & hb : config.heartbeats) {
    if (hb.alarm.empty()) {
      throw std::invalid_argument("heartbeat entry without an 'alarm' name");
    }
    if (hb.topic.empty()) {
      throw std::invalid_argument("heartbeat '" + hb.alarm + "' has no 'topic'");
    }
    if (!(hb.deadline > 0.0)) {
      throw std::invalid_argument(
              "heartbeat '" + hb.alarm + "': deadline must be positive (got " +
              std::to_string(hb.deadline) + ")");
    }
    if (!(hb.tick_interval > 0.0)) {
      throw std::invalid_argument(
              "heartbeat '" + hb.alarm + "': tick_interval must be positive (got " +
              std::to_string(hb.tick_interval) + ")");
    }
    if (!seen.insert(hb.alarm).second) {
      throw std::invalid_argument("alarm '" + hb.alarm + "' is driven by two heartbeats");
    }
  }

  if (config.kill) {
    const auto & kill = *config.kill;
    if (kill.kill_alarm.empty()) {
      throw std::invalid_argument("'kill.alarm' must not be empty");
    }
    if (kill.members.empty()) {
      throw std::invalid_argument("'kill.members' must name at least one alarm");
    }
    if (std::find(kill.members.begin(), kill.members.end(), kill.kill_alarm) !=
      kill.members.end())
    {
      throw std::invalid_argument("kill alarm '" + kill.kill_alarm + "' lists itself as a member");
    }
    if (seen.count(kill.kill_alarm) != 0) {
      throw std::invalid_argument(
              "kill alarm '" + kill.kill_alarm + "' cannot also be driven by a heartbeat");
    }
  }

  for (const auto & name : config.extra_alarms) {
    if (name.empty()) {
      throw std::invalid_argument("'alarms' contains an empty name");
    }
  }

  if (!(config.diagnostics_period > 0.0)) {
    throw std::invalid_argument("diagnostics_period must be positive");
  }
}
