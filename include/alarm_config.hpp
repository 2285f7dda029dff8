#ifndef ALARM_CONFIG_HPP
#define ALARM_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "heartbeat_watchdog.hpp"
#include "kill_aggregator.hpp"

/**
 * @brief One monitored liveness stream and the alarm it drives.
 */
struct HeartbeatSourceConfig
{
  std::string alarm;
  std::string topic;
  double deadline{8.0};       // seconds
  double tick_interval{0.5};  // seconds
  bool raise_on_silent_start{true};

  HeartbeatWatchdogConfig toWatchdogConfig() const;
};

/**
 * @brief Everything the alarm server needs from its YAML file.
 *
 * Example:
 * ```yaml
 * heartbeats:
 *   - alarm: network-loss
 *     topic: /network
 *     deadline: 8.0
 *     tick_interval: 0.5
 * kill:
 *   alarm: kill
 *   members: [hw-kill, network-loss]
 *   latching: true
 * alarms: [hw-kill]
 * audit_log: /var/log/killswitch/overrides.yaml
 * diagnostics_period: 1.0
 * ```
 */
struct AlarmServerConfig
{
  std::vector<HeartbeatSourceConfig> heartbeats;
  std::optional<KillAggregatorConfig> kill;
  std::vector<std::string> extra_alarms;
  std::string audit_log;
  double diagnostics_period{1.0};

  /// Every alarm name the server exposes, sorted and unique.
  std::vector<std::string> allAlarmNames() const;
};

/**
 * @brief Parse a config tree. Missing sections take their defaults.
 * @throws std::invalid_argument on malformed or unsafe values
 */
AlarmServerConfig parseAlarmServerConfig(const YAML::Node & root);

/**
 * @brief Load and parse a config file.
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws std::invalid_argument on malformed or unsafe values
 */
AlarmServerConfig loadAlarmServerConfig(const std::string & path);

/// @throws std::invalid_argument describing the first problem found
void validateAlarmServerConfig(const AlarmServerConfig & config);

#endif  // ALARM_CONFIG_HPP
