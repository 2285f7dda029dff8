#ifndef ALARM_ROS_CONVERSIONS_HPP
#define ALARM_ROS_CONVERSIONS_HPP

#include <string>

#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <diagnostic_msgs/msg/diagnostic_status.hpp>

#include "alarm_record.hpp"

/**
 * @brief Egress encoding of an alarm record.
 *
 * level ERROR when raised and OK when clear, message = problem description,
 * hardware_id = raisedBy, values = record parameters plus the reserved keys
 * "raised", "sequence" and "observed_at" (seconds since epoch).
 */
diagnostic_msgs::msg::DiagnosticStatus toDiagnosticStatus(const AlarmRecord & record);

/// Single-status array stamped with the record's observation time.
diagnostic_msgs::msg::DiagnosticArray toDiagnosticArray(const AlarmRecord & record);

/**
 * @brief Turn an alarm name into a valid ROS topic token.
 *
 * "network-loss" becomes "network_loss". Characters other than [A-Za-z0-9_]
 * map to '_', runs of '_' collapse, and a leading digit gets an "a_" prefix.
 */
std::string alarmTopicToken(const std::string & alarm_name);

#endif  // ALARM_ROS_CONVERSIONS_HPP
