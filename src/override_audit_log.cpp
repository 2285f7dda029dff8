#include "override_audit_log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

OverrideAuditLog::OverrideAuditLog(std::string path, rclcpp::Logger logger)
: path_(std::move(path)),
  logger_(std::move(logger))
{
}

bool OverrideAuditLog::append(const OverrideAuditEntry & entry)
{
  if (!enabled()) {
    return true;
  }

  YAML::Emitter out;
  out << YAML::BeginSeq;
  out << YAML::BeginMap;
  out << YAML::Key << "alarm" << YAML::Value << entry.alarm;
  out << YAML::Key << "timestamp" << YAML::Value << entry.timestamp;
  out << YAML::Key << "sequence" << YAML::Value << entry.sequence;
  out << YAML::Key << "previously_raised" << YAML::Value << entry.previously_raised;
  out << YAML::Key << "requested_by" << YAML::Value << entry.requested_by;
  out << YAML::EndMap;
  out << YAML::EndSeq;

  if (!out.good()) {
    RCLCPP_ERROR(logger_, "Could not encode audit entry for '%s': %s",
      entry.alarm.c_str(), out.GetLastError().c_str());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream audit_file(path_, std::ios::app);
  if (!audit_file.is_open()) {
    RCLCPP_ERROR(logger_, "Could not open audit log: %s", path_.c_str());
    return false;
  }

  audit_file << out.c_str() << "\n";
  audit_file.close();

  if (audit_file.fail()) {
    RCLCPP_ERROR(logger_, "Failed writing audit log: %s", path_.c_str());
    return false;
  }

  RCLCPP_INFO(logger_, "Force clear of '%s' logged to audit trail: %s",
    entry.alarm.c_str(), path_.c_str());
  return true;
}

std::string OverrideAuditLog::currentTimestamp()
{
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}
