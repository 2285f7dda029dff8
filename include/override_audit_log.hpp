#ifndef OVERRIDE_AUDIT_LOG_HPP
#define OVERRIDE_AUDIT_LOG_HPP

#include <cstdint>
#include <mutex>
#include <string>

#include <rclcpp/rclcpp.hpp>

/**
 * @struct OverrideAuditEntry
 * @brief One administrative force-clear, as written to the audit trail
 */
struct OverrideAuditEntry {
  std::string alarm;             ///< Alarm that was force-cleared
  std::string timestamp;         ///< ISO 8601 UTC time of the clear
  std::uint64_t sequence{0};     ///< Sequence of the clearing record
  bool previously_raised{false}; ///< Whether the alarm was raised before the clear
  std::string requested_by;      ///< Caller identity (service name, operator)
};

/**
 * @class OverrideAuditLog
 * @brief Appends force-clear events to a YAML audit trail
 *
 * Each entry is a YAML sequence item, so the whole file loads as a list.
 * An empty path disables the log.
 */
class OverrideAuditLog {
public:
  explicit OverrideAuditLog(
    std::string path,
    rclcpp::Logger logger = rclcpp::get_logger("override_audit_log"));

  bool enabled() const {return !path_.empty();}

  const std::string & path() const {return path_;}

  /**
   * @brief Append @p entry to the audit file
   * @return false if the log is enabled but the entry could not be written
   */
  bool append(const OverrideAuditEntry & entry);

  /**
   * @brief Current UTC time as ISO 8601 (e.g. "2025-10-29T14:30:00Z")
   */
  static std::string currentTimestamp();

private:
  std::string path_;
  rclcpp::Logger logger_;
  std::mutex mutex_;
};

#endif  // OVERRIDE_AUDIT_LOG_HPP
