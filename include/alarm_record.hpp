#ifndef ALARM_RECORD_HPP
#define ALARM_RECORD_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <rclcpp/time.hpp>

using AlarmParameters = std::map<std::string, std::string>;

/**
 * @brief Immutable snapshot of one alarm at one sequence number.
 *
 * Every transition on the bus builds a fresh record, so consumers may keep
 * the shared pointer of the last record they saw without copying it.
 */
class AlarmRecord
{
public:
  using ConstSharedPtr = std::shared_ptr<const AlarmRecord>;

  AlarmRecord(
    std::string name,
    bool raised,
    std::optional<std::string> problem_description,
    AlarmParameters parameters,
    std::string raised_by,
    std::uint64_t sequence,
    rclcpp::Time observed_at);

  /// Cleared record with sequence 0, used when a name is first seen.
  static ConstSharedPtr makeDefault(const std::string & name, const rclcpp::Time & observed_at);

  const std::string & name() const {return name_;}
  bool raised() const {return raised_;}
  const std::optional<std::string> & problemDescription() const {return problem_description_;}
  const AlarmParameters & parameters() const {return parameters_;}
  const std::string & raisedBy() const {return raised_by_;}
  std::uint64_t sequence() const {return sequence_;}
  const rclcpp::Time & observedAt() const {return observed_at_;}

  /// Parameter value or @p fallback when the key is absent.
  std::string parameter(const std::string & key, const std::string & fallback = {}) const;

  /// One-line summary for logs and service responses.
  std::string describe() const;

private:
  const std::string name_;
  const bool raised_;
  const std::optional<std::string> problem_description_;
  const AlarmParameters parameters_;
  const std::string raised_by_;
  const std::uint64_t sequence_;
  const rclcpp::Time observed_at_;
};

#endif  // ALARM_RECORD_HPP
