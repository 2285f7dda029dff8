#include "alarm_record.hpp"

#include <sstream>
#include <utility>

AlarmRecord::AlarmRecord(
  std::string name,
  bool raised,
  std::optional<std::string> problem_description,
  AlarmParameters parameters,
  std::string raised_by,
  std::uint64_t sequence,
  rclcpp::Time observed_at)
: name_(std::move(name)),
  raised_(raised),
  problem_description_(std::move(problem_description)),
  parameters_(std::move(parameters)),
  raised_by_(std::move(raised_by)),
  sequence_(sequence),
  observed_at_(std::move(observed_at))
{
}

AlarmRecord::ConstSharedPtr AlarmRecord::makeDefault(
  const std::string & name, const rclcpp::Time & observed_at)
{
  return std::make_shared<const AlarmRecord>(
    name, false, std::nullopt, AlarmParameters{}, std::string{}, 0u, observed_at);
}

std::string AlarmRecord::parameter(const std::string & key, const std::string & fallback) const
{
  auto it = parameters_.find(key);
  if (it == parameters_.end()) {
    return fallback;
  }
  return it->second;
}

std::string AlarmRecord::describe() const
{
  std::ostringstream ss;
  ss << "'" << name_ << "' " << (raised_ ? "RAISED" : "cleared") << " #" << sequence_;
  if (!raised_by_.empty()) {
    ss << " by " << raised_by_;
  }
  if (problem_description_ && !problem_description_->empty()) {
    ss << ": " << *problem_description_;
  }
  if (!parameters_.empty()) {
    ss << " {";
    bool first = true;
    for (const auto & kv : parameters_) {
      if (!first) {
        ss << ", ";
      }
      ss << kv.first << "=" << kv.second;
      first = false;
    }
    ss << "}";
  }
  return ss.str();
}
