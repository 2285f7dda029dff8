#include "alarm_broadcaster.hpp"

#include <stdexcept>
#include <utility>

AlarmBroadcaster::AlarmBroadcaster(std::string alarm_name, std::string raised_by, AlarmBus & bus)
: alarm_name_(std::move(alarm_name)),
  raised_by_(std::move(raised_by)),
  bus_(bus)
{
  if (alarm_name_.empty()) {
    throw std::invalid_argument("AlarmBroadcaster requires a non-empty alarm name");
  }
  if (raised_by_.empty()) {
    raised_by_ = "broadcaster/" + alarm_name_;
  }
}

AlarmRecord::ConstSharedPtr AlarmBroadcaster::raiseAlarm(
  const AlarmParameters & parameters,
  const std::optional<std::string> & problem_description)
{
  return bus_.broadcast(alarm_name_, true, parameters, raised_by_, problem_description);
}

AlarmRecord::ConstSharedPtr AlarmBroadcaster::clearAlarm(const AlarmParameters & parameters)
{
  return bus_.broadcast(alarm_name_, false, parameters, raised_by_);
}
