#ifndef ALARM_BROADCASTER_HPP
#define ALARM_BROADCASTER_HPP

#include <optional>
#include <string>

#include "alarm_bus.hpp"

/**
 * @brief Name-bound handle used by fault producers to raise and clear an alarm.
 *
 * Repeated raises or clears are not filtered; each one advances the alarm's
 * sequence so consumers can tell a fresh confirmation from a stale cache.
 */
class AlarmBroadcaster
{
public:
  explicit AlarmBroadcaster(
    std::string alarm_name,
    std::string raised_by = {},
    AlarmBus & bus = AlarmBus::global());

  AlarmRecord::ConstSharedPtr raiseAlarm(
    const AlarmParameters & parameters = {},
    const std::optional<std::string> & problem_description = std::nullopt);

  AlarmRecord::ConstSharedPtr clearAlarm(const AlarmParameters & parameters = {});

  const std::string & alarmName() const {return alarm_name_;}
  const std::string & raisedBy() const {return raised_by_;}

private:
  std::string alarm_name_;
  std::string raised_by_;
  AlarmBus & bus_;
};

#endif  // ALARM_BROADCASTER_HPP
