#ifndef ALARM_LISTENER_HPP
#define ALARM_LISTENER_HPP

#include <chrono>
#include <mutex>
#include <string>

#include "alarm_bus.hpp"

/**
 * @brief RAII subscription to one alarm.
 *
 * The constructor returns only after the current record has been delivered,
 * so the pre-existing state can never be missed. Every later broadcast is
 * delivered once, in sequence order, until cancel() or destruction.
 */
class AlarmListener
{
public:
  AlarmListener(
    std::string alarm_name,
    AlarmBus::Callback callback = {},
    AlarmBus & bus = AlarmBus::global());

  ~AlarmListener();

  AlarmListener(const AlarmListener &) = delete;
  AlarmListener & operator=(const AlarmListener &) = delete;

  /// Stop receiving callbacks. Idempotent.
  void cancel();

  bool active() const;

  /// Last record delivered to this listener.
  AlarmRecord::ConstSharedPtr lastRecord() const;

  bool isRaised() const;

  /**
   * @brief Block until the alarm has a record newer than @p after_sequence.
   * @return The newer record, or nullptr on timeout.
   */
  AlarmRecord::ConstSharedPtr waitForUpdate(
    std::uint64_t after_sequence, std::chrono::nanoseconds timeout) const;

  const std::string & alarmName() const {return alarm_name_;}

private:
  void onRecord(const AlarmRecord::ConstSharedPtr & record);

  std::string alarm_name_;
  AlarmBus::Callback callback_;
  AlarmBus & bus_;

  mutable std::mutex mutex_;
  AlarmRecord::ConstSharedPtr last_record_;
  AlarmBus::Subscription subscription_;
  bool failed_{false};
  bool cancelled_{false};
};

#endif  // ALARM_LISTENER_HPP
