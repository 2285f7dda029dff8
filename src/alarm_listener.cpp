#include "alarm_listener.hpp"

#include <stdexcept>
#include <utility>

AlarmListener::AlarmListener(std::string alarm_name, AlarmBus::Callback callback, AlarmBus & bus)
: alarm_name_(std::move(alarm_name)),
  callback_(std::move(callback)),
  bus_(bus)
{
  if (alarm_name_.empty()) {
    throw std::invalid_argument("AlarmListener requires a non-empty alarm name");
  }

  auto subscription = bus_.subscribe(
    alarm_name_, [this](const AlarmRecord::ConstSharedPtr & record) {onRecord(record);});

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failed_ && !cancelled_) {
      subscription_ = std::move(subscription);
      return;
    }
  }
  // cancel() ran in a callback before the subscription was stored here
  bus_.unsubscribe(subscription);
}

AlarmListener::~AlarmListener()
{
  cancel();
}

void AlarmListener::cancel()
{
  AlarmBus::Subscription subscription;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    subscription = subscription_;
    subscription_ = AlarmBus::Subscription{};
  }
  bus_.unsubscribe(subscription);
}

bool AlarmListener::active() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return subscription_.valid();
}

AlarmRecord::ConstSharedPtr AlarmListener::lastRecord() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_record_;
}

bool AlarmListener::isRaised() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return last_record_ && last_record_->raised();
}

AlarmRecord::ConstSharedPtr AlarmListener::waitForUpdate(
  std::uint64_t after_sequence, std::chrono::nanoseconds timeout) const
{
  return bus_.waitForUpdate(alarm_name_, after_sequence, timeout);
}

void AlarmListener::onRecord(const AlarmRecord::ConstSharedPtr & record)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    last_record_ = record;
  }
  if (!callback_) {
    return;
  }

  try {
    callback_(record);
  } catch (const std::exception &) {
    // The bus drops this registration when the exception reaches it.
    std::lock_guard<std::mutex> lock(mutex_);
    subscription_ = AlarmBus::Subscription{};
    failed_ = true;
    throw;
  }
}
