#include "alarm_bus.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace
{
// Marks the calling thread as the one delivering on a channel until scope exit.
class DeliveryScope
{
public:
  DeliveryScope(std::mutex & state_mutex, std::thread::id & delivering_thread)
  : state_mutex_(state_mutex), delivering_thread_(delivering_thread)
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    delivering_thread_ = std::this_thread::get_id();
  }

  DeliveryScope(const DeliveryScope &) = delete;
  DeliveryScope & operator=(const DeliveryScope &) = delete;

  ~DeliveryScope()
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    delivering_thread_ = std::thread::id();
  }

private:
  std::mutex & state_mutex_;
  std::thread::id & delivering_thread_;
};
}  // namespace

AlarmBus::AlarmBus(rclcpp::Clock::SharedPtr clock, rclcpp::Logger logger)
: clock_(std::move(clock)),
  logger_(std::move(logger))
{
  if (!clock_) {
    throw std::invalid_argument("AlarmBus requires a valid clock");
  }
}

AlarmBus & AlarmBus::global()
{
  static AlarmBus bus;
  return bus;
}

AlarmRecord::ConstSharedPtr AlarmBus::getOrCreate(const std::string & name)
{
  auto ch = channel(name);
  std::lock_guard<std::mutex> lock(ch->state_mutex);
  return ch->current;
}

AlarmRecord::ConstSharedPtr AlarmBus::broadcast(
  const std::string & name,
  bool raised,
  const AlarmParameters & parameters,
  const std::string & raised_by,
  const std::optional<std::string> & problem_description)
{
  auto ch = channel(name);
  rejectReentry(*ch, name, "broadcast");

  std::lock_guard<std::mutex> delivery(ch->delivery_mutex);
  DeliveryScope scope(ch->state_mutex, ch->delivering_thread);

  AlarmRecord::ConstSharedPtr record;
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(ch->state_mutex);
    record = std::make_shared<const AlarmRecord>(
      name, raised, problem_description, parameters, raised_by,
      ch->current->sequence() + 1, clock_->now());
    ch->current = record;
    listeners = ch->listeners;
  }
  ch->updated.notify_all();

  RCLCPP_DEBUG(logger_, "Broadcast %s to %zu listener(s)",
    record->describe().c_str(), listeners.size());

  for (const auto & listener : listeners) {
    // A listener may have unsubscribed itself or a peer earlier in this round.
    if (!isRegistered(*ch, listener.id)) {
      continue;
    }
    deliver(*ch, listener, record);
  }

  return record;
}

AlarmRecord::ConstSharedPtr AlarmBus::forceClear(
  const std::string & name, const AlarmParameters & parameters)
{
  const bool was_raised = getOrCreate(name)->raised();
  auto record = broadcast(name, false, parameters, kManualOverride);
  RCLCPP_WARN(logger_, "Manual override cleared alarm '%s' (was %s, now #%lu)",
    name.c_str(), was_raised ? "raised" : "clear",
    static_cast<unsigned long>(record->sequence()));
  return record;
}

AlarmBus::Subscription AlarmBus::subscribe(const std::string & name, Callback callback)
{
  if (!callback) {
    throw std::invalid_argument("AlarmBus::subscribe requires a callback for '" + name + "'");
  }

  auto ch = channel(name);
  rejectReentry(*ch, name, "subscribe");

  std::lock_guard<std::mutex> delivery(ch->delivery_mutex);
  DeliveryScope scope(ch->state_mutex, ch->delivering_thread);

  Listener listener{next_subscription_id_.fetch_add(1), std::move(callback)};
  AlarmRecord::ConstSharedPtr snapshot;
  {
    std::lock_guard<std::mutex> lock(ch->state_mutex);
    ch->listeners.push_back(listener);
    snapshot = ch->current;
  }

  deliver(*ch, listener, snapshot);
  return Subscription{name, listener.id};
}

void AlarmBus::unsubscribe(const Subscription & subscription)
{
  if (!subscription.valid()) {
    return;
  }

  auto ch = findChannel(subscription.alarm_name);
  if (!ch) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(ch->state_mutex);
    if (ch->delivering_thread == std::this_thread::get_id()) {
      // Called from a callback of this channel; the delivery lock is ours already.
      ch->listeners.erase(
        std::remove_if(ch->listeners.begin(), ch->listeners.end(),
        [&](const Listener & l) {return l.id == subscription.id;}),
        ch->listeners.end());
      return;
    }
  }

  std::lock_guard<std::mutex> delivery(ch->delivery_mutex);
  removeListener(*ch, subscription.id);
}

AlarmRecord::ConstSharedPtr AlarmBus::waitForUpdate(
  const std::string & name,
  std::uint64_t after_sequence,
  std::chrono::nanoseconds timeout)
{
  auto ch = channel(name);
  std::unique_lock<std::mutex> lock(ch->state_mutex);
  const bool updated = ch->updated.wait_for(lock, timeout, [&]() {
        return ch->current->sequence() > after_sequence;
      });
  if (!updated) {
    return nullptr;
  }
  return ch->current;
}

std::vector<std::string> AlarmBus::alarmNames() const
{
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<std::string> names;
  names.reserve(channels_.size());
  for (const auto & kv : channels_) {
    names.push_back(kv.first);
  }
  return names;
}

std::size_t AlarmBus::listenerCount(const std::string & name) const
{
  auto ch = findChannel(name);
  if (!ch) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(ch->state_mutex);
  return ch->listeners.size();
}

std::shared_ptr<AlarmBus::Channel> AlarmBus::channel(const std::string & name)
{
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = channels_.find(name);
  if (it != channels_.end()) {
    return it->second;
  }

  auto ch = std::make_shared<Channel>();
  ch->current = AlarmRecord::makeDefault(name, clock_->now());
  channels_.emplace(name, ch);
  RCLCPP_DEBUG(logger_, "Registered alarm '%s'", name.c_str());
  return ch;
}

std::shared_ptr<AlarmBus::Channel> AlarmBus::findChannel(const std::string & name) const
{
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = channels_.find(name);
  if (it == channels_.end()) {
    return nullptr;
  }
  return it->second;
}

bool AlarmBus::isRegistered(Channel & channel, std::uint64_t id) const
{
  std::lock_guard<std::mutex> lock(channel.state_mutex);
  return std::any_of(channel.listeners.begin(), channel.listeners.end(),
           [id](const Listener & l) {return l.id == id;});
}

void AlarmBus::removeListener(Channel & channel, std::uint64_t id)
{
  std::lock_guard<std::mutex> lock(channel.state_mutex);
  channel.listeners.erase(
    std::remove_if(channel.listeners.begin(), channel.listeners.end(),
    [id](const Listener & l) {return l.id == id;}),
    channel.listeners.end());
}

void AlarmBus::deliver(
  Channel & channel, const Listener & listener, const AlarmRecord::ConstSharedPtr & record)
{
  try {
    listener.callback(record);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_,
      "Listener %lu on alarm '%s' failed on #%lu (%s) - unsubscribing it",
      static_cast<unsigned long>(listener.id), record->name().c_str(),
      static_cast<unsigned long>(record->sequence()), e.what());
    removeListener(channel, listener.id);
  }
}

void AlarmBus::rejectReentry(
  const Channel & channel, const std::string & name, const char * operation) const
{
  std::lock_guard<std::mutex> lock(channel.state_mutex);
  if (channel.delivering_thread == std::this_thread::get_id()) {
    throw std::logic_error(
            std::string("AlarmBus::") + operation + " on '" + name +
            "' from inside one of its own listener callbacks");
  }
}
