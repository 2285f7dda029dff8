#ifndef ALARM_BUS_HPP
#define ALARM_BUS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "alarm_record.hpp"

/**
 * @brief Registry of named alarms with synchronous, per-name ordered delivery.
 *
 * Each alarm name owns an independent channel. Broadcasts on one name are
 * serialized and delivered on the broadcasting thread, so every listener sees
 * the same total order and a slow listener holds back the broadcaster instead
 * of losing transitions. Broadcasts on different names never contend.
 *
 * Names are created lazily with a cleared record, so producers and consumers
 * of an alarm can start in any order.
 */
class AlarmBus
{
public:
  using Callback = std::function<void (const AlarmRecord::ConstSharedPtr &)>;

  /// Identity attached to administrative force-clears.
  static constexpr const char * kManualOverride = "manual-override";

  /**
   * @brief Registration returned by subscribe(); pass it back to unsubscribe().
   */
  struct Subscription
  {
    std::string alarm_name;
    std::uint64_t id{0};

    bool valid() const {return id != 0;}
  };

  explicit AlarmBus(
    rclcpp::Clock::SharedPtr clock = std::make_shared<rclcpp::Clock>(RCL_SYSTEM_TIME),
    rclcpp::Logger logger = rclcpp::get_logger("alarm_bus"));

  AlarmBus(const AlarmBus &) = delete;
  AlarmBus & operator=(const AlarmBus &) = delete;

  /// Process-wide bus shared by handles that are not given an explicit one.
  static AlarmBus & global();

  AlarmRecord::ConstSharedPtr getOrCreate(const std::string & name);

  /**
   * @brief Publish a new record for @p name and deliver it to every listener.
   * @return The record that was stored and delivered.
   * @throws std::logic_error if called from a listener callback of the same name
   */
  AlarmRecord::ConstSharedPtr broadcast(
    const std::string & name,
    bool raised,
    const AlarmParameters & parameters,
    const std::string & raised_by,
    const std::optional<std::string> & problem_description = std::nullopt);

  /// Administrative clear tagged with kManualOverride.
  AlarmRecord::ConstSharedPtr forceClear(
    const std::string & name, const AlarmParameters & parameters = {});

  /**
   * @brief Register @p callback and deliver the current record before returning.
   * @throws std::invalid_argument if @p callback is empty
   * @throws std::logic_error if called from a listener callback of the same name
   */
  Subscription subscribe(const std::string & name, Callback callback);

  /**
   * @brief Remove a registration. No callback runs for it after this returns.
   *
   * Safe to call from inside the registration's own callback.
   */
  void unsubscribe(const Subscription & subscription);

  /**
   * @brief Block until @p name has a record newer than @p after_sequence.
   * @return The newer record, or nullptr on timeout.
   */
  AlarmRecord::ConstSharedPtr waitForUpdate(
    const std::string & name,
    std::uint64_t after_sequence,
    std::chrono::nanoseconds timeout);

  std::vector<std::string> alarmNames() const;

  std::size_t listenerCount(const std::string & name) const;

private:
  struct Listener
  {
    std::uint64_t id;
    Callback callback;
  };

  struct Channel
  {
    // Held for a whole delivery round; gives the per-name total order.
    std::mutex delivery_mutex;
    std::thread::id delivering_thread;

    // Guards the fields below; never held while user callbacks run.
    mutable std::mutex state_mutex;
    std::condition_variable updated;
    AlarmRecord::ConstSharedPtr current;
    std::vector<Listener> listeners;
  };

  std::shared_ptr<Channel> channel(const std::string & name);
  std::shared_ptr<Channel> findChannel(const std::string & name) const;

  bool isRegistered(Channel & channel, std::uint64_t id) const;
  void removeListener(Channel & channel, std::uint64_t id);
  void deliver(
    Channel & channel, const Listener & listener, const AlarmRecord::ConstSharedPtr & record);
  void rejectReentry(const Channel & channel, const std::string & name, const char * operation) const;

  rclcpp::Clock::SharedPtr clock_;
  rclcpp::Logger logger_;

  mutable std::mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<Channel>> channels_;
  std::atomic<std::uint64_t> next_subscription_id_{1};
};

#endif  // ALARM_BUS_HPP
