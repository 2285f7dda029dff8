#ifndef HEARTBEAT_WATCHDOG_HPP
#define HEARTBEAT_WATCHDOG_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>

#include "alarm_broadcaster.hpp"
#include "alarm_bus.hpp"

enum class HeartbeatState {
  AWAITING_FIRST,  ///< No signal seen since the watchdog started
  ALIVE,           ///< Signals arriving within the deadline
  TIMED_OUT        ///< Deadline exceeded, bound alarm raised
};

const char * toString(HeartbeatState state);

struct HeartbeatWatchdogConfig
{
  std::string alarm_name;
  std::chrono::nanoseconds deadline{std::chrono::seconds(8)};
  std::chrono::nanoseconds tick_interval{std::chrono::milliseconds(500)};
  /// Treat silence since start as a fault once the deadline has passed.
  bool raise_on_silent_start{true};
  /// Spawn the periodic tick thread. Disabled in tests that call onTick() directly.
  bool start_timer{true};
};

/**
 * @brief Converts "liveness signal stopped arriving" into a raised alarm.
 *
 * Signal intake and the periodic tick run on different threads. The tick
 * thread belongs to the watchdog and keeps running while callers of
 * onSignal() are busy, which bounds detection latency to deadline + one tick.
 *
 * State changes and the broadcasts they cause are serialized, so the alarm's
 * sequence order always matches the order of state transitions.
 *
 * Listeners of the bound alarm run on the tick thread. They may call
 * dispose(), but must not destroy the watchdog: onTick() is still on the
 * stack when they return.
 */
class HeartbeatWatchdog
{
public:
  /**
   * @throws std::invalid_argument on an empty alarm name or a non-positive
   *         deadline or tick interval
   */
  HeartbeatWatchdog(
    HeartbeatWatchdogConfig config,
    rclcpp::Clock::SharedPtr clock,
    AlarmBus & bus = AlarmBus::global(),
    rclcpp::Logger logger = rclcpp::get_logger("heartbeat_watchdog"));

  virtual ~HeartbeatWatchdog();

  HeartbeatWatchdog(const HeartbeatWatchdog &) = delete;
  HeartbeatWatchdog & operator=(const HeartbeatWatchdog &) = delete;

  /// Record a liveness signal at the current clock time.
  void onSignal();

  /// Record a liveness signal observed at @p stamp (same clock type as the watchdog).
  void onSignal(const rclcpp::Time & stamp);

  /// Re-evaluate elapsed silence. Called every tick interval by the timer thread.
  virtual void onTick();

  /// Stop the tick thread. Idempotent. From the tick thread itself the
  /// thread is only asked to stop; a later dispose() or the destructor joins it.
  void dispose();

  bool disposed() const;

  HeartbeatState state() const;

  /// Seconds since the last signal, or since start when none arrived yet.
  double timeSinceLastSignal() const;

  std::uint64_t timeoutCount() const;

  const std::string & alarmName() const {return config_.alarm_name;}
  std::chrono::nanoseconds deadline() const {return config_.deadline;}
  std::chrono::nanoseconds tickInterval() const {return config_.tick_interval;}

protected:
  struct DeferTimerStart {};

  // For subclasses that override onTick(): the tick thread must not start
  // before the subclass is fully constructed, so they call startTimer() last.
  HeartbeatWatchdog(
    HeartbeatWatchdogConfig config,
    rclcpp::Clock::SharedPtr clock,
    AlarmBus & bus,
    rclcpp::Logger logger,
    DeferTimerStart);

  void startTimer();

  rclcpp::Time now() const {return clock_->now();}
  rcl_clock_type_t clockType() const {return clock_->get_clock_type();}
  const rclcpp::Logger & logger() const {return logger_;}

private:
  struct HeartbeatSource
  {
    rclcpp::Time started_at;
    rclcpp::Time last_seen_at;
    bool has_signal{false};
    HeartbeatState state{HeartbeatState::AWAITING_FIRST};
    std::uint64_t timeout_count{0};
  };

  void timerLoop();

  HeartbeatWatchdogConfig config_;
  rclcpp::Clock::SharedPtr clock_;
  AlarmBus & bus_;
  rclcpp::Logger logger_;
  AlarmBroadcaster broadcaster_;

  // Held across a state transition and the broadcast it triggers.
  std::mutex transition_mutex_;

  mutable std::mutex source_mutex_;
  HeartbeatSource source_;

  mutable std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool stop_requested_{false};
  std::mutex join_mutex_;
  std::thread timer_thread_;
  std::thread::id tick_thread_id_;
  std::shared_ptr<std::atomic<bool>> destroyed_{std::make_shared<std::atomic<bool>>(false)};
};

#endif  // HEARTBEAT_WATCHDOG_HPP
