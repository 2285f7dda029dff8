#include "heartbeat_watchdog.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace
{
HeartbeatWatchdogConfig validated(HeartbeatWatchdogConfig config)
{
  if (config.alarm_name.empty()) {
    throw std::invalid_argument("HeartbeatWatchdog requires a non-empty alarm name");
  }
  if (config.deadline.count() <= 0) {
    throw std::invalid_argument(
            "HeartbeatWatchdog '" + config.alarm_name + "': deadline must be positive");
  }
  if (config.tick_interval.count() <= 0) {
    throw std::invalid_argument(
            "HeartbeatWatchdog '" + config.alarm_name + "': tick interval must be positive");
  }
  return config;
}

double toSeconds(std::chrono::nanoseconds duration)
{
  return std::chrono::duration<double>(duration).count();
}

std::string formatSeconds(double seconds)
{
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3) << seconds;
  return ss.str();
}
}  // namespace

const char * toString(HeartbeatState state)
{
  switch (state) {
    case HeartbeatState::AWAITING_FIRST:
      return "AWAITING_FIRST";
    case HeartbeatState::ALIVE:
      return "ALIVE";
    case HeartbeatState::TIMED_OUT:
      return "TIMED_OUT";
  }
  return "UNKNOWN";
}

HeartbeatWatchdog::HeartbeatWatchdog(
  HeartbeatWatchdogConfig config,
  rclcpp::Clock::SharedPtr clock,
  AlarmBus & bus,
  rclcpp::Logger logger)
: HeartbeatWatchdog(std::move(config), std::move(clock), bus, std::move(logger), DeferTimerStart{})
{
  startTimer();
}

HeartbeatWatchdog::HeartbeatWatchdog(
  HeartbeatWatchdogConfig config,
  rclcpp::Clock::SharedPtr clock,
  AlarmBus & bus,
  rclcpp::Logger logger,
  DeferTimerStart)
: config_(validated(std::move(config))),
  clock_(std::move(clock)),
  bus_(bus),
  logger_(std::move(logger)),
  broadcaster_(config_.alarm_name, "heartbeat_watchdog/" + config_.alarm_name, bus)
{
  if (!clock_) {
    throw std::invalid_argument("HeartbeatWatchdog requires a valid clock");
  }

  if (config_.tick_interval * 4 > config_.deadline) {
    RCLCPP_WARN(logger_,
      "Watchdog '%s': tick interval %.3f s exceeds a quarter of the %.3f s deadline; "
      "detection may lag by up to one tick",
      config_.alarm_name.c_str(), toSeconds(config_.tick_interval), toSeconds(config_.deadline));
  }

  const rclcpp::Time start = clock_->now();
  source_.started_at = start;
  source_.last_seen_at = start;

  RCLCPP_INFO(logger_,
    "Watchdog '%s' armed (deadline=%.3f s, tick=%.3f s, silent start %s)",
    config_.alarm_name.c_str(), toSeconds(config_.deadline), toSeconds(config_.tick_interval),
    config_.raise_on_silent_start ? "raises" : "tolerated");
}

HeartbeatWatchdog::~HeartbeatWatchdog()
{
  dispose();
  if (timer_thread_.joinable()) {
    // Only reachable when destroyed from the tick thread itself; timerLoop()
    // sees the flag and returns without touching members.
    destroyed_->store(true);
    timer_thread_.detach();
  }
}

void HeartbeatWatchdog::startTimer()
{
  if (!config_.start_timer) {
    return;
  }

  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (stop_requested_ || timer_thread_.joinable()) {
    return;
  }
  timer_thread_ = std::thread(&HeartbeatWatchdog::timerLoop, this);
  tick_thread_id_ = timer_thread_.get_id();
}

void HeartbeatWatchdog::dispose()
{
  bool first = false;
  bool on_tick_thread = false;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    first = !stop_requested_;
    stop_requested_ = true;
    on_tick_thread = tick_thread_id_ == std::this_thread::get_id();
  }
  if (first) {
    timer_cv_.notify_all();
  }

  // From the tick thread the join is left to the next caller.
  if (!on_tick_thread) {
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (timer_thread_.joinable()) {
      timer_thread_.join();
    }
  }

  if (first) {
    RCLCPP_DEBUG(logger_, "Watchdog '%s' disposed", config_.alarm_name.c_str());
  }
}

bool HeartbeatWatchdog::disposed() const
{
  std::lock_guard<std::mutex> lock(timer_mutex_);
  return stop_requested_;
}

void HeartbeatWatchdog::onSignal()
{
  onSignal(clock_->now());
}

void HeartbeatWatchdog::onSignal(const rclcpp::Time & stamp)
{
  if (stamp.get_clock_type() != clock_->get_clock_type()) {
    throw std::invalid_argument(
            "Watchdog '" + config_.alarm_name + "': signal stamp uses a different clock type");
  }

  // A stamp ahead of our clock would hold the silence negative past the deadline.
  const rclcpp::Time now = clock_->now();
  const rclcpp::Time seen = stamp > now ? now : stamp;

  {
    std::lock_guard<std::mutex> lock(source_mutex_);
    if (!source_.has_signal || seen > source_.last_seen_at) {
      source_.last_seen_at = seen;
    }
    source_.has_signal = true;
    if (source_.state == HeartbeatState::ALIVE) {
      return;
    }
  }

  std::lock_guard<std::mutex> transition(transition_mutex_);
  HeartbeatState previous;
  {
    std::lock_guard<std::mutex> lock(source_mutex_);
    if (source_.state == HeartbeatState::ALIVE) {
      return;  // Another caller completed the recovery first
    }
    previous = source_.state;
    source_.state = HeartbeatState::ALIVE;
  }

  const std::string reason = previous == HeartbeatState::TIMED_OUT ?
    "signal resumed" : "first signal received";
  auto record = broadcaster_.clearAlarm({{"reason", reason}});

  RCLCPP_INFO(logger_, "Watchdog '%s' %s -> ALIVE (%s), alarm cleared #%lu",
    config_.alarm_name.c_str(), toString(previous), reason.c_str(),
    static_cast<unsigned long>(record->sequence()));
}

void HeartbeatWatchdog::onTick()
{
  std::lock_guard<std::mutex> transition(transition_mutex_);
  const rclcpp::Time now = clock_->now();
  const rclcpp::Duration deadline(config_.deadline);

  std::string reason;
  double silence_s = 0.0;
  bool reassert = false;
  {
    std::lock_guard<std::mutex> lock(source_mutex_);
    switch (source_.state) {
      case HeartbeatState::ALIVE: {
          const rclcpp::Duration silence = now - source_.last_seen_at;
          if (silence <= deadline) {
            return;
          }
          silence_s = silence.seconds();
          reason = "no signal for > " + formatSeconds(deadline.seconds()) + " s";
          break;
        }
      case HeartbeatState::AWAITING_FIRST: {
          const rclcpp::Duration silence = now - source_.started_at;
          if (!config_.raise_on_silent_start || silence <= deadline) {
            return;
          }
          silence_s = silence.seconds();
          reason = "no signal since start for > " + formatSeconds(deadline.seconds()) + " s";
          break;
        }
      case HeartbeatState::TIMED_OUT: {
          const rclcpp::Time reference = source_.has_signal ?
            source_.last_seen_at : source_.started_at;
          silence_s = (now - reference).seconds();
          reason = "still no signal for > " + formatSeconds(deadline.seconds()) + " s";
          reassert = true;
          break;
        }
    }

    if (!reassert) {
      source_.state = HeartbeatState::TIMED_OUT;
      ++source_.timeout_count;
    }
  }

  if (reassert) {
    // Someone cleared the alarm (e.g. a manual override) while the source is
    // still silent; the alarm must reflect the timed-out state again.
    if (bus_.getOrCreate(config_.alarm_name)->raised()) {
      return;
    }
    RCLCPP_WARN(logger_, "Watchdog '%s' still TIMED_OUT but alarm was cleared - re-raising",
      config_.alarm_name.c_str());
  }

  auto record = broadcaster_.raiseAlarm(
    {{"reason", reason},
      {"deadline_s", formatSeconds(deadline.seconds())},
      {"silence_s", formatSeconds(silence_s)}},
    reason);

  RCLCPP_WARN(logger_, "Watchdog '%s' TIMED_OUT: %s (silence %.3f s), alarm raised #%lu",
    config_.alarm_name.c_str(), reason.c_str(), silence_s,
    static_cast<unsigned long>(record->sequence()));
}

HeartbeatState HeartbeatWatchdog::state() const
{
  std::lock_guard<std::mutex> lock(source_mutex_);
  return source_.state;
}

double HeartbeatWatchdog::timeSinceLastSignal() const
{
  const rclcpp::Time now = clock_->now();
  std::lock_guard<std::mutex> lock(source_mutex_);
  const rclcpp::Time & reference = source_.has_signal ? source_.last_seen_at : source_.started_at;
  return (now - reference).seconds();
}

std::uint64_t HeartbeatWatchdog::timeoutCount() const
{
  std::lock_guard<std::mutex> lock(source_mutex_);
  return source_.timeout_count;
}

void HeartbeatWatchdog::timerLoop()
{
  const std::shared_ptr<std::atomic<bool>> destroyed = destroyed_;
  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stop_requested_) {
    if (timer_cv_.wait_for(lock, config_.tick_interval, [this]() {return stop_requested_;})) {
      break;
    }

    lock.unlock();
    try {
      onTick();
    } catch (const std::exception & e) {
      if (destroyed->load()) {
        return;
      }
      RCLCPP_ERROR(logger_, "Watchdog '%s' tick failed: %s",
        config_.alarm_name.c_str(), e.what());
    }
    if (destroyed->load()) {
      return;
    }
    lock.lock();
  }
}
