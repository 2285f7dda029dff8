#ifndef NETWORK_LOSS_MONITOR_HPP
#define NETWORK_LOSS_MONITOR_HPP

#include <atomic>
#include <cstdint>

#include "heartbeat_watchdog.hpp"

/**
 * @brief Heartbeat watchdog fed by every message of a monitored stream.
 *
 * Message payloads are ignored. At high rates only the first message of each
 * tick interval is forwarded as a signal; later arrivals are remembered and
 * folded in before the next evaluation, so the timeout is still measured from
 * the most recent arrival.
 */
class NetworkLossMonitor : public HeartbeatWatchdog
{
public:
  NetworkLossMonitor(
    HeartbeatWatchdogConfig config,
    rclcpp::Clock::SharedPtr clock,
    AlarmBus & bus = AlarmBus::global(),
    rclcpp::Logger logger = rclcpp::get_logger("network_loss_monitor"));

  ~NetworkLossMonitor() override;

  /// A message arrived now.
  void onMessage();

  /// A message arrived at @p arrival (same clock type as the monitor).
  void onMessage(const rclcpp::Time & arrival);

  void onTick() override;

  std::uint64_t messagesReceived() const {return messages_received_.load();}
  std::uint64_t signalsForwarded() const {return signals_forwarded_.load();}

private:
  void forwardPending();

  std::atomic<std::uint64_t> messages_received_{0};
  std::atomic<std::uint64_t> signals_forwarded_{0};
  std::atomic<bool> forwarded_this_tick_{false};
  std::atomic<std::int64_t> latest_arrival_ns_{0};
  std::atomic<std::int64_t> last_forwarded_ns_{0};
};

#endif  // NETWORK_LOSS_MONITOR_HPP
