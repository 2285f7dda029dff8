#include "network_loss_monitor.hpp"

#include <stdexcept>
#include <utility>

NetworkLossMonitor::NetworkLossMonitor(
  HeartbeatWatchdogConfig config,
  rclcpp::Clock::SharedPtr clock,
  AlarmBus & bus,
  rclcpp::Logger logger)
: HeartbeatWatchdog(std::move(config), std::move(clock), bus, std::move(logger), DeferTimerStart{})
{
  startTimer();
}

NetworkLossMonitor::~NetworkLossMonitor()
{
  // The tick thread calls onTick() on this subclass; stop it before our members go.
  dispose();
}

void NetworkLossMonitor::onMessage()
{
  onMessage(now());
}

void NetworkLossMonitor::onMessage(const rclcpp::Time & arrival)
{
  if (arrival.get_clock_type() != clockType()) {
    throw std::invalid_argument(
            "Watchdog '" + alarmName() + "': message stamp uses a different clock type");
  }
  messages_received_.fetch_add(1);

  const rclcpp::Time current = now();
  const rclcpp::Time clamped = arrival > current ? current : arrival;
  const std::int64_t arrival_ns = clamped.nanoseconds();
  std::int64_t latest = latest_arrival_ns_.load();
  while (arrival_ns > latest && !latest_arrival_ns_.compare_exchange_weak(latest, arrival_ns)) {
  }

  if (forwarded_this_tick_.exchange(true)) {
    return;  // Coalesced; picked up by forwardPending() on the next tick
  }

  std::int64_t forwarded = last_forwarded_ns_.load();
  while (arrival_ns > forwarded && !last_forwarded_ns_.compare_exchange_weak(forwarded, arrival_ns)) {
  }
  signals_forwarded_.fetch_add(1);
  onSignal(clamped);
}

void NetworkLossMonitor::onTick()
{
  forwardPending();
  forwarded_this_tick_.store(false);
  HeartbeatWatchdog::onTick();
}

void NetworkLossMonitor::forwardPending()
{
  const std::int64_t latest = latest_arrival_ns_.load();
  std::int64_t forwarded = last_forwarded_ns_.load();
  do {
    if (latest <= forwarded) {
      return;
    }
  } while (!last_forwarded_ns_.compare_exchange_weak(forwarded, latest));

  signals_forwarded_.fetch_add(1);
  onSignal(rclcpp::Time(latest, clockType()));
  RCLCPP_DEBUG(logger(), "Watchdog '%s': folded coalesced arrival (%lu messages so far)",
    alarmName().c_str(), static_cast<unsigned long>(messages_received_.load()));
}
