#ifndef ALARM_SERVER_NODE_HPP
#define ALARM_SERVER_NODE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <diagnostic_msgs/msg/diagnostic_array.hpp>
#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <std_msgs/msg/header.hpp>
#include <std_srvs/srv/trigger.hpp>

#include "alarm_bus.hpp"
#include "alarm_config.hpp"
#include "alarm_listener.hpp"
#include "kill_aggregator.hpp"
#include "network_loss_monitor.hpp"
#include "override_audit_log.hpp"

/**
 * @brief Lifecycle node exposing the alarm bus and heartbeat watchdogs over ROS.
 *
 * - configure: loads the YAML config, creates publishers, liveness
 *   subscriptions and force-clear services
 * - activate: arms one NetworkLossMonitor per configured heartbeat, the kill
 *   aggregator and the egress listeners
 * - deactivate: disarms everything created by activate
 *
 * Every alarm transition is published on "alarms/updates" and on a latched
 * per-alarm topic "alarms/<name>", which late joiners use to query the
 * current state. "alarms/<name>/force_clear" clears an alarm on request and
 * records the override in the audit log.
 */
class AlarmServerNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;
  using DiagnosticArray = diagnostic_msgs::msg::DiagnosticArray;

  explicit AlarmServerNode(
    const rclcpp::NodeOptions & options = rclcpp::NodeOptions(),
    AlarmBus & bus = AlarmBus::global());

  ~AlarmServerNode() override;

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_error(const rclcpp_lifecycle::State & state) override;

  AlarmBus & bus() {return bus_;}

  const AlarmServerConfig & config() const {return config_;}

  /// Armed monitor for @p alarm, or nullptr when inactive or unknown.
  std::shared_ptr<NetworkLossMonitor> monitor(const std::string & alarm) const;

  /// True while alarm records are being published.
  bool publishing() const;

private:
  std::string resolveConfigPath();
  bool createTopics();

  void livenessCallback(const std::string & alarm, const std_msgs::msg::Header::SharedPtr msg);
  void publishRecord(const AlarmRecord::ConstSharedPtr & record);
  void handleForceClear(
    const std::string & alarm,
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void diagnosticTimerCallback();

  void disarm();
  void deactivatePublishers();
  void releaseEntities();

  AlarmBus & bus_;
  AlarmServerConfig config_;
  std::string config_path_;
  std::unique_ptr<OverrideAuditLog> audit_log_;

  // Watchdogs measure silence on a steady clock, independent of /clock.
  rclcpp::Clock::SharedPtr watchdog_clock_;

  mutable std::mutex runtime_mutex_;
  std::map<std::string, std::shared_ptr<NetworkLossMonitor>> monitors_;
  std::unique_ptr<KillAggregator> kill_aggregator_;
  std::vector<std::unique_ptr<AlarmListener>> egress_listeners_;

  rclcpp_lifecycle::LifecyclePublisher<DiagnosticArray>::SharedPtr updates_pub_;
  rclcpp_lifecycle::LifecyclePublisher<DiagnosticArray>::SharedPtr diagnostics_pub_;
  std::map<std::string, rclcpp_lifecycle::LifecyclePublisher<DiagnosticArray>::SharedPtr>
  alarm_pubs_;

  std::vector<rclcpp::Subscription<std_msgs::msg::Header>::SharedPtr> liveness_subs_;
  std::vector<rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr> force_clear_services_;
  rclcpp::TimerBase::SharedPtr diagnostic_timer_;
};

#endif  // ALARM_SERVER_NODE_HPP
