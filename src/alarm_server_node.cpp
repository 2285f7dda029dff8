#include "alarm_server_node.hpp"

#include <chrono>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <ament_index_cpp/get_package_share_directory.hpp>
#include <lifecycle_msgs/msg/state.hpp>

#include "alarm_ros_conversions.hpp"

namespace
{
constexpr const char * kPackageName = "killswitch";
constexpr const char * kUpdatesToken = "updates";

std::chrono::nanoseconds secondsToNanoseconds(double seconds)
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
    std::chrono::duration<double>(seconds));
}

std::string formatSeconds(double seconds)
{
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3) << seconds;
  return ss.str();
}

diagnostic_msgs::msg::KeyValue keyValue(const std::string & key, const std::string & value)
{
  diagnostic_msgs::msg::KeyValue kv;
  kv.key = key;
  kv.value = value;
  return kv;
}
}  // namespace

AlarmServerNode::AlarmServerNode(const rclcpp::NodeOptions & options, AlarmBus & bus)
: rclcpp_lifecycle::LifecycleNode("alarm_server", options),
  bus_(bus),
  watchdog_clock_(std::make_shared<rclcpp::Clock>(RCL_STEADY_TIME))
{
  this->declare_parameter("config_file", std::string{});
  RCLCPP_DEBUG(get_logger(), "AlarmServerNode lifecycle node constructed");
}

AlarmServerNode::~AlarmServerNode()
{
  disarm();
}

std::shared_ptr<NetworkLossMonitor> AlarmServerNode::monitor(const std::string & alarm) const
{
  std::lock_guard<std::mutex> lock(runtime_mutex_);
  auto it = monitors_.find(alarm);
  if (it == monitors_.end()) {
    return nullptr;
  }
  return it->second;
}

std::string AlarmServerNode::resolveConfigPath()
{
  std::string path = this->get_parameter("config_file").as_string();
  if (!path.empty()) {
    return path;
  }

  try {
    path = ament_index_cpp::get_package_share_directory(kPackageName) + "/config/alarm_server.yaml";
  } catch (const std::exception & e) {
    RCLCPP_FATAL(get_logger(), "No 'config_file' given and package '%s' not found: %s",
      kPackageName, e.what());
    return {};
  }
  return path;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_configure(const rclcpp_lifecycle::State &)
{
  config_path_ = resolveConfigPath();
  if (config_path_.empty()) {
    return CallbackReturn::FAILURE;
  }

  try {
    config_ = loadAlarmServerConfig(config_path_);
  } catch (const std::exception & e) {
    RCLCPP_FATAL(get_logger(), "Invalid alarm server config %s: %s", config_path_.c_str(), e.what());
    return CallbackReturn::FAILURE;
  }

  audit_log_ = std::make_unique<OverrideAuditLog>(
    config_.audit_log, get_logger().get_child("audit"));

  if (!createTopics()) {
    releaseEntities();
    return CallbackReturn::FAILURE;
  }

  RCLCPP_INFO(get_logger(), "Configured alarm server from %s", config_path_.c_str());
  RCLCPP_INFO(get_logger(), "   Heartbeat sources: %zu", config_.heartbeats.size());
  for (const auto & hb : config_.heartbeats) {
    RCLCPP_INFO(get_logger(), "   - %s <- %s (deadline %.3f s, tick %.3f s)",
      hb.alarm.c_str(), hb.topic.c_str(), hb.deadline, hb.tick_interval);
  }
  if (config_.kill) {
    RCLCPP_INFO(get_logger(), "   Kill alarm: %s (%zu members, %s)",
      config_.kill->kill_alarm.c_str(), config_.kill->members.size(),
      config_.kill->latching ? "latching" : "non-latching");
  }
  if (audit_log_->enabled()) {
    RCLCPP_INFO(get_logger(), "   Override audit log: %s", audit_log_->path().c_str());
  } else {
    RCLCPP_WARN(get_logger(), "   Override audit log DISABLED (no 'audit_log' configured)");
  }

  return CallbackReturn::SUCCESS;
}

bool AlarmServerNode::createTopics()
{
  std::map<std::string, std::string> token_owner;

  for (const auto & name : config_.allAlarmNames()) {
    const std::string token = alarmTopicToken(name);
    if (token == kUpdatesToken) {
      RCLCPP_FATAL(get_logger(), "Alarm '%s' collides with the reserved topic alarms/%s",
        name.c_str(), kUpdatesToken);
      return false;
    }
    auto owner = token_owner.find(token);
    if (owner != token_owner.end()) {
      RCLCPP_FATAL(get_logger(), "Alarms '%s' and '%s' both map to topic alarms/%s",
        owner->second.c_str(), name.c_str(), token.c_str());
      return false;
    }
    token_owner.emplace(token, name);

    alarm_pubs_[name] = this->create_publisher<DiagnosticArray>(
      "alarms/" + token, rclcpp::QoS(1).reliable().transient_local());

    force_clear_services_.push_back(
      this->create_service<std_srvs::srv::Trigger>(
        "alarms/" + token + "/force_clear",
        [this, name](
          const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
          std::shared_ptr<std_srvs::srv::Trigger::Response> response) {
          handleForceClear(name, request, response);
        }));
  }

  updates_pub_ = this->create_publisher<DiagnosticArray>(
    "alarms/updates", rclcpp::QoS(50).reliable());
  diagnostics_pub_ = this->create_publisher<DiagnosticArray>("/diagnostics", rclcpp::QoS(10));

  for (const auto & hb : config_.heartbeats) {
    const std::string alarm = hb.alarm;
    liveness_subs_.push_back(
      this->create_subscription<std_msgs::msg::Header>(
        hb.topic, rclcpp::QoS(10).best_effort(),
        [this, alarm](const std_msgs::msg::Header::SharedPtr msg) {
          livenessCallback(alarm, msg);
        }));
  }

  return true;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_activate(const rclcpp_lifecycle::State &)
{
  RCLCPP_INFO(get_logger(), "Activating alarm server");

  if (updates_pub_) {
    updates_pub_->on_activate();
  }
  if (diagnostics_pub_) {
    diagnostics_pub_->on_activate();
  }
  for (auto & kv : alarm_pubs_) {
    kv.second->on_activate();
  }

  try {
    std::lock_guard<std::mutex> lock(runtime_mutex_);

    // Egress first so the latched topics carry every record from here on.
    for (const auto & name : config_.allAlarmNames()) {
      egress_listeners_.push_back(std::make_unique<AlarmListener>(
          name,
          [this](const AlarmRecord::ConstSharedPtr & record) {publishRecord(record);},
          bus_));
    }

    if (config_.kill) {
      kill_aggregator_ = std::make_unique<KillAggregator>(
        *config_.kill, bus_, get_logger().get_child("kill"));
    }

    for (const auto & hb : config_.heartbeats) {
      monitors_[hb.alarm] = std::make_shared<NetworkLossMonitor>(
        hb.toWatchdogConfig(), watchdog_clock_, bus_,
        get_logger().get_child(alarmTopicToken(hb.alarm)));
    }
  } catch (const std::exception & e) {
    RCLCPP_FATAL(get_logger(), "Failed to arm alarm server: %s", e.what());
    disarm();
    deactivatePublishers();
    return CallbackReturn::FAILURE;
  }

  diagnostic_timer_ = this->create_wall_timer(
    secondsToNanoseconds(config_.diagnostics_period),
    std::bind(&AlarmServerNode::diagnosticTimerCallback, this));

  RCLCPP_INFO(get_logger(), "Alarm server ACTIVE - %zu heartbeat watchdog(s) armed",
    config_.heartbeats.size());
  return CallbackReturn::SUCCESS;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_deactivate(const rclcpp_lifecycle::State &)
{
  RCLCPP_WARN(get_logger(), "Deactivating alarm server - heartbeat monitoring STOPPED");

  if (diagnostic_timer_) {
    diagnostic_timer_->cancel();
    diagnostic_timer_.reset();
  }

  disarm();
  deactivatePublishers();

  return CallbackReturn::SUCCESS;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_cleanup(const rclcpp_lifecycle::State &)
{
  RCLCPP_INFO(get_logger(), "Cleaning up alarm server resources");

  if (diagnostic_timer_) {
    diagnostic_timer_->cancel();
    diagnostic_timer_.reset();
  }

  disarm();
  releaseEntities();
  return CallbackReturn::SUCCESS;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_shutdown(const rclcpp_lifecycle::State & state)
{
  RCLCPP_INFO(get_logger(), "Lifecycle shutdown requested from state %s", state.label().c_str());

  if (this->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
    on_deactivate(state);
  }

  on_cleanup(state);
  return CallbackReturn::SUCCESS;
}

AlarmServerNode::CallbackReturn AlarmServerNode::on_error(const rclcpp_lifecycle::State & state)
{
  RCLCPP_ERROR(get_logger(), "Lifecycle error in state %s", state.label().c_str());

  if (diagnostic_timer_) {
    diagnostic_timer_->cancel();
    diagnostic_timer_.reset();
  }

  disarm();
  releaseEntities();
  return CallbackReturn::SUCCESS;
}

void AlarmServerNode::livenessCallback(
  const std::string & alarm, const std_msgs::msg::Header::SharedPtr msg)
{
  (void)msg;  // Only the arrival matters; payload and sender stamp are ignored

  auto target = monitor(alarm);
  if (!target) {
    RCLCPP_DEBUG(get_logger(), "Ignoring liveness message for '%s' while inactive", alarm.c_str());
    return;
  }
  target->onMessage();
}

void AlarmServerNode::publishRecord(const AlarmRecord::ConstSharedPtr & record)
{
  const auto array = toDiagnosticArray(*record);

  if (updates_pub_ && updates_pub_->is_activated()) {
    updates_pub_->publish(array);
  }

  auto it = alarm_pubs_.find(record->name());
  if (it != alarm_pubs_.end() && it->second->is_activated()) {
    it->second->publish(array);
  }
}

void AlarmServerNode::handleForceClear(
  const std::string & alarm,
  const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  (void)request;

  if (this->get_current_state().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
    response->success = false;
    response->message = "alarm server is not active";
    return;
  }

  const std::string service_name = "alarms/" + alarmTopicToken(alarm) + "/force_clear";
  const bool previously_raised = bus_.getOrCreate(alarm)->raised();
  auto record = bus_.forceClear(alarm, {{"requested_via", service_name}});

  OverrideAuditEntry entry;
  entry.alarm = alarm;
  entry.timestamp = OverrideAuditLog::currentTimestamp();
  entry.sequence = record->sequence();
  entry.previously_raised = previously_raised;
  entry.requested_by = std::string(this->get_fully_qualified_name()) + "/" + service_name;

  const bool logged = !audit_log_ || audit_log_->append(entry);

  response->success = true;
  response->message = record->describe();
  if (!logged) {
    response->message += " (audit log write FAILED)";
  }
}

void AlarmServerNode::diagnosticTimerCallback()
{
  if (this->get_current_state().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
    return;
  }
  if (!diagnostics_pub_ || !diagnostics_pub_->is_activated()) {
    return;
  }

  DiagnosticArray diag_array;
  diag_array.header.stamp = this->now();

  std::lock_guard<std::mutex> lock(runtime_mutex_);
  for (const auto & kv : monitors_) {
    const auto & watchdog = *kv.second;
    const HeartbeatState state = watchdog.state();
    const auto record = bus_.getOrCreate(kv.first);

    diagnostic_msgs::msg::DiagnosticStatus status;
    status.name = std::string(this->get_name()) + ": heartbeat " + kv.first;
    status.hardware_id = this->get_name();
    switch (state) {
      case HeartbeatState::ALIVE:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::OK;
        break;
      case HeartbeatState::AWAITING_FIRST:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::WARN;
        break;
      case HeartbeatState::TIMED_OUT:
        status.level = diagnostic_msgs::msg::DiagnosticStatus::ERROR;
        break;
    }
    status.message = toString(state);

    status.values.push_back(keyValue("silence_s", formatSeconds(watchdog.timeSinceLastSignal())));
    status.values.push_back(keyValue("deadline_s",
      formatSeconds(std::chrono::duration<double>(watchdog.deadline()).count())));
    status.values.push_back(keyValue("timeouts", std::to_string(watchdog.timeoutCount())));
    status.values.push_back(keyValue("messages_received",
      std::to_string(watchdog.messagesReceived())));
    status.values.push_back(keyValue("signals_forwarded",
      std::to_string(watchdog.signalsForwarded())));
    status.values.push_back(keyValue("alarm_raised", record->raised() ? "true" : "false"));
    status.values.push_back(keyValue("alarm_sequence", std::to_string(record->sequence())));
    diag_array.status.push_back(status);
  }

  if (kill_aggregator_) {
    const auto record = bus_.getOrCreate(kill_aggregator_->config().kill_alarm);
    const auto raised_members = kill_aggregator_->raisedMembers();

    diagnostic_msgs::msg::DiagnosticStatus status;
    status.name = std::string(this->get_name()) + ": " + record->name();
    status.hardware_id = this->get_name();
    status.level = record->raised() ?
      diagnostic_msgs::msg::DiagnosticStatus::ERROR :
      diagnostic_msgs::msg::DiagnosticStatus::OK;
    status.message = record->raised() ? "KILLED" : "clear";

    std::string members;
    for (const auto & member : raised_members) {
      members += members.empty() ? member : "," + member;
    }
    status.values.push_back(keyValue("raised_members", members));
    status.values.push_back(keyValue("sequence", std::to_string(record->sequence())));
    status.values.push_back(keyValue("raised_by", record->raisedBy()));
    diag_array.status.push_back(status);
  }

  diagnostics_pub_->publish(diag_array);
}

bool AlarmServerNode::publishing() const
{
  return updates_pub_ && updates_pub_->is_activated();
}

void AlarmServerNode::deactivatePublishers()
{
  if (updates_pub_ && updates_pub_->is_activated()) {
    updates_pub_->on_deactivate();
  }
  if (diagnostics_pub_ && diagnostics_pub_->is_activated()) {
    diagnostics_pub_->on_deactivate();
  }
  for (auto & kv : alarm_pubs_) {
    if (kv.second->is_activated()) {
      kv.second->on_deactivate();
    }
  }
}

void AlarmServerNode::disarm()
{
  std::map<std::string, std::shared_ptr<NetworkLossMonitor>> monitors;
  std::unique_ptr<KillAggregator> kill_aggregator;
  std::vector<std::unique_ptr<AlarmListener>> egress_listeners;
  {
    std::lock_guard<std::mutex> lock(runtime_mutex_);
    monitors.swap(monitors_);
    kill_aggregator.swap(kill_aggregator_);
    egress_listeners.swap(egress_listeners_);
  }

  // Stop producers before the consumers they feed.
  for (auto & kv : monitors) {
    kv.second->dispose();
  }
  monitors.clear();
  kill_aggregator.reset();
  egress_listeners.clear();
}

void AlarmServerNode::releaseEntities()
{
  liveness_subs_.clear();
  force_clear_services_.clear();
  alarm_pubs_.clear();
  updates_pub_.reset();
  diagnostics_pub_.reset();
  audit_log_.reset();
}
