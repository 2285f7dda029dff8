#ifndef KILL_AGGREGATOR_HPP
#define KILL_AGGREGATOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "alarm_broadcaster.hpp"
#include "alarm_listener.hpp"

struct KillAggregatorConfig
{
  std::string kill_alarm{"kill"};
  std::vector<std::string> members{"hw-kill", "network-loss"};
  /// When true, the kill alarm stays raised until explicitly cleared.
  bool latching{true};
};

/**
 * @brief Keeps the aggregate kill alarm in sync with its member alarms.
 *
 * Any member becoming raised raises the kill alarm, naming the member in the
 * record parameters. A latching aggregator leaves clearing to an operator
 * (force clear); a non-latching one clears the kill alarm once every member
 * is clear. Clearing the kill alarm never stops later member raises from
 * raising it again.
 */
class KillAggregator
{
public:
  /**
   * @throws std::invalid_argument on an empty kill alarm name, no members, or
   *         a member equal to the kill alarm
   */
  explicit KillAggregator(
    KillAggregatorConfig config,
    AlarmBus & bus = AlarmBus::global(),
    rclcpp::Logger logger = rclcpp::get_logger("kill_aggregator"));

  ~KillAggregator();

  KillAggregator(const KillAggregator &) = delete;
  KillAggregator & operator=(const KillAggregator &) = delete;

  const KillAggregatorConfig & config() const {return config_;}

  /// Members whose last delivered record was raised.
  std::vector<std::string> raisedMembers() const;

private:
  void onMemberRecord(const std::string & member, const AlarmRecord::ConstSharedPtr & record);

  KillAggregatorConfig config_;
  AlarmBus & bus_;
  rclcpp::Logger logger_;
  AlarmBroadcaster kill_broadcaster_;

  mutable std::mutex mutex_;
  std::map<std::string, bool> member_raised_;

  std::vector<std::unique_ptr<AlarmListener>> member_listeners_;
};

#endif  // KILL_AGGREGATOR_HPP
