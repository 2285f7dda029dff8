#include "kill_aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace
{
KillAggregatorConfig validated(KillAggregatorConfig config)
{
  if (config.kill_alarm.empty()) {
    throw std::invalid_argument("KillAggregator requires a kill alarm name");
  }
  if (config.members.empty()) {
    throw std::invalid_argument("KillAggregator '" + config.kill_alarm + "' has no members");
  }
  for (const auto & member : config.members) {
    if (member.empty()) {
      throw std::invalid_argument("KillAggregator '" + config.kill_alarm + "' has an empty member");
    }
    if (member == config.kill_alarm) {
      throw std::invalid_argument(
              "KillAggregator '" + config.kill_alarm + "' cannot list itself as a member");
    }
  }

  std::sort(config.members.begin(), config.members.end());
  config.members.erase(
    std::unique(config.members.begin(), config.members.end()), config.members.end());
  return config;
}
}  // namespace

KillAggregator::KillAggregator(KillAggregatorConfig config, AlarmBus & bus, rclcpp::Logger logger)
: config_(validated(std::move(config))),
  bus_(bus),
  logger_(std::move(logger)),
  kill_broadcaster_(config_.kill_alarm, "kill_aggregator/" + config_.kill_alarm, bus)
{
  for (const auto & member : config_.members) {
    member_raised_[member] = false;
  }

  // Each listener delivers its member's current record before returning.
  for (const auto & member : config_.members) {
    member_listeners_.push_back(std::make_unique<AlarmListener>(
        member,
        [this, member](const AlarmRecord::ConstSharedPtr & record) {
          onMemberRecord(member, record);
        },
        bus_));
  }

  RCLCPP_INFO(logger_, "Kill aggregator '%s' tracking %zu member alarm(s) (%s)",
    config_.kill_alarm.c_str(), config_.members.size(),
    config_.latching ? "latching" : "follows members");
}

KillAggregator::~KillAggregator()
{
  for (auto & listener : member_listeners_) {
    listener->cancel();
  }
}

std::vector<std::string> KillAggregator::raisedMembers() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> raised;
  for (const auto & kv : member_raised_) {
    if (kv.second) {
      raised.push_back(kv.first);
    }
  }
  return raised;
}

void KillAggregator::onMemberRecord(
  const std::string & member, const AlarmRecord::ConstSharedPtr & record)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const bool was_raised = member_raised_[member];
  member_raised_[member] = record->raised();

  if (record->raised() && !was_raised) {
    const std::string description = record->problemDescription() ?
      "'" + member + "': " + *record->problemDescription() :
      "'" + member + "' raised";
    auto kill = kill_broadcaster_.raiseAlarm(
      {{"source", member}, {"source_sequence", std::to_string(record->sequence())}},
      description);
    RCLCPP_WARN(logger_, "KILL raised by %s (#%lu)", description.c_str(),
      static_cast<unsigned long>(kill->sequence()));
    return;
  }

  if (record->raised() || !was_raised || config_.latching) {
    return;
  }

  const bool any_raised = std::any_of(member_raised_.begin(), member_raised_.end(),
      [](const std::pair<const std::string, bool> & kv) {return kv.second;});
  if (any_raised || !bus_.getOrCreate(config_.kill_alarm)->raised()) {
    return;
  }

  auto kill = kill_broadcaster_.clearAlarm({{"reason", "all members clear"}, {"source", member}});
  RCLCPP_INFO(logger_, "KILL cleared, all members clear (#%lu)",
    static_cast<unsigned long>(kill->sequence()));
}
