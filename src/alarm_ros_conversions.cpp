#include "alarm_ros_conversions.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace
{
diagnostic_msgs::msg::KeyValue keyValue(const std::string & key, const std::string & value)
{
  diagnostic_msgs::msg::KeyValue kv;
  kv.key = key;
  kv.value = value;
  return kv;
}

// Keys the encoder fills in itself; a parameter of the same name is renamed.
bool isReservedKey(const std::string & key)
{
  return key == "raised" || key == "sequence" || key == "observed_at";
}
}  // namespace

diagnostic_msgs::msg::DiagnosticStatus toDiagnosticStatus(const AlarmRecord & record)
{
  diagnostic_msgs::msg::DiagnosticStatus status;
  status.name = record.name();
  status.hardware_id = record.raisedBy();
  status.level = record.raised() ?
    diagnostic_msgs::msg::DiagnosticStatus::ERROR :
    diagnostic_msgs::msg::DiagnosticStatus::OK;
  status.message = record.problemDescription().value_or(record.raised() ? "raised" : "clear");

  status.values.push_back(keyValue("raised", record.raised() ? "true" : "false"));
  status.values.push_back(keyValue("sequence", std::to_string(record.sequence())));

  std::ostringstream observed;
  observed << std::fixed << std::setprecision(9) << record.observedAt().seconds();
  status.values.push_back(keyValue("observed_at", observed.str()));

  for (const auto & kv : record.parameters()) {
    const std::string key = isReservedKey(kv.first) ? "param." + kv.first : kv.first;
    status.values.push_back(keyValue(key, kv.second));
  }
  return status;
}

diagnostic_msgs::msg::DiagnosticArray toDiagnosticArray(const AlarmRecord & record)
{
  diagnostic_msgs::msg::DiagnosticArray array;
  array.header.stamp = record.observedAt();
  array.status.push_back(toDiagnosticStatus(record));
  return array;
}

std::string alarmTopicToken(const std::string & alarm_name)
{
  std::string token;
  token.reserve(alarm_name.size() + 2);
  for (const char c : alarm_name) {
    const bool valid = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    const char mapped = valid ? c : '_';
    if (mapped == '_' && !token.empty() && token.back() == '_') {
      continue;
    }
    token.push_back(mapped);
  }

  while (!token.empty() && token.back() == '_') {
    token.pop_back();
  }
  while (!token.empty() && token.front() == '_') {
    token.erase(token.begin());
  }

  if (token.empty()) {
    return "unnamed";
  }
  if (std::isdigit(static_cast<unsigned char>(token.front())) != 0) {
    token.insert(0, "a_");
  }
  return token;
}
