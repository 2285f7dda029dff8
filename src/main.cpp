#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>
#include <rclcpp/executors/multi_threaded_executor.hpp>
#include <lifecycle_msgs/msg/state.hpp>

#include "alarm_server_node.hpp"

#include "cli_options.hpp"

int main(int argc, char * argv[])
{
  std::vector<char *> filtered_args;
  killswitch::CliOptions options;

  try {
    options = killswitch::parse_cli_arguments(argc, argv, filtered_args);
  } catch (const std::exception & e) {
    std::cerr << "Failed to process command-line arguments: " << e.what() << std::endl;
    return 1;
  }

  int filtered_argc = static_cast<int>(filtered_args.size()) - 1;
  rclcpp::init(filtered_argc, filtered_args.data());

  rclcpp::NodeOptions node_options;
  if (!options.config_file.empty()) {
    node_options.parameter_overrides({rclcpp::Parameter("config_file", options.config_file)});
  }

  auto node = std::make_shared<AlarmServerNode>(node_options);

  rclcpp::executors::MultiThreadedExecutor executor;
  executor.add_node(node->get_node_base_interface());

  if (options.autostart) {
    RCLCPP_WARN(rclcpp::get_logger("alarm_server"),
      "Autostart enabled - configuring and activating alarm server immediately");

    if (node->configure().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
      RCLCPP_FATAL(rclcpp::get_logger("alarm_server"), "Failed to configure alarm server");
      rclcpp::shutdown();
      return 1;
    }

    if (node->activate().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
      RCLCPP_FATAL(rclcpp::get_logger("alarm_server"), "Failed to activate alarm server");
      rclcpp::shutdown();
      return 1;
    }
  } else {
    RCLCPP_INFO(rclcpp::get_logger("alarm_server"),
      "Autostart disabled - waiting for external lifecycle transitions");
  }

  executor.spin();
  executor.remove_node(node->get_node_base_interface());

  int exit_code = 0;
  if (node->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
    if (node->deactivate().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
      RCLCPP_ERROR(rclcpp::get_logger("alarm_server"),
        "Error deactivating alarm server during shutdown");
      exit_code = 1;
    }
  }

  if (node->get_current_state().id() == lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
    if (node->cleanup().id() != lifecycle_msgs::msg::State::PRIMARY_STATE_UNCONFIGURED) {
      RCLCPP_ERROR(rclcpp::get_logger("alarm_server"),
        "Error cleaning up alarm server during shutdown");
      exit_code = 1;
    }
  }

  rclcpp::shutdown();
  return exit_code;
}
