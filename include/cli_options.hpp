#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace killswitch
{
constexpr const char * kAutostartEnv = "KILLSWITCH_AUTOSTART";

struct CliOptions
{
  bool autostart{false};
  std::string config_file;
};

inline bool parse_truthy(std::string value)
{
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

/**
 * Strips the options handled here from argv and returns the rest (plus a
 * terminating nullptr) in @p filtered for rclcpp::init.
 *
 *   --autostart / --no-autostart   configure+activate immediately (or not)
 *   --config <path> | --config=<path>
 */
inline CliOptions parse_cli_arguments(int argc, char * argv[], std::vector<char *> & filtered)
{
  if (argc < 0) {
    throw std::invalid_argument("argc cannot be negative");
  }
  if (argc > 0 && argv == nullptr) {
    throw std::invalid_argument("argv cannot be null when argc is positive");
  }

  CliOptions options;
  bool autostart_set = false;

  filtered.clear();
  filtered.reserve(static_cast<size_t>(argc) + 1);
  if (argc > 0) {
    filtered.push_back(argv[0]);
  }

  for (int i = 1; i < argc; ++i) {
    const bool is_autostart = std::strcmp(argv[i], "--autostart") == 0;
    const bool is_no_autostart = std::strcmp(argv[i], "--no-autostart") == 0;

    if (is_autostart || is_no_autostart) {
      const bool requested_autostart = is_autostart;
      if (autostart_set && options.autostart != requested_autostart) {
        throw std::invalid_argument(
          "Conflicting autostart flags detected (both --autostart and --no-autostart)");
      }

      options.autostart = requested_autostart;
      autostart_set = true;
      continue;
    }

    if (std::strcmp(argv[i], "--config") == 0) {
      if (i + 1 >= argc) {
        throw std::invalid_argument("--config requires a file path");
      }
      options.config_file = argv[++i];
      if (options.config_file.empty()) {
        throw std::invalid_argument("--config requires a file path");
      }
      continue;
    }

    if (std::strncmp(argv[i], "--config=", 9) == 0) {
      options.config_file = argv[i] + 9;
      if (options.config_file.empty()) {
        throw std::invalid_argument("--config requires a file path");
      }
      continue;
    }

    filtered.push_back(argv[i]);
  }

  filtered.push_back(nullptr);

  if (!autostart_set) {
    if (const char * env = std::getenv(kAutostartEnv)) {
      options.autostart = parse_truthy(env);
    }
  }

  return options;
}
}  // namespace killswitch
