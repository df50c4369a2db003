#include "config.hpp"

#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace streamfs {

namespace {

core::Result<Config> invalid(const std::string &message) {
  return core::Result<Config>::Error(
      std::runtime_error("Invalid configuration: " + message));
}

} // namespace

core::Result<Config> Config::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return invalid("top level must be an object");
  }

  Config config;

  try {
    const auto storage = json.value("storage", nlohmann::json::object());
    config.storage.root = storage.value("root", std::string{});
    config.storage.incomplete_suffix =
        storage.value("incomplete_suffix", config.storage.incomplete_suffix);

    const auto wait = json.value("completion_wait", nlohmann::json::object());
    const auto timeout_ms =
        wait.value("timeout_ms", config.completion_wait.timeout.count());
    const auto poll_interval_ms = wait.value(
        "poll_interval_ms", config.completion_wait.poll_interval.count());

    const auto logging = json.value("logging", nlohmann::json::object());
    const auto level_name = logging.value("level", std::string{"info"});

    if (config.storage.root.empty()) {
      return invalid("storage.root is required");
    }
    if (config.storage.incomplete_suffix.empty()) {
      return invalid("storage.incomplete_suffix must not be empty");
    }
    if (timeout_ms < 0) {
      return invalid(fmt::format(
          "completion_wait.timeout_ms must be >= 0, got {}", timeout_ms));
    }
    if (poll_interval_ms <= 0) {
      return invalid(
          fmt::format("completion_wait.poll_interval_ms must be > 0, got {}",
                      poll_interval_ms));
    }

    const auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
      return invalid("unknown logging.level '" + level_name + "'");
    }

    config.completion_wait.timeout = std::chrono::milliseconds(timeout_ms);
    config.completion_wait.poll_interval =
        std::chrono::milliseconds(poll_interval_ms);
    config.logging.level = level;
  } catch (const nlohmann::json::exception &e) {
    return invalid(e.what());
  }

  spdlog::debug("Loaded configuration: root={}, wait timeout={} ms",
                config.storage.root, config.completion_wait.timeout.count());
  return core::Result<Config>::Ok(std::move(config));
}

core::Result<Config> Config::parse(std::string_view text) {
  try {
    return fromJson(nlohmann::json::parse(text));
  } catch (const nlohmann::json::exception &e) {
    return core::Result<Config>::Error(
        std::runtime_error(fmt::format("Failed to parse JSON: {}", e.what())));
  }
}

core::Result<Config> Config::load(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return core::Result<Config>::Error(
        std::runtime_error(fmt::format("Failed to open file: {}", path)));
  }

  std::stringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    return core::Result<Config>::Error(
        std::runtime_error(fmt::format("Failed to read file: {}", path)));
  }

  return parse(content.str());
}

} // namespace streamfs
