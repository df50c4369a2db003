#ifndef STREAMFS_CONFIG_CONFIG
#define STREAMFS_CONFIG_CONFIG

#include <chrono>
#include <infrastructure/result.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace streamfs {

struct Config {
  struct Storage {
    std::string root;
    std::string incomplete_suffix{".inprogress"};
  };

  struct CompletionWait {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds poll_interval{50};
  };

  struct Logging {
    spdlog::level::level_enum level{spdlog::level::info};
  };

  Storage storage;
  CompletionWait completion_wait;
  Logging logging;

  static core::Result<Config> fromJson(const nlohmann::json &json);

  static core::Result<Config> parse(std::string_view text);

  static core::Result<Config> load(const std::string &path);
};

} // namespace streamfs

#endif // STREAMFS_CONFIG_CONFIG
