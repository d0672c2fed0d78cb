#include "cronwork/cli/commands.hpp"
#include "cronwork/config/config.hpp"
#include "cronwork/util/log.hpp"

#include <filesystem>
#include <print>

namespace cronwork::cli {

auto load_settings(const CommonOptions& opts) -> std::optional<SystemConfig> {
  SystemConfig config;

  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return std::nullopt;
    }
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return std::nullopt;
    }
    config = std::move(*loaded);
  }

  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }

  log::set_level(config.log.level);
  if (!config.log.file.empty() && !log::open(config.log.file)) {
    std::println(stderr, "Error: Cannot open log file: {}", config.log.file);
    return std::nullopt;
  }
  return config;
}

}  // namespace cronwork::cli
