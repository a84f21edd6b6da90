#pragma once

#include "upkeep/app/application.hpp"
#include "upkeep/config/config.hpp"

#include <memory>
#include <optional>
#include <print>
#include <string>

namespace upkeep::cli {

[[nodiscard]] inline auto load_config(const std::string& path)
    -> std::optional<Config> {
  if (path.empty()) {
    return Config{};
  }
  auto result = ConfigLoader::load_from_file(path);
  if (!result) {
    std::println(stderr, "Error: {}: {}", path, result.error().message());
    return std::nullopt;
  }
  return std::move(*result);
}

// Loads the config and opens the store for a one-shot command.
[[nodiscard]] inline auto open_application(const std::string& config_file)
    -> std::unique_ptr<Application> {
  auto config = load_config(config_file);
  if (!config) {
    return nullptr;
  }
  auto app = std::make_unique<Application>(std::move(*config));
  if (auto r = app->init(); !r) {
    std::println(stderr, "Error: Failed to open {}: {}",
                 app->config().storage.db_file, r.error().message());
    return nullptr;
  }
  return app;
}

}  // namespace upkeep::cli
