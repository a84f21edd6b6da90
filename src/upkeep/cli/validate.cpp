#include "common.hpp"
#include "upkeep/cli/commands.hpp"

#include <print>

namespace upkeep::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: validate requires a config file");
    return 1;
  }
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }

  if (opts.print) {
    std::println("{}", ConfigLoader::to_string(*config));
  }

  auto problems = ConfigLoader::check(*config);
  for (const auto& problem : problems) {
    std::println("✗ {}", problem);
  }
  if (problems.empty()) {
    std::println("✓ {} - Valid", opts.config_file);
    return 0;
  }
  std::println("\n{} problem(s) in {}", problems.size(), opts.config_file);
  return 1;
}

}  // namespace upkeep::cli
