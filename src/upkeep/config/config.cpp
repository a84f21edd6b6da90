#include "upkeep/config/config.hpp"

#include "upkeep/config/yaml_utils.hpp"
#include "upkeep/scheduler/task_registry.hpp"
#include "upkeep/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<upkeep::StorageConfig> {
  static bool decode(const Node& node, upkeep::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = upkeep::yaml_get_or<std::string>(node, "db_file", "upkeep.db");
    return true;
  }
};

template <>
struct convert<upkeep::RunnerConfig> {
  static bool decode(const Node& node, upkeep::RunnerConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.log_level = upkeep::yaml_get_or<std::string>(node, "log_level", "info");
    r.log_file = upkeep::yaml_get_or<std::string>(node, "log_file", "");
    r.pid_file = upkeep::yaml_get_or<std::string>(node, "pid_file", "");
    r.tick_interval_ms = upkeep::yaml_get_or(node, "tick_interval_ms", 1000);
    r.time_limit_sec = upkeep::yaml_get_or(node, "time_limit_sec", 25);
    r.time_buffer_sec = upkeep::yaml_get_or(node, "time_buffer_sec", 3);
    r.resume_delay_sec = upkeep::yaml_get_or(node, "resume_delay_sec", 60);
    r.stale_threshold_sec =
        upkeep::yaml_get_or(node, "stale_threshold_sec", 86400);
    return true;
  }
};

template <>
struct convert<upkeep::SchedulingSettings> {
  static bool decode(const Node& node, upkeep::SchedulingSettings& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.scheduler_enabled = upkeep::yaml_get_or(node, "scheduler_enabled", true);
    s.preferred_time = upkeep::yaml_get_or(node, "preferred_time", 2);
    s.timezone = upkeep::yaml_get_or<std::string>(node, "timezone", "UTC");
    for (const auto& entry : upkeep::kTaskRegistry) {
      std::string enabled_key{entry.enabled_key};
      std::string frequency_key{entry.frequency_key};
      if (node[enabled_key]) {
        s.task_enabled[enabled_key] = node[enabled_key].as<bool>();
      }
      if (node[frequency_key]) {
        s.task_frequency[frequency_key] =
            node[frequency_key].as<std::string>();
      }
    }
    return true;
  }
};

template <>
struct convert<upkeep::CacheConfig> {
  static bool decode(const Node& node, upkeep::CacheConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.backend = upkeep::string_to_cache_backend_choice(
        upkeep::yaml_get_or<std::string>(node, "backend", "auto"));
    c.prefix = upkeep::yaml_get_or<std::string>(node, "prefix", "upkeep_");
    c.memory_max_items =
        upkeep::yaml_get_or<std::size_t>(node, "memory_max_items", 1000);
    return true;
  }
};

template <>
struct convert<upkeep::RateLimitSection> {
  static bool decode(const Node& node, upkeep::RateLimitSection& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.requests_per_minute = upkeep::yaml_get_or(node, "requests_per_minute", 60);
    r.lock_attempts = upkeep::yaml_get_or(node, "lock_attempts", 5);
    r.lock_backoff_ms = upkeep::yaml_get_or(node, "lock_backoff_ms", 50);
    r.lock_ttl_sec = upkeep::yaml_get_or(node, "lock_ttl_sec", 5);
    return true;
  }
};

template <>
struct convert<upkeep::SystemConfig> {
  static bool decode(const Node& node, upkeep::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<upkeep::StorageConfig>();
    }
    if (auto runner = node["runner"]) {
      c.runner = runner.as<upkeep::RunnerConfig>();
    }
    if (auto scheduling = node["scheduling"]) {
      c.scheduling = scheduling.as<upkeep::SchedulingSettings>();
    }
    if (auto cache = node["cache"]) {
      c.cache = cache.as<upkeep::CacheConfig>();
    }
    if (auto rate_limit = node["rate_limit"]) {
      c.rate_limit = rate_limit.as<upkeep::RateLimitSection>();
    }
    return true;
  }
};

}  // namespace YAML

namespace upkeep {

namespace {

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "db_file", s.db_file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const RunnerConfig& r) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", r.log_level);
  yaml_emit_if_not_empty(out, "log_file", r.log_file);
  yaml_emit_if_not_empty(out, "pid_file", r.pid_file);
  yaml_emit(out, "tick_interval_ms", r.tick_interval_ms);
  yaml_emit(out, "time_limit_sec", r.time_limit_sec);
  yaml_emit(out, "time_buffer_sec", r.time_buffer_sec);
  yaml_emit(out, "resume_delay_sec", r.resume_delay_sec);
  yaml_emit(out, "stale_threshold_sec", r.stale_threshold_sec);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SchedulingSettings& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "scheduler_enabled", s.scheduler_enabled);
  yaml_emit(out, "preferred_time", s.preferred_time);
  yaml_emit(out, "timezone", s.timezone);
  for (const auto& entry : kTaskRegistry) {
    yaml_emit(out, entry.enabled_key, s.is_task_enabled(entry.enabled_key));
    yaml_emit(out, entry.frequency_key,
              s.frequency_for(entry.frequency_key,
                              to_string_view(entry.default_frequency)));
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const CacheConfig& c) {
  out << YAML::BeginMap;
  yaml_emit(out, "backend",
            std::string(cache_backend_choice_to_string(c.backend)));
  yaml_emit(out, "prefix", c.prefix);
  yaml_emit(out, "memory_max_items", c.memory_max_items);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const RateLimitSection& r) {
  out << YAML::BeginMap;
  yaml_emit(out, "requests_per_minute", r.requests_per_minute);
  yaml_emit(out, "lock_attempts", r.lock_attempts);
  yaml_emit(out, "lock_backoff_ms", r.lock_backoff_ms);
  yaml_emit(out, "lock_ttl_sec", r.lock_ttl_sec);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "runner" << YAML::Value;
  to_yaml(out, config.runner);
  out << YAML::Key << "scheduling" << YAML::Value;
  to_yaml(out, config.scheduling);
  out << YAML::Key << "cache" << YAML::Value;
  to_yaml(out, config.cache);
  out << YAML::Key << "rate_limit" << YAML::Value;
  to_yaml(out, config.rate_limit);
  out << YAML::EndMap;
  return out.c_str();
}

auto ConfigLoader::check(const SystemConfig& config)
    -> std::vector<std::string> {
  std::vector<std::string> problems;

  const auto& runner = config.runner;
  if (runner.tick_interval_ms <= 0) {
    problems.push_back("runner.tick_interval_ms must be positive");
  }
  if (runner.time_limit_sec <= runner.time_buffer_sec) {
    problems.push_back(
        "runner.time_limit_sec must be larger than runner.time_buffer_sec");
  }
  if (runner.resume_delay_sec < 0) {
    problems.push_back("runner.resume_delay_sec must not be negative");
  }

  const auto& scheduling = config.scheduling;
  if (scheduling.preferred_time < 0 || scheduling.preferred_time > 23) {
    problems.push_back(
        std::format("scheduling.preferred_time {} will be clamped to [0, 23]",
                    scheduling.preferred_time));
  }
  for (const auto& [key, frequency] : scheduling.task_frequency) {
    if (frequency != kFrequencyDisabled && !parse_frequency(frequency)) {
      problems.push_back(
          std::format("scheduling.{}: unknown frequency '{}'", key, frequency));
    }
  }

  if (config.rate_limit.lock_attempts <= 0) {
    problems.push_back("rate_limit.lock_attempts must be positive");
  }
  return problems;
}

}  // namespace upkeep
