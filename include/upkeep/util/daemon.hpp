#pragma once

#include <atomic>
#include <string>

namespace upkeep {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();

// Writes the current pid to path. An empty path is a no-op.
[[nodiscard]] auto write_pid_file(const std::string& path) -> bool;
void remove_pid_file(const std::string& path);

}  // namespace upkeep
