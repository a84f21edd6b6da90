#include "upkeep/util/daemon.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace upkeep {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (!std::freopen("/dev/null", "r", stdin) ||
      !std::freopen("/dev/null", "w", stdout) ||
      !std::freopen("/dev/null", "w", stderr)) {
    return false;
  }
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
}

auto write_pid_file(const std::string& path) -> bool {
  if (path.empty()) return true;
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) return false;
  out << getpid() << '\n';
  return static_cast<bool>(out);
}

void remove_pid_file(const std::string& path) {
  if (!path.empty()) {
    std::remove(path.c_str());
  }
}

}  // namespace upkeep
