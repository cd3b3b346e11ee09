// luuma-cursor-watch: prints cursor events until interrupted.
//
//   luuma-cursor-watch          activity log lines only
//   luuma-cursor-watch --json   one compact JSON event per line on stdout

#include <csignal>
#include <cstdio>
#include <cstring>

#include <pthread.h>

#include <luuma-cursor/log.hpp>
#include <luuma-cursor/luuma_cursor.hpp>

namespace {

void printUsage(const char *argv0) {
  std::fprintf(stderr, "usage: %s [--json] [--version]\n", argv0);
}

} // namespace

int main(int argc, char **argv) {
  using namespace luuma::cursor;

  bool json = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--json") == 0) {
      json = true;
    } else if (std::strcmp(argv[i], "--version") == 0) {
      std::printf("luuma-cursor-watch %s\n", libraryVersion());
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  // Block the termination signals before the sampling thread exists so only
  // sigwait below receives them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  MonitorOptions options = loadMonitorOptions();
  if (json)
    options.logActivity = false;

  Monitor monitor(options);
  bool ok = monitor.start([json](const CursorEvent &event) {
    if (json) {
      std::printf("%s\n", toJson(event).c_str());
      std::fflush(stdout);
    }
  });
  if (!ok) {
    std::fprintf(stderr, "error: cursor monitoring could not be started\n");
    return 1;
  }

  if (json) {
    std::printf("%s\n", toJson(monitor.getState()).c_str());
    std::fflush(stdout);
  }

  int received = 0;
  sigwait(&signals, &received);
  monitor.stop();

  MonitorStats stats = monitor.stats();
  LUUMA_CURSOR_LOG_INFO("luuma-cursor-watch: signal %d, %llu ticks, %llu events",
                        received, static_cast<unsigned long long>(stats.ticks),
                        static_cast<unsigned long long>(stats.events));
  return 0;
}
