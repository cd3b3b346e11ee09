#pragma once

// luuma-cursor - monitor.hpp
// Public Monitor API.
//
// The Monitor polls the pointer at a fixed debounce interval on a dedicated
// sampling thread and turns the polled state into discrete events (move,
// cursor type change, button click and release). The latest snapshot can be
// read at any time from any thread with `getState()`.
//
// Note on sampling:
// - Only the states at two consecutive ticks are compared. Motion between
//   two ticks is invisible and is not reconstructed; a press and release
//   that both fall between two ticks produce no event.
// - A tick that overruns the interval is followed immediately by the next
//   one. Missed intervals are not caught up.
// - A failed platform query skips the tick: the previous state is kept and
//   no event fires.
//
// Example:
//
//   #include <luuma-cursor/monitor.hpp>
//
//   int main() {
//     luuma::cursor::Monitor m(luuma::cursor::loadMonitorOptions());
//     bool ok = m.start([](const luuma::cursor::CursorEvent &e) {
//       // handle event
//     });
//     if (!ok) {
//       // Monitor couldn't be started (no X display / XFixes missing)
//     }
//     // ...
//     m.stop();
//     return 0;
//   }
//
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <luuma-cursor/config.hpp>
#include <luuma-cursor/core.hpp>
#include <luuma-cursor/sampler.hpp>
#include <luuma-cursor/state.hpp>

namespace luuma {
namespace cursor {

struct MonitorStats {
  /// Ticks that produced a new snapshot (priming sample included).
  uint64_t ticks{0};
  /// Ticks skipped because the sampler failed.
  uint64_t skippedTicks{0};
  /// Events delivered to the handler.
  uint64_t events{0};
};

class LUUMA_CURSOR_API Monitor {
public:
  // Invoked on the sampling thread, synchronously and in tick order.
  using EventHandler = std::function<void(const CursorEvent &event)>;

  // Invoked on the sampling thread for each loggable occurrence with the
  // snapshot of that tick and the log message (without timestamp prefix).
  using StateCallback =
      std::function<void(const CursorState &state, const std::string &message)>;

  // Opens the platform backend on `options.displayName`.
  explicit Monitor(const MonitorOptions &options = MonitorOptions());

  // Uses the given collaborators. `resolver` may be null, in which case every
  // shape maps to a `custom_<id>` label.
  Monitor(std::shared_ptr<RawSampler> sampler,
          std::shared_ptr<ShapeResolver> resolver,
          const MonitorOptions &options = MonitorOptions());

  // Stops and joins the internal thread. Must not run on that thread: a
  // handler may call stop() but must not destroy the Monitor that invoked it.
  ~Monitor();

  Monitor(const Monitor &) = delete;
  Monitor &operator=(const Monitor &) = delete;
  Monitor(Monitor &&) noexcept;
  Monitor &operator=(Monitor &&) noexcept;

  // Start monitoring on an internal thread. Returns false when the sampler
  // is unavailable or the monitor is already running. A failed first sample
  // only delays priming to the next good tick. A non-empty `handler`
  // replaces the registered one.
  bool start(EventHandler handler = EventHandler());

  // Same as start() but runs the sampling loop on the calling thread and
  // blocks until stop() is called from another thread or from a handler.
  bool run(EventHandler handler = EventHandler());

  // Ask the loop to finish. The flag is checked between ticks, never in the
  // middle of one. Safe to call from any thread, including from a handler;
  // joins the internal thread unless called from it.
  void stop();

  [[nodiscard]] bool isMonitoring() const;

  // Run one tick synchronously on the calling thread. Must not be called
  // while the loop is running. The first successful tick primes the monitor
  // and emits no events. Returns false if the sample failed.
  bool tick();

  // Latest published snapshot. Never blocks on an in-progress tick.
  [[nodiscard]] CursorState getState() const;

  // Replace the event handler. Takes effect from the next tick.
  void setEventHandler(EventHandler handler);

  // Replace the state callback. Takes effect from the next tick.
  void setStateCallback(StateCallback callback);

  [[nodiscard]] MonitorStats stats() const;
  [[nodiscard]] const MonitorOptions &options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace cursor
} // namespace luuma
