/**
 * @file monitor.cpp
 * @brief Sampling loop, change dispatch and the shared snapshot.
 */

#include <luuma-cursor/monitor.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <luuma-cursor/detector.hpp>
#include <luuma-cursor/log.hpp>
#include <luuma-cursor/shape_cache.hpp>

namespace luuma::cursor {

struct Monitor::Impl {
  MonitorOptions options;
  std::shared_ptr<RawSampler> sampler;
  std::shared_ptr<ShapeResolver> resolver;
  ShapeCache cache;

  // Touched by the sampling context only.
  std::optional<CursorState> retained;

  mutable std::mutex stateMutex;
  std::shared_ptr<const CursorState> published;

  std::mutex handlerMutex;
  EventHandler handler;
  StateCallback stateCallback;

  std::mutex wakeMutex;
  std::condition_variable wake;
  std::atomic<bool> running{false};
  std::atomic<bool> stopRequested{false};
  std::thread worker;

  std::atomic<uint64_t> ticks{0};
  std::atomic<uint64_t> skippedTicks{0};
  std::atomic<uint64_t> eventCount{0};

  Impl(std::shared_ptr<RawSampler> s, std::shared_ptr<ShapeResolver> r,
       const MonitorOptions &opts)
      : options(opts), sampler(std::move(s)), resolver(std::move(r)),
        cache([res = resolver](ShapeHandle handle) {
          return res ? res->resolve(handle) : std::string();
        }),
        published(std::make_shared<const CursorState>()) {
    if (options.interval < kMinInterval)
      options.interval = kMinInterval;
  }

  ~Impl() { stop(); }

  void publish(const CursorState &state) {
    auto next = std::make_shared<const CursorState>(state);
    std::lock_guard<std::mutex> lock(stateMutex);
    published.swap(next);
  }

  CursorState snapshot() const {
    std::shared_ptr<const CursorState> current;
    {
      std::lock_guard<std::mutex> lock(stateMutex);
      current = published;
    }
    return *current;
  }

  void report(const CursorState &state, const std::string &message,
              const StateCallback &cb) {
    if (options.logActivity)
      LUUMA_CURSOR_LOG_INFO("%s", message.c_str());
    if (cb)
      cb(state, message);
  }

  bool tickOnce() {
    RawSample raw;
    if (!sampler || !sampler->sample(raw)) {
      skippedTicks.fetch_add(1);
      LUUMA_CURSOR_LOG_DEBUG("Monitor: sample failed, tick skipped");
      return false;
    }

    CursorState next(raw.position, cache.resolve(raw.shape), raw.leftDown,
                     raw.rightDown, currentTimestamp());

    EventHandler h;
    StateCallback cb;
    {
      std::lock_guard<std::mutex> lock(handlerMutex);
      h = handler;
      cb = stateCallback;
    }

    if (!retained) {
      retained = next;
      publish(next);
      ticks.fetch_add(1);
      report(next,
             describeEvent(MoveEvent{next.position, next.cursorType,
                                     next.timestamp}),
             cb);
      return true;
    }

    std::vector<CursorEvent> events = diff(*retained, next);
    retained = next;
    publish(next);
    ticks.fetch_add(1);

    for (const CursorEvent &event : events) {
      report(next, describeEvent(event), cb);
      if (h)
        h(event);
      eventCount.fetch_add(1);
    }
    return true;
  }

  // Checks availability and primes the retained state. A failed first sample
  // is not fatal; the first good tick of the loop primes instead. On success
  // the monitor is marked running.
  bool prepare(const char *who) {
    bool expected = false;
    if (!running.compare_exchange_strong(expected, true)) {
      LUUMA_CURSOR_LOG_WARN("Monitor::%s: already monitoring", who);
      return false;
    }

    if (!sampler || !sampler->isReady()) {
      LUUMA_CURSOR_LOG_ERROR(
          "Monitor::%s: pointer sampling is unavailable on this system", who);
      running = false;
      return false;
    }

    stopRequested = false;
    retained.reset();
    if (!tickOnce())
      LUUMA_CURSOR_LOG_WARN(
          "Monitor::%s: initial pointer sample failed, priming on a later tick",
          who);

    LUUMA_CURSOR_LOG_INFO("Monitor: started (interval=%lldms)",
                          static_cast<long long>(options.interval.count()));
    return true;
  }

  void loop() {
    using clock = std::chrono::steady_clock;
    while (!stopRequested.load()) {
      const auto tickStart = clock::now();
      tickOnce();

      // An overrun leaves the deadline in the past and the next tick starts
      // right away.
      std::unique_lock<std::mutex> lock(wakeMutex);
      wake.wait_until(lock, tickStart + options.interval,
                      [this] { return stopRequested.load(); });
    }
    running = false;
    LUUMA_CURSOR_LOG_INFO("Monitor: stopped (ticks=%llu skipped=%llu)",
                          static_cast<unsigned long long>(ticks.load()),
                          static_cast<unsigned long long>(skippedTicks.load()));
  }

  void joinWorker() {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
      worker.join();
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(wakeMutex);
      stopRequested = true;
    }
    wake.notify_all();
    joinWorker();
  }
};

Monitor::Monitor(const MonitorOptions &options) {
  PlatformBackend backend = openPlatformBackend(options.displayName);
  if (!backend.sampler)
    LUUMA_CURSOR_LOG_ERROR("Monitor: no pointer backend for this platform");
  m_impl = std::make_unique<Impl>(std::move(backend.sampler),
                                  std::move(backend.resolver), options);
}

Monitor::Monitor(std::shared_ptr<RawSampler> sampler,
                 std::shared_ptr<ShapeResolver> resolver,
                 const MonitorOptions &options)
    : m_impl(std::make_unique<Impl>(std::move(sampler), std::move(resolver),
                                    options)) {}

Monitor::~Monitor() = default;
Monitor::Monitor(Monitor &&) noexcept = default;
Monitor &Monitor::operator=(Monitor &&) noexcept = default;

bool Monitor::start(EventHandler handler) {
  if (!m_impl)
    return false;
  if (m_impl->running.load()) {
    LUUMA_CURSOR_LOG_WARN("Monitor::start: already monitoring");
    return false;
  }

  // A previous loop may have been stopped from inside a handler, which
  // leaves its thread to be joined here.
  m_impl->joinWorker();

  if (handler)
    setEventHandler(std::move(handler));
  if (!m_impl->prepare("start"))
    return false;

  Impl *impl = m_impl.get();
  m_impl->worker = std::thread([impl] { impl->loop(); });
  return true;
}

bool Monitor::run(EventHandler handler) {
  if (!m_impl)
    return false;
  if (m_impl->running.load()) {
    LUUMA_CURSOR_LOG_WARN("Monitor::run: already monitoring");
    return false;
  }

  if (handler)
    setEventHandler(std::move(handler));
  if (!m_impl->prepare("run"))
    return false;

  m_impl->loop();
  return true;
}

void Monitor::stop() {
  if (m_impl)
    m_impl->stop();
}

bool Monitor::isMonitoring() const { return m_impl && m_impl->running.load(); }

bool Monitor::tick() {
  if (!m_impl)
    return false;
  if (m_impl->running.load()) {
    LUUMA_CURSOR_LOG_WARN("Monitor::tick: ignored while the loop is running");
    return false;
  }
  return m_impl->tickOnce();
}

CursorState Monitor::getState() const {
  if (!m_impl)
    return CursorState();
  return m_impl->snapshot();
}

void Monitor::setEventHandler(EventHandler handler) {
  if (!m_impl)
    return;
  std::lock_guard<std::mutex> lock(m_impl->handlerMutex);
  m_impl->handler = std::move(handler);
}

void Monitor::setStateCallback(StateCallback callback) {
  if (!m_impl)
    return;
  std::lock_guard<std::mutex> lock(m_impl->handlerMutex);
  m_impl->stateCallback = std::move(callback);
}

MonitorStats Monitor::stats() const {
  MonitorStats s;
  if (m_impl) {
    s.ticks = m_impl->ticks.load();
    s.skippedTicks = m_impl->skippedTicks.load();
    s.events = m_impl->eventCount.load();
  }
  return s;
}

const MonitorOptions &Monitor::options() const {
  static const MonitorOptions kDefaults;
  return m_impl ? m_impl->options : kDefaults;
}

} // namespace luuma::cursor
