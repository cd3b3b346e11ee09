#include <catch2/catch_all.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <luuma-cursor/log.hpp>
#include <luuma-cursor/monitor.hpp>

#include "fake_backend.hpp"

using namespace luuma::cursor;
using namespace luuma::cursor::testing;
using namespace std::chrono_literals;

namespace {

MonitorOptions fastOptions(std::chrono::milliseconds interval = 2ms) {
  MonitorOptions options;
  options.interval = interval;
  options.logActivity = false;
  return options;
}

template <class Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

struct QuietLog {
  log::Level saved = log::level();
  QuietLog() { log::setLevel(log::Level::Off); }
  ~QuietLog() { log::setLevel(saved); }
};

} // namespace

TEST_CASE("start delivers events from the sampling thread", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(0, 0, kArrowShape));

  Monitor monitor(sampler, std::make_shared<FakeResolver>(), fastOptions());

  std::mutex mutex;
  std::vector<CursorEvent> events;
  std::thread::id handlerThread;
  REQUIRE(monitor.start([&](const CursorEvent &e) {
    std::lock_guard<std::mutex> lock(mutex);
    handlerThread = std::this_thread::get_id();
    events.push_back(e);
  }));
  CHECK(monitor.isMonitoring());

  // A second start while running is refused.
  CHECK_FALSE(monitor.start());

  sampler->setCurrent(rawSample(40, 30, kHandShape, true, false));
  REQUIRE(waitFor([&] {
    std::lock_guard<std::mutex> lock(mutex);
    return events.size() >= 3;
  }));

  monitor.stop();
  CHECK_FALSE(monitor.isMonitoring());

  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(events.size() == 3);
  CHECK(std::holds_alternative<MoveEvent>(events[0]));
  CHECK(std::holds_alternative<TypeChangeEvent>(events[1]));
  CHECK(std::holds_alternative<ClickEvent>(events[2]));
  CHECK(handlerThread != std::this_thread::get_id());

  CursorState s = monitor.getState();
  CHECK(s.position == Position{40, 30});
  CHECK(s.cursorType == "hand");
  CHECK(s.leftClick);
}

TEST_CASE("a failed first sample does not prevent start", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->pushFailure();
  sampler->push(rawSample(1, 1, kArrowShape));
  sampler->push(rawSample(4, 4, kArrowShape));

  Monitor monitor(sampler, std::make_shared<FakeResolver>(), fastOptions());

  std::mutex mutex;
  std::vector<CursorEvent> events;
  REQUIRE(monitor.start([&](const CursorEvent &e) {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(e);
  }));
  CHECK(monitor.isMonitoring());

  REQUIRE(waitFor([&] {
    std::lock_guard<std::mutex> lock(mutex);
    return !events.empty();
  }));
  monitor.stop();

  // (1, 1) primed the state silently; only the move to (4, 4) is reported.
  std::lock_guard<std::mutex> lock(mutex);
  REQUIRE(events.size() == 1);
  CHECK(std::get<MoveEvent>(events[0]).position == Position{4, 4});
  CHECK(monitor.stats().skippedTicks == 1);
  CHECK(monitor.getState().position == Position{4, 4});
}

TEST_CASE("snapshots read concurrently are never torn", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(0, 0, kArrowShape));

  Monitor monitor(sampler, std::make_shared<FakeResolver>(), fastOptions(1ms));
  REQUIRE(monitor.start());

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::thread writer([&] {
    // Position and type always change together: x == y, and the type is
    // "hand" exactly when x is odd.
    for (int i = 1; i <= 200 && !done; ++i) {
      sampler->setCurrent(rawSample(i, i, (i % 2) ? kHandShape : kArrowShape));
      std::this_thread::sleep_for(500us);
    }
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      for (int i = 0; i < 2000; ++i) {
        CursorState s = monitor.getState();
        if (s.position.x != s.position.y)
          ++torn;
        if (s.position.x > 0) {
          bool odd = static_cast<long long>(s.position.x) % 2 == 1;
          if ((s.cursorType == "hand") != odd)
            ++torn;
        }
      }
    });
  }

  for (auto &t : readers)
    t.join();
  done = true;
  writer.join();
  monitor.stop();

  CHECK(torn.load() == 0);
  CHECK(monitor.stats().ticks > 1);
}

TEST_CASE("debounce interval spaces the ticks", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(0, 0, kArrowShape));

  Monitor monitor(sampler, nullptr, fastOptions(20ms));
  REQUIRE(monitor.start());
  std::this_thread::sleep_for(210ms);
  monitor.stop();

  // Roughly ten ticks plus the priming sample; the lower bound only guards
  // against a busy loop, the upper one against a stalled loop.
  int calls = sampler->calls();
  CHECK(calls >= 3);
  CHECK(calls <= 14);
}

namespace {

// The first few samples take longer than the monitor interval; later ones
// return at once. Records when each sample started.
class SlowStartSampler : public RawSampler {
public:
  SlowStartSampler(int slowCalls, std::chrono::milliseconds cost)
      : m_slowCalls(slowCalls), m_cost(cost) {}

  bool isReady() const override { return true; }

  bool sample(RawSample &out) override {
    int index;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      index = static_cast<int>(m_starts.size());
      m_starts.push_back(std::chrono::steady_clock::now());
    }
    if (index < m_slowCalls)
      std::this_thread::sleep_for(m_cost);
    out = rawSample(0, 0, kArrowShape);
    return true;
  }

  std::vector<std::chrono::steady_clock::time_point> starts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_starts;
  }

private:
  int m_slowCalls;
  std::chrono::milliseconds m_cost;
  mutable std::mutex m_mutex;
  std::vector<std::chrono::steady_clock::time_point> m_starts;
};

} // namespace

TEST_CASE("overrunning ticks run back to back without catching up",
          "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<SlowStartSampler>(3, 50ms);

  Monitor monitor(sampler, nullptr, fastOptions(40ms));
  REQUIRE(monitor.start());
  REQUIRE(waitFor([&] { return sampler->starts().size() >= 8; }, 3000ms));
  monitor.stop();

  auto starts = sampler->starts();
  auto gap = [&](size_t i) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(starts[i] -
                                                                 starts[i - 1]);
  };

  // A 50ms sample overruns the 40ms interval, so the next tick follows it
  // directly instead of waiting another interval.
  for (size_t i = 1; i <= 3; ++i) {
    INFO("slow gap " << i << ": " << gap(i).count() << "ms");
    CHECK(gap(i) < 75ms);
  }

  // Once samples are fast again the missed intervals are not replayed as a
  // burst; ticks go back to the regular spacing.
  for (size_t i = 4; i < starts.size(); ++i) {
    INFO("fast gap " << i << ": " << gap(i).count() << "ms");
    CHECK(gap(i) >= 30ms);
  }
}

TEST_CASE("stop wakes the loop promptly", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(0, 0, kArrowShape));

  Monitor monitor(sampler, nullptr, fastOptions(1000ms));
  REQUIRE(monitor.start());
  std::this_thread::sleep_for(20ms);

  auto before = std::chrono::steady_clock::now();
  monitor.stop();
  auto elapsed = std::chrono::steady_clock::now() - before;
  CHECK(elapsed < 500ms);
  CHECK_FALSE(monitor.isMonitoring());
}

TEST_CASE("run blocks until a handler stops it", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->push(rawSample(0, 0, kArrowShape));
  sampler->push(rawSample(5, 5, kArrowShape));

  Monitor monitor(sampler, nullptr, fastOptions());
  int seen = 0;
  bool ok = monitor.run([&](const CursorEvent &) {
    ++seen;
    monitor.stop();
  });

  CHECK(ok);
  CHECK(seen == 1);
  CHECK_FALSE(monitor.isMonitoring());
}

TEST_CASE("monitor can be restarted after stop", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(1, 1, kArrowShape));

  Monitor monitor(sampler, nullptr, fastOptions());
  REQUIRE(monitor.start());
  monitor.stop();
  REQUIRE(monitor.start());
  CHECK(monitor.isMonitoring());
  monitor.stop();
  CHECK_FALSE(monitor.isMonitoring());
}

TEST_CASE("tick is refused while the loop runs", "[thread]") {
  QuietLog quiet;
  auto sampler = std::make_shared<FakeSampler>();
  sampler->setCurrent(rawSample(1, 1, kArrowShape));

  Monitor monitor(sampler, nullptr, fastOptions());
  REQUIRE(monitor.start());
  CHECK_FALSE(monitor.tick());
  monitor.stop();
  CHECK(monitor.tick());
}
