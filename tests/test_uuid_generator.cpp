#include "uidgen/core/listener.h"
#include "uidgen/core/time.h"
#include "uidgen/core/time_source.h"
#include "uidgen/core/uuid_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

using namespace uidgen::core;

namespace {

// One tick past the epoch, so the first generate() differs from the initial state.
Timestamp one_tick_after_epoch() {
  return Timestamp(std::chrono::nanoseconds(100));
}

}  // namespace

TEST_CASE("Sequence number increases for identical ticks", "[generator]") {
  FixedTimeSource clock(one_tick_after_epoch());
  GeneratorOptions options;
  options.time_source = &clock;
  UuidGenerator generator(options);

  const auto first = generator.generate();
  const auto second = generator.generate();

  CHECK(first.timestamp() == second.timestamp());
  CHECK(first.sequence() == 0);
  CHECK(second.sequence() == 1);
}

TEST_CASE("Sequence number resets for a new tick", "[generator]") {
  FixedTimeSource clock(one_tick_after_epoch());
  GeneratorOptions options;
  options.time_source = &clock;
  UuidGenerator generator(options);

  const auto first = generator.generate();
  clock.advance(std::chrono::nanoseconds(100));
  const auto second = generator.generate();

  CHECK(first.timestamp() == second.timestamp() - 1);
  CHECK(first.sequence() == 0);
  CHECK(second.sequence() == 0);
}

TEST_CASE("Sub-tick clock movement keeps the same timestamp", "[generator]") {
  FixedTimeSource clock(Timestamp(std::chrono::seconds(5)));
  GeneratorOptions options;
  options.time_source = &clock;
  UuidGenerator generator(options);

  const auto first = generator.generate();
  clock.advance(std::chrono::nanoseconds(99));
  const auto second = generator.generate();

  CHECK(first.timestamp() == 5 * kTicksPerSecond);
  CHECK(second.timestamp() == first.timestamp());
  CHECK(second.sequence() == 1);
}

TEST_CASE("Sequence resets when the clock moves by whole microseconds", "[generator]") {
  FixedTimeSource clock(Timestamp(std::chrono::microseconds(10)));
  GeneratorOptions options;
  options.time_source = &clock;
  UuidGenerator generator(options);

  (void)generator.generate();
  (void)generator.generate();
  clock.advance(std::chrono::microseconds(1));
  const auto later = generator.generate();
  CHECK(later.sequence() == 0);
  CHECK(later.timestamp() == 110);
}

TEST_CASE("Successive ids never repeat timestamp and sequence", "[generator]") {
  FixedTimeSource clock(one_tick_after_epoch());
  GeneratorOptions options;
  options.time_source = &clock;
  options.node_address = 7;
  UuidGenerator generator(options);

  std::set<UniqueId> seen;
  UniqueId previous = generator.generate();
  seen.insert(previous);
  for (int i = 1; i < 1000; ++i) {
    if (i % 10 == 0) {
      clock.advance(std::chrono::nanoseconds(100));
    }
    const UniqueId current = generator.generate();
    CHECK((current.timestamp() != previous.timestamp() ||
           current.sequence() != previous.sequence()));
    CHECK(previous < current);
    seen.insert(current);
    previous = current;
  }
  CHECK(seen.size() == 1000);
}

TEST_CASE("Listener receives every generated id in order", "[generator][listener]") {
  std::vector<UniqueId> log;
  CallbackListener listener([&log](const UniqueId& id) { log.push_back(id); });

  GeneratorOptions options;
  options.listener = &listener;
  UuidGenerator generator(options);

  const auto first = generator.generate();
  const auto second = generator.generate();

  CHECK(log == std::vector<UniqueId>{first, second});
  CHECK(first != second);
}

TEST_CASE("Listener is invoked before generate returns", "[generator][listener]") {
  FixedTimeSource clock(one_tick_after_epoch());
  std::size_t calls = 0;
  CallbackListener listener([&calls](const UniqueId&) { ++calls; });

  GeneratorOptions options;
  options.time_source = &clock;
  options.listener = &listener;
  UuidGenerator generator(options);

  for (std::size_t i = 1; i <= 5; ++i) {
    (void)generator.generate();
    CHECK(calls == i);
  }
}

TEST_CASE("Listener exceptions propagate to the caller", "[generator][listener]") {
  FixedTimeSource clock(one_tick_after_epoch());
  bool fail = true;
  CallbackListener listener([&fail](const UniqueId&) {
    if (fail) {
      throw std::runtime_error("audit sink down");
    }
  });

  GeneratorOptions options;
  options.time_source = &clock;
  options.listener = &listener;
  UuidGenerator generator(options);

  CHECK_THROWS_AS(generator.generate(), std::runtime_error);

  // State advanced before the listener ran: the next id continues the sequence.
  fail = false;
  const auto next = generator.generate();
  CHECK(next.sequence() == 1);
}

TEST_CASE("Node address passes through", "[generator]") {
  GeneratorOptions options;
  options.node_address = 42;
  UuidGenerator generator(options);

  CHECK(generator.node_address() == 42);
  for (int i = 0; i < 10; ++i) {
    CHECK(generator.generate().node_address() == 42);
  }
}

TEST_CASE("Negative node address passes through", "[generator]") {
  GeneratorOptions options;
  options.node_address = -42;
  UuidGenerator generator(options);

  CHECK(generator.generate().node_address() == -42);
}

TEST_CASE("Default generator keeps one node address", "[generator]") {
  auto generator = UuidGenerator::make();
  const auto node = generator.node_address();

  CHECK(generator.generate().node_address() == node);
  CHECK(generator.generate().node_address() == node);
}

TEST_CASE("Default generator produces sensible ticks", "[generator]") {
  auto generator = UuidGenerator::make();

  const auto before_ms = to_unix_millis(now_utc());
  const auto id = generator.generate();
  const auto after_ms = to_unix_millis(now_utc());

  // 10'000 ticks per millisecond
  const auto id_ms = id.timestamp() / 10'000;
  CHECK(id_ms >= before_ms - 1);
  CHECK(id_ms <= after_ms + 1);
}

TEST_CASE("First id at the epoch continues from the zero initial state", "[generator]") {
  FixedTimeSource clock{Timestamp{}};
  GeneratorOptions options;
  options.time_source = &clock;
  UuidGenerator generator(options);

  // The initial last timestamp is 0, so an id minted at tick 0 is treated as a repeat.
  const auto first = generator.generate();
  CHECK(first.timestamp() == 0);
  CHECK(first.sequence() == 1);
}

TEST_CASE("Generator resumes after a previously issued id", "[generator]") {
  FixedTimeSource clock(one_tick_after_epoch());
  GeneratorOptions options;
  options.node_address = 3;
  options.time_source = &clock;
  options.resume_after = UniqueId{1, 3, 41};
  UuidGenerator generator(options);

  CHECK(generator.generate() == UniqueId{1, 3, 42});

  clock.advance(std::chrono::nanoseconds(100));
  CHECK(generator.generate() == UniqueId{2, 3, 0});
}

TEST_CASE("Exhausted sequence within one tick throws instead of wrapping", "[generator]") {
  constexpr auto kMaxSequence = std::numeric_limits<std::int32_t>::max();

  FixedTimeSource clock(one_tick_after_epoch());
  std::vector<UniqueId> seen;
  CallbackListener listener([&seen](const UniqueId& id) { seen.push_back(id); });

  GeneratorOptions options;
  options.node_address = 1;
  options.time_source = &clock;
  options.listener = &listener;
  options.resume_after = UniqueId{1, 1, kMaxSequence - 1};
  UuidGenerator generator(options);

  const auto last = generator.generate();
  CHECK(last.sequence() == kMaxSequence);

  CHECK_THROWS_AS(generator.generate(), std::overflow_error);
  CHECK_THROWS_AS(generator.generate(), std::overflow_error);
  CHECK(seen.size() == 1);

  // A new tick starts a fresh sequence.
  clock.advance(std::chrono::nanoseconds(100));
  const auto next = generator.generate();
  CHECK(next.timestamp() == 2);
  CHECK(next.sequence() == 0);
  CHECK(last < next);
}
