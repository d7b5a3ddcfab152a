#pragma once

#include "uidgen/core/listener.h"
#include "uidgen/core/time_source.h"
#include "uidgen/core/unique_id.h"

#include <cstdint>
#include <optional>

namespace uidgen::core {

// GeneratorOptions configures a UuidGenerator. Every field is optional and independent.
//
// - node_address: pins the node identifier; when absent, resolve_default_node_address()
//                 is used (host hardware address, else a random value)
// - time_source:  non-owning; defaults to the system clock
// - listener:     non-owning; notified of every generated id; none by default
// - resume_after: continue after a previously issued id, taking its timestamp and
//                 sequence as the last state; starts from timestamp 0, sequence 0 otherwise
//
// Pointed-to objects must outlive the generator.
struct GeneratorOptions {
  std::optional<std::int64_t> node_address;  // NOLINT(readability-identifier-naming)
  ITimeSource* time_source{nullptr};         // NOLINT(readability-identifier-naming)
  IUniqueIdListener* listener{nullptr};      // NOLINT(readability-identifier-naming)
  std::optional<UniqueId> resume_after;      // NOLINT(readability-identifier-naming)
};

// UuidGenerator mints identifiers following the time-based UUID template:
// (100ns ticks since epoch, node address, per-tick sequence number).
//
// A single instance never produces the same (timestamp, sequence) pair twice while its
// time source does not repeat past ticks. Ids are unique across instances only if each
// instance has a distinct node address.
//
// Not thread-safe: generate() mutates internal state without locking. Callers sharing an
// instance across threads must serialize access externally.
class UuidGenerator {
 public:
  explicit UuidGenerator(const GeneratorOptions& options = {});
  ~UuidGenerator() = default;

  // Not copyable or movable: a copy would repeat the original's future ids.
  UuidGenerator(const UuidGenerator&) = delete;
  UuidGenerator& operator=(const UuidGenerator&) = delete;
  UuidGenerator(UuidGenerator&&) = delete;
  UuidGenerator& operator=(UuidGenerator&&) = delete;

  // A generator with default settings for every option.
  [[nodiscard]] static UuidGenerator make() { return UuidGenerator(GeneratorOptions{}); }

  // Produce the next identifier and notify the listener, if any.
  // Exceptions from the listener propagate to the caller; the internal state has already
  // advanced when that happens.
  // Throws std::overflow_error when every sequence number of the current tick is used up;
  // the state is left unchanged, and generation resumes once the time source moves on.
  UniqueId generate();

  [[nodiscard]] std::int64_t node_address() const { return node_address_; }

 private:
  SystemTimeSource system_time_source_;
  ITimeSource* time_source_;
  IUniqueIdListener* listener_;
  std::int64_t node_address_;

  // Last timestamp produced and the sequence number issued for it.
  std::int64_t last_timestamp_{0};
  std::int32_t sequence_{0};
};

}  // namespace uidgen::core
