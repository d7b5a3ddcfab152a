#pragma once

#include "uidgen/core/result.h"

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace uidgen::core {

// UniqueId is a time-ordered identifier: (timestamp, node_address, sequence).
//
// - timestamp:    100ns ticks since the Unix epoch
// - node_address: identifies the generator instance that minted the id
// - sequence:     disambiguates ids from one generator within a single tick
//
// Immutable value type. Ordering is lexicographic over the fields in declaration order,
// so sorting a set of ids sorts by time first, then node address, then sequence.
// Equality is field-by-field.
class UniqueId {
 public:
  constexpr UniqueId() = default;
  constexpr UniqueId(std::int64_t timestamp, std::int64_t node_address, std::int32_t sequence)
      : timestamp_(timestamp), node_address_(node_address), sequence_(sequence) {}

  [[nodiscard]] constexpr std::int64_t timestamp() const { return timestamp_; }
  [[nodiscard]] constexpr std::int64_t node_address() const { return node_address_; }
  [[nodiscard]] constexpr std::int32_t sequence() const { return sequence_; }

  // Canonical text form "{timestamp}-{node_address}-{sequence}", e.g. "1-2-3".
  // No padding; negative fields keep their leading '-'.
  [[nodiscard]] std::string to_string() const;

  auto operator<=>(const UniqueId&) const = default;

 private:
  std::int64_t timestamp_{0};
  std::int64_t node_address_{0};
  std::int32_t sequence_{0};
};

// compare returns a negative value, zero, or a positive value as a orders before,
// equal to, or after b.
[[nodiscard]] int compare(const UniqueId& a, const UniqueId& b);

std::ostream& operator<<(std::ostream& os, const UniqueId& id);

// parse_unique_id accepts exactly the canonical text form produced by UniqueId::to_string().
//
// Each field is an optional '-' followed by decimal digits; fields are separated by a single '-'.
// So "5--7-0" parses as {5, -7, 0}. The sequence field must be non-negative.
[[nodiscard]] Result<UniqueId, ParseError> parse_unique_id(std::string_view text);

}  // namespace uidgen::core
