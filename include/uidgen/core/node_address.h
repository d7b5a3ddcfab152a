#pragma once

#include <cstdint>
#include <optional>
#include <span>

namespace uidgen::core {

// hardware_address_to_node_address interprets raw address bytes as a big-endian
// two's-complement integer, sign-extended from the first byte. When more than 8 bytes
// are given only the low-order 64 bits are kept.
//
// Returns nullopt for an empty address.
[[nodiscard]] std::optional<std::int64_t> hardware_address_to_node_address(
    std::span<const unsigned char> bytes);

// probe_host_hardware_address resolves the local hostname, finds the network interface
// carrying one of its addresses, and converts that interface's hardware (MAC) address.
//
// Returns nullopt when the hostname does not resolve, no interface carries the address,
// or the interface has no hardware address (loopback reports all zeros).
[[nodiscard]] std::optional<std::int64_t> probe_host_hardware_address();

// random_node_address draws a uniformly distributed 64-bit value.
// May throw if the platform entropy source is unavailable.
[[nodiscard]] std::int64_t random_node_address();

// resolve_default_node_address returns the host's hardware address, or a random value
// when it cannot be determined. Never throws.
[[nodiscard]] std::int64_t resolve_default_node_address() noexcept;

}  // namespace uidgen::core
