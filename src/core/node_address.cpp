#include "uidgen/core/node_address.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#ifdef __linux__
#include <netpacket/packet.h>
#endif

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace uidgen::core {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

struct IfAddrsDeleter {
  void operator()(ifaddrs* addrs) const {
    if (addrs != nullptr) {
      freeifaddrs(addrs);
    }
  }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;
using IfAddrsPtr = std::unique_ptr<ifaddrs, IfAddrsDeleter>;

bool same_address(const sockaddr* a, const sockaddr* b) {
  if (a == nullptr || b == nullptr || a->sa_family != b->sa_family) {
    return false;
  }
  if (a->sa_family == AF_INET) {
    const auto* a4 = reinterpret_cast<const sockaddr_in*>(a);  // NOLINT
    const auto* b4 = reinterpret_cast<const sockaddr_in*>(b);  // NOLINT
    return a4->sin_addr.s_addr == b4->sin_addr.s_addr;
  }
  if (a->sa_family == AF_INET6) {
    const auto* a6 = reinterpret_cast<const sockaddr_in6*>(a);  // NOLINT
    const auto* b6 = reinterpret_cast<const sockaddr_in6*>(b);  // NOLINT
    return std::memcmp(&a6->sin6_addr, &b6->sin6_addr, sizeof(in6_addr)) == 0;
  }
  return false;
}

// Name of the interface carrying any of the given addresses, or "" if none does.
std::string find_interface_name(const ifaddrs* interfaces, const addrinfo* host_addrs) {
  for (const ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
    for (const addrinfo* ai = host_addrs; ai != nullptr; ai = ai->ai_next) {
      if (same_address(ifa->ifa_addr, ai->ai_addr)) {
        return ifa->ifa_name;
      }
    }
  }
  return "";
}

std::optional<std::vector<unsigned char>> find_hardware_address(const ifaddrs* interfaces,
                                                                const std::string& name) {
#ifdef __linux__
  for (const ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET ||
        name != ifa->ifa_name) {
      continue;
    }
    const auto* link = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);  // NOLINT
    const auto length = std::min<std::size_t>(link->sll_halen, sizeof(link->sll_addr));
    return std::vector<unsigned char>(link->sll_addr, link->sll_addr + length);
  }
#else
  (void)interfaces;
  (void)name;
#endif
  return std::nullopt;
}

}  // namespace

std::optional<std::int64_t> hardware_address_to_node_address(std::span<const unsigned char> bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }

  std::uint64_t value = (bytes.front() & 0x80U) != 0 ? ~std::uint64_t{0} : std::uint64_t{0};
  for (const unsigned char b : bytes) {
    value = (value << 8U) | b;
  }
  return static_cast<std::int64_t>(value);
}

std::optional<std::int64_t> probe_host_hardware_address() {
  std::array<char, 256> hostname{};
  if (gethostname(hostname.data(), hostname.size() - 1) != 0) {
    return std::nullopt;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* raw_host_addrs = nullptr;
  if (getaddrinfo(hostname.data(), nullptr, &hints, &raw_host_addrs) != 0) {
    return std::nullopt;
  }
  const AddrInfoPtr host_addrs(raw_host_addrs);

  ifaddrs* raw_interfaces = nullptr;
  if (getifaddrs(&raw_interfaces) != 0) {
    return std::nullopt;
  }
  const IfAddrsPtr interfaces(raw_interfaces);

  const std::string name = find_interface_name(interfaces.get(), host_addrs.get());
  if (name.empty()) {
    return std::nullopt;
  }

  const auto hardware = find_hardware_address(interfaces.get(), name);
  if (!hardware.has_value() ||
      std::all_of(hardware->begin(), hardware->end(), [](unsigned char b) { return b == 0; })) {
    return std::nullopt;
  }

  return hardware_address_to_node_address(*hardware);
}

std::int64_t random_node_address() {
  std::random_device device;
  std::seed_seq seed{device(), device(), device(), device()};
  std::mt19937_64 engine(seed);
  std::uniform_int_distribution<std::int64_t> dist(std::numeric_limits<std::int64_t>::min(),
                                                   std::numeric_limits<std::int64_t>::max());
  return dist(engine);
}

std::int64_t resolve_default_node_address() noexcept {
  try {
    if (const auto hardware = probe_host_hardware_address()) {
      return *hardware;
    }
  } catch (const std::exception&) {
    // Host lookup failure selects the random fallback below.
  }

  try {
    return random_node_address();
  } catch (const std::exception&) {
    // No entropy source: seed from the clock instead.
  }

  std::mt19937_64 engine(
      static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
  return static_cast<std::int64_t>(engine());
}

}  // namespace uidgen::core
