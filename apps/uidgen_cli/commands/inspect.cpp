#include "inspect.h"

#include "uidgen/core/node_address.h"
#include "uidgen/core/time.h"
#include "uidgen/core/unique_id.h"
#include "uidgen/core/unique_id_json.h"
#include "uidgen/core/version.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

int cmd_parse(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    std::cerr << "Usage: uidgen_cli parse <id>\n";
    return 1;
  }

  const std::string text = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto parsed = uidgen::core::parse_unique_id(text);
  if (!parsed.has_value()) {
    std::cerr << "Error: cannot parse '" << text
              << "': " << uidgen::core::parse_error_to_string(parsed.error()) << "\n";
    return 1;
  }

  const auto& id = parsed.value();
  nlohmann::json out = uidgen::core::unique_id_to_json(id);
  out["unique_id"] = id.to_string();

  // Timestamp back to an instant; ticks beyond the nanosecond range have no calendar form.
  constexpr auto kMaxTicks = std::numeric_limits<std::int64_t>::max() / uidgen::core::kNanosPerTick;
  if (id.timestamp() >= -kMaxTicks && id.timestamp() <= kMaxTicks) {
    const auto since_epoch = std::chrono::duration_cast<uidgen::core::Clock::duration>(
        std::chrono::nanoseconds(id.timestamp() * uidgen::core::kNanosPerTick));
    out["generated_at"] = uidgen::core::to_iso8601(uidgen::core::Timestamp(since_epoch));
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_node_address() {
  std::cout << uidgen::core::resolve_default_node_address() << "\n";
  return 0;
}

int cmd_version() {
  std::cout << "uidgen " << uidgen::core::kBuildVersion << "\n";
  return 0;
}
