#pragma once

namespace uidgen::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.2";

}  // namespace uidgen::core
