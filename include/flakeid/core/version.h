#pragma once

namespace flakeid::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "1.2";

}  // namespace flakeid::core
