#pragma once
// Version: software version and generation-backend protocol compatibility

#define SLEUTH_VERSION "1.4.0"
#define SLEUTH_PROTOCOL_VERSION_MAJOR 1
#define SLEUTH_PROTOCOL_VERSION_MINOR 0

namespace sleuth {
namespace version {

inline bool protocol_compatible(int major, int minor) {
    // Major version must match exactly (breaking changes)
    // Minor version: backend must be >= client (backward compatible additions)
    return major == SLEUTH_PROTOCOL_VERSION_MAJOR &&
           minor >= SLEUTH_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace sleuth
