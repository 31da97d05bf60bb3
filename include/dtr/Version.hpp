#pragma once

#define DTR_VERSION_MAJOR 0
#define DTR_VERSION_MINOR 2
#define DTR_VERSION_PATCH 0

#define DTR_VERSION_HEX ((DTR_VERSION_MAJOR<<16) | (DTR_VERSION_MINOR<<8) | (DTR_VERSION_PATCH))

namespace dtr {
inline constexpr int version_major = DTR_VERSION_MAJOR;
inline constexpr int version_minor = DTR_VERSION_MINOR;
inline constexpr int version_patch = DTR_VERSION_PATCH;
} // namespace dtr
