#pragma once

namespace pltx {

/// Version information
struct Version {
    static constexpr int MAJOR = PLTX_VERSION_MAJOR;
    static constexpr int MINOR = PLTX_VERSION_MINOR;
    static constexpr int PATCH = PLTX_VERSION_PATCH;
    
    static const char* get_version_string();
};

} // namespace pltx
