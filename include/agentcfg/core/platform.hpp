#pragma once

#ifdef _WIN32
    #define AGENTCFG_PLATFORM_WINDOWS
#else
    #define AGENTCFG_PLATFORM_POSIX
    #include <unistd.h>
#endif

namespace agentcfg {

enum class Platform {
    Windows,
    Posix,
    Unknown
};

inline Platform get_platform() {
#ifdef AGENTCFG_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(AGENTCFG_PLATFORM_POSIX)
    return Platform::Posix;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch(get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Posix: return "POSIX";
        default: return "Unknown";
    }
}

/// Environment variable holding the user's home directory on this platform.
inline const char* home_variable() {
    return get_platform() == Platform::Windows ? "USERPROFILE" : "HOME";
}

/// True when both standard input and standard output are attached to a terminal.
bool is_interactive_terminal();

} // namespace agentcfg
