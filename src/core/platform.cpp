#include "agentcfg/core/platform.hpp"

#ifdef AGENTCFG_PLATFORM_WINDOWS
    #include <io.h>
    #include <cstdio>
#endif

namespace agentcfg {

bool is_interactive_terminal() {
#ifdef AGENTCFG_PLATFORM_WINDOWS
    return _isatty(_fileno(stdin)) != 0 && _isatty(_fileno(stdout)) != 0;
#else
    return ::isatty(STDIN_FILENO) != 0 && ::isatty(STDOUT_FILENO) != 0;
#endif
}

} // namespace agentcfg
