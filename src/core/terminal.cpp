#include <ftc_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace ftc_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveLogColor(std::optional<bool> forced) {
    if (forced.has_value()) {
        return *forced;
    }
    return IsStderrTty() && !NoColorEnvSet();
}

} // namespace ftc_mcp
