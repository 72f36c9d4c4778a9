#include <ftc_mcp/core/timestamp.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ftc_mcp {

std::string Iso8601(std::chrono::system_clock::time_point tp) {
    const auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_tp, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string Iso8601Now() {
    return Iso8601(std::chrono::system_clock::now());
}

} // namespace ftc_mcp
