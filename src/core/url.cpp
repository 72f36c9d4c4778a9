#include <ftc_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace ftc_mcp {

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string EventPath(std::string_view event_id, std::string_view resource) {
    return "/events/" + UrlEncode(event_id) + "/" + std::string(resource);
}

} // namespace ftc_mcp
