#include <ftc_mcp/config/dotenv.hpp>

#include <ftc_mcp/core/log.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace ftc_mcp {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool IsValidKey(std::string_view key) {
    if (key.empty() || std::isdigit(static_cast<unsigned char>(key.front()))) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string UnquoteValue(std::string_view raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'')) {
        const char quote = raw.front();
        const auto close = raw.find(quote, 1);
        if (close != std::string_view::npos) {
            std::string value(raw.substr(1, close - 1));
            if (quote == '"') {
                std::string unescaped;
                for (size_t i = 0; i < value.size(); ++i) {
                    if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == 'n') {
                        unescaped += '\n';
                        ++i;
                    } else {
                        unescaped += value[i];
                    }
                }
                return unescaped;
            }
            return value;
        }
    }
    // Unquoted: a " #" starts an inline comment.
    const auto comment = raw.find(" #");
    if (comment != std::string_view::npos) {
        raw = raw.substr(0, comment);
    }
    return std::string(Trim(raw));
}

} // anonymous namespace

DotEnvEntries ParseDotEnv(std::string_view content) {
    DotEnvEntries entries;
    size_t line_no = 0;
    while (!content.empty()) {
        const auto eol = content.find('\n');
        std::string_view line = content.substr(0, eol);
        content = eol == std::string_view::npos ? std::string_view{}
                                                : content.substr(eol + 1);
        ++line_no;

        line = Trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        constexpr std::string_view kExport = "export ";
        if (line.substr(0, kExport.size()) == kExport) {
            line = Trim(line.substr(kExport.size()));
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            LogWarn("config", ".env line " + std::to_string(line_no) +
                                  ": missing '=', skipped");
            continue;
        }
        const auto key = Trim(line.substr(0, eq));
        if (!IsValidKey(key)) {
            LogWarn("config", ".env line " + std::to_string(line_no) +
                                  ": invalid variable name, skipped");
            continue;
        }
        entries.emplace_back(std::string(key),
                             UnquoteValue(Trim(line.substr(eq + 1))));
    }
    return entries;
}

Result<size_t, Error> LoadDotEnv(std::string_view path) {
    std::ifstream in{std::string(path)};
    if (!in) {
        LogDebug("config", "No .env file at " + std::string(path));
        return Result<size_t, Error>::Ok(0);
    }
    std::ostringstream content;
    content << in.rdbuf();

    size_t applied = 0;
    for (const auto& [key, value] : ParseDotEnv(content.str())) {
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
            return Result<size_t, Error>::Err(Error{
                "LoadDotEnv", std::string(path), std::nullopt,
                "Failed to set " + key + ": " + std::strerror(errno),
                std::nullopt, ErrorCategory::Configuration});
        }
        ++applied;
    }
    LogDebug("config", "Loaded " + std::to_string(applied) + " variable(s) from " +
                           std::string(path));
    return Result<size_t, Error>::Ok(applied);
}

} // namespace ftc_mcp
