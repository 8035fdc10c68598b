#include "excelpager/core/Config.hpp"
#include "excelpager/core/Exception.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace excelpager {
namespace core {

namespace {

const char* const kKnownKeys[] = {
    "API_KEY", "DATA_DIR", "PER_PAGE", "RATE_LIMIT", "BIND_ADDRESS", "PORT",
    "SHEET_SELECTION", "ROW_COUNT_MODE", "REQUEST_TIMEOUT_MS", "CONNECTION_TIMEOUT_MS",
    "LOG_FILE", "LOG_LEVEL", "LOG_CONSOLE"
};

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int64_t parseInteger(const std::string& key, const std::string& text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || text.empty()) {
        throw ConfigException(fmt::format("Invalid integer value '{}'", text), key);
    }
    return value;
}

bool parseBool(const std::string& key, const std::string& text) {
    std::string lowered = toLower(text);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") return false;
    throw ConfigException(fmt::format("Invalid boolean value '{}'", text), key);
}

const std::string* find(const ServiceConfig::Values& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace

const char* toString(SheetSelectionMode mode) {
    return mode == SheetSelectionMode::FirstSheet ? "first-sheet" : "require-name";
}

const char* toString(RowCountMode mode) {
    return mode == RowCountMode::Dimension ? "dimension" : "scan";
}

RateLimitSpec RateLimitSpec::parse(const std::string& text) {
    std::istringstream iss(toLower(trim(text)));
    std::string count_text;
    std::string per;
    std::string unit;
    std::string extra;
    if (!(iss >> count_text >> per >> unit) || (iss >> extra) || per != "per") {
        throw ConfigException(fmt::format("Invalid rate limit '{}', expected '<n> per <unit>'", text),
                              "RATE_LIMIT");
    }

    int64_t count = parseInteger("RATE_LIMIT", count_text);
    if (count <= 0 || count > UINT32_MAX) {
        throw ConfigException(fmt::format("Rate limit count out of range: {}", count), "RATE_LIMIT");
    }

    if (unit.size() > 1 && unit.back() == 's') {
        unit.pop_back();
    }

    RateLimitSpec spec;
    spec.requests = static_cast<uint32_t>(count);
    if (unit == "second") {
        spec.window = std::chrono::seconds(1);
    } else if (unit == "minute") {
        spec.window = std::chrono::seconds(60);
    } else if (unit == "hour") {
        spec.window = std::chrono::seconds(3600);
    } else if (unit == "day") {
        spec.window = std::chrono::seconds(86400);
    } else {
        throw ConfigException(fmt::format("Unknown rate limit unit '{}'", unit), "RATE_LIMIT");
    }
    return spec;
}

std::string RateLimitSpec::toString() const {
    switch (window.count()) {
        case 1: return fmt::format("{} per second", requests);
        case 60: return fmt::format("{} per minute", requests);
        case 3600: return fmt::format("{} per hour", requests);
        case 86400: return fmt::format("{} per day", requests);
        default: return fmt::format("{} per {}s", requests, window.count());
    }
}

ServiceConfig::Values ServiceConfig::parseEnvFile(const std::string& content) {
    Values values;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        if (stripped.compare(0, 7, "export ") == 0) {
            stripped = trim(stripped.substr(7));
        }

        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            CORE_WARN("Ignoring malformed .env line: {}", stripped);
            continue;
        }

        std::string key = trim(stripped.substr(0, eq));
        std::string value = trim(stripped.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // 未加引号的值允许行尾注释
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }
        if (!key.empty()) {
            values[key] = value;
        }
    }
    return values;
}

ServiceConfig ServiceConfig::fromEnvironment(const std::string& env_file) {
    Values values;

    if (!env_file.empty()) {
        std::ifstream in(env_file, std::ios::binary);
        if (in) {
            std::ostringstream content;
            content << in.rdbuf();
            values = parseEnvFile(content.str());
        }
    }

    for (const char* key : kKnownKeys) {
        if (const char* env = std::getenv(key)) {
            values[key] = env;
        }
    }

    return fromValues(values);
}

ServiceConfig ServiceConfig::fromValues(const Values& values) {
    ServiceConfig config;

    const std::string* api_key = find(values, "API_KEY");
    if (!api_key || api_key->empty()) {
        throw ConfigException("API_KEY must be set", "API_KEY");
    }
    config.api_key_ = *api_key;

    if (const auto* v = find(values, "DATA_DIR")) {
        if (v->empty()) {
            throw ConfigException("DATA_DIR must not be empty", "DATA_DIR");
        }
        config.data_dir_ = Path(*v);
    }

    if (const auto* v = find(values, "PER_PAGE")) {
        config.per_page_ = parseInteger("PER_PAGE", *v);
        if (config.per_page_ <= 0) {
            throw ConfigException("PER_PAGE must be positive", "PER_PAGE");
        }
    }

    if (const auto* v = find(values, "RATE_LIMIT")) {
        config.rate_limit_ = RateLimitSpec::parse(*v);
    }

    if (const auto* v = find(values, "BIND_ADDRESS")) {
        if (v->empty()) {
            throw ConfigException("BIND_ADDRESS must not be empty", "BIND_ADDRESS");
        }
        config.bind_address_ = *v;
    }

    if (const auto* v = find(values, "PORT")) {
        int64_t port = parseInteger("PORT", *v);
        if (port < 0 || port > 65535) {
            throw ConfigException(fmt::format("PORT out of range: {}", port), "PORT");
        }
        config.port_ = static_cast<uint16_t>(port);
    }

    if (const auto* v = find(values, "SHEET_SELECTION")) {
        std::string mode = toLower(*v);
        if (mode == "require-name") {
            config.sheet_selection_ = SheetSelectionMode::RequireName;
        } else if (mode == "first-sheet") {
            config.sheet_selection_ = SheetSelectionMode::FirstSheet;
        } else {
            throw ConfigException(fmt::format("Unknown sheet selection mode '{}'", *v), "SHEET_SELECTION");
        }
    }

    if (const auto* v = find(values, "ROW_COUNT_MODE")) {
        std::string mode = toLower(*v);
        if (mode == "scan") {
            config.row_count_mode_ = RowCountMode::Scan;
        } else if (mode == "dimension") {
            config.row_count_mode_ = RowCountMode::Dimension;
        } else {
            throw ConfigException(fmt::format("Unknown row count mode '{}'", *v), "ROW_COUNT_MODE");
        }
    }

    if (const auto* v = find(values, "REQUEST_TIMEOUT_MS")) {
        int64_t timeout = parseInteger("REQUEST_TIMEOUT_MS", *v);
        if (timeout < 0) {
            throw ConfigException("REQUEST_TIMEOUT_MS must not be negative", "REQUEST_TIMEOUT_MS");
        }
        config.request_timeout_ = std::chrono::milliseconds(timeout);
    }

    if (const auto* v = find(values, "CONNECTION_TIMEOUT_MS")) {
        int64_t timeout = parseInteger("CONNECTION_TIMEOUT_MS", *v);
        if (timeout <= 0) {
            throw ConfigException("CONNECTION_TIMEOUT_MS must be positive", "CONNECTION_TIMEOUT_MS");
        }
        config.connection_timeout_ = std::chrono::milliseconds(timeout);
    }

    if (const auto* v = find(values, "LOG_FILE")) {
        config.log_file_ = *v;
    }

    if (const auto* v = find(values, "LOG_LEVEL")) {
        if (!Logger::parseLevel(*v, config.log_level_)) {
            throw ConfigException(fmt::format("Unknown log level '{}'", *v), "LOG_LEVEL");
        }
    }

    if (const auto* v = find(values, "LOG_CONSOLE")) {
        config.log_console_ = parseBool("LOG_CONSOLE", *v);
    }

    return config;
}

void ServiceConfig::validate() const {
    if (!data_dir_.exists()) {
        throw ConfigException(fmt::format("Data directory does not exist: {}", data_dir_.string()), "DATA_DIR");
    }
    if (!data_dir_.isDirectory()) {
        throw ConfigException(fmt::format("Data directory is not a directory: {}", data_dir_.string()), "DATA_DIR");
    }
}

}} // namespace excelpager::core
