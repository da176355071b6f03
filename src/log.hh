#pragma once

#include <spdlog/spdlog.h>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace forsale::log {
static const constexpr char LOGGER_NAME[] = "forsale";

struct LogConfig {
    std::string level{"info"};
    std::string pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
};

struct Field {
    std::string key;
    std::string value;
};

Field field(std::string_view key, std::string_view value);
Field field(std::string_view key, int64_t value);
Field bool_field(std::string_view key, bool value);

// Replaces the `forsale` logger, FORSALE_LOG_LEVEL and FORSALE_LOG_PATTERN take precedence over `config`.
void init(const LogConfig &config);

// Returns the `forsale` logger, creating it with the defaults when `init` was never called.
std::shared_ptr<spdlog::logger> logger();

// Logs `message` followed by space separated key=value fields.
void write(spdlog::level::level_enum level, std::string_view message, std::initializer_list<Field> fields = {});

inline void debug(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::debug, message, fields);
}

inline void info(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::info, message, fields);
}

inline void warn(std::string_view message, std::initializer_list<Field> fields = {}) {
    write(spdlog::level::warn, message, fields);
}
}  // namespace forsale::log
