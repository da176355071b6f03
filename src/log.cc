#include "log.hh"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace forsale::log {
namespace {
std::mutex logger_mutex;

std::string resolve(const char *env, const std::string &configured) {
    if (const char *value = std::getenv(env); value != nullptr && *value != '\0') return value;
    return configured;
}

std::shared_ptr<spdlog::logger> create_logger(const LogConfig &config) {
    spdlog::drop(LOGGER_NAME);
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern(resolve("FORSALE_LOG_PATTERN", config.pattern));
    logger->set_level(spdlog::level::from_str(resolve("FORSALE_LOG_LEVEL", config.level)));
    logger->flush_on(spdlog::level::warn);
    return logger;
}
}  // namespace

Field field(std::string_view key, std::string_view value) { return {std::string{key}, std::string{value}}; }

Field field(std::string_view key, int64_t value) { return {std::string{key}, std::to_string(value)}; }

Field bool_field(std::string_view key, bool value) { return {std::string{key}, value ? "true" : "false"}; }

void init(const LogConfig &config) {
    std::lock_guard lock{logger_mutex};
    create_logger(config);
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) return existing;

    std::lock_guard lock{logger_mutex};
    if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
    return create_logger(LogConfig{});
}

void write(spdlog::level::level_enum level, std::string_view message, std::initializer_list<Field> fields) {
    auto target = logger();
    if (!target->should_log(level)) return;

    std::string line{message};
    for (const auto &field : fields) {
        line += ' ';
        line += field.key;
        line += '=';
        line += field.value;
    }
    target->log(level, line);
}
}  // namespace forsale::log
