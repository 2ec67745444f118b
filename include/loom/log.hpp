#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#define LOOM_LOG_TRACE(...) ::loom::logger()->trace(__VA_ARGS__)
#define LOOM_LOG_DEBUG(...) ::loom::logger()->debug(__VA_ARGS__)
#define LOOM_LOG_INFO(...) ::loom::logger()->info(__VA_ARGS__)
#define LOOM_LOG_WARN(...) ::loom::logger()->warn(__VA_ARGS__)
#define LOOM_LOG_ERROR(...) ::loom::logger()->error(__VA_ARGS__)
#define LOOM_LOG_CRITICAL(...) ::loom::logger()->critical(__VA_ARGS__)

namespace loom
{
constexpr const char* logger_name = "loom";

struct log_config
{
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};

// Library logger, created on first use with a stderr colour sink
std::shared_ptr<spdlog::logger> logger();

void configure_logging(const log_config& config);

void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "err", "critical", "off")
// as well as "warning" and "error"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);
} // namespace loom
