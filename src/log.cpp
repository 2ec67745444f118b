#include "loom/log.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace loom
{
namespace
{
struct logger_registry
{
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> instance;
    log_config config;
};

logger_registry& registry()
{
    static logger_registry reg;
    return reg;
}
} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (reg.instance)
        return reg.instance;

    // Another component may have registered a logger under our name already
    reg.instance = spdlog::get(logger_name);
    if (!reg.instance)
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        reg.instance = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
        spdlog::register_logger(reg.instance);
    }

    reg.instance->set_pattern(reg.config.pattern);
    reg.instance->set_level(reg.config.level);

    return reg.instance;
}

void configure_logging(const log_config& config)
{
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        reg.config = config;
        if (!reg.instance)
            return;
    }

    const auto instance = logger();
    instance->set_pattern(config.pattern);
    instance->set_level(config.level);
}

void set_log_level(spdlog::level::level_enum level)
{
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        reg.config.level = level;
    }

    logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str)
{
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning")
        return spdlog::level::warn;
    if (lower == "error")
        return spdlog::level::err;

    const auto level = spdlog::level::from_str(lower);

    // from_str() falls back to "off" for unknown names
    if (level == spdlog::level::off && lower != "off")
        return std::nullopt;

    return level;
}
} // namespace loom
