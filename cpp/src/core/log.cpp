#include "medley/core/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace medley::core {

namespace {
    std::mutex g_log_mutex;

    std::shared_ptr<spdlog::logger> get_or_create_locked() {
        auto lg = spdlog::get(kLoggerName);
        if (!lg) {
            lg = spdlog::stderr_color_mt(kLoggerName);
            lg->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%n] %v");
            lg->set_level(spdlog::level::info);
        }
        return lg;
    }
} // namespace

void log_init(std::string_view level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    auto lg = get_or_create_locked();
    // from_str maps unknown names to off; keep info for those
    const auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        lg->set_level(spdlog::level::info);
    } else {
        lg->set_level(parsed);
    }
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return get_or_create_locked();
}

} // namespace medley::core
