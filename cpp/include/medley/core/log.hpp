#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace medley::core {

    inline constexpr const char* kLoggerName = "medley";

    // Creates (or reconfigures) the "medley" stderr logger.
    // Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
    void log_init(std::string_view level);

    // Returns the "medley" logger, creating it at info level on first use.
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace medley::core
