#pragma once

#include <string>

#include "medley/core/errors.hpp"
#include "medley/core/types.hpp"

namespace medley::core {

    inline constexpr u64 kDefaultMaxUploadBytes = 500ull * 1024ull * 1024ull;

    struct MedleyConfig {
        std::string data_root{"./medley-data"};  // blob root for the server tier
        std::string db_path;                     // empty = {data_root}/catalog.db
        std::string mirror_db_path;              // empty = no client tier
        std::string cache_root;                  // empty = {data_root}/cache
        std::string log_level{"info"};
        bool strict_cascade{false};
        u64 max_upload_bytes{kDefaultMaxUploadBytes};
    };

    // Overlays MEDLEY_* environment variables onto *cfg.
    // Returns Invalid (aux = index of the offending variable) when a value does not parse;
    // variables before it are already applied.
    [[nodiscard]] Status load_config_from_env(MedleyConfig* cfg) noexcept;

    [[nodiscard]] std::string resolved_db_path(const MedleyConfig& cfg);
    [[nodiscard]] std::string resolved_cache_root(const MedleyConfig& cfg);

} // namespace medley::core
