#include "medley/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace medley::core {

namespace {
    [[nodiscard]] const char* env_or_null(const char* name) noexcept {
        const char* v = std::getenv(name);
        if (v == nullptr || v[0] == '\0') {
            return nullptr;
        }
        return v;
    }

    [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
        const char* end = s + std::strlen(s);
        u64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }
} // namespace

Status load_config_from_env(MedleyConfig* cfg) noexcept {
    if (cfg == nullptr) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    try {
        if (const char* v = env_or_null("MEDLEY_DATA_ROOT")) {
            cfg->data_root = v;
        }
        if (const char* v = env_or_null("MEDLEY_DB_PATH")) {
            cfg->db_path = v;
        }
        if (const char* v = env_or_null("MEDLEY_MIRROR_DB_PATH")) {
            cfg->mirror_db_path = v;
        }
        if (const char* v = env_or_null("MEDLEY_CACHE_ROOT")) {
            cfg->cache_root = v;
        }
        if (const char* v = env_or_null("MEDLEY_LOG_LEVEL")) {
            cfg->log_level = v;
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Core, StatusCode::Unavailable);
    }

    if (const char* v = env_or_null("MEDLEY_CASCADE_POLICY")) {
        if (std::strcmp(v, "strict") == 0) {
            cfg->strict_cascade = true;
        } else if (std::strcmp(v, "best-effort") == 0) {
            cfg->strict_cascade = false;
        } else {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 1);
        }
    }

    if (const char* v = env_or_null("MEDLEY_MAX_UPLOAD_BYTES")) {
        u64 n = 0;
        if (!parse_u64(v, &n) || n == 0) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, 2);
        }
        cfg->max_upload_bytes = n;
    }

    return ok_status();
}

std::string resolved_db_path(const MedleyConfig& cfg) {
    if (!cfg.db_path.empty()) {
        return cfg.db_path;
    }
    return cfg.data_root + "/catalog.db";
}

std::string resolved_cache_root(const MedleyConfig& cfg) {
    if (!cfg.cache_root.empty()) {
        return cfg.cache_root;
    }
    return cfg.data_root + "/cache";
}

} // namespace medley::core
