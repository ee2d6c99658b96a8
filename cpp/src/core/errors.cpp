#include "medley/core/errors.hpp"

#include <cstring>

namespace medley::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Conflict: return "Conflict";
        case StatusCode::Busy: return "Busy";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Storage: return "Storage";
        case StatusDomain::Db: return "Db";
        case StatusDomain::Media: return "Media";
        case StatusDomain::Library: return "Library";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

std::string describe(Status s) {
    std::string out = status_code_name(s.code);
    out += '/';
    out += status_domain_name(s.domain);
    if (s.aux != 0) {
        out += " aux=";
        out += std::to_string(s.aux);
        // Io carries errno in aux
        if (s.code == StatusCode::Io) {
            out += " (";
            out += std::strerror(static_cast<int>(s.aux));
            out += ')';
        }
    }
    return out;
}

} // namespace medley::core
