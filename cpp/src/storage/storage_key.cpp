#include "medley/storage/storage_key.hpp"

#include <array>
#include <utility>

#include "medley/storage/hashing.hpp"

namespace medley::storage {

namespace {
    struct MimeExt {
        std::string_view mime;
        std::string_view ext;
    };

    // First entry per extension is the canonical mime type for reverse lookups.
    constexpr std::array<MimeExt, 11> kMimeTable{{
        {"audio/mpeg", ".mp3"},
        {"audio/mp3", ".mp3"},
        {"audio/flac", ".flac"},
        {"audio/wav", ".wav"},
        {"audio/wave", ".wav"},
        {"audio/x-wav", ".wav"},
        {"audio/ogg", ".ogg"},
        {"audio/mp4", ".m4a"},
        {"audio/m4a", ".m4a"},
        {"audio/x-m4a", ".m4a"},
        {"audio/aac", ".aac"},
    }};

    constexpr std::string_view kDefaultExt = ".audio";
    constexpr std::string_view kOctetStream = "application/octet-stream";

    // "audio/mpeg; charset=binary" -> "audio/mpeg"
    [[nodiscard]] std::string_view strip_params(std::string_view mime) noexcept {
        const auto semi = mime.find(';');
        if (semi != std::string_view::npos) {
            mime = mime.substr(0, semi);
        }
        while (!mime.empty() && mime.back() == ' ') {
            mime.remove_suffix(1);
        }
        return mime;
    }

    [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) {
                return false;
            }
        }
        return true;
    }
} // namespace

std::string_view extension_for_mime(std::string_view mime_type) noexcept {
    const std::string_view m = strip_params(mime_type);
    for (const auto& e : kMimeTable) {
        if (iequals(e.mime, m)) {
            return e.ext;
        }
    }
    return kDefaultExt;
}

std::string_view mime_for_key(std::string_view key) noexcept {
    const auto dot = key.rfind('.');
    if (dot == std::string_view::npos) {
        return kOctetStream;
    }
    const std::string_view ext = key.substr(dot);
    for (const auto& e : kMimeTable) {
        if (iequals(e.ext, ext)) {
            return e.mime;
        }
    }
    return kOctetStream;
}

std::string storage_key_for(const medley::core::Hash256& hash, std::string_view mime_type) {
    std::string key(kFilesPrefix);
    key += hash_to_hex(hash);
    key += extension_for_mime(mime_type);
    return key;
}

} // namespace medley::storage
