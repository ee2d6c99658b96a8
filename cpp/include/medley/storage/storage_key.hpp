#pragma once

#include <string>
#include <string_view>

#include "medley/core/types.hpp"

namespace medley::storage {

    inline constexpr std::string_view kFilesPrefix = "files/";

    // ".mp3" for audio/mpeg, ".audio" for anything unrecognised.
    [[nodiscard]] std::string_view extension_for_mime(std::string_view mime_type) noexcept;

    // Reverse of extension_for_mime on a key or filename; "application/octet-stream" when unknown.
    [[nodiscard]] std::string_view mime_for_key(std::string_view key) noexcept;

    // files/{hex(hash)}{ext}
    [[nodiscard]] std::string storage_key_for(const medley::core::Hash256& hash, std::string_view mime_type);

} // namespace medley::storage
