#pragma once

#include <string_view>

#include "medley/core/errors.hpp"
#include "medley/core/models.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::media {

    // Reads descriptive tags and physical properties from an audio payload.
    // Implementations may return an error status or throw; callers treat
    // extraction as best-effort.
    class TagExtractor {
    public:
        virtual ~TagExtractor() = default;

        [[nodiscard]] virtual medley::core::Status extract(medley::storage::BufferView data,
            std::string_view mime_type, medley::core::TagRecord* out) = 0;
    };

    // Understands RIFF/WAVE (fmt, data and LIST/INFO chunks), ID3v2.3/2.4
    // text frames, ID3v1 trailers and the first MPEG audio frame header.
    // Anything else is Unsupported.
    class BasicTagExtractor final : public TagExtractor {
    public:
        [[nodiscard]] medley::core::Status extract(medley::storage::BufferView data,
            std::string_view mime_type, medley::core::TagRecord* out) override;
    };

    // Tags guessed from a filename:
    //   "01 - Title", "01. Title", "01_Title" -> title
    //   "Artist - Title"                    -> artist, title
    //   anything else                       -> stem as title
    [[nodiscard]] medley::core::TagRecord tags_from_filename(std::string_view filename);

    // Fills title (and artist when missing) from the filename when the tags carry no title.
    void apply_filename_fallback(std::string_view filename, medley::core::TagRecord* tags);

} // namespace medley::media
