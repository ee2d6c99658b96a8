#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/core/types.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::storage {

struct BlobMetadata {
    u64 size_bytes{0};
    std::string content_type;
    medley::core::Timestamp last_modified{0};
};

// Narrow adapter over a blob/object service.
//
// Keys are relative, '/'-separated paths (e.g. "files/<hex>.mp3"); empty keys,
// absolute keys and ".." segments are rejected with Invalid.
// remove() of an absent key returns NotFound; callers on delete paths treat
// that as success.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Creates or replaces the object.
    [[nodiscard]] virtual medley::core::Status put(std::string_view key,
                                                   BufferView data,
                                                   std::string_view content_type) noexcept = 0;

    [[nodiscard]] virtual medley::core::Status get(std::string_view key, std::vector<u8>* out) noexcept = 0;

    // Bytes [start, end] inclusive; end is clamped to the last byte.
    // start past the end of the object is Invalid.
    [[nodiscard]] virtual medley::core::Status stream_range(std::string_view key,
                                                            u64 start,
                                                            u64 end,
                                                            std::vector<u8>* out) noexcept = 0;

    [[nodiscard]] virtual medley::core::Status remove(std::string_view key) noexcept = 0;

    [[nodiscard]] virtual medley::core::Status exists(std::string_view key, bool* out) noexcept = 0;

    [[nodiscard]] virtual medley::core::Status get_metadata(std::string_view key, BlobMetadata* out) noexcept = 0;

    // Sorted keys starting with prefix ("" lists everything).
    [[nodiscard]] virtual medley::core::Status list(std::string_view prefix,
                                                    std::vector<std::string>* out) noexcept = 0;
};

[[nodiscard]] bool blob_key_is_valid(std::string_view key) noexcept;

} // namespace medley::storage
