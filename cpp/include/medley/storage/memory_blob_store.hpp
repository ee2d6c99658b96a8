#pragma once

#include <map>
#include <mutex>
#include <string>

#include "medley/storage/blob_store.hpp"

namespace medley::storage {

// In-process BlobStore, used for the client tier in tests and for ephemeral runs.
class MemoryBlobStore final : public BlobStore {
public:
    [[nodiscard]] medley::core::Status put(std::string_view key,
                                           BufferView data,
                                           std::string_view content_type) noexcept override;
    [[nodiscard]] medley::core::Status get(std::string_view key, std::vector<u8>* out) noexcept override;
    [[nodiscard]] medley::core::Status stream_range(std::string_view key,
                                                    u64 start,
                                                    u64 end,
                                                    std::vector<u8>* out) noexcept override;
    [[nodiscard]] medley::core::Status remove(std::string_view key) noexcept override;
    [[nodiscard]] medley::core::Status exists(std::string_view key, bool* out) noexcept override;
    [[nodiscard]] medley::core::Status get_metadata(std::string_view key, BlobMetadata* out) noexcept override;
    [[nodiscard]] medley::core::Status list(std::string_view prefix,
                                            std::vector<std::string>* out) noexcept override;

    // Number of successful put() calls since construction.
    [[nodiscard]] u64 put_count() const noexcept;
    [[nodiscard]] size_t size() const noexcept;

private:
    struct Entry {
        std::vector<u8> bytes;
        std::string content_type;
        medley::core::Timestamp last_modified{0};
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> objects_;
    u64 puts_{0};
};

} // namespace medley::storage
