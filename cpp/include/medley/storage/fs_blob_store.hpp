#pragma once

#include <string>

#include "medley/storage/blob_store.hpp"

namespace medley::storage {

struct FsBlobStoreConfig {
    std::string root;       // objects live at {root}/{key}
    bool fsync_writes{true};
};

// Filesystem-backed BlobStore. Writes go to a temp file beside the target and are
// renamed into place, so readers never observe a partial object. Content type is
// derived from the key's extension.
class FsBlobStore final : public BlobStore {
public:
    explicit FsBlobStore(FsBlobStoreConfig cfg);

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

    [[nodiscard]] const std::string& root() const noexcept { return cfg_.root; }

private:
    [[nodiscard]] std::string path_for(std::string_view key) const;

    FsBlobStoreConfig cfg_;
};

} // namespace medley::storage
