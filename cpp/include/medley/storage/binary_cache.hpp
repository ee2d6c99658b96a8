#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "medley/core/errors.hpp"
#include "medley/storage/blob_store.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::storage {

// Client-side byte cache addressed by a stream URL (the logical retrieval URL,
// not the content hash). remove() is idempotent: absent entries return NotFound.
class BinaryCache {
public:
    virtual ~BinaryCache() = default;

    [[nodiscard]] virtual medley::core::Status put(std::string_view url, BufferView data) noexcept = 0;
    [[nodiscard]] virtual medley::core::Status get(std::string_view url, std::vector<u8>* out) noexcept = 0;
    [[nodiscard]] virtual medley::core::Status remove(std::string_view url) noexcept = 0;
};

// BinaryCache stored in a BlobStore under "{cache_name}/{hex(blake3(url))}".
class BlobBinaryCache final : public BinaryCache {
public:
    BlobBinaryCache(BlobStore& store, std::string cache_name = "audio");

    [[nodiscard]] medley::core::Status put(std::string_view url, BufferView data) noexcept override;
    [[nodiscard]] medley::core::Status get(std::string_view url, std::vector<u8>* out) noexcept override;
    [[nodiscard]] medley::core::Status remove(std::string_view url) noexcept override;

    [[nodiscard]] medley::core::Status key_for(std::string_view url, std::string* out) const noexcept;

private:
    BlobStore& store_;
    std::string cache_name_;
};

} // namespace medley::storage
