#include "medley/storage/memory_blob_store.hpp"

#include <algorithm>
#include <ctime>

namespace medley::storage {

using namespace medley::core;

Status MemoryBlobStore::put(std::string_view key, BufferView data, std::string_view content_type) noexcept {
    if (!blob_key_is_valid(key) || (data.len > 0 && data.data == nullptr)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    Entry e;
    if (data.len > 0) {
        e.bytes.assign(data.data, data.data + data.len);
    }
    e.content_type = std::string(content_type);
    e.last_modified = static_cast<Timestamp>(std::time(nullptr));

    std::lock_guard<std::mutex> lock(mutex_);
    objects_.insert_or_assign(std::string(key), std::move(e));
    ++puts_;
    return ok_status();
}

Status MemoryBlobStore::get(std::string_view key, std::vector<u8>* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    *out = it->second.bytes;
    return ok_status();
}

Status MemoryBlobStore::stream_range(std::string_view key, u64 start, u64 end, std::vector<u8>* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key) || end < start) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    const auto& bytes = it->second.bytes;
    if (start >= bytes.size()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid, static_cast<u32>(bytes.size()));
    }
    const u64 last = std::min<u64>(end, bytes.size() - 1);
    out->assign(bytes.begin() + static_cast<std::ptrdiff_t>(start),
                bytes.begin() + static_cast<std::ptrdiff_t>(last + 1));
    return ok_status();
}

Status MemoryBlobStore::remove(std::string_view key) noexcept {
    if (!blob_key_is_valid(key)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    objects_.erase(it);
    return ok_status();
}

Status MemoryBlobStore::exists(std::string_view key, bool* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    *out = objects_.find(key) != objects_.end();
    return ok_status();
}

Status MemoryBlobStore::get_metadata(std::string_view key, BlobMetadata* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    out->size_bytes = it->second.bytes.size();
    out->content_type = it->second.content_type;
    out->last_modified = it->second.last_modified;
    return ok_status();
}

Status MemoryBlobStore::list(std::string_view prefix, std::vector<std::string>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    out->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out->push_back(it->first);
    }
    return ok_status();
}

u64 MemoryBlobStore::put_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return puts_;
}

size_t MemoryBlobStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

} // namespace medley::storage
