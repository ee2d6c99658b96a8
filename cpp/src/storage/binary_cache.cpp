#include "medley/storage/binary_cache.hpp"

#include <utility>

#include "medley/storage/hashing.hpp"

namespace medley::storage {

using namespace medley::core;

BlobBinaryCache::BlobBinaryCache(BlobStore& store, std::string cache_name)
    : store_(store), cache_name_(std::move(cache_name)) {}

Status BlobBinaryCache::key_for(std::string_view url, std::string* out) const noexcept {
    if (out == nullptr || url.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Hash256 h{};
    Status s = hash_compute(BufferView{reinterpret_cast<const u8*>(url.data()), url.size()}, &h);
    if (!is_ok(s)) {
        return s;
    }
    *out = cache_name_;
    *out += '/';
    *out += hash_to_hex(h);
    return ok_status();
}

Status BlobBinaryCache::put(std::string_view url, BufferView data) noexcept {
    std::string key;
    Status s = key_for(url, &key);
    if (!is_ok(s)) {
        return s;
    }
    return store_.put(key, data, "application/octet-stream");
}

Status BlobBinaryCache::get(std::string_view url, std::vector<u8>* out) noexcept {
    std::string key;
    Status s = key_for(url, &key);
    if (!is_ok(s)) {
        return s;
    }
    return store_.get(key, out);
}

Status BlobBinaryCache::remove(std::string_view url) noexcept {
    std::string key;
    Status s = key_for(url, &key);
    if (!is_ok(s)) {
        return s;
    }
    return store_.remove(key);
}

} // namespace medley::storage
