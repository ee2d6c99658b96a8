#include "medley/storage/fs_blob_store.hpp"
#include "medley/storage/storage_key.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <random>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace medley::storage {

using namespace medley::core;

namespace {

constexpr const char* kTempMarker = ".tmp-";

[[nodiscard]] Status io_error(int err) noexcept {
    return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
}

[[nodiscard]] Status invalid() noexcept {
    return make_status(StatusDomain::Storage, StatusCode::Invalid);
}

[[nodiscard]] Status not_found() noexcept {
    return make_status(StatusDomain::Storage, StatusCode::NotFound);
}

// Create directory hierarchy for the parent of path
Status create_parent_directories(const char* path) {
    char tmp[4096];
    const int n = snprintf(tmp, sizeof(tmp), "%s", path);
    if (n < 0 || static_cast<size_t>(n) >= sizeof(tmp)) {
        return invalid();
    }

    char* last_slash = strrchr(tmp, '/');
    if (!last_slash || last_slash == tmp) {
        return ok_status();
    }

    *last_slash = '\0';

    if (mkdir(tmp, 0755) == 0) {
        return ok_status();
    }

    if (errno == EEXIST) {
        return ok_status();
    }

    if (errno == ENOENT) {
        // Parent doesn't exist, recurse
        Status s = create_parent_directories(tmp);
        if (!is_ok(s)) return s;

        if (mkdir(tmp, 0755) != 0 && errno != EEXIST) {
            return io_error(errno);
        }
        return ok_status();
    }

    return io_error(errno);
}

Status write_all(int fd, const u8* data, u64 size) noexcept {
    u64 written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        written += static_cast<u64>(n);
    }
    return ok_status();
}

Status read_at(int fd, u64 offset, u64 size, u8* out, u64* bytes_read) noexcept {
    u64 done = 0;
    while (done < size) {
        ssize_t n = ::pread(fd, out + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno);
        }
        if (n == 0) break;  // EOF
        done += static_cast<u64>(n);
    }
    *bytes_read = done;
    return ok_status();
}

[[nodiscard]] std::string temp_suffix() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    char buf[32];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
    return std::string(kTempMarker) + buf;
}

} // namespace

bool blob_key_is_valid(std::string_view key) noexcept {
    if (key.empty() || key.front() == '/' || key.back() == '/') {
        return false;
    }
    if (key.find('\0') != std::string_view::npos) {
        return false;
    }
    size_t pos = 0;
    while (pos <= key.size()) {
        size_t next = key.find('/', pos);
        if (next == std::string_view::npos) {
            next = key.size();
        }
        const std::string_view seg = key.substr(pos, next - pos);
        if (seg.empty() || seg == "." || seg == "..") {
            return false;
        }
        if (seg.find(kTempMarker) != std::string_view::npos) {
            return false;
        }
        pos = next + 1;
    }
    return true;
}

FsBlobStore::FsBlobStore(FsBlobStoreConfig cfg) : cfg_(std::move(cfg)) {
    while (cfg_.root.size() > 1 && cfg_.root.back() == '/') {
        cfg_.root.pop_back();
    }
}

std::string FsBlobStore::path_for(std::string_view key) const {
    std::string p = cfg_.root;
    p += '/';
    p += key;
    return p;
}

Status FsBlobStore::put(std::string_view key, BufferView data, std::string_view /*content_type*/) noexcept {
    if (!blob_key_is_valid(key) || (data.len > 0 && data.data == nullptr)) {
        return invalid();
    }

    const std::string fs_path = path_for(key);
    Status s = create_parent_directories(fs_path.c_str());
    if (!is_ok(s)) {
        return s;
    }

    const std::string tmp_path = fs_path + temp_suffix();
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return io_error(errno);
    }

    s = write_all(fd, data.data, data.len);
    if (is_ok(s) && cfg_.fsync_writes && ::fsync(fd) != 0) {
        s = io_error(errno);
    }
    if (::close(fd) != 0 && is_ok(s)) {
        s = io_error(errno);
    }
    if (!is_ok(s)) {
        ::unlink(tmp_path.c_str());  // Cleanup partial write
        return s;
    }

    if (::rename(tmp_path.c_str(), fs_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return io_error(err);
    }
    return ok_status();
}

Status FsBlobStore::get(std::string_view key, std::vector<u8>* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return invalid();
    }

    const std::string fs_path = path_for(key);
    int fd = ::open(fs_path.c_str(), O_RDONLY);
    if (fd < 0) {
        return errno == ENOENT ? not_found() : io_error(errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return io_error(err);
    }

    out->resize(static_cast<size_t>(st.st_size));
    u64 bytes_read = 0;
    Status s = read_at(fd, 0, out->size(), out->data(), &bytes_read);
    ::close(fd);
    if (!is_ok(s)) {
        return s;
    }
    if (bytes_read != out->size()) {
        return make_status(StatusDomain::Storage, StatusCode::Corrupt);
    }
    return ok_status();
}

Status FsBlobStore::stream_range(std::string_view key, u64 start, u64 end, std::vector<u8>* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key) || end < start) {
        return invalid();
    }

    const std::string fs_path = path_for(key);
    int fd = ::open(fs_path.c_str(), O_RDONLY);
    if (fd < 0) {
        return errno == ENOENT ? not_found() : io_error(errno);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return io_error(err);
    }

    const u64 size = static_cast<u64>(st.st_size);
    if (start >= size) {
        ::close(fd);
        return make_status(StatusDomain::Storage, StatusCode::Invalid, static_cast<u32>(size));
    }
    const u64 last = std::min(end, size - 1);

    out->resize(static_cast<size_t>(last - start + 1));
    u64 bytes_read = 0;
    Status s = read_at(fd, start, out->size(), out->data(), &bytes_read);
    ::close(fd);
    if (!is_ok(s)) {
        return s;
    }
    out->resize(static_cast<size_t>(bytes_read));
    return ok_status();
}

Status FsBlobStore::remove(std::string_view key) noexcept {
    if (!blob_key_is_valid(key)) {
        return invalid();
    }
    const std::string fs_path = path_for(key);
    if (::unlink(fs_path.c_str()) != 0) {
        return errno == ENOENT ? not_found() : io_error(errno);
    }
    return ok_status();
}

Status FsBlobStore::exists(std::string_view key, bool* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return invalid();
    }
    struct stat st{};
    const std::string fs_path = path_for(key);
    if (::stat(fs_path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            *out = false;
            return ok_status();
        }
        return io_error(errno);
    }
    *out = S_ISREG(st.st_mode);
    return ok_status();
}

Status FsBlobStore::get_metadata(std::string_view key, BlobMetadata* out) noexcept {
    if (out == nullptr || !blob_key_is_valid(key)) {
        return invalid();
    }
    struct stat st{};
    const std::string fs_path = path_for(key);
    if (::stat(fs_path.c_str(), &st) != 0) {
        return (errno == ENOENT || errno == ENOTDIR) ? not_found() : io_error(errno);
    }
    out->size_bytes = static_cast<u64>(st.st_size);
    out->content_type = std::string(mime_for_key(key));
    out->last_modified = static_cast<Timestamp>(st.st_mtime);
    return ok_status();
}

Status FsBlobStore::list(std::string_view prefix, std::vector<std::string>* out) noexcept {
    namespace fs = std::filesystem;
    if (out == nullptr) {
        return invalid();
    }
    out->clear();

    std::error_code ec;
    const fs::path root(cfg_.root);
    if (!fs::exists(root, ec)) {
        return ok_status();
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return io_error(ec.value());
    }
    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return io_error(ec.value());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string rel = fs::relative(it->path(), root, ec).generic_string();
        if (ec) {
            return io_error(ec.value());
        }
        if (rel.find(kTempMarker) != std::string::npos) {
            continue;
        }
        if (rel.compare(0, prefix.size(), prefix) == 0) {
            out->push_back(std::move(rel));
        }
    }
    std::sort(out->begin(), out->end());
    return ok_status();
}

} // namespace medley::storage
