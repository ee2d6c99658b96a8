#include "medley/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace medley::storage {
    namespace {
        [[nodiscard]] int hex_nibble(char c) noexcept {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    } // namespace

    medley::core::Status hash_compute(BufferView data, medley::core::Hash256* out) noexcept {
        if (out == nullptr){
            return medley::core::make_status(medley::core::StatusDomain::Storage, medley::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return medley::core::make_status(medley::core::StatusDomain::Storage, medley::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return medley::core::ok_status();
    }

    std::string hash_to_hex(const medley::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (u8 byte : h.b) {
            out.push_back(hex[(byte >> 4) & 0xF]);
            out.push_back(hex[byte & 0xF]);
        }
        return out;
    }

    medley::core::Status hash_from_hex(std::string_view hex, medley::core::Hash256* out) noexcept {
        if (out == nullptr || hex.size() != out->b.size() * 2) {
            return medley::core::make_status(medley::core::StatusDomain::Storage, medley::core::StatusCode::Invalid);
        }
        medley::core::Hash256 tmp{};
        for (size_t i = 0; i < tmp.b.size(); ++i) {
            const int hi = hex_nibble(hex[2 * i]);
            const int lo = hex_nibble(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return medley::core::make_status(medley::core::StatusDomain::Storage, medley::core::StatusCode::Invalid);
            }
            tmp.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = tmp;
        return medley::core::ok_status();
    }
} // namespace medley::storage
