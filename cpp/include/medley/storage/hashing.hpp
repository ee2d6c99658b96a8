#pragma once

#include <string>
#include <string_view>

#include "medley/core/errors.hpp"
#include "medley/core/types.hpp"
#include "medley/storage/buffer.hpp"

namespace medley::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const medley::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3-256 of the whole buffer.
    [[nodiscard]] medley::core::Status hash_compute(BufferView data, medley::core::Hash256* out) noexcept;

    // Lowercase, 64 chars.
    [[nodiscard]] std::string hash_to_hex(const medley::core::Hash256& h);

    [[nodiscard]] medley::core::Status hash_from_hex(std::string_view hex, medley::core::Hash256* out) noexcept;

} // namespace medley::storage
