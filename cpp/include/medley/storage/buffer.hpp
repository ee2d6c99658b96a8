#pragma once

#include <type_traits>
#include <vector>

#include "medley/core/types.hpp"

namespace medley::storage {
    using u8 = medley::core::u8;
    using u32 = medley::core::u32;
    using u64 = medley::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView view_of(const std::vector<u8>& v) noexcept {
        return BufferView{v.data(), static_cast<u64>(v.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace medley::storage
