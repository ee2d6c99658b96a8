#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace medley::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Unix seconds
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
        friend constexpr auto operator<=>(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct UserIdTag {};
    using UserId = Id<UserIdTag, u64>;

    struct FileIdTag {};
    using FileId = Id<FileIdTag, u64>;

    struct SongIdTag {};
    using SongId = Id<SongIdTag, u64>;

    struct LibraryIdTag {};
    using LibraryId = Id<LibraryIdTag, u64>;

    struct PlaylistIdTag {};
    using PlaylistId = Id<PlaylistIdTag, u64>;

    static_assert(std::is_trivially_copyable_v<FileId>);
    static_assert(std::is_standard_layout_v<FileId>);

} // namespace medley::core
