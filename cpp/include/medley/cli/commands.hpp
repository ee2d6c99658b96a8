#pragma once

#include <type_traits>

#include "medley/cli/options.hpp"
#include "medley/core/errors.hpp"

namespace medley::cli {
    using u32 = medley::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        MakeLibrary = 2,
        ListLibraries = 3,
        ListSongs = 4,
        Upload = 5,
        Link = 6,
        RemoveSong = 7,
        RemoveLibrary = 8,
        MakePlaylist = 9,
        PlaylistAdd = 10,
        RemovePlaylist = 11,
        ListFiles = 12,
        Fsck = 13,
        Exit = 14,
        MirrorAdd = 15,
        MirrorList = 16,
        MirrorRemoveLibrary = 17,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Table of every command name the binary accepts (aliases included).
    [[nodiscard]] const CommandSpec* default_commands(u32* count) noexcept;

    [[nodiscard]] medley::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace medley::cli
