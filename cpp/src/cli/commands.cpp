#include "medley/cli/commands.hpp"

#include <cstring>

namespace medley::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help"},
            {CommandId::MakeLibrary, "mklib"},
            {CommandId::ListLibraries, "libs"},
            {CommandId::ListSongs, "ls"},
            {CommandId::Upload, "upload"},
            {CommandId::Upload, "up"},
            {CommandId::Link, "link"},
            {CommandId::RemoveSong, "rm-song"},
            {CommandId::RemoveLibrary, "rm-library"},
            {CommandId::MakePlaylist, "mkpl"},
            {CommandId::PlaylistAdd, "pl-add"},
            {CommandId::RemovePlaylist, "rm-playlist"},
            {CommandId::ListFiles, "files"},
            {CommandId::Fsck, "fsck"},
            {CommandId::MirrorAdd, "mirror-add"},
            {CommandId::MirrorList, "mirror-ls"},
            {CommandId::MirrorRemoveLibrary, "mirror-rm-library"},
            {CommandId::Exit, "q"},
            {CommandId::Exit, "quit"},
            {CommandId::Exit, "exit"},
        };
    } // namespace

    const CommandSpec* default_commands(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }

    medley::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const auto invalid = medley::core::make_status(medley::core::StatusDomain::Cli,
                                                       medley::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return invalid;
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return medley::core::ok_status();
            }
        }
        return medley::core::make_status(medley::core::StatusDomain::Cli, medley::core::StatusCode::NotFound);
    }
} // namespace medley::cli
