#pragma once

#include <cstdio>
#include <memory>

#include "medley/cli/commands.hpp"
#include "medley/core/config.hpp"
#include "medley/core/errors.hpp"
#include "medley/db/db.hpp"
#include "medley/library/backend.hpp"
#include "medley/media/tags.hpp"
#include "medley/storage/binary_cache.hpp"
#include "medley/storage/fs_blob_store.hpp"

namespace medley::cli {

    // Exit codes
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitError = 1;
    inline constexpr int kExitUsage = 2;

    struct AppOptions {
        medley::core::MedleyConfig config{};
        medley::core::UserId user{1};
    };

    // --data-root/-d, --db/-b, --user/-u, --strict/-s, --log-level/-l
    [[nodiscard]] const OptionSpec* global_option_specs(u32* count) noexcept;

    // --title/-t, --artist/-a, --album, --mime/-m, --repair/-r, --default, --library/-L
    [[nodiscard]] const OptionSpec* command_option_specs(u32* count) noexcept;

    // Overlays parsed global options onto *opts. Invalid for a non-positive --user.
    [[nodiscard]] medley::core::Status apply_global_options(const ParsedOptions& parsed, AppOptions* opts) noexcept;

    // Owns the catalog (and, on demand, the mirror) for one CLI session and
    // runs parsed commands against them. Output goes to `out`, diagnostics to the logger.
    class App {
    public:
        App(AppOptions opts, std::FILE* out) noexcept;
        ~App();

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        // Creates the data directories, opens the catalog database and installs its schema.
        [[nodiscard]] medley::core::Status open() noexcept;

        // Returns one of the kExit* codes.
        int run(const CommandInvocation& cmd);

        [[nodiscard]] medley::db::DbHandle catalog_db() const noexcept { return catalog_db_; }
        [[nodiscard]] medley::db::DbHandle mirror_db() const noexcept { return mirror_db_; }

    private:
        [[nodiscard]] medley::core::Status open_mirror() noexcept;

        int help();
        int make_library(const CliArgs& args);
        int list_libraries(const CliArgs& args);
        int list_songs(const CliArgs& args);
        int upload(const CliArgs& args);
        int link(const CliArgs& args);
        int remove_song(const CliArgs& args);
        int remove_library(const CliArgs& args);
        int make_playlist(const CliArgs& args);
        int playlist_add(const CliArgs& args);
        int remove_playlist(const CliArgs& args);
        int list_files(const CliArgs& args);
        int fsck(const CliArgs& args);
        int mirror_add(const CliArgs& args);
        int mirror_list(const CliArgs& args);
        int mirror_remove_library(const CliArgs& args);

        AppOptions opts_;
        std::FILE* out_;
        medley::db::DbHandle catalog_db_{};
        medley::db::DbHandle mirror_db_{};
        std::unique_ptr<medley::storage::FsBlobStore> blobs_;
        std::unique_ptr<medley::storage::FsBlobStore> cache_store_;
        std::unique_ptr<medley::storage::BlobBinaryCache> cache_;
        std::unique_ptr<medley::library::CatalogBackend> catalog_;
        std::unique_ptr<medley::library::MirrorBackend> mirror_;
        medley::media::BasicTagExtractor extractor_;
    };

} // namespace medley::cli
