#include "medley/cli/app.hpp"

#include <charconv>
#include <cstring>
#include <ctime>
#include <exception>
#include <filesystem>
#include <new>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "medley/core/log.hpp"
#include "medley/db/catalog.hpp"
#include "medley/db/mirror.hpp"
#include "medley/library/audit.hpp"
#include "medley/library/cascade.hpp"
#include "medley/library/mirror_ops.hpp"
#include "medley/library/uploader.hpp"
#include "medley/storage/hashing.hpp"
#include "medley/storage/storage_key.hpp"

namespace medley::cli {

using namespace medley::core;
namespace db = medley::db;
namespace lib = medley::library;

namespace {

    constexpr OptionSpec kGlobalOptions[] = {
        {OptionId::DataRoot, OptionType::String, "data-root", 'd'},
        {OptionId::Db, OptionType::String, "db", 'b'},
        {OptionId::User, OptionType::I64, "user", 'u'},
        {OptionId::Strict, OptionType::Flag, "strict", 's'},
        {OptionId::LogLevel, OptionType::String, "log-level", 'l'},
    };

    constexpr OptionSpec kCommandOptions[] = {
        {OptionId::Title, OptionType::String, "title", 't'},
        {OptionId::Artist, OptionType::String, "artist", 'a'},
        {OptionId::Album, OptionType::String, "album", '\0'},
        {OptionId::Mime, OptionType::String, "mime", 'm'},
        {OptionId::Repair, OptionType::Flag, "repair", 'r'},
        {OptionId::Default, OptionType::Flag, "default", '\0'},
        {OptionId::Library, OptionType::I64, "library", 'L'},
    };

    constexpr u32 kMaxCommandOptions = 16;

    // Positional arguments and options may interleave: "upload 3 a.mp3 -t X b.mp3".
    struct CommandLine {
        std::vector<const char*> positional;
        ParsedOption storage[kMaxCommandOptions]{};
        ParsedOptions opts{storage, 0, kMaxCommandOptions};
    };

    [[nodiscard]] Status split_command_line(const CliArgs& args, CommandLine* out) {
        u32 spec_count = 0;
        const OptionSpec* specs = command_option_specs(&spec_count);

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok[0] != '-' || tok[1] == '\0') {
                out->positional.push_back(tok);
                ++i;
                continue;
            }

            ParsedOption chunk_storage[kMaxCommandOptions]{};
            ParsedOptions chunk{chunk_storage, 0, kMaxCommandOptions - out->opts.len};
            u32 consumed = 0;
            const CliArgs rest{args.argv + i, args.argc - i};
            Status s = parse_options(rest, specs, spec_count, &chunk, &consumed);
            if (!is_ok(s)) {
                return s;
            }
            for (u32 k = 0; k < chunk.len; ++k) {
                out->opts.data[out->opts.len++] = chunk.data[k];
            }
            if (consumed == 0) {
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            i += consumed;
            // Everything after "--" is positional.
            if (std::strcmp(rest.argv[consumed - 1], "--") == 0) {
                for (; i < args.argc; ++i) {
                    out->positional.push_back(args.argv[i]);
                }
            }
        }
        return ok_status();
    }

    [[nodiscard]] bool parse_id(const char* s, u64* out) noexcept {
        const char* end = s + std::strlen(s);
        u64 v{};
        auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end || s == end || v == 0) {
            return false;
        }
        *out = v;
        return true;
    }

    [[nodiscard]] const char* option_str(const CommandLine& cl, OptionId id) noexcept {
        const ParsedOption* o = find_option(cl.opts, id);
        return o != nullptr ? o->value.str : nullptr;
    }

    [[nodiscard]] bool has_flag(const CommandLine& cl, OptionId id) noexcept {
        return find_option(cl.opts, id) != nullptr;
    }

    [[nodiscard]] TagRecord tag_overrides(const CommandLine& cl) {
        TagRecord t;
        if (const char* v = option_str(cl, OptionId::Title)) {
            t.title = v;
        }
        if (const char* v = option_str(cl, OptionId::Artist)) {
            t.artist = v;
        }
        if (const char* v = option_str(cl, OptionId::Album)) {
            t.album = v;
        }
        return t;
    }

    [[nodiscard]] Status read_file(const char* path, std::vector<u8>* out) {
        std::FILE* f = std::fopen(path, "rb");
        if (f == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::NotFound);
        }
        out->clear();
        u8 buf[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            out->insert(out->end(), buf, buf + n);
        }
        const bool failed = std::ferror(f) != 0;
        std::fclose(f);
        return failed ? make_status(StatusDomain::Cli, StatusCode::Io) : ok_status();
    }

    // Explicit --mime, else whatever the extension says; empty lets the uploader default.
    [[nodiscard]] std::string_view mime_for_upload(const CommandLine& cl, const char* path) noexcept {
        if (const char* m = option_str(cl, OptionId::Mime)) {
            return m;
        }
        const std::string_view guessed = medley::storage::mime_for_key(path);
        return guessed == "application/octet-stream" ? std::string_view{} : guessed;
    }

    [[nodiscard]] std::string display(const std::optional<std::string>& v) {
        return v.has_value() ? *v : std::string("-");
    }

    void print_status_error(const char* context, Status s) {
        std::fprintf(stderr, "error: %s failed (%s)\n", context, describe(s).c_str());
    }

    int usage(const char* text) {
        std::fprintf(stderr, "usage: %s\n", text);
        return kExitUsage;
    }

    void print_delete_result(std::FILE* out, const lib::DeleteResult& r) {
        fmt::print(out, "deleted songs={} playlist_entries={} purged={} library_deleted={} playlist_deleted={}\n",
                   r.deleted_songs, r.deleted_playlist_songs, r.deleted_cache_entries, r.library_deleted,
                   r.playlist_deleted);
        for (const lib::SongError& e : r.errors) {
            fmt::print(out, "  error: {}\n", e.message);
        }
    }

    [[nodiscard]] int delete_exit_code(const lib::DeleteResult& r) noexcept {
        return r.success && r.errors.empty() ? kExitOk : kExitError;
    }

} // namespace

const OptionSpec* global_option_specs(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]));
    }
    return kGlobalOptions;
}

const OptionSpec* command_option_specs(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kCommandOptions) / sizeof(kCommandOptions[0]));
    }
    return kCommandOptions;
}

Status apply_global_options(const ParsedOptions& parsed, AppOptions* opts) noexcept {
    if (opts == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    try {
        for (u32 i = 0; i < parsed.len; ++i) {
            const ParsedOption& o = parsed.data[i];
            switch (o.id) {
                case OptionId::DataRoot:
                    opts->config.data_root = o.value.str;
                    break;
                case OptionId::Db:
                    opts->config.db_path = o.value.str;
                    break;
                case OptionId::User:
                    if (o.value.i64v <= 0) {
                        return make_status(StatusDomain::Cli, StatusCode::Invalid);
                    }
                    opts->user = UserId{static_cast<u64>(o.value.i64v)};
                    break;
                case OptionId::Strict:
                    opts->config.strict_cascade = true;
                    break;
                case OptionId::LogLevel:
                    opts->config.log_level = o.value.str;
                    break;
                default:
                    return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cli, StatusCode::Unavailable);
    }
    return ok_status();
}

App::App(AppOptions opts, std::FILE* out) noexcept : opts_(std::move(opts)), out_(out) {}

App::~App() {
    mirror_.reset();
    catalog_.reset();
    if (db::db_handle_valid(mirror_db_)) {
        (void)db::db_close(mirror_db_);
    }
    if (db::db_handle_valid(catalog_db_)) {
        (void)db::db_close(catalog_db_);
    }
}

Status App::open() noexcept {
    try {
        const std::string db_path = resolved_db_path(opts_.config);
        std::error_code ec;
        std::filesystem::create_directories(opts_.config.data_root, ec);
        if (ec) {
            logger()->error("cannot create data root {}: {}", opts_.config.data_root, ec.message());
            return make_status(StatusDomain::Cli, StatusCode::Io);
        }
        const auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }

        Status s = db::db_open(db::DbConfig{db_path}, &catalog_db_);
        if (!is_ok(s)) {
            return s;
        }
        s = db::catalog_install_schema(catalog_db_);
        if (!is_ok(s)) {
            return s;
        }

        blobs_ = std::make_unique<medley::storage::FsBlobStore>(
            medley::storage::FsBlobStoreConfig{opts_.config.data_root, true});
        catalog_ = std::make_unique<lib::CatalogBackend>(catalog_db_, *blobs_);
        logger()->debug("catalog open db={} data_root={}", db_path, opts_.config.data_root);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cli, StatusCode::Unavailable);
    }
    return ok_status();
}

Status App::open_mirror() noexcept {
    if (mirror_ != nullptr) {
        return ok_status();
    }
    if (opts_.config.mirror_db_path.empty()) {
        logger()->error("no mirror configured (set MEDLEY_MIRROR_DB_PATH)");
        return make_status(StatusDomain::Cli, StatusCode::Unsupported);
    }
    try {
        const std::string cache_root = resolved_cache_root(opts_.config);
        std::error_code ec;
        std::filesystem::create_directories(cache_root, ec);
        if (ec) {
            logger()->error("cannot create cache root {}: {}", cache_root, ec.message());
            return make_status(StatusDomain::Cli, StatusCode::Io);
        }

        Status s = db::db_open(db::DbConfig{opts_.config.mirror_db_path}, &mirror_db_);
        if (!is_ok(s)) {
            return s;
        }
        s = db::mirror_install_schema(mirror_db_);
        if (!is_ok(s)) {
            return s;
        }
        cache_store_ = std::make_unique<medley::storage::FsBlobStore>(
            medley::storage::FsBlobStoreConfig{cache_root, false});
        cache_ = std::make_unique<medley::storage::BlobBinaryCache>(*cache_store_);
        mirror_ = std::make_unique<lib::MirrorBackend>(mirror_db_, *cache_);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cli, StatusCode::Unavailable);
    }
    return ok_status();
}

int App::run(const CommandInvocation& cmd) {
    if (catalog_ == nullptr) {
        std::fprintf(stderr, "error: catalog not open\n");
        return kExitError;
    }
    switch (cmd.id) {
        case CommandId::Help:
            return help();
        case CommandId::MakeLibrary:
            return make_library(cmd.args);
        case CommandId::ListLibraries:
            return list_libraries(cmd.args);
        case CommandId::ListSongs:
            return list_songs(cmd.args);
        case CommandId::Upload:
            return upload(cmd.args);
        case CommandId::Link:
            return link(cmd.args);
        case CommandId::RemoveSong:
            return remove_song(cmd.args);
        case CommandId::RemoveLibrary:
            return remove_library(cmd.args);
        case CommandId::MakePlaylist:
            return make_playlist(cmd.args);
        case CommandId::PlaylistAdd:
            return playlist_add(cmd.args);
        case CommandId::RemovePlaylist:
            return remove_playlist(cmd.args);
        case CommandId::ListFiles:
            return list_files(cmd.args);
        case CommandId::Fsck:
            return fsck(cmd.args);
        case CommandId::MirrorAdd:
            return mirror_add(cmd.args);
        case CommandId::MirrorList:
            return mirror_list(cmd.args);
        case CommandId::MirrorRemoveLibrary:
            return mirror_remove_library(cmd.args);
        case CommandId::Exit:
            return kExitOk;
        default:
            std::fprintf(stderr, "error: unknown command\n");
            return kExitUsage;
    }
}

int App::help() {
    fmt::print(out_,
               "Commands:\n"
               "  mklib <name> [--default]          Create a library (--default: cannot be deleted)\n"
               "  libs                              List your libraries\n"
               "  ls <library>                      List a library's songs\n"
               "  upload <library> <paths..>        Upload audio files (-t/--title, -a/--artist, --album, -m/--mime)\n"
               "  link <file> <library>             New song for an already stored file\n"
               "  rm-song <library> <song>          Delete one song\n"
               "  rm-library <library>              Delete a library with all its songs\n"
               "  mkpl <name> [-L <library>]        Create a playlist\n"
               "  pl-add <playlist> <song>          Append a song to a playlist\n"
               "  rm-playlist <playlist>            Delete a playlist (songs stay)\n"
               "  files                             List stored files and reference counts\n"
               "  fsck [--repair]                   Check reference counts, blobs and orphaned songs\n"
               "  mirror-add <library> <path>       Record and cache a song in the offline mirror\n"
               "  mirror-ls <library>               List mirrored songs and cache usage\n"
               "  mirror-rm-library <library>       Delete a library from the offline mirror\n"
               "  help                              Show this help\n"
               "\n"
               "Global options: -d/--data-root <dir>, -b/--db <path>, -u/--user <id>, -s/--strict, -l/--log-level <lvl>\n");
    return kExitOk;
}

int App::make_library(const CliArgs& args) {
    CommandLine cl;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1) {
        return usage("mklib <name> [--default]");
    }
    LibraryRecord rec;
    rec.owner = opts_.user;
    rec.name = cl.positional[0];
    rec.can_delete = !has_flag(cl, OptionId::Default);
    rec.created_at = static_cast<Timestamp>(std::time(nullptr));

    LibraryId id;
    const Status s = db::db_library_create(catalog_db_, rec, &id);
    if (!is_ok(s)) {
        print_status_error("mklib", s);
        return kExitError;
    }
    fmt::print(out_, "library {} {}\n", id.v, rec.name);
    return kExitOk;
}

int App::list_libraries(const CliArgs& args) {
    if (args.argc != 0) {
        return usage("libs");
    }
    std::vector<LibraryRecord> libs;
    const Status s = db::db_library_list_by_owner(catalog_db_, opts_.user, &libs);
    if (!is_ok(s)) {
        print_status_error("libs", s);
        return kExitError;
    }
    for (const LibraryRecord& l : libs) {
        fmt::print(out_, "{:>6}  {:<24} songs={}{}\n", l.id.v, l.name, l.song_count, l.can_delete ? "" : " (default)");
    }
    return kExitOk;
}

int App::list_songs(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("ls <library>");
    }
    std::vector<SongRecord> songs;
    const Status s = db::db_song_list_by_library(catalog_db_, LibraryId{lib_id}, &songs);
    if (!is_ok(s)) {
        print_status_error("ls", s);
        return kExitError;
    }
    for (const SongRecord& song : songs) {
        fmt::print(out_, "{:>6}  file={:<6} {} - {}\n", song.id.v, song.file_id.v, display(song.tags.artist),
                   display(song.tags.title));
    }
    return kExitOk;
}

int App::upload(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() < 2 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("upload <library> <paths..> [-t title] [-a artist] [--album album] [-m mime]");
    }

    LibraryRecord lib_rec;
    Status s = db::db_library_get(catalog_db_, LibraryId{lib_id}, &lib_rec);
    if (!is_ok(s)) {
        print_status_error("upload: library lookup", s);
        return kExitError;
    }

    lib::UploaderConfig ucfg;
    ucfg.max_bytes = opts_.config.max_upload_bytes;
    lib::Uploader uploader(*catalog_, &extractor_, ucfg);
    const TagRecord overrides = tag_overrides(cl);

    int rc = kExitOk;
    for (size_t i = 1; i < cl.positional.size(); ++i) {
        const char* path = cl.positional[i];
        std::vector<u8> bytes;
        s = read_file(path, &bytes);
        if (!is_ok(s)) {
            std::fprintf(stderr, "error: upload: cannot read %s\n", path);
            rc = kExitError;
            continue;
        }

        lib::UploadResult result;
        SongId song;
        s = uploader.upload_song(lib_rec.id, medley::storage::view_of(bytes),
                                 std::filesystem::path(path).filename().string(), mime_for_upload(cl, path),
                                 &overrides, &result, &song);
        if (!is_ok(s)) {
            std::fprintf(stderr, "error: upload failed for %s (%s)\n", path, describe(s).c_str());
            rc = kExitError;
            continue;
        }
        fmt::print(out_, "song {} file {} {} ref={}  {}\n", song.v, result.file_id.v,
                   result.is_new_file ? "new" : "dedup", result.ref_count, path);
    }
    return rc;
}

int App::link(const CliArgs& args) {
    CommandLine cl;
    u64 file_id = 0;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 2 || !parse_id(cl.positional[0], &file_id) ||
        !parse_id(cl.positional[1], &lib_id)) {
        return usage("link <file> <library> [-t title] [-a artist] [--album album]");
    }
    lib::Uploader uploader(*catalog_, &extractor_);
    SongId song;
    const Status s = uploader.link_file(FileId{file_id}, LibraryId{lib_id}, tag_overrides(cl), &song);
    if (!is_ok(s)) {
        print_status_error("link", s);
        return kExitError;
    }
    fmt::print(out_, "song {} file {}\n", song.v, file_id);
    return kExitOk;
}

int App::remove_song(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    u64 song_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 2 || !parse_id(cl.positional[0], &lib_id) ||
        !parse_id(cl.positional[1], &song_id)) {
        return usage("rm-song <library> <song>");
    }
    lib::CascadeDeleter deleter(*catalog_);
    const lib::DeleteResult r = deleter.delete_song_from_library(LibraryId{lib_id}, SongId{song_id});
    print_delete_result(out_, r);
    return delete_exit_code(r);
}

int App::remove_library(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("rm-library <library>");
    }
    lib::CascadeConfig ccfg;
    ccfg.policy = opts_.config.strict_cascade ? lib::CascadePolicy::Strict : lib::CascadePolicy::BestEffort;
    ccfg.respect_can_delete = true;
    lib::CascadeDeleter deleter(*catalog_, ccfg);

    const lib::DeleteResult r = deleter.delete_library(LibraryId{lib_id}, [this](const lib::DeleteProgress& p) {
        fmt::print(out_, "[{}] {}/{} {}\n", lib::delete_stage_name(p.stage), p.current, p.total, p.message);
    });
    print_delete_result(out_, r);
    return delete_exit_code(r);
}

int App::make_playlist(const CliArgs& args) {
    CommandLine cl;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1) {
        return usage("mkpl <name> [-L library]");
    }
    PlaylistRecord rec;
    rec.owner = opts_.user;
    rec.name = cl.positional[0];
    rec.created_at = static_cast<Timestamp>(std::time(nullptr));
    if (const ParsedOption* o = find_option(cl.opts, OptionId::Library)) {
        if (o->value.i64v <= 0) {
            return usage("mkpl <name> [-L library]");
        }
        rec.linked_library = LibraryId{static_cast<u64>(o->value.i64v)};
    }

    PlaylistId id;
    const Status s = db::db_playlist_create(catalog_db_, rec, &id);
    if (!is_ok(s)) {
        print_status_error("mkpl", s);
        return kExitError;
    }
    fmt::print(out_, "playlist {} {}\n", id.v, rec.name);
    return kExitOk;
}

int App::playlist_add(const CliArgs& args) {
    CommandLine cl;
    u64 pl_id = 0;
    u64 song_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 2 || !parse_id(cl.positional[0], &pl_id) ||
        !parse_id(cl.positional[1], &song_id)) {
        return usage("pl-add <playlist> <song>");
    }
    PlaylistRecord pl;
    Status s = db::db_playlist_get(catalog_db_, PlaylistId{pl_id}, &pl);
    if (!is_ok(s)) {
        print_status_error("pl-add: playlist lookup", s);
        return kExitError;
    }
    PlaylistSongRecord link;
    link.playlist_id = pl.id;
    link.song_id = SongId{song_id};
    link.order = pl.song_count;
    link.added_at = static_cast<Timestamp>(std::time(nullptr));
    s = db::db_playlist_song_add(catalog_db_, link);
    if (!is_ok(s)) {
        print_status_error("pl-add", s);
        return kExitError;
    }
    fmt::print(out_, "playlist {} += song {}\n", pl_id, song_id);
    return kExitOk;
}

int App::remove_playlist(const CliArgs& args) {
    CommandLine cl;
    u64 pl_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1 || !parse_id(cl.positional[0], &pl_id)) {
        return usage("rm-playlist <playlist>");
    }
    lib::CascadeDeleter deleter(*catalog_);
    const lib::DeleteResult r = deleter.delete_playlist(PlaylistId{pl_id});
    print_delete_result(out_, r);
    return delete_exit_code(r);
}

int App::list_files(const CliArgs& args) {
    if (args.argc != 0) {
        return usage("files");
    }
    std::vector<FileRecord> files;
    const Status s = db::db_file_list(catalog_db_, &files);
    if (!is_ok(s)) {
        print_status_error("files", s);
        return kExitError;
    }
    for (const FileRecord& f : files) {
        fmt::print(out_, "{:>6}  refs={:<4} {:>10}  {}\n", f.id.v, f.ref_count, f.size_bytes, f.storage_key);
    }
    return kExitOk;
}

int App::fsck(const CliArgs& args) {
    CommandLine cl;
    if (!is_ok(split_command_line(args, &cl)) || !cl.positional.empty()) {
        return usage("fsck [--repair]");
    }
    lib::AuditOptions aopts;
    aopts.repair = has_flag(cl, OptionId::Repair);

    lib::AuditReport report;
    const Status s = lib::audit_catalog(catalog_db_, blobs_.get(), aopts, &report);
    if (!is_ok(s)) {
        print_status_error("fsck", s);
        return kExitError;
    }

    fmt::print(out_, "files checked: {}\n", report.files_checked);
    for (const lib::RefDrift& d : report.drifts) {
        fmt::print(out_, "  ref drift file={} stored={} actual={}\n", d.file_id.v, d.stored, d.actual);
    }
    for (const std::string& key : report.missing_blobs) {
        fmt::print(out_, "  missing blob {}\n", key);
    }
    for (const SongRecord& song : report.orphaned_songs) {
        fmt::print(out_, "  orphaned song={} library={} (rm-library {} collects it)\n", song.id.v,
                   song.library_id.v, song.library_id.v);
    }
    if (aopts.repair) {
        fmt::print(out_, "repaired={} purged={}\n", report.repaired, report.purged_files);
        for (const std::string& key : report.unpurged_blobs) {
            fmt::print(out_, "  blob not removed {}\n", key);
        }
    }
    if (lib::audit_clean(report)) {
        fmt::print(out_, "clean\n");
        return kExitOk;
    }
    return aopts.repair && report.missing_blobs.empty() && report.orphaned_songs.empty() &&
                   report.unpurged_blobs.empty()
               ? kExitOk
               : kExitError;
}

int App::mirror_add(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 2 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("mirror-add <library> <path> [-t title] [-a artist] [--album album] [-m mime]");
    }
    Status s = open_mirror();
    if (!is_ok(s)) {
        print_status_error("mirror-add: open mirror", s);
        return kExitError;
    }

    const char* path = cl.positional[1];
    std::vector<u8> bytes;
    s = read_file(path, &bytes);
    if (!is_ok(s)) {
        std::fprintf(stderr, "error: mirror-add: cannot read %s\n", path);
        return kExitError;
    }

    const std::string_view mime = mime_for_upload(cl, path);
    TagRecord tags;
    try {
        s = extractor_.extract(medley::storage::view_of(bytes), mime, &tags);
    } catch (const std::exception& e) {
        logger()->warn("tag extraction threw path={} error={}", path, e.what());
        s = make_status(StatusDomain::Media, StatusCode::Unknown);
    }
    if (!is_ok(s)) {
        tags = TagRecord{};
    }
    medley::media::apply_filename_fallback(std::filesystem::path(path).filename().string(), &tags);
    const TagRecord overrides = tag_overrides(cl);
    tags = lib::merge_tags(tags, &overrides);

    lib::MirrorSongInput in;
    in.library = LibraryId{lib_id};
    in.tags = tags;
    in.data = medley::storage::view_of(bytes);
    in.mime_type = mime;

    lib::MirrorAddResult result;
    s = lib::mirror_add_song(*mirror_, in, &result);
    if (!is_ok(s)) {
        print_status_error("mirror-add", s);
        return kExitError;
    }
    fmt::print(out_, "song {} file {} {} {}\n", result.song_id.v, result.file_id.v, result.stream_url,
               result.cached ? "cached" : "not cached");
    return kExitOk;
}

int App::mirror_list(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("mirror-ls <library>");
    }
    Status s = open_mirror();
    if (!is_ok(s)) {
        print_status_error("mirror-ls: open mirror", s);
        return kExitError;
    }
    std::vector<SongRecord> songs;
    s = db::db_song_list_by_library(mirror_db_, LibraryId{lib_id}, &songs);
    db::MirrorLibraryStats stats;
    if (is_ok(s)) {
        s = db::mirror_library_stats(mirror_db_, LibraryId{lib_id}, &stats);
    }
    if (!is_ok(s)) {
        print_status_error("mirror-ls", s);
        return kExitError;
    }
    for (const SongRecord& song : songs) {
        fmt::print(out_, "{:>6}  {:<8} {} - {}  {}\n", song.id.v, song.is_cached ? "cached" : "-",
                   display(song.tags.artist), display(song.tags.title), song.stream_url);
    }
    fmt::print(out_, "songs={} cached={} bytes={}\n", stats.song_count, stats.cached_count, stats.cached_bytes);
    return kExitOk;
}

int App::mirror_remove_library(const CliArgs& args) {
    CommandLine cl;
    u64 lib_id = 0;
    if (!is_ok(split_command_line(args, &cl)) || cl.positional.size() != 1 || !parse_id(cl.positional[0], &lib_id)) {
        return usage("mirror-rm-library <library>");
    }
    const Status s = open_mirror();
    if (!is_ok(s)) {
        print_status_error("mirror-rm-library: open mirror", s);
        return kExitError;
    }
    lib::CascadeConfig ccfg;
    ccfg.policy = opts_.config.strict_cascade ? lib::CascadePolicy::Strict : lib::CascadePolicy::BestEffort;
    lib::CascadeDeleter deleter(*mirror_, ccfg);
    const lib::DeleteResult r = deleter.delete_library(LibraryId{lib_id}, [this](const lib::DeleteProgress& p) {
        fmt::print(out_, "[{}] {}/{} {}\n", lib::delete_stage_name(p.stage), p.current, p.total, p.message);
    });
    print_delete_result(out_, r);
    return delete_exit_code(r);
}

} // namespace medley::cli
