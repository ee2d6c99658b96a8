#include "medley/media/tags.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <regex>
#include <string>
#include <utility>

namespace medley::media {

using namespace medley::core;
using medley::storage::BufferView;

namespace {

    constexpr u64 kId3v1Size = 128;
    constexpr u64 kMpegScanLimit = 64 * 1024;

    [[nodiscard]] u32 rd_le16(const u8* p) noexcept {
        return static_cast<u32>(p[0]) | (static_cast<u32>(p[1]) << 8);
    }

    [[nodiscard]] u32 rd_le32(const u8* p) noexcept {
        return static_cast<u32>(p[0]) | (static_cast<u32>(p[1]) << 8) | (static_cast<u32>(p[2]) << 16) |
               (static_cast<u32>(p[3]) << 24);
    }

    [[nodiscard]] u32 rd_be32(const u8* p) noexcept {
        return (static_cast<u32>(p[0]) << 24) | (static_cast<u32>(p[1]) << 16) | (static_cast<u32>(p[2]) << 8) |
               static_cast<u32>(p[3]);
    }

    [[nodiscard]] u32 rd_syncsafe32(const u8* p) noexcept {
        return (static_cast<u32>(p[0] & 0x7f) << 21) | (static_cast<u32>(p[1] & 0x7f) << 14) |
               (static_cast<u32>(p[2] & 0x7f) << 7) | static_cast<u32>(p[3] & 0x7f);
    }

    [[nodiscard]] std::string trim(std::string s) {
        const auto is_pad = [](unsigned char c) { return c == '\0' || c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
        while (!s.empty() && is_pad(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        size_t start = 0;
        while (start < s.size() && is_pad(static_cast<unsigned char>(s[start]))) {
            ++start;
        }
        return s.substr(start);
    }

    void append_utf8(std::string* out, u32 cp) {
        if (cp < 0x80) {
            out->push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Stops at the first NUL; later values of multi-value frames are ignored.
    [[nodiscard]] std::string latin1_to_utf8(const u8* p, u64 n) {
        std::string out;
        out.reserve(static_cast<size_t>(n));
        for (u64 i = 0; i < n && p[i] != 0; ++i) {
            append_utf8(&out, p[i]);
        }
        return out;
    }

    [[nodiscard]] std::string utf16_to_utf8(const u8* p, u64 n, bool big_endian) {
        std::string out;
        u64 i = 0;
        if (n >= 2 && ((p[0] == 0xFF && p[1] == 0xFE) || (p[0] == 0xFE && p[1] == 0xFF))) {
            big_endian = p[0] == 0xFE;
            i = 2;
        }
        auto unit = [&](u64 at) -> u32 {
            return big_endian ? (static_cast<u32>(p[at]) << 8) | p[at + 1] : (static_cast<u32>(p[at + 1]) << 8) | p[at];
        };
        for (; i + 1 < n; i += 2) {
            u32 cu = unit(i);
            if (cu == 0) {
                break;
            }
            if (cu >= 0xD800 && cu <= 0xDBFF && i + 3 < n) {
                const u32 lo = unit(i + 2);
                if (lo >= 0xDC00 && lo <= 0xDFFF) {
                    cu = 0x10000 + ((cu - 0xD800) << 10) + (lo - 0xDC00);
                    i += 2;
                }
            }
            append_utf8(&out, cu);
        }
        return out;
    }

    [[nodiscard]] std::string decode_text_frame(const u8* body, u64 size) {
        if (size < 1) {
            return std::string();
        }
        const u8 encoding = body[0];
        const u8* text = body + 1;
        const u64 len = size - 1;
        switch (encoding) {
            case 0:
                return trim(latin1_to_utf8(text, len));
            case 1:
                return trim(utf16_to_utf8(text, len, false));
            case 2:
                return trim(utf16_to_utf8(text, len, true));
            case 3: {
                const u8* nul = static_cast<const u8*>(std::memchr(text, 0, static_cast<size_t>(len)));
                const u64 n = nul ? static_cast<u64>(nul - text) : len;
                return trim(std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(n)));
            }
            default:
                return std::string();
        }
    }

    // Leading decimal number of "3/12", "2004-05-01", " 7".
    [[nodiscard]] std::optional<u32> leading_number(std::string_view s) {
        size_t i = 0;
        while (i < s.size() && s[i] == ' ') {
            ++i;
        }
        u64 v = 0;
        size_t digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9' && digits < 9) {
            v = v * 10 + static_cast<u64>(s[i] - '0');
            ++i;
            ++digits;
        }
        if (digits == 0 || v == 0) {
            return std::nullopt;
        }
        return static_cast<u32>(v);
    }

    void set_text(std::optional<std::string>* field, std::string value) {
        if (!field->has_value() && !value.empty()) {
            *field = std::move(value);
        }
    }

    void set_number(std::optional<u32>* field, std::string_view value) {
        if (!field->has_value()) {
            *field = leading_number(value);
        }
    }

    // "(17)Rock" -> "Rock"; "(17)" stays as is.
    [[nodiscard]] std::string clean_genre(std::string g) {
        if (g.size() > 2 && g[0] == '(') {
            const size_t close = g.find(')');
            if (close != std::string::npos && close + 1 < g.size()) {
                return trim(g.substr(close + 1));
            }
        }
        return g;
    }

    // ------------------------------------------------------------------------
    // RIFF/WAVE
    // ------------------------------------------------------------------------

    void parse_riff_info(const u8* p, u64 n, TagRecord* out) {
        u64 off = 0;
        while (off + 8 <= n) {
            const u8* id = p + off;
            const u64 size = rd_le32(p + off + 4);
            const u64 body = off + 8;
            if (size > n - body) {
                break;
            }
            const std::string value = trim(latin1_to_utf8(p + body, size));
            if (std::memcmp(id, "INAM", 4) == 0) {
                set_text(&out->title, value);
            } else if (std::memcmp(id, "IART", 4) == 0) {
                set_text(&out->artist, value);
            } else if (std::memcmp(id, "IPRD", 4) == 0) {
                set_text(&out->album, value);
            } else if (std::memcmp(id, "IGNR", 4) == 0) {
                set_text(&out->genre, value);
            } else if (std::memcmp(id, "ICRD", 4) == 0) {
                set_number(&out->year, value);
            } else if (std::memcmp(id, "ITRK", 4) == 0 || std::memcmp(id, "IPRT", 4) == 0) {
                set_number(&out->track_number, value);
            }
            off = body + size + (size & 1);
        }
    }

    [[nodiscard]] bool parse_wav(const u8* p, u64 n, TagRecord* out) {
        if (n < 12 || std::memcmp(p, "RIFF", 4) != 0 || std::memcmp(p + 8, "WAVE", 4) != 0) {
            return false;
        }

        bool have_fmt = false;
        u32 byte_rate = 0;
        u64 data_size = 0;

        u64 off = 12;
        while (off + 8 <= n) {
            const u8* id = p + off;
            const u64 size = rd_le32(p + off + 4);
            const u64 body = off + 8;
            const u64 avail = std::min<u64>(size, n - body);

            if (std::memcmp(id, "fmt ", 4) == 0 && avail >= 16) {
                out->physical.channels = rd_le16(p + body + 2);
                out->physical.sample_rate = rd_le32(p + body + 4);
                byte_rate = rd_le32(p + body + 8);
                have_fmt = true;
            } else if (std::memcmp(id, "data", 4) == 0) {
                data_size = avail;
            } else if (std::memcmp(id, "LIST", 4) == 0 && avail >= 4 && std::memcmp(p + body, "INFO", 4) == 0) {
                parse_riff_info(p + body + 4, avail - 4, out);
            }

            if (size > n - body) {
                break;
            }
            off = body + size + (size & 1);
        }

        if (!have_fmt) {
            return false;
        }
        if (byte_rate > 0) {
            out->physical.bitrate_kbps = static_cast<u32>((static_cast<u64>(byte_rate) * 8 + 500) / 1000);
            if (data_size > 0) {
                out->physical.duration_sec = static_cast<u32>((data_size + byte_rate / 2) / byte_rate);
            }
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // ID3
    // ------------------------------------------------------------------------

    // Returns the byte length of the ID3v2 tag at the start of the buffer (0 if none).
    [[nodiscard]] u64 parse_id3v2(const u8* p, u64 n, TagRecord* out) {
        if (n < 10 || std::memcmp(p, "ID3", 3) != 0) {
            return 0;
        }
        const u8 major = p[3];
        const u8 flags = p[5];
        const u64 tag_size = rd_syncsafe32(p + 6);
        u64 total = 10 + tag_size + ((flags & 0x10) ? 10 : 0);
        const u64 end = std::min<u64>(10 + tag_size, n);
        if (major != 3 && major != 4) {
            return total;
        }

        u64 off = 10;
        if ((flags & 0x40) && off + 4 <= end) {
            const u64 ext = major == 4 ? rd_syncsafe32(p + off) : static_cast<u64>(rd_be32(p + off)) + 4;
            off += ext;
        }

        while (off + 10 <= end) {
            const u8* id = p + off;
            if (id[0] == 0) {
                break;  // padding
            }
            const u64 fsize = major == 4 ? rd_syncsafe32(p + off + 4) : rd_be32(p + off + 4);
            const u64 body = off + 10;
            if (fsize > end - body) {
                break;
            }

            if (id[0] == 'T') {
                std::string value = decode_text_frame(p + body, fsize);
                if (std::memcmp(id, "TIT2", 4) == 0) {
                    set_text(&out->title, std::move(value));
                } else if (std::memcmp(id, "TPE1", 4) == 0) {
                    set_text(&out->artist, std::move(value));
                } else if (std::memcmp(id, "TALB", 4) == 0) {
                    set_text(&out->album, std::move(value));
                } else if (std::memcmp(id, "TPE2", 4) == 0) {
                    set_text(&out->album_artist, std::move(value));
                } else if (std::memcmp(id, "TCON", 4) == 0) {
                    set_text(&out->genre, clean_genre(std::move(value)));
                } else if (std::memcmp(id, "TCOM", 4) == 0) {
                    set_text(&out->composer, std::move(value));
                } else if (std::memcmp(id, "TYER", 4) == 0 || std::memcmp(id, "TDRC", 4) == 0) {
                    set_number(&out->year, value);
                } else if (std::memcmp(id, "TRCK", 4) == 0) {
                    set_number(&out->track_number, value);
                } else if (std::memcmp(id, "TPOS", 4) == 0) {
                    set_number(&out->disc_number, value);
                } else if (std::memcmp(id, "TLEN", 4) == 0 && !out->physical.duration_sec) {
                    const auto ms = leading_number(value);
                    if (ms) {
                        out->physical.duration_sec = (*ms + 500) / 1000;
                    }
                }
            }
            off = body + fsize;
        }
        return total;
    }

    [[nodiscard]] bool has_id3v1(const u8* p, u64 n) noexcept {
        return n >= kId3v1Size && std::memcmp(p + n - kId3v1Size, "TAG", 3) == 0;
    }

    void parse_id3v1(const u8* p, u64 n, TagRecord* out) {
        const u8* t = p + n - kId3v1Size;
        set_text(&out->title, trim(latin1_to_utf8(t + 3, 30)));
        set_text(&out->artist, trim(latin1_to_utf8(t + 33, 30)));
        set_text(&out->album, trim(latin1_to_utf8(t + 63, 30)));
        set_number(&out->year, std::string(reinterpret_cast<const char*>(t + 93), 4));
        // ID3v1.1: zero byte before the last comment byte marks a track number.
        if (t[125] == 0 && t[126] != 0 && !out->track_number) {
            out->track_number = t[126];
        }
    }

    // ------------------------------------------------------------------------
    // MPEG audio frame header
    // ------------------------------------------------------------------------

    struct MpegFrame {
        u32 bitrate_kbps{0};
        u32 sample_rate{0};
        u32 channels{0};
        u64 frame_len{0};
    };

    constexpr std::array<std::array<u16, 15>, 5> kBitrates{{
        {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448},  // V1 L1
        {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384},     // V1 L2
        {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320},      // V1 L3
        {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256},     // V2 L1
        {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160},          // V2 L2/L3
    }};

    constexpr std::array<std::array<u32, 3>, 3> kSampleRates{{
        {44100, 48000, 32000},  // MPEG-1
        {22050, 24000, 16000},  // MPEG-2
        {11025, 12000, 8000},   // MPEG-2.5
    }};

    [[nodiscard]] bool decode_mpeg_header(const u8* h, MpegFrame* out) noexcept {
        if (h[0] != 0xFF || (h[1] & 0xE0) != 0xE0) {
            return false;
        }
        const u32 version_bits = (h[1] >> 3) & 0x3;  // 3=V1, 2=V2, 0=V2.5
        const u32 layer_bits = (h[1] >> 1) & 0x3;    // 3=L1, 2=L2, 1=L3
        const u32 bitrate_idx = h[2] >> 4;
        const u32 rate_idx = (h[2] >> 2) & 0x3;
        if (version_bits == 1 || layer_bits == 0 || bitrate_idx == 0 || bitrate_idx == 15 || rate_idx == 3) {
            return false;
        }

        const bool v1 = version_bits == 3;
        const u32 layer = 4 - layer_bits;  // 1, 2, 3
        size_t table = 0;
        if (v1) {
            table = layer - 1;
        } else {
            table = layer == 1 ? 3 : 4;
        }
        const u32 version_row = v1 ? 0 : (version_bits == 2 ? 1 : 2);

        out->bitrate_kbps = kBitrates[table][bitrate_idx];
        out->sample_rate = kSampleRates[version_row][rate_idx];
        out->channels = ((h[3] >> 6) == 3) ? 1 : 2;

        const u64 padding = (h[2] >> 1) & 0x1;
        const u64 bps = static_cast<u64>(out->bitrate_kbps) * 1000;
        if (layer == 1) {
            out->frame_len = (12 * bps / out->sample_rate + padding) * 4;
        } else if (layer == 3 && !v1) {
            out->frame_len = 72 * bps / out->sample_rate + padding;
        } else {
            out->frame_len = 144 * bps / out->sample_rate + padding;
        }
        return out->frame_len >= 4;
    }

    // Constant-bitrate estimate from the first frame whose successor also syncs.
    [[nodiscard]] bool parse_mpeg(const u8* p, u64 start, u64 audio_end, TagRecord* out) {
        const u64 scan_end = std::min<u64>(audio_end, start + kMpegScanLimit);
        for (u64 i = start; i + 4 <= scan_end; ++i) {
            MpegFrame frame;
            if (!decode_mpeg_header(p + i, &frame)) {
                continue;
            }
            const u64 next = i + frame.frame_len;
            if (next + 2 <= audio_end && (p[next] != 0xFF || (p[next + 1] & 0xE0) != 0xE0)) {
                continue;
            }
            out->physical.bitrate_kbps = frame.bitrate_kbps;
            out->physical.sample_rate = frame.sample_rate;
            out->physical.channels = frame.channels;
            if (!out->physical.duration_sec) {
                const u64 audio_bytes = audio_end - i;
                out->physical.duration_sec =
                    static_cast<u32>((audio_bytes * 8 + frame.bitrate_kbps * 500) / (static_cast<u64>(frame.bitrate_kbps) * 1000));
            }
            return true;
        }
        return false;
    }

} // namespace

Status BasicTagExtractor::extract(BufferView data, std::string_view /*mime_type*/, TagRecord* out) {
    if (out == nullptr || (data.len > 0 && data.data == nullptr)) {
        return make_status(StatusDomain::Media, StatusCode::Invalid);
    }

    *out = TagRecord{};
    const u8* p = data.data;
    const u64 n = data.len;

    if (parse_wav(p, n, out)) {
        return ok_status();
    }

    bool recognized = false;
    const u64 id3v2_len = parse_id3v2(p, n, out);
    if (id3v2_len > 0) {
        recognized = true;
    }

    u64 audio_end = n;
    if (has_id3v1(p, n)) {
        parse_id3v1(p, n, out);
        audio_end -= kId3v1Size;
        recognized = true;
    }

    if (id3v2_len < audio_end && parse_mpeg(p, id3v2_len, audio_end, out)) {
        recognized = true;
    }

    if (!recognized) {
        return make_status(StatusDomain::Media, StatusCode::Unsupported);
    }
    return ok_status();
}

TagRecord tags_from_filename(std::string_view filename) {
    std::string name(filename);
    const size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name.erase(0, slash + 1);
    }

    static const std::regex kExtension(R"(\.[^.]+$)");
    static const std::regex kTrackTitle(R"(^\d+\s*[-_.]\s*(.+)$)");
    static const std::regex kArtistTitle(R"(^(.+?)\s*-\s*(.+)$)");

    const std::string stem = std::regex_replace(name, kExtension, "");

    TagRecord tags;
    std::smatch m;
    if (std::regex_match(stem, m, kTrackTitle)) {
        tags.title = trim(m[1].str());
    } else if (std::regex_match(stem, m, kArtistTitle)) {
        tags.artist = trim(m[1].str());
        tags.title = trim(m[2].str());
    } else {
        tags.title = stem;
    }
    return tags;
}

void apply_filename_fallback(std::string_view filename, TagRecord* tags) {
    if (tags == nullptr || (tags->title && !tags->title->empty())) {
        return;
    }
    TagRecord guess = tags_from_filename(filename);
    tags->title = std::move(guess.title);
    if (!tags->artist && guess.artist) {
        tags->artist = std::move(guess.artist);
    }
}

} // namespace medley::media
