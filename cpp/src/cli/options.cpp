#include "medley/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace medley::cli {
    using medley::core::Status;

    namespace {
        [[nodiscard]] constexpr Status cli_invalid() noexcept {
            return medley::core::make_status(medley::core::StatusDomain::Cli, medley::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end || s == end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return medley::core::ok_status();
        }

        // Flags take no value; the others take `inline_value` or the next token.
        [[nodiscard]] Status take_option(const CliArgs& args, const OptionSpec& spec, const char* inline_value,
                                         u32* i, ParsedOptions* out) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;

            if (spec.type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
                ++*i;
                return push_option(out, opt);
            }

            const char* value = inline_value;
            if (value == nullptr) {
                if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                    return cli_invalid();
                }
                value = args.argv[*i + 1];
                *i += 2;
            } else {
                ++*i;
            }

            switch (spec.type) {
                case OptionType::String:
                    opt.value.str = value;
                    break;
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return cli_invalid();
                    }
                    opt.value.i64v = v;
                    break;
                }
                default:
                    return cli_invalid();
            }
            return push_option(out, opt);
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            Status s;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* value = nullptr;
                char name_buf[64]{};
                if (const char* eq = std::strchr(name, '='); eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                }

                const OptionSpec* spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return cli_invalid();
                }
                s = take_option(args, *spec, value, &i, out);
            } else {
                const OptionSpec* spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return cli_invalid();
                }
                s = take_option(args, *spec, tok[2] != '\0' ? tok + 2 : nullptr, &i, out);
            }
            if (!medley::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return medley::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace medley::cli
