#include "assetforge/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace assetforge::cli {
    using assetforge::core::is_ok;
    using assetforge::core::make_status;
    using assetforge::core::ok_status;
    using assetforge::core::Status;
    using assetforge::core::StatusCode;
    using assetforge::core::StatusDomain;

    namespace {
        constexpr size_t kMaxLongName = 64;

        [[nodiscard]] Status invalid() noexcept {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_spec(const OptionSpec* specs, u32 spec_count, const char* long_name, char short_name) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (long_name != nullptr) {
                    if (s.long_name != nullptr && std::strcmp(s.long_name, long_name) == 0) {
                        return &s;
                    }
                } else if (short_name != '\0' && s.short_name == short_name) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Appends one occurrence. `value` is nullptr for flags.
        [[nodiscard]] Status append(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    if (value != nullptr) {
                        return invalid();
                    }
                    opt.value.boolv = 1;
                    break;
                case OptionType::String:
                    opt.value.str = value;
                    break;
                case OptionType::I64:
                    if (!parse_i64(value, &opt.value.i64v)) {
                        return invalid();
                    }
                    break;
            }
            out->data[out->len++] = opt;
            return ok_status();
        }

        // Cursor over argv shared by the long and short forms.
        struct TokenStream {
            const CliArgs& args;
            u32 pos;

            [[nodiscard]] const char* take_value() noexcept {
                if (pos >= args.argc || args.argv[pos] == nullptr) {
                    return nullptr;
                }
                return args.argv[pos++];
            }
        };

        // "--name", "--name value" or "--name=value"; `body` is the text after "--".
        [[nodiscard]] Status parse_long(TokenStream& ts, const char* body, const OptionSpec* specs, u32 spec_count, ParsedOptions* out) noexcept {
            char name[kMaxLongName]{};
            const char* inline_value = nullptr;
            const char* eq = std::strchr(body, '=');
            const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - body) : std::strlen(body);
            if (name_len == 0 || name_len >= sizeof(name)) {
                return invalid();
            }
            std::memcpy(name, body, name_len);
            if (eq != nullptr) {
                inline_value = eq + 1;
            }

            const OptionSpec* spec = find_spec(specs, spec_count, name, '\0');
            if (spec == nullptr) {
                return invalid();
            }
            if (spec->type == OptionType::Flag) {
                return append(out, *spec, inline_value);
            }
            const char* value = inline_value != nullptr ? inline_value : ts.take_value();
            if (value == nullptr) {
                return invalid();
            }
            return append(out, *spec, value);
        }

        // "-n", "-n value" or "-nvalue"; `body` is the text after "-".
        [[nodiscard]] Status parse_short(TokenStream& ts, const char* body, const OptionSpec* specs, u32 spec_count, ParsedOptions* out) noexcept {
            const OptionSpec* spec = find_spec(specs, spec_count, nullptr, body[0]);
            if (spec == nullptr) {
                return invalid();
            }
            const char* attached = body[1] != '\0' ? body + 1 : nullptr;
            if (spec->type == OptionType::Flag) {
                return append(out, *spec, attached);
            }
            const char* value = attached != nullptr ? attached : ts.take_value();
            if (value == nullptr) {
                return invalid();
            }
            return append(out, *spec, value);
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return invalid();
        }

        TokenStream ts{args, 0};
        while (ts.pos < args.argc) {
            const char* tok = args.argv[ts.pos];
            // positional, or a lone "-" (stdin by convention)
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            ++ts.pos;
            if (std::strcmp(tok, "--") == 0) {
                break;
            }

            const Status s = tok[1] == '-'
                ? parse_long(ts, tok + 2, specs, spec_count, out)
                : parse_short(ts, tok + 1, specs, spec_count, out);
            if (!is_ok(s)) {
                return s;
            }
        }

        *consumed = ts.pos;
        return ok_status();
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

    bool option_flag(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return opt != nullptr && opt->type == OptionType::Flag && opt->value.boolv != 0;
    }

    const char* option_string(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* opt = find_option(opts, id);
        return opt != nullptr && opt->type == OptionType::String ? opt->value.str : nullptr;
    }

    u32 option_strings(const ParsedOptions& opts, OptionId id, const char** out, u32 cap) noexcept {
        u32 n = 0;
        for (u32 i = 0; i < opts.len && n < cap; ++i) {
            const ParsedOption& opt = opts.data[i];
            if (opt.id == id && opt.type == OptionType::String) {
                out[n++] = opt.value.str;
            }
        }
        return n;
    }
} // namespace assetforge::cli
