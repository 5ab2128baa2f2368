#include "wcoord/cli/options.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace wcoord::cli {

    using wcoord::core::Status;
    using wcoord::core::StatusCode;
    using wcoord::core::StatusDomain;

    namespace {
        [[nodiscard]] constexpr Status invalid(u32 aux = 0) noexcept {
            return wcoord::core::make_status(StatusDomain::Cli, StatusCode::Invalid, aux);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
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
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_f64(const char* s, double* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(s, &end);
            if (end == s || end == nullptr || *end != '\0' || errno != 0 || !std::isfinite(v)) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return wcoord::core::ok_status();
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return invalid(static_cast<u32>(spec.id));
                    }
                    opt->value.i64v = v;
                    return wcoord::core::ok_status();
                }
                case OptionType::F64: {
                    double v{};
                    if (!parse_f64(value, &v)) {
                        return invalid(static_cast<u32>(spec.id));
                    }
                    opt->value.f64v = v;
                    return wcoord::core::ok_status();
                }
                case OptionType::Flag:
                    break;
            }
            return invalid(static_cast<u32>(spec.id));
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return wcoord::core::ok_status();
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

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            // A bare "-" or a negative number is positional.
            if (tok[0] != '-' || tok[1] == '\0' || (tok[1] >= '0' && tok[1] <= '9') || tok[1] == '.') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            bool inline_value = false;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[64]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name = name_buf;
                    value = eq + 1;
                    inline_value = true;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                    inline_value = true;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value) {
                    return invalid(static_cast<u32>(spec->id));
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                if (inline_value) {
                    ++i;
                } else {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return invalid(static_cast<u32>(spec->id));
                    }
                    value = args.argv[i + 1];
                    i += 2;
                }
                const Status s = set_value(*spec, value, &opt);
                if (!wcoord::core::is_ok(s)) {
                    return s;
                }
            }

            const Status s = push_option(out, opt);
            if (!wcoord::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return wcoord::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        if (opts.data == nullptr) {
            return nullptr;
        }
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }
} // namespace wcoord::cli
