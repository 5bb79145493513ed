#include <docpatch-cpp/hasher.hpp>

#include "crypto/sha256.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace docpatch_cpp {

namespace {

// Serializes canonically into any sink with `append(std::string_view)`.
template <typename Sink>
class CanonicalWriter {
public:
    explicit CanonicalWriter(Sink& sink) : sink_{sink} {}

    void write(const Value& value) {
        std::visit(overload{
            [&](Null) { sink_.append("null"); },
            [&](bool b) { sink_.append(b ? "true" : "false"); },
            [&](std::int64_t i) { write_integer(i); },
            [&](std::uint64_t u) { write_integer(u); },
            [&](double d) { write_double(d); },
            [&](const std::string& s) { write_string(s); },
            [&](const Array& a) {
                sink_.append("[");
                for (std::size_t i = 0; i < a.size(); ++i) {
                    if (i > 0) sink_.append(",");
                    write(a[i]);
                }
                sink_.append("]");
            },
            [&](const Object& o) {
                auto members = std::vector<const Object::Member*>{};
                members.reserve(o.size());
                for (const auto& m : o) members.push_back(&m);
                std::ranges::sort(members, [](const auto* a, const auto* b) {
                    return a->first < b->first;
                });
                sink_.append("{");
                for (std::size_t i = 0; i < members.size(); ++i) {
                    if (i > 0) sink_.append(",");
                    write_string(members[i]->first);
                    sink_.append(":");
                    write(members[i]->second);
                }
                sink_.append("}");
            },
        }, value.storage());
    }

private:
    template <typename I>
    void write_integer(I i) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), i);
        sink_.append(std::string_view{buf, static_cast<std::size_t>(ptr - buf)});
    }

    void write_double(double d) {
        if (!std::isfinite(d)) {
            throw std::domain_error{"cannot canonicalize a non-finite number"};
        }
        // Integral doubles take the integer spelling so equal numbers hash alike.
        if (d == std::trunc(d)) {
            if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
                write_integer(static_cast<std::int64_t>(d));
                return;
            }
            if (d > 0 && d < 18446744073709551616.0) {
                write_integer(static_cast<std::uint64_t>(d));
                return;
            }
        }
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        sink_.append(std::string_view{buf, static_cast<std::size_t>(ptr - buf)});
    }

    void write_string(std::string_view s) {
        static constexpr char hex_chars[] = "0123456789abcdef";
        sink_.append("\"");
        auto run_start = std::size_t{0};
        for (std::size_t i = 0; i < s.size(); ++i) {
            const auto c = static_cast<unsigned char>(s[i]);
            const char* escape = nullptr;
            char unicode[7] = {'\\', 'u', '0', '0', 0, 0, 0};
            switch (c) {
                case '"':  escape = "\\\""; break;
                case '\\': escape = "\\\\"; break;
                case '\b': escape = "\\b"; break;
                case '\f': escape = "\\f"; break;
                case '\n': escape = "\\n"; break;
                case '\r': escape = "\\r"; break;
                case '\t': escape = "\\t"; break;
                default:
                    if (c < 0x20) {
                        unicode[4] = hex_chars[c >> 4];
                        unicode[5] = hex_chars[c & 0x0F];
                        escape = unicode;
                    }
            }
            if (!escape) continue;
            sink_.append(s.substr(run_start, i - run_start));
            sink_.append(escape);
            run_start = i + 1;
        }
        sink_.append(s.substr(run_start));
        sink_.append("\"");
    }

    Sink& sink_;
};

struct StringSink {
    std::string out;
    void append(std::string_view s) { out.append(s); }
};

struct DigestSink {
    crypto::Sha256 sha;
    void append(std::string_view s) { sha.update(s); }
};

auto parse_option_pointer(const std::string& text, const char* name) -> Pointer {
    auto pointer = Pointer::parse(text);
    if (!pointer) {
        throw std::invalid_argument{std::string{name} + ": " + pointer.error().message};
    }
    return *std::move(pointer);
}

}  // anonymous namespace

auto canonical_json(const Value& value) -> std::string {
    auto sink = StringSink{};
    CanonicalWriter{sink}.write(value);
    return std::move(sink.out);
}

auto is_content_hash(std::string_view text) -> bool {
    constexpr auto prefix = std::string_view{"sha256:"};
    if (text.size() != prefix.size() + 64 || !text.starts_with(prefix)) return false;
    return std::ranges::all_of(text.substr(prefix.size()), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

ContentHasher::ContentHasher(std::vector<Pointer> excluded)
    : excluded_{std::move(excluded)} {}

auto ContentHasher::for_documents(const EngineOptions& options) -> ContentHasher {
    return ContentHasher{{
        parse_option_pointer(options.audit_pointer, "audit_pointer"),
        parse_option_pointer(options.versioning_pointer, "versioning_pointer"),
        parse_option_pointer(options.updated_at_pointer, "updated_at_pointer"),
    }};
}

auto ContentHasher::hash(const Value& tree) const -> std::string {
    auto present = std::ranges::any_of(excluded_, [&](const Pointer& p) {
        return static_cast<bool>(find(tree, p));
    });

    auto sink = DigestSink{};
    if (!present) {
        CanonicalWriter{sink}.write(tree);
    } else {
        auto scrubbed = tree;
        for (const auto& p : excluded_) {
            if (p.is_root()) continue;
            auto parent = find(scrubbed, p.parent());
            if (parent && (*parent)->is_object()) {
                (*parent)->as_object().erase(p.back());
            }
        }
        CanonicalWriter{sink}.write(scrubbed);
    }
    return "sha256:" + crypto::to_hex(sink.sha.finish());
}

}  // namespace docpatch_cpp
