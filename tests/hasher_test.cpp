#include <docpatch-cpp/hasher.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using namespace docpatch_cpp;

// -- Canonical form -----------------------------------------------------------

TEST(CanonicalJson, scalars) {
    EXPECT_EQ(canonical_json(Value{}), "null");
    EXPECT_EQ(canonical_json(Value{true}), "true");
    EXPECT_EQ(canonical_json(Value{false}), "false");
    EXPECT_EQ(canonical_json(Value{-42}), "-42");
    EXPECT_EQ(canonical_json(Value{std::numeric_limits<std::uint64_t>::max()}),
              "18446744073709551615");
    EXPECT_EQ(canonical_json(Value{"hi"}), R"("hi")");
}

TEST(CanonicalJson, doubles_use_shortest_form) {
    EXPECT_EQ(canonical_json(Value{0.5}), "0.5");
    EXPECT_EQ(canonical_json(Value{0.1}), "0.1");
    EXPECT_EQ(canonical_json(Value{-2.25}), "-2.25");
    EXPECT_EQ(canonical_json(Value{1e300}), "1e+300");
}

TEST(CanonicalJson, integral_doubles_print_like_integers) {
    EXPECT_EQ(canonical_json(Value{1.0}), "1");
    EXPECT_EQ(canonical_json(Value{-0.0}), "0");
    EXPECT_EQ(canonical_json(Value{1e15}), "1000000000000000");
}

TEST(CanonicalJson, object_keys_are_sorted_without_whitespace) {
    const auto v = Value{Object{{"b", 1}, {"a", Object{{"d", 2}, {"c", 3}}}, {"A", 0}}};
    EXPECT_EQ(canonical_json(v), R"({"A":0,"a":{"c":3,"d":2},"b":1})");
}

TEST(CanonicalJson, arrays_keep_order) {
    EXPECT_EQ(canonical_json(Value{Array{3, 1, 2}}), "[3,1,2]");
    EXPECT_EQ(canonical_json(Value{Array{}}), "[]");
    EXPECT_EQ(canonical_json(Value{Object{}}), "{}");
}

TEST(CanonicalJson, string_escaping) {
    EXPECT_EQ(canonical_json(Value{"a\"b\\c"}), R"("a\"b\\c")");
    EXPECT_EQ(canonical_json(Value{"line\nbreak\ttab"}), R"("line\nbreak\ttab")");
    EXPECT_EQ(canonical_json(Value{std::string{"\x01", 1}}), R"("\u0001")");
    EXPECT_EQ(canonical_json(Value{"caf\xc3\xa9"}), "\"caf\xc3\xa9\"");
}

TEST(CanonicalJson, non_finite_numbers_throw) {
    EXPECT_THROW(canonical_json(Value{std::numeric_limits<double>::quiet_NaN()}),
                 std::domain_error);
    EXPECT_THROW(canonical_json(Value{Array{std::numeric_limits<double>::infinity()}}),
                 std::domain_error);
}

// -- Hash format --------------------------------------------------------------

TEST(ContentHash, format) {
    const auto h = ContentHasher{}.hash(Value{Object{{"field", 1}}});
    EXPECT_TRUE(is_content_hash(h));
    EXPECT_EQ(h.substr(0, 7), "sha256:");
    EXPECT_EQ(h.size(), 71u);
}

TEST(ContentHash, is_content_hash_rejects_malformed) {
    EXPECT_FALSE(is_content_hash(""));
    EXPECT_FALSE(is_content_hash("sha256:"));
    EXPECT_FALSE(is_content_hash("md5:" + std::string(64, 'a')));
    EXPECT_FALSE(is_content_hash("sha256:" + std::string(64, 'A')));
    EXPECT_FALSE(is_content_hash("sha256:" + std::string(63, 'a')));
    EXPECT_TRUE(is_content_hash("sha256:" + std::string(64, '0')));
}

TEST(ContentHash, empty_object_known_digest) {
    // sha256("{}")
    EXPECT_EQ(ContentHasher{}.hash(Value{Object{}}),
              "sha256:44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a");
}

// -- Determinism and sensitivity ----------------------------------------------

TEST(ContentHash, ignores_key_insertion_order) {
    const auto a = Value{Object{{"x", 1}, {"y", Object{{"p", true}, {"q", Array{1, 2}}}}}};
    const auto b = Value{Object{{"y", Object{{"q", Array{1, 2}}, {"p", true}}}, {"x", 1}}};
    const auto hasher = ContentHasher{};
    EXPECT_EQ(hasher.hash(a), hasher.hash(b));
}

TEST(ContentHash, equal_numbers_hash_alike) {
    const auto hasher = ContentHasher{};
    EXPECT_EQ(hasher.hash(Value{Object{{"n", 1}}}), hasher.hash(Value{Object{{"n", 1.0}}}));
}

TEST(ContentHash, any_single_change_changes_the_hash) {
    const auto hasher = ContentHasher{};
    const auto base = hasher.hash(Value{Object{{"a", Array{1, 2}}, {"b", "x"}}});
    EXPECT_NE(base, hasher.hash(Value{Object{{"a", Array{2, 1}}, {"b", "x"}}}));
    EXPECT_NE(base, hasher.hash(Value{Object{{"a", Array{1, 2}}, {"b", "y"}}}));
    EXPECT_NE(base, hasher.hash(Value{Object{{"a", Array{1, 2}}, {"c", "x"}}}));
    EXPECT_NE(base, hasher.hash(Value{Object{{"a", Array{1, 2, 3}}, {"b", "x"}}}));
    EXPECT_NE(base, hasher.hash(Value{Object{{"a", Array{1, 2}}, {"b", "x"}, {"c", Value{}}}}));
}

// -- Exclusions ---------------------------------------------------------------

TEST(ContentHash, excluded_regions_do_not_contribute) {
    const auto hasher = ContentHasher::for_documents(EngineOptions{});
    const auto plain = Value{Object{{"field", 1}, {"meta", Object{}}}};
    const auto recorded = Value{Object{
        {"field", 1},
        {"meta", Object{{"versioning", Object{{"content_hash", "sha256:x"}}}}},
        {"audit", Array{Object{{"action", "patch_applied"}}}},
    }};
    EXPECT_EQ(hasher.hash(plain), hasher.hash(recorded));
    EXPECT_EQ(hasher.excluded().size(), 3u);
}

TEST(ContentHash, updated_at_does_not_contribute) {
    const auto hasher = ContentHasher::for_documents(EngineOptions{});
    const auto stamped = [](const char* when) {
        return Value{Object{
            {"field", 1},
            {"meta", Object{{"timestamps", Object{{"created_at", "c"}, {"updated_at", when}}}}},
        }};
    };
    const auto unstamped = Value{Object{
        {"field", 1},
        {"meta", Object{{"timestamps", Object{{"created_at", "c"}}}}},
    }};
    EXPECT_EQ(hasher.hash(stamped("2026-01-01T00:00:00.000Z")),
              hasher.hash(stamped("2026-02-01T00:00:00.000Z")));
    EXPECT_EQ(hasher.hash(stamped("2026-01-01T00:00:00.000Z")), hasher.hash(unstamped));
}

TEST(ContentHash, exclusions_leave_the_input_untouched) {
    const auto hasher = ContentHasher::for_documents(EngineOptions{});
    const auto doc = Value{Object{{"field", 1}, {"audit", Array{1}}}};
    const auto copy = doc;
    (void)hasher.hash(doc);
    EXPECT_EQ(doc, copy);
}

TEST(ContentHash, other_content_still_counts) {
    const auto hasher = ContentHasher::for_documents(EngineOptions{});
    EXPECT_NE(hasher.hash(Value{Object{{"meta", Object{{"owner", "a"}}}}}),
              hasher.hash(Value{Object{{"meta", Object{{"owner", "b"}}}}}));
}

TEST(ContentHash, for_documents_rejects_malformed_pointers) {
    auto o = EngineOptions{};
    o.audit_pointer = "audit";
    EXPECT_THROW(ContentHasher::for_documents(o), std::invalid_argument);
}
