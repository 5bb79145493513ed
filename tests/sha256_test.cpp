#include "../src/crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace docpatch_cpp::crypto;

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    EXPECT_EQ(sha256_hex("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
                         "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"),
              "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, one_million_a) {
    auto h = Sha256{};
    const auto chunk = std::string(1000, 'a');
    for (int i = 0; i < 1000; ++i) h.update(chunk);
    EXPECT_EQ(to_hex(h.finish()),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(Sha256, single_zero_byte) {
    auto h = Sha256{};
    const auto input = std::vector<std::byte>{std::byte{0x00}};
    h.update(std::span<const std::byte>{input});
    EXPECT_EQ(to_hex(h.finish()),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

// -- Incremental updates ------------------------------------------------------

TEST(Sha256, split_updates_match_one_shot) {
    const auto text = std::string{"The quick brown fox jumps over the lazy dog"};
    for (std::size_t split = 0; split <= text.size(); ++split) {
        auto h = Sha256{};
        h.update(std::string_view{text}.substr(0, split));
        h.update(std::string_view{text}.substr(split));
        EXPECT_EQ(to_hex(h.finish()),
                  "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592")
            << "split at " << split;
    }
}

TEST(Sha256, block_boundary_lengths_match_one_shot) {
    // 55, 56 and 64 bytes exercise the padding edge cases.
    for (std::size_t n : {55u, 56u, 63u, 64u, 65u, 119u, 120u, 128u}) {
        const auto text = std::string(n, 'x');
        auto byte_at_a_time = Sha256{};
        for (char c : text) byte_at_a_time.update(std::string_view{&c, 1});
        EXPECT_EQ(to_hex(byte_at_a_time.finish()), sha256_hex(text)) << "length " << n;
    }
}

TEST(Sha256, to_hex_is_lowercase_and_64_chars) {
    const auto hex = sha256_hex("docpatch");
    EXPECT_EQ(hex.size(), 64u);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}
