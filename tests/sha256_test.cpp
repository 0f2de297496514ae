#include "../src/crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

using namespace xpoint_cpp::crypto;

// Helper: convert bytes to hex string
static auto bytes_to_hex(std::span<const std::byte> bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    for (auto b : bytes) {
        auto val = static_cast<std::uint8_t>(b);
        result += hex_chars[val >> 4];
        result += hex_chars[val & 0x0F];
    }
    return result;
}

// Helper: hash a string in one shot
static auto sha256_string(const std::string& s) -> std::string {
    auto input = std::vector<std::byte>(s.size());
    std::memcpy(input.data(), s.data(), s.size());
    auto digest = sha256(input);
    return bytes_to_hex(digest);
}

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(sha256_string(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(sha256_string("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(sha256_string("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    auto digest = sha256_string(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu");
    EXPECT_EQ(digest, "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_zero_byte) {
    auto input = std::vector<std::byte>{std::byte{0x00}};
    EXPECT_EQ(bytes_to_hex(sha256(input)),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, incremental_updates_match_one_shot) {
    const auto text = std::string{"abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"};

    auto h = Sha256{};
    h.update(std::string_view{text}.substr(0, 5));
    h.update(std::string_view{text}.substr(5, 50));
    h.update(std::string_view{text}.substr(55));

    EXPECT_EQ(bytes_to_hex(h.finish()), sha256_string(text));
}

TEST(Sha256, updates_across_block_boundary) {
    // 63 + 2 bytes straddles the 64-byte block
    auto h = Sha256{};
    h.update(std::string(63, 'A'));
    h.update(std::string(2, 'A'));

    EXPECT_EQ(bytes_to_hex(h.finish()), sha256_string(std::string(65, 'A')));
}

TEST(Sha256, byte_and_string_updates_agree) {
    auto bytes = std::vector<std::byte>{std::byte{'a'}, std::byte{'b'}, std::byte{'c'}};
    auto h1 = Sha256{};
    h1.update(std::span<const std::byte>{bytes});
    auto h2 = Sha256{};
    h2.update(std::string_view{"abc"});

    EXPECT_EQ(h1.finish(), h2.finish());
}
