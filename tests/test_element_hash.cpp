#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "hash/element_hash.hpp"

TEST_CASE("integers serialize as base-10 text") {
    CHECK(element_to_bytes(42) == "42");
    CHECK(element_to_bytes(static_cast<int64_t>(-7)) == "-7");
    CHECK(element_to_bytes(static_cast<uint64_t>(18446744073709551615ULL)) == "18446744073709551615");
}

TEST_CASE("only non-character integers take the decimal text path") {
    CHECK(is_integer_element_v<int>);
    CHECK(is_integer_element_v<uint64_t>);
    CHECK(is_integer_element_v<const int16_t>);
    CHECK_FALSE(is_integer_element_v<bool>);
    CHECK_FALSE(is_integer_element_v<char>);
    CHECK_FALSE(is_integer_element_v<signed char>);
    CHECK_FALSE(is_integer_element_v<unsigned char>);
    CHECK_FALSE(is_integer_element_v<const char>);
    CHECK_FALSE(is_integer_element_v<char32_t>);
    CHECK_FALSE(is_integer_element_v<double>);
}

TEST_CASE("strings serialize as their raw bytes") {
    CHECK(element_to_bytes(std::string("10.0.0.1")) == "10.0.0.1");
    CHECK(element_to_bytes("172.16.0.5") == "172.16.0.5");
    CHECK(element_to_bytes(std::string_view("a,b")) == "a,b");
    CHECK(element_to_bytes(std::string()) == "");
}

TEST_CASE("integer and its decimal text hash identically") {
    CHECK(hash_element(element_to_bytes(12345), 0) == hash_element("12345", 0));
}

TEST_CASE("hash family is deterministic and seed dependent") {
    const std::string ip = "192.168.1.17";
    CHECK(hash_element(ip, 3) == hash_element(ip, 3));
    CHECK(hash_element(ip, 0) != hash_element(ip, 1));
    CHECK(hash_element(ip, 1) != hash_element(ip, 2));
    CHECK(mix_seed(0) != mix_seed(1));

    ElementHasher single = default_element_hasher();
    SeededElementHasher family = default_seeded_element_hasher();
    CHECK(single(ip) == hash_element(ip, 0));
    CHECK(family(ip, 7) == hash_element(ip, 7));
}

TEST_CASE("low bits of the hash spread evenly over bins") {
    const int num_bins = 16;
    const int num_items = 160000;
    std::vector<int> bins(num_bins, 0);
    for (int i = 0; i < num_items; ++i) bins[hash_element("item_" + std::to_string(i), 0) & (num_bins - 1)]++;

    const double expected = static_cast<double>(num_items) / num_bins;
    for (int count : bins) {
        CHECK(count > expected * 0.95);
        CHECK(count < expected * 1.05);
    }
}
