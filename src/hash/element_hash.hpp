#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include <xxhash.h>

// Element serialization: every element is hashed through its byte representation.
//  - strings hash their raw bytes
//  - integers hash their base-10 text, so 42 and "42" are the same element
//  - bool and character types are not elements; pass a one-character string instead
template <typename T> struct is_character_type : std::false_type {};
template <> struct is_character_type<char> : std::true_type {};
template <> struct is_character_type<signed char> : std::true_type {};
template <> struct is_character_type<unsigned char> : std::true_type {};
template <> struct is_character_type<wchar_t> : std::true_type {};
template <> struct is_character_type<char16_t> : std::true_type {};
template <> struct is_character_type<char32_t> : std::true_type {};

template <typename T>
inline constexpr bool is_integer_element_v = std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool> && !is_character_type<std::remove_cv_t<T>>::value;

inline std::string element_to_bytes(std::string_view item) { return std::string(item); }

inline std::string element_to_bytes(const char *item) { return std::string(item); }

template <typename T, std::enable_if_t<is_integer_element_v<T>, int> = 0> std::string element_to_bytes(T item) { return std::to_string(item); }

// Single hash over the full 64-bit space (cardinality)
using ElementHasher = std::function<uint64_t(std::string_view)>;

// Hash family indexed by probe number (frequency)
using SeededElementHasher = std::function<uint64_t(std::string_view, uint32_t)>;

// splitmix64 finalizer, turns consecutive probe indices into unrelated seeds
inline uint64_t mix_seed(uint64_t x) {
    x += 0x9e3779b97f4a7c15;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9;
    x = (x ^ (x >> 27)) * 0x94d049bb133111eb;
    return x ^ (x >> 31);
}

inline uint64_t hash_element(std::string_view bytes, uint32_t seed_index) { return XXH64(bytes.data(), bytes.size(), mix_seed(seed_index)); }

inline ElementHasher default_element_hasher() {
    return [](std::string_view bytes) { return hash_element(bytes, 0); };
}

inline SeededElementHasher default_seeded_element_hasher() {
    return [](std::string_view bytes, uint32_t seed_index) { return hash_element(bytes, seed_index); };
}
