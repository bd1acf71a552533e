#pragma once

/// @file hash.hpp
/// @brief Hashing helpers for value identities

#include <cstddef>
#include <cstdint>
#include <string>

namespace xref_core {

namespace detail {

/// FNV-1a hash constants
constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

/// Compute FNV-1a hash of a byte range
[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len,
                                                 std::uint64_t seed = FNV_OFFSET_BASIS) noexcept {
    std::uint64_t hash = seed;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

} // namespace detail

/// FNV-1a hash of a string
[[nodiscard]] inline std::uint64_t fnv1a_hash(const std::string& str) noexcept {
    return detail::fnv1a_hash(str.data(), str.size());
}

/// Hash of an ordered pair of strings. The separator byte keeps ("ab", "c")
/// and ("a", "bc") apart.
[[nodiscard]] inline std::uint64_t hash_string_pair(const std::string& first,
                                                    const std::string& second) noexcept {
    constexpr char separator = '\0';
    std::uint64_t hash = detail::fnv1a_hash(first.data(), first.size());
    hash = detail::fnv1a_hash(&separator, 1, hash);
    return detail::fnv1a_hash(second.data(), second.size(), hash);
}

} // namespace xref_core
