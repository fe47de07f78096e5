#ifndef FUNCSTRUCTS_TYPES_HPP
#define FUNCSTRUCTS_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace funcstructs {

// Node heights, partition parts, symbols and node labels are all
// non-negative counts.
using Level = std::size_t;
using Part = std::size_t;
using Symbol = std::size_t;
using Node = std::size_t;

// FNV-1a over a sequence of hashable values. Used for every canonical
// tuple type so that equal canonical forms hash equally.
constexpr std::size_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr std::size_t FNV_PRIME = 1099511628211ULL;

inline std::size_t hash_mix(std::size_t hash, std::size_t value) {
    hash ^= value;
    hash *= FNV_PRIME;
    return hash;
}

template<typename T>
std::size_t hash_sequence(const std::vector<T>& values) {
    std::size_t hash = FNV_OFFSET_BASIS;
    hash = hash_mix(hash, values.size());
    for (const auto& value : values) {
        hash = hash_mix(hash, std::hash<T>{}(value));
    }
    return hash;
}

} // namespace funcstructs

#endif // FUNCSTRUCTS_TYPES_HPP
