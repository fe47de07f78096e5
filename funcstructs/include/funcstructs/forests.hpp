#ifndef FUNCSTRUCTS_FORESTS_HPP
#define FUNCSTRUCTS_FORESTS_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/debug_log.hpp>
#include <funcstructs/level_sequence.hpp>
#include <funcstructs/partitions.hpp>
#include <funcstructs/rooted_trees.hpp>
#include <funcstructs/unordered_product.hpp>
#include <optional>
#include <string>
#include <vector>

namespace funcstructs {

/**
 * Multiset of unordered rooted trees. Trees are kept sorted, so equal
 * forests hold equal vectors.
 */
class Forest {
public:
    Forest() = default;
    explicit Forest(std::vector<DominantSequence> trees);

    const std::vector<DominantSequence>& trees() const { return trees_; }
    std::size_t size() const { return trees_.size(); }
    bool empty() const { return trees_.empty(); }
    const DominantSequence& operator[](std::size_t i) const { return trees_[i]; }
    std::vector<DominantSequence>::const_iterator begin() const { return trees_.begin(); }
    std::vector<DominantSequence>::const_iterator end() const { return trees_.end(); }

    std::size_t node_count() const;

    // Tree sizes, largest first.
    Partition tree_sizes() const;

    // Automorphisms: swaps of equal trees times each tree's own.
    Count degeneracy() const;

    std::string to_string() const;

    bool operator==(const Forest& other) const { return trees_ == other.trees_; }
    bool operator!=(const Forest& other) const { return trees_ != other.trees_; }
    bool operator<(const Forest& other) const { return trees_ < other.trees_; }

private:
    std::vector<DominantSequence> trees_;
};

/**
 * Every forest whose tree sizes are the parts of a partition. Trees of
 * equal size are drawn with repetition from one TreeGenerator, sizes that
 * differ are combined by an outer product.
 */
class ForestGenerator {
public:
    using value_type = Forest;

    explicit ForestGenerator(const Partition& tree_sizes);

    std::optional<Forest> next();
    void reset();

    const Partition& tree_sizes() const { return sizes_; }
    Count cardinality() const;

private:
    Partition sizes_;
    UnorderedProduct<TreeGenerator> product_;
    debug::EmissionTrace trace_{"ForestGenerator"};
};

// Forests with the given tree sizes: over each distinct size, multisets
// of that many trees from tree_count(size) kinds.
Count forest_count(const Partition& tree_sizes);

} // namespace funcstructs

namespace std {
    template<>
    struct hash<funcstructs::Forest> {
        std::size_t operator()(const funcstructs::Forest& forest) const {
            return funcstructs::hash_sequence(forest.trees());
        }
    };
}

#endif // FUNCSTRUCTS_FORESTS_HPP
