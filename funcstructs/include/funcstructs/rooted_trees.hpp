#ifndef FUNCSTRUCTS_ROOTED_TREES_HPP
#define FUNCSTRUCTS_ROOTED_TREES_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/debug_log.hpp>
#include <funcstructs/level_sequence.hpp>
#include <optional>
#include <vector>

namespace funcstructs {

/**
 * Enumerates the dominant sequence of every unordered rooted tree on n
 * nodes, each exactly once, in decreasing lexicographic order: from the
 * path (0, 1, ..., n-1) down to the star (0, 1, 1, ..., 1).
 *
 * Uses the constant amortized time successor rule of Beyer and
 * Hedetniemi, "Constant time generation of rooted trees", SIAM J.
 * Comput. 9(4), 1980. The only state is the current level sequence, so
 * copying a generator forks the enumeration at its current position.
 */
class TreeGenerator {
public:
    using value_type = DominantSequence;

    explicit TreeGenerator(std::size_t node_count);

    // Next tree, or nullopt once every tree has been produced.
    std::optional<DominantSequence> next();

    // Start over from the first tree.
    void reset();

    std::size_t node_count() const { return n_; }

    // Number of trees this generator produces in total.
    Count cardinality() const;

private:
    void successor();

    std::size_t n_;
    std::vector<Level> tree_;
    bool started_ = false;
    bool exhausted_ = false;
    debug::EmissionTrace trace_{"TreeGenerator"};
};

// Unlabelled rooted trees on n nodes (OEIS A000081) via Otter's
// recurrence. Entry i of the table holds the count for i nodes; entry 0
// is zero.
std::vector<Count> tree_counts_upto(std::size_t max_nodes);
Count tree_count(std::size_t node_count);

} // namespace funcstructs

#endif // FUNCSTRUCTS_ROOTED_TREES_HPP
