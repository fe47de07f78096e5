/**
 * Rooted Tree Enumeration Example
 *
 * Demonstrates the tree layer:
 * - Generating every unordered rooted tree on n nodes
 * - Canonicalizing an arbitrary level sequence
 * - Walking a tree through its node arena
 */

#include <funcstructs/rooted_trees.hpp>
#include <funcstructs/level_sequence.hpp>
#include <iostream>

using namespace funcstructs;

int main() {
    std::cout << "=== Rooted Tree Enumeration Example ===\n\n";

    // Every tree on 5 nodes, path first and star last
    std::cout << "Rooted trees on 5 nodes:\n";
    TreeGenerator trees(5);
    while (auto tree = trees.next()) {
        std::cout << "  " << tree->to_string()
                  << "  automorphisms: " << tree->degeneracy() << "\n";
    }
    std::cout << "Expected count: " << trees.cardinality() << "\n\n";

    // Any ordering of a tree canonicalizes to the same dominant sequence
    LevelSequence ordered({0, 1, 1, 2, 1, 2, 3});
    DominantSequence canonical(ordered);
    std::cout << "Level sequence " << ordered.to_string() << "\n";
    std::cout << "  dominant form " << canonical.to_string() << "\n\n";

    // Parent/child links live in an arena indexed by pre-order position
    RootedTree arena(canonical);
    auto sizes = arena.subtree_sizes();
    std::cout << "Node arena:\n";
    for (Node x = 0; x < arena.size(); ++x) {
        std::cout << "  node " << x << ": height " << arena.node(x).height
                  << ", parent " << arena.parent(x)
                  << ", subtree size " << sizes[x] << "\n";
    }

    std::cout << "\nTree counts (Otter): ";
    auto counts = tree_counts_upto(12);
    for (std::size_t n = 1; n < counts.size(); ++n) {
        std::cout << counts[n] << (n + 1 < counts.size() ? ", " : "\n");
    }
    return 0;
}
