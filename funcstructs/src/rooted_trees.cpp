#include <funcstructs/rooted_trees.hpp>
#include <numeric>

namespace funcstructs {

TreeGenerator::TreeGenerator(std::size_t node_count)
    : n_(node_count) {
    DEBUG_LOG("TreeGenerator: n=%zu", n_);
    reset();
}

void TreeGenerator::reset() {
    tree_.resize(n_);
    std::iota(tree_.begin(), tree_.end(), Level{0});
    started_ = false;
    exhausted_ = (n_ == 0);
    trace_ = debug::EmissionTrace("TreeGenerator");
}

std::optional<DominantSequence> TreeGenerator::next() {
    if (exhausted_) {
        trace_.exhausted();
        return std::nullopt;
    }
    if (started_) {
        successor();
    }
    started_ = true;

    // One and two nodes admit a single tree. Otherwise the star, whose
    // second and third entries are equal, is the last tree.
    if (n_ <= 2 || tree_[1] == tree_[2]) {
        exhausted_ = true;
    }
    trace_.emitted();
    return DominantSequence::trusted(tree_);
}

void TreeGenerator::successor() {
    // p: rightmost node not at the height of the first branch's root
    std::size_t p = n_ - 1;
    while (tree_[p] == tree_[1]) {
        --p;
    }
    // q: p's parent, the nearest node to its left that sits lower
    std::size_t q = p - 1;
    while (tree_[q] >= tree_[p]) {
        --q;
    }
    // Replace everything from p on with copies of the subtree at q
    const std::size_t shift = p - q;
    for (std::size_t i = p; i < n_; ++i) {
        tree_[i] = tree_[i - shift];
    }
}

Count TreeGenerator::cardinality() const {
    return tree_count(n_);
}

std::vector<Count> tree_counts_upto(std::size_t max_nodes) {
    // a(n) = 1/(n-1) * sum_{i=1}^{n-1} (sum_{d|i} d*a(d)) * a(n-i)
    std::vector<Count> counts(max_nodes + 1, 0);
    if (max_nodes >= 1) {
        counts[1] = 1;
    }
    std::vector<Count> divisor_sums(max_nodes + 1, 0);
    for (std::size_t n = 2; n <= max_nodes; ++n) {
        std::size_t i = n - 1;
        for (std::size_t d : divisors(i)) {
            divisor_sums[i] = checked_add(divisor_sums[i], checked_multiply(d, counts[d]));
        }
        Count total = 0;
        for (std::size_t k = 1; k < n; ++k) {
            total = checked_add(total, checked_multiply(divisor_sums[k], counts[n - k]));
        }
        counts[n] = total / (n - 1);
    }
    return counts;
}

Count tree_count(std::size_t node_count) {
    return tree_counts_upto(node_count)[node_count];
}

} // namespace funcstructs
