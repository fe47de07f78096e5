#include <funcstructs/forests.hpp>
#include <algorithm>
#include <functional>
#include <sstream>

namespace funcstructs {

Forest::Forest(std::vector<DominantSequence> trees)
    : trees_(std::move(trees)) {
    std::sort(trees_.begin(), trees_.end(), std::greater<DominantSequence>());
}

std::size_t Forest::node_count() const {
    std::size_t total = 0;
    for (const auto& tree : trees_) {
        total += tree.size();
    }
    return total;
}

Partition Forest::tree_sizes() const {
    std::vector<Part> sizes;
    sizes.reserve(trees_.size());
    for (const auto& tree : trees_) {
        sizes.push_back(tree.size());
    }
    std::sort(sizes.begin(), sizes.end(), std::greater<Part>());
    return Partition::trusted(std::move(sizes));
}

Count Forest::degeneracy() const {
    Count deg = 1;
    std::size_t run = 0;
    for (std::size_t i = 0; i < trees_.size(); ++i) {
        run = (i > 0 && trees_[i] == trees_[i - 1]) ? run + 1 : 1;
        deg = checked_multiply(deg, run);
        deg = checked_multiply(deg, trees_[i].degeneracy());
    }
    return deg;
}

std::string Forest::to_string() const {
    std::ostringstream oss;
    oss << "Forest(";
    for (std::size_t i = 0; i < trees_.size(); ++i) {
        oss << trees_[i].to_string();
        if (i < trees_.size() - 1) oss << ", ";
    }
    oss << ")";
    return oss.str();
}

ForestGenerator::ForestGenerator(const Partition& tree_sizes)
    : sizes_(tree_sizes),
      product_(tree_sizes, [](Part size) { return TreeGenerator(size); }) {
    DEBUG_LOG("ForestGenerator: sizes=%s", sizes_.to_string().c_str());
}

void ForestGenerator::reset() {
    product_.reset();
    trace_ = debug::EmissionTrace("ForestGenerator");
}

std::optional<Forest> ForestGenerator::next() {
    auto trees = product_.next();
    if (!trees) {
        trace_.exhausted();
        return std::nullopt;
    }
    trace_.emitted();
    return Forest(std::move(*trees));
}

Count ForestGenerator::cardinality() const {
    return forest_count(sizes_);
}

Count forest_count(const Partition& tree_sizes) {
    if (tree_sizes.empty()) {
        return 1;
    }
    const std::vector<Count> trees = tree_counts_upto(tree_sizes[0]);
    const CountingTables tables(0);
    Count total = 1;
    for (const auto& [size, multiplicity] : tree_sizes.multiplicities()) {
        total = checked_multiply(total, tables.multiset_coefficient(trees[size], multiplicity));
    }
    return total;
}

} // namespace funcstructs
