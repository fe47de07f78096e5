#include <funcstructs/structures.hpp>
#include <funcstructs/errors.hpp>
#include <algorithm>
#include <functional>
#include <iterator>
#include <sstream>

namespace funcstructs {

namespace {

Count cycle_degeneracy(const Cycle& cycle) {
    Count deg = cycle.degeneracy();
    for (const auto& tree : cycle) {
        deg = checked_multiply(deg, tree.degeneracy());
    }
    return deg;
}

// Height of the deepest descendant below each node of a tree.
std::vector<std::size_t> depths_below(const DominantSequence& tree) {
    const std::vector<Node> parents = tree.parents();
    std::vector<std::size_t> depth(tree.size(), 0);
    for (std::size_t i = tree.size(); i-- > 1;) {
        depth[parents[i]] = std::max(depth[parents[i]], depth[i] + 1);
    }
    return depth;
}

} // namespace

EndofunctionStructure::EndofunctionStructure(std::vector<Cycle> cycles)
    : cycles_(std::move(cycles)) {
    for (const auto& cycle : cycles_) {
        if (cycle.empty()) {
            throw InvalidParameter("every cycle of a structure needs at least one node");
        }
    }
    std::sort(cycles_.begin(), cycles_.end());
    for (const auto& cycle : cycles_) {
        for (const auto& tree : cycle) {
            node_count_ += tree.size();
        }
    }
}

EndofunctionStructure EndofunctionStructure::from_function(const Endofunction& f) {
    const auto ancestors = f.acyclic_ancestors();
    std::vector<Cycle> cycles;
    for (const auto& cycle : f.cycles()) {
        std::vector<DominantSequence> strand;
        strand.reserve(cycle.size());
        for (Node x : cycle) {
            strand.emplace_back(LevelSequence::from_children(ancestors, x));
        }
        cycles.emplace_back(std::move(strand));
    }
    return EndofunctionStructure(std::move(cycles));
}

CycleType EndofunctionStructure::cycle_type() const {
    std::vector<Part> lengths;
    lengths.reserve(cycles_.size());
    for (const auto& cycle : cycles_) {
        lengths.push_back(cycle.size());
    }
    std::sort(lengths.begin(), lengths.end(), std::greater<Part>());
    return CycleType::trusted(std::move(lengths));
}

Endofunction EndofunctionStructure::to_function() const {
    std::vector<Node> images(node_count_);
    Node root = 0;
    for (const auto& cycle : cycles_) {
        const Node cycle_start = root;
        Node last_root = root;
        for (const auto& tree : cycle) {
            const std::vector<Node> parents = tree.parents();
            for (std::size_t i = 1; i < tree.size(); ++i) {
                images[root + i] = root + parents[i];
            }
            last_root = root;
            root += tree.size();
            // Cycle node points at the next tree's root
            images[last_root] = root;
        }
        images[last_root] = cycle_start;
    }
    return Endofunction(std::move(images));
}

Count EndofunctionStructure::degeneracy() const {
    Count deg = 1;
    std::size_t run = 0;
    for (std::size_t i = 0; i < cycles_.size(); ++i) {
        run = (i > 0 && cycles_[i] == cycles_[i - 1]) ? run + 1 : 1;
        deg = checked_multiply(deg, run);
        deg = checked_multiply(deg, cycle_degeneracy(cycles_[i]));
    }
    return deg;
}

std::vector<std::size_t> EndofunctionStructure::imagepath() const {
    const std::size_t n = node_count_;
    if (n == 0) {
        return {};
    }
    const std::size_t iterates = std::max<std::size_t>(1, n - 1);

    // A tree node is in the image of f^k iff something lies k levels below
    // it; cyclic nodes are in every image.
    std::vector<std::size_t> deeper(n + 1, 0);
    std::size_t cyclic = 0;
    for (const auto& cycle : cycles_) {
        for (const auto& tree : cycle) {
            ++cyclic;
            const auto depth = depths_below(tree);
            for (std::size_t i = 1; i < depth.size(); ++i) {
                ++deeper[depth[i]];
            }
        }
    }

    std::vector<std::size_t> cardinalities(iterates, cyclic);
    std::size_t at_least = 0;
    for (std::size_t k = n; k-- > 1;) {
        at_least += deeper[k];
        if (k <= iterates) {
            cardinalities[k - 1] += at_least;
        }
    }
    return cardinalities;
}

std::string EndofunctionStructure::to_string() const {
    std::ostringstream oss;
    oss << "EndofunctionStructure(";
    for (std::size_t i = 0; i < cycles_.size(); ++i) {
        oss << "Cycle(";
        for (std::size_t j = 0; j < cycles_[i].size(); ++j) {
            oss << cycles_[i][j].to_string();
            if (j < cycles_[i].size() - 1) oss << ", ";
        }
        oss << ")";
        if (i < cycles_.size() - 1) oss << ", ";
    }
    oss << ")";
    return oss.str();
}

AttachmentCycleGenerator::AttachmentCycleGenerator(std::size_t tree_nodes, std::size_t cycle_length)
    : sizes_(tree_nodes + cycle_length, cycle_length) {}

void AttachmentCycleGenerator::reset() {
    sizes_.reset();
    forests_.reset();
    arrangements_.reset();
}

std::optional<Cycle> AttachmentCycleGenerator::next() {
    while (true) {
        if (arrangements_) {
            if (auto cycle = arrangements_->next()) {
                return cycle;
            }
            arrangements_.reset();
        }
        if (forests_) {
            if (auto forest = forests_->next()) {
                arrangements_.emplace(forest->trees());
                continue;
            }
            forests_.reset();
        }
        auto sizes = sizes_.next();
        if (!sizes) {
            return std::nullopt;
        }
        forests_.emplace(*sizes);
    }
}

ComponentGroupGenerator::ComponentGroupGenerator(std::size_t tree_nodes, std::size_t cycle_length,
                                                 std::size_t cycle_count)
    : cycle_length_(cycle_length),
      shares_(tree_nodes + cycle_count, cycle_count) {}

void ComponentGroupGenerator::reset() {
    shares_.reset();
    groups_.reset();
}

std::optional<std::vector<Cycle>> ComponentGroupGenerator::next() {
    while (true) {
        if (groups_) {
            if (auto group = groups_->next()) {
                return group;
            }
            groups_.reset();
        }
        auto shares = shares_.next();
        if (!shares) {
            return std::nullopt;
        }
        const std::size_t length = cycle_length_;
        groups_.emplace(*shares, [length](Part share) {
            return AttachmentCycleGenerator(share - 1, length);
        });
    }
}

StructureGenerator::StructureGenerator(std::size_t node_count, std::optional<CycleType> cycle_type)
    : n_(node_count), fixed_cycle_type_(std::move(cycle_type)) {
    if (fixed_cycle_type_) {
        const std::size_t cyclic = fixed_cycle_type_->sum();
        if (cyclic > n_) {
            throw InvalidParameter("cycle type " + fixed_cycle_type_->to_string() + " needs " +
                                   std::to_string(cyclic) + " nodes but only " +
                                   std::to_string(n_) + " are available");
        }
        if (fixed_cycle_type_->empty() && n_ > 0) {
            throw InvalidParameter("an endofunction on " + std::to_string(n_) +
                                   " nodes has at least one cycle");
        }
    } else if (n_ == 0) {
        // The empty map is the only structure on no nodes.
        fixed_cycle_type_ = CycleType();
    }
    DEBUG_LOG("StructureGenerator: n=%zu cycle_type=%s", n_,
              fixed_cycle_type_ ? fixed_cycle_type_->to_string().c_str() : "any");
    reset();
}

void StructureGenerator::reset() {
    fixed_cycle_type_used_ = false;
    cyclic_nodes_ = 0;
    cycle_types_.reset();
    lengths_.clear();
    compositions_.reset();
    bundles_.reset();
    exhausted_ = false;
    trace_ = debug::EmissionTrace("StructureGenerator");
}

std::optional<EndofunctionStructure> StructureGenerator::next() {
    while (!exhausted_) {
        if (bundles_) {
            if (auto bundle = bundles_->next()) {
                std::vector<Cycle> cycles;
                for (auto& group : *bundle) {
                    std::move(group.begin(), group.end(), std::back_inserter(cycles));
                }
                trace_.emitted();
                return EndofunctionStructure(std::move(cycles));
            }
            bundles_.reset();
        }
        if (compositions_) {
            if (auto composition = compositions_->next()) {
                begin_composition(*composition);
                continue;
            }
            compositions_.reset();
        }
        if (!advance_cycle_type()) {
            exhausted_ = true;
        }
    }
    trace_.exhausted();
    return std::nullopt;
}

bool StructureGenerator::advance_cycle_type() {
    if (fixed_cycle_type_) {
        if (fixed_cycle_type_used_) {
            return false;
        }
        fixed_cycle_type_used_ = true;
        begin_cycle_type(*fixed_cycle_type_);
        return true;
    }
    while (true) {
        if (cycle_types_) {
            if (auto cycle_type = cycle_types_->next()) {
                begin_cycle_type(*cycle_type);
                return true;
            }
        }
        if (cyclic_nodes_ >= n_) {
            return false;
        }
        ++cyclic_nodes_;
        cycle_types_.emplace(cyclic_nodes_);
    }
}

void StructureGenerator::begin_cycle_type(const CycleType& cycle_type) {
    lengths_ = cycle_type.multiplicities();
    compositions_.emplace(n_ - cycle_type.sum(), lengths_.size());
}

void StructureGenerator::begin_composition(const std::vector<std::size_t>& composition) {
    std::vector<ComponentGroupGenerator> groups;
    groups.reserve(lengths_.size());
    for (std::size_t i = 0; i < lengths_.size(); ++i) {
        groups.emplace_back(composition[i], lengths_[i].first, lengths_[i].second);
    }
    bundles_.emplace(std::move(groups));
}

Count structure_count(std::size_t node_count) {
    const std::size_t n = node_count;
    const CountingTables tables(n);
    const Count n_factorial = tables.factorial(n);

    // Sum over cycle types b of n!/z(b) * prod_i s_i^(b_i), where z(b) is
    // the centralizer order and s_i = sum of j * b_j over divisors j of i.
    Count total = 0;
    AllPartitionsGenerator partitions(n);
    while (auto partition = partitions.next()) {
        std::vector<std::size_t> b(n + 1, 0);
        for (const auto& [length, multiplicity] : partition->multiplicities()) {
            b[length] = multiplicity;
        }

        Count centralizer = 1;
        Count weight = 1;
        for (std::size_t i = 1; i <= n; ++i) {
            if (b[i] == 0) continue;
            centralizer = checked_multiply(centralizer, checked_power(i, b[i]));
            centralizer = checked_multiply(centralizer, tables.factorial(b[i]));
            Count s = 0;
            for (std::size_t j : divisors(i)) {
                s += j * b[j];
            }
            weight = checked_multiply(weight, checked_power(s, b[i]));
        }
        total = checked_add(total, checked_multiply(n_factorial / centralizer, weight));
    }
    return total / n_factorial;
}

} // namespace funcstructs
