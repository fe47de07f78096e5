#ifndef FUNCSTRUCTS_STRUCTURES_HPP
#define FUNCSTRUCTS_STRUCTURES_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/debug_log.hpp>
#include <funcstructs/endofunctions.hpp>
#include <funcstructs/forests.hpp>
#include <funcstructs/level_sequence.hpp>
#include <funcstructs/necklaces.hpp>
#include <funcstructs/partitions.hpp>
#include <funcstructs/unordered_product.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace funcstructs {

// The trees hanging off each node of one cycle, read along the map.
using Cycle = Necklace<DominantSequence>;

/**
 * Endofunction up to relabelling: a multiset of cycles, each a necklace
 * of the rooted trees attached to its nodes. Every tree's root is the
 * cyclic node itself.
 *
 * Two endofunctions have equal structures iff they are conjugate.
 */
class EndofunctionStructure {
public:
    EndofunctionStructure() = default;
    explicit EndofunctionStructure(std::vector<Cycle> cycles);

    static EndofunctionStructure from_function(const Endofunction& f);

    const std::vector<Cycle>& cycles() const { return cycles_; }
    std::vector<Cycle>::const_iterator begin() const { return cycles_.begin(); }
    std::vector<Cycle>::const_iterator end() const { return cycles_.end(); }
    std::size_t node_count() const { return node_count_; }

    CycleType cycle_type() const;

    // A representative map on {0, ..., n-1}. Each tree occupies a block
    // of consecutive labels in pre-order, and the blocks of one cycle
    // follow each other along it.
    Endofunction to_function() const;

    // Relabellings that fix a representative; n!/degeneracy() labelled
    // endofunctions share this structure.
    Count degeneracy() const;

    // Same as to_function().imagepath(), read off the tree heights.
    std::vector<std::size_t> imagepath() const;

    std::string to_string() const;

    bool operator==(const EndofunctionStructure& other) const { return cycles_ == other.cycles_; }
    bool operator!=(const EndofunctionStructure& other) const { return cycles_ != other.cycles_; }
    bool operator<(const EndofunctionStructure& other) const { return cycles_ < other.cycles_; }

private:
    std::vector<Cycle> cycles_;
    std::size_t node_count_ = 0;
};

/**
 * Ways to grow t free nodes into trees rooted on the l nodes of one
 * cycle: for each split of t + l into l tree sizes, each forest with
 * those sizes, arranged around the cycle in every distinct way.
 */
class AttachmentCycleGenerator {
public:
    using value_type = Cycle;

    AttachmentCycleGenerator(std::size_t tree_nodes, std::size_t cycle_length);

    std::optional<Cycle> next();
    void reset();

private:
    PartitionGenerator sizes_;
    std::optional<ForestGenerator> forests_;
    std::optional<FixedContentNecklaces<DominantSequence>> arrangements_;
};

/**
 * Every multiset of m cycles of length l that together carry c free
 * nodes. The free nodes are first split among the cycles (a partition of
 * c + m into m parts, each part one more than its cycle's share), then
 * cycles with equal shares are chosen with repetition.
 */
class ComponentGroupGenerator {
public:
    using value_type = std::vector<Cycle>;

    ComponentGroupGenerator(std::size_t tree_nodes, std::size_t cycle_length,
                            std::size_t cycle_count);

    std::optional<std::vector<Cycle>> next();
    void reset();

private:
    std::size_t cycle_length_;
    PartitionGenerator shares_;
    std::optional<UnorderedProduct<AttachmentCycleGenerator>> groups_;
};

/**
 * Every endofunction structure on n nodes, optionally only those with a
 * given cycle type. A cycle type lists cycle lengths; nodes it leaves
 * over lie on trees. Without one, every cycle type whose lengths sum to
 * 1, ..., n is visited in turn.
 *
 * For a cycle type, the leftover nodes are split among its distinct
 * cycle lengths by a weak composition, and the component groups for the
 * lengths are combined by an outer product.
 */
class StructureGenerator {
public:
    using value_type = EndofunctionStructure;

    explicit StructureGenerator(std::size_t node_count,
                                std::optional<CycleType> cycle_type = std::nullopt);

    std::optional<EndofunctionStructure> next();
    void reset();

    std::size_t node_count() const { return n_; }
    const std::optional<CycleType>& cycle_type() const { return fixed_cycle_type_; }

private:
    bool advance_cycle_type();
    void begin_cycle_type(const CycleType& cycle_type);
    void begin_composition(const std::vector<std::size_t>& composition);

    std::size_t n_;
    std::optional<CycleType> fixed_cycle_type_;
    bool fixed_cycle_type_used_ = false;

    std::size_t cyclic_nodes_ = 0;
    std::optional<AllPartitionsGenerator> cycle_types_;

    // Distinct cycle lengths of the current cycle type with multiplicities
    std::vector<std::pair<Part, std::size_t>> lengths_;
    std::optional<WeakCompositionGenerator> compositions_;
    std::optional<OuterProduct<ComponentGroupGenerator>> bundles_;
    bool exhausted_ = false;
    debug::EmissionTrace trace_{"StructureGenerator"};
};

// Endofunction structures on n nodes (OEIS A001372), by de Bruijn's
// formula from "Enumeration of mapping patterns", J. Combin. Theory A 12
// (1972). Throws std::overflow_error once n!-scaled terms leave 64 bits.
Count structure_count(std::size_t node_count);

} // namespace funcstructs

namespace std {
    template<>
    struct hash<funcstructs::EndofunctionStructure> {
        std::size_t operator()(const funcstructs::EndofunctionStructure& s) const {
            return funcstructs::hash_sequence(s.cycles());
        }
    };
}

#endif // FUNCSTRUCTS_STRUCTURES_HPP
