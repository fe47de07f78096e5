#ifndef FUNCSTRUCTS_PARTITIONS_HPP
#define FUNCSTRUCTS_PARTITIONS_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/debug_log.hpp>
#include <funcstructs/types.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace funcstructs {

/**
 * Integer partition held as its parts in non-increasing order.
 * Every part is at least one; the empty partition is the partition of 0.
 */
class Partition {
public:
    Partition() = default;
    explicit Partition(std::vector<Part> parts);

    // Wrap parts already known to be valid. Not checked.
    static Partition trusted(std::vector<Part> parts);

    const std::vector<Part>& parts() const { return parts_; }
    std::size_t size() const { return parts_.size(); }
    bool empty() const { return parts_.empty(); }
    Part operator[](std::size_t i) const { return parts_[i]; }
    std::vector<Part>::const_iterator begin() const { return parts_.begin(); }
    std::vector<Part>::const_iterator end() const { return parts_.end(); }

    std::size_t sum() const;

    // Distinct parts, largest first, each with its multiplicity.
    std::vector<std::pair<Part, std::size_t>> multiplicities() const;

    std::string to_string() const;

    bool operator==(const Partition& other) const { return parts_ == other.parts_; }
    bool operator!=(const Partition& other) const { return parts_ != other.parts_; }
    bool operator<(const Partition& other) const { return parts_ < other.parts_; }

private:
    std::vector<Part> parts_;
};

// A partition read as the lengths of the cycles of an endofunction.
using CycleType = Partition;

/**
 * Enumerates every partition of n into exactly L positive parts, in
 * increasing lexicographic order: from the most balanced partition (parts
 * differ by at most one) to the spike (n-L+1, 1, ..., 1).
 *
 * Alongside the parts the generator tracks how long the run of trailing
 * ones is, so each step only touches the suffix it rebalances. Amortized
 * O(1) per partition.
 */
class PartitionGenerator {
public:
    using value_type = Partition;

    PartitionGenerator(std::size_t total, std::size_t length);

    std::optional<Partition> next();
    void reset();

    std::size_t total() const { return n_; }
    std::size_t length() const { return length_; }

    // p(n, L): number of partitions this generator produces.
    Count cardinality() const;

private:
    bool successor();

    std::size_t n_;
    std::size_t length_;
    std::vector<Part> parts_;
    std::size_t suffix_ = 0;  // trailing ones + 1
    bool started_ = false;
    bool exhausted_ = false;
    debug::EmissionTrace trace_{"PartitionGenerator"};
};

/**
 * Every partition of n: by number of parts, then in PartitionGenerator
 * order. The partition of 0 is the empty partition.
 */
class AllPartitionsGenerator {
public:
    using value_type = Partition;

    explicit AllPartitionsGenerator(std::size_t total);

    std::optional<Partition> next();
    void reset();

private:
    std::size_t n_;
    std::size_t length_;
    PartitionGenerator current_;
};

/**
 * Ordered k-tuples of non-negative integers summing to n, starting at
 * (n, 0, ..., 0) and ending at (0, ..., 0, n).
 */
class WeakCompositionGenerator {
public:
    using value_type = std::vector<std::size_t>;

    WeakCompositionGenerator(std::size_t total, std::size_t length);

    std::optional<std::vector<std::size_t>> next();
    void reset();

private:
    bool successor();

    std::size_t n_;
    std::size_t length_;
    std::vector<std::size_t> composition_;
    bool started_ = false;
    bool exhausted_ = false;
};

// Number of partitions of n into exactly L parts.
Count partition_count(std::size_t total, std::size_t length);

// Partition numbers p(0), ..., p(N) via Euler's pentagonal number theorem.
std::vector<Count> partition_numbers_upto(std::size_t max_total);

} // namespace funcstructs

namespace std {
    template<>
    struct hash<funcstructs::Partition> {
        std::size_t operator()(const funcstructs::Partition& p) const {
            return funcstructs::hash_sequence(p.parts());
        }
    };
}

#endif // FUNCSTRUCTS_PARTITIONS_HPP
