#include <funcstructs/partitions.hpp>
#include <funcstructs/errors.hpp>
#include <algorithm>
#include <numeric>
#include <cstddef>
#include <sstream>
#include <tuple>

namespace funcstructs {

namespace {

// Most balanced partition of total into length parts (length >= 1,
// total >= length), and the matching trailing-ones counter.
std::pair<std::vector<Part>, std::size_t> balanced_partition(std::size_t total, std::size_t length) {
    const std::size_t binsize = total / length;
    const std::size_t overstuffed = total - length * binsize;
    const std::size_t regular = length - overstuffed;

    std::vector<Part> parts(overstuffed, binsize + 1);
    parts.insert(parts.end(), regular, binsize);
    const std::size_t suffix = (binsize != 1) ? 1 : regular + 1;
    return {std::move(parts), suffix};
}

} // namespace

Partition::Partition(std::vector<Part> parts)
    : parts_(std::move(parts)) {
    for (std::size_t i = 0; i < parts_.size(); ++i) {
        if (parts_[i] == 0) {
            throw InvalidParameter("partition parts must be positive: " + to_string());
        }
        if (i > 0 && parts_[i] > parts_[i - 1]) {
            throw InvalidParameter("partition parts must be non-increasing: " + to_string());
        }
    }
}

Partition Partition::trusted(std::vector<Part> parts) {
    Partition p;
    p.parts_ = std::move(parts);
    return p;
}

std::size_t Partition::sum() const {
    return std::accumulate(parts_.begin(), parts_.end(), std::size_t{0});
}

std::vector<std::pair<Part, std::size_t>> Partition::multiplicities() const {
    std::vector<std::pair<Part, std::size_t>> result;
    for (Part part : parts_) {
        if (!result.empty() && result.back().first == part) {
            ++result.back().second;
        } else {
            result.emplace_back(part, 1);
        }
    }
    return result;
}

std::string Partition::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < parts_.size(); ++i) {
        oss << parts_[i];
        if (i < parts_.size() - 1) oss << ", ";
    }
    oss << "]";
    return oss.str();
}

PartitionGenerator::PartitionGenerator(std::size_t total, std::size_t length)
    : n_(total), length_(length) {
    DEBUG_LOG("PartitionGenerator: n=%zu L=%zu", n_, length_);
    reset();
}

void PartitionGenerator::reset() {
    started_ = false;
    trace_ = debug::EmissionTrace("PartitionGenerator");
    parts_.clear();
    suffix_ = 0;
    if (length_ == 0) {
        // Only 0 splits into no parts
        exhausted_ = (n_ != 0);
        return;
    }
    if (n_ < length_) {
        exhausted_ = true;
        return;
    }
    exhausted_ = false;
    std::tie(parts_, suffix_) = balanced_partition(n_, length_);
}

std::optional<Partition> PartitionGenerator::next() {
    if (!exhausted_ && started_ && !successor()) {
        exhausted_ = true;
    }
    if (exhausted_) {
        trace_.exhausted();
        return std::nullopt;
    }
    started_ = true;
    trace_.emitted();
    return Partition::trusted(parts_);
}

bool PartitionGenerator::successor() {
    const std::size_t L = length_;
    std::size_t j = suffix_;

    // All parts after the first are ones: nothing left to move left.
    if (L == 0 || j >= L) {
        return false;
    }

    // Walk left over the run of parts equal to the one just before the
    // ones, collecting the sum they release. One unit of that sum moves
    // to the part immediately left of the run.
    std::size_t released = (j - 1) + parts_[L - j] - 1;
    std::size_t k = 2;
    while (j + k - 1 < L && parts_[L - j - k] == parts_[L - j - 1]) {
        released += parts_[L - j - 1];
        ++k;
    }
    --k;
    parts_[L - j - k] += 1;

    // Spread the released sum as evenly as possible over everything to
    // the right of the incremented part.
    auto [tail, tail_suffix] = balanced_partition(released, j + k - 1);
    std::copy(tail.begin(), tail.end(), parts_.begin() + static_cast<std::ptrdiff_t>(L - j - k + 1));
    suffix_ = tail_suffix;
    return true;
}

Count PartitionGenerator::cardinality() const {
    return partition_count(n_, length_);
}

AllPartitionsGenerator::AllPartitionsGenerator(std::size_t total)
    : n_(total), length_(total == 0 ? 0 : 1), current_(total, length_) {}

void AllPartitionsGenerator::reset() {
    length_ = (n_ == 0) ? 0 : 1;
    current_ = PartitionGenerator(n_, length_);
}

std::optional<Partition> AllPartitionsGenerator::next() {
    while (true) {
        if (auto partition = current_.next()) {
            return partition;
        }
        if (length_ >= n_) {
            return std::nullopt;
        }
        ++length_;
        current_ = PartitionGenerator(n_, length_);
    }
}

WeakCompositionGenerator::WeakCompositionGenerator(std::size_t total, std::size_t length)
    : n_(total), length_(length) {
    reset();
}

void WeakCompositionGenerator::reset() {
    started_ = false;
    composition_.assign(length_, 0);
    if (length_ == 0) {
        // The empty sum is zero
        exhausted_ = (n_ != 0);
        return;
    }
    exhausted_ = false;
    composition_[0] = n_;
}

std::optional<std::vector<std::size_t>> WeakCompositionGenerator::next() {
    if (!exhausted_ && started_ && !successor()) {
        exhausted_ = true;
    }
    if (exhausted_) {
        return std::nullopt;
    }
    started_ = true;
    return composition_;
}

bool WeakCompositionGenerator::successor() {
    if (length_ < 2) {
        return false;
    }
    // Move one unit from the rightmost non-zero entry before the last
    // into its right neighbour, which also absorbs the last entry.
    const std::size_t last = composition_[length_ - 1];
    std::size_t i = length_ - 1;
    while (i > 0 && composition_[i - 1] == 0) {
        --i;
    }
    if (i == 0) {
        return false;
    }
    composition_[length_ - 1] = 0;
    composition_[i - 1] -= 1;
    composition_[i] = last + 1;
    return true;
}

Count partition_count(std::size_t total, std::size_t length) {
    // p(n, L) = p(n-1, L-1) + p(n-L, L)
    std::vector<std::vector<Count>> table(total + 1, std::vector<Count>(length + 1, 0));
    table[0][0] = 1;
    for (std::size_t n = 1; n <= total; ++n) {
        for (std::size_t l = 1; l <= length && l <= n; ++l) {
            table[n][l] = checked_add(table[n - 1][l - 1], table[n - l][l]);
        }
    }
    return table[total][length];
}

std::vector<Count> partition_numbers_upto(std::size_t max_total) {
    std::vector<Count> p(max_total + 1, 0);
    p[0] = 1;
    for (std::size_t n = 1; n <= max_total; ++n) {
        // Generalized pentagonal numbers k(3k-1)/2 and k(3k+1)/2 enter
        // with sign (-1)^(k-1).
        Count positive = 0;
        Count negative = 0;
        for (std::size_t k = 1;; ++k) {
            const std::size_t g1 = k * (3 * k - 1) / 2;
            if (g1 > n) break;
            const std::size_t g2 = k * (3 * k + 1) / 2;
            Count term = p[n - g1];
            if (g2 <= n) {
                term = checked_add(term, p[n - g2]);
            }
            if (k % 2 == 1) {
                positive = checked_add(positive, term);
            } else {
                negative = checked_add(negative, term);
            }
        }
        p[n] = positive - negative;
    }
    return p;
}

} // namespace funcstructs
