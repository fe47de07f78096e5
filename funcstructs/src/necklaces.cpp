#include <funcstructs/necklaces.hpp>
#include <numeric>

namespace funcstructs {

NecklaceGenerator::NecklaceGenerator(std::vector<std::size_t> multiplicities)
    : multiplicities_(std::move(multiplicities)) {
    for (std::size_t i = 0; i < multiplicities_.size(); ++i) {
        if (multiplicities_[i] == 0) {
            throw InvalidParameter("necklace multiplicity of symbol " + std::to_string(i) +
                                   " is zero");
        }
    }
    n_ = std::accumulate(multiplicities_.begin(), multiplicities_.end(), std::size_t{0});
    DEBUG_LOG("NecklaceGenerator: %zu symbols, word length %zu", multiplicities_.size(), n_);
    reset();
}

void NecklaceGenerator::reset() {
    trace_ = debug::EmissionTrace("NecklaceGenerator");
    stack_.clear();
    word_.assign(n_, 0);
    remaining_ = multiplicities_;
    empty_word_pending_ = (n_ == 0);
    if (n_ == 0) {
        return;
    }
    // Every necklace starts with the smallest symbol.
    word_[0] = 0;
    --remaining_[0];
    push_frame(2, 1);
}

void NecklaceGenerator::push_frame(std::size_t t, std::size_t p) {
    Frame frame;
    frame.t = t;
    frame.p = p;
    frame.candidate = (t > n_) ? 0 : word_[t - p - 1];
    frame.placed = false;
    stack_.push_back(frame);
}

std::optional<Necklace<Symbol>> NecklaceGenerator::next() {
    if (empty_word_pending_) {
        empty_word_pending_ = false;
        trace_.emitted();
        return Necklace<Symbol>::trusted({});
    }

    while (!stack_.empty()) {
        Frame& frame = stack_.back();

        if (frame.t > n_) {
            const bool is_necklace = (n_ % frame.p == 0);
            stack_.pop_back();
            if (is_necklace) {
                trace_.emitted();
                return Necklace<Symbol>::trusted(word_);
            }
            continue;
        }

        if (frame.placed) {
            ++remaining_[word_[frame.t - 1]];
            frame.placed = false;
        }
        while (frame.candidate < remaining_.size() && remaining_[frame.candidate] == 0) {
            ++frame.candidate;
        }
        if (frame.candidate >= remaining_.size()) {
            stack_.pop_back();
            continue;
        }

        const Symbol symbol = frame.candidate++;
        const std::size_t t = frame.t;
        const std::size_t p = frame.p;
        word_[t - 1] = symbol;
        --remaining_[symbol];
        frame.placed = true;

        // frame is invalidated by the push below
        push_frame(t + 1, symbol == word_[t - p - 1] ? p : t);
    }

    trace_.exhausted();
    return std::nullopt;
}

std::map<std::size_t, Count> NecklaceGenerator::count_by_period() const {
    std::map<std::size_t, Count> counts;
    if (n_ == 0) {
        counts[0] = 1;
        return counts;
    }

    std::size_t common = 0;
    for (std::size_t m : multiplicities_) {
        common = std::gcd(common, m);
    }
    const std::size_t base_period = n_ / common;
    const CountingTables tables(n_);

    // A word whose content is the fraction factor/common of ours has
    // multinomial-many arrangements. Removing those with a strictly
    // shorter period leaves factor*base_period rotations of each necklace
    // of exactly that period.
    std::map<std::size_t, Count> by_factor;
    for (std::size_t factor : divisors(common)) {
        std::vector<std::size_t> content;
        content.reserve(multiplicities_.size());
        for (std::size_t m : multiplicities_) {
            content.push_back(m / common * factor);
        }
        Count words = tables.multinomial(content);
        for (std::size_t subfactor : divisors(factor)) {
            if (subfactor == factor) {
                break;
            }
            words -= checked_multiply(subfactor * base_period, by_factor[subfactor]);
        }
        by_factor[factor] = words / (base_period * factor);
    }

    for (const auto& [factor, count] : by_factor) {
        if (count != 0) {
            counts[base_period * factor] = count;
        }
    }
    return counts;
}

Count NecklaceGenerator::cardinality() const {
    Count total = 0;
    for (const auto& entry : count_by_period()) {
        total = checked_add(total, entry.second);
    }
    return total;
}

} // namespace funcstructs
