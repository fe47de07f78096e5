#ifndef FUNCSTRUCTS_NECKLACES_HPP
#define FUNCSTRUCTS_NECKLACES_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/debug_log.hpp>
#include <funcstructs/errors.hpp>
#include <funcstructs/types.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace funcstructs {

// Start of the lexicographically smallest rotation of word (two-pointer
// minimum expression search, O(n)).
template<typename T>
std::size_t least_rotation(const std::vector<T>& word) {
    const std::size_t n = word.size();
    std::size_t i = 0, j = 1, k = 0;
    while (i < n && j < n && k < n) {
        const T& a = word[(i + k) % n];
        const T& b = word[(j + k) % n];
        if (a == b) {
            ++k;
            continue;
        }
        if (b < a) {
            i += k + 1;
        } else {
            j += k + 1;
        }
        if (i == j) {
            ++j;
        }
        k = 0;
    }
    return std::min(i, j);
}

// Smallest p > 0 such that rotating word by p leaves it unchanged, via
// the prefix function. Returns 0 for the empty word.
template<typename T>
std::size_t rotation_period(const std::vector<T>& word) {
    const std::size_t n = word.size();
    if (n == 0) {
        return 0;
    }
    std::vector<std::size_t> border(n, 0);
    for (std::size_t i = 1; i < n; ++i) {
        std::size_t b = border[i - 1];
        while (b > 0 && !(word[i] == word[b])) {
            b = border[b - 1];
        }
        if (word[i] == word[b]) {
            ++b;
        }
        border[i] = b;
    }
    const std::size_t p = n - border[n - 1];
    return (n % p == 0) ? p : n;
}

/**
 * Canonical representative of a word up to rotation: its smallest
 * rotation. Elements need operator< and operator== forming a total order.
 */
template<typename T>
class Necklace {
public:
    using value_type = T;

    Necklace() = default;

    explicit Necklace(std::vector<T> word) {
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (!(word[i] == word[i])) {
                throw NotOrderable("necklace element at position " + std::to_string(i) +
                                   " is not equal to itself");
            }
        }
        const std::size_t start = least_rotation(word);
        std::rotate(word.begin(), word.begin() + static_cast<std::ptrdiff_t>(start), word.end());
        beads_ = std::move(word);
    }

    // Wrap a word already in smallest-rotation form. Not checked.
    static Necklace trusted(std::vector<T> word) {
        Necklace necklace;
        necklace.beads_ = std::move(word);
        return necklace;
    }

    const std::vector<T>& beads() const { return beads_; }
    std::size_t size() const { return beads_.size(); }
    bool empty() const { return beads_.empty(); }
    const T& operator[](std::size_t i) const { return beads_[i]; }
    typename std::vector<T>::const_iterator begin() const { return beads_.begin(); }
    typename std::vector<T>::const_iterator end() const { return beads_.end(); }

    // Number of distinct rotations.
    std::size_t period() const { return rotation_period(beads_); }

    // Number of rotations that fix the necklace.
    std::size_t degeneracy() const { return beads_.empty() ? 1 : size() / period(); }

    bool operator==(const Necklace& other) const { return beads_ == other.beads_; }
    bool operator!=(const Necklace& other) const { return beads_ != other.beads_; }
    bool operator<(const Necklace& other) const { return beads_ < other.beads_; }
    bool operator>(const Necklace& other) const { return beads_ > other.beads_; }

private:
    std::vector<T> beads_;
};

/**
 * Enumerates every necklace over the symbols 0..k-1 in which symbol i
 * occurs multiplicities[i] times, each once, in lexicographic order.
 *
 * Sawada's simple fixed-content algorithm ("A fast algorithm to generate
 * necklaces with fixed content", Theoret. Comput. Sci. 301, 2003): the
 * word is grown one position at a time while tracking the length p of
 * its longest Lyndon prefix, so only prenecklaces are ever extended, and
 * a full word is a necklace iff p divides its length. The recursion runs
 * on an explicit stack so the generator can stop after every necklace.
 * Amortized O(1) per necklace.
 */
class NecklaceGenerator {
public:
    using value_type = Necklace<Symbol>;

    explicit NecklaceGenerator(std::vector<std::size_t> multiplicities);

    std::optional<Necklace<Symbol>> next();
    void reset();

    const std::vector<std::size_t>& multiplicities() const { return multiplicities_; }
    std::size_t word_length() const { return n_; }

    // Number of necklaces keyed by period (distinct rotations).
    std::map<std::size_t, Count> count_by_period() const;
    Count cardinality() const;

private:
    struct Frame {
        std::size_t t;        // 1-based position being filled
        std::size_t p;        // longest Lyndon prefix of a[0..t-2]
        Symbol candidate;     // next symbol to try at position t
        bool placed;          // a[t-1] holds a choice of this frame
    };

    void push_frame(std::size_t t, std::size_t p);

    std::vector<std::size_t> multiplicities_;
    std::size_t n_ = 0;
    std::vector<Symbol> word_;
    std::vector<std::size_t> remaining_;
    std::vector<Frame> stack_;
    bool empty_word_pending_ = false;
    debug::EmissionTrace trace_{"NecklaceGenerator"};
};

/**
 * Necklaces over an arbitrary ordered content: every arrangement up to
 * rotation of a fixed multiset of beads.
 */
template<typename T>
class FixedContentNecklaces {
public:
    using value_type = Necklace<T>;

    // beads: the multiset of beads, in any order
    explicit FixedContentNecklaces(std::vector<T> beads)
        : symbols_(content_of(beads)), generator_(multiplicities_of(beads, symbols_)) {}

    std::optional<Necklace<T>> next() {
        auto strand = generator_.next();
        if (!strand) {
            return std::nullopt;
        }
        // Symbols are numbered in increasing bead order, so the image of
        // a smallest rotation is again a smallest rotation.
        std::vector<T> beads;
        beads.reserve(strand->size());
        for (Symbol s : *strand) {
            beads.push_back(symbols_[s]);
        }
        return Necklace<T>::trusted(std::move(beads));
    }

    void reset() { generator_.reset(); }

    const std::vector<T>& content() const { return symbols_; }
    const std::vector<std::size_t>& multiplicities() const { return generator_.multiplicities(); }
    Count cardinality() const { return generator_.cardinality(); }

private:
    static std::vector<T> content_of(std::vector<T> beads) {
        for (std::size_t i = 0; i < beads.size(); ++i) {
            if (!(beads[i] == beads[i])) {
                throw NotOrderable("bead at position " + std::to_string(i) +
                                   " is not equal to itself");
            }
        }
        std::sort(beads.begin(), beads.end());
        beads.erase(std::unique(beads.begin(), beads.end()), beads.end());
        return beads;
    }

    static std::vector<std::size_t> multiplicities_of(const std::vector<T>& beads,
                                                      const std::vector<T>& content) {
        std::vector<std::size_t> counts(content.size(), 0);
        for (const T& bead : beads) {
            auto it = std::lower_bound(content.begin(), content.end(), bead);
            ++counts[static_cast<std::size_t>(it - content.begin())];
        }
        return counts;
    }

    std::vector<T> symbols_;
    NecklaceGenerator generator_;
};

} // namespace funcstructs

namespace std {
    template<typename T>
    struct hash<funcstructs::Necklace<T>> {
        std::size_t operator()(const funcstructs::Necklace<T>& necklace) const {
            return funcstructs::hash_sequence(necklace.beads());
        }
    };
}

#endif // FUNCSTRUCTS_NECKLACES_HPP
