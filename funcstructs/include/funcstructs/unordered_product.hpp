#ifndef FUNCSTRUCTS_UNORDERED_PRODUCT_HPP
#define FUNCSTRUCTS_UNORDERED_PRODUCT_HPP

#include <funcstructs/partitions.hpp>
#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace funcstructs {

/**
 * Every multiset of `count` values drawn, with repetition, from what
 * `base` produces. A multiset is emitted as the non-decreasing sequence
 * of its members' positions in base's output, so each appears once.
 *
 * Works as an odometer over copies of base: slot j always continues from
 * a copy of slot j-1 taken when slot j-1 emitted its current value.
 * Only generator state is copied; emitted values are never cached.
 */
template<typename Generator>
class CombinationsWithReplacement {
public:
    using element_type = typename Generator::value_type;
    using value_type = std::vector<element_type>;

    CombinationsWithReplacement(Generator base, std::size_t count)
        : base_(std::move(base)), count_(count) {
        reset();
    }

    std::optional<value_type> next() {
        if (exhausted_) {
            return std::nullopt;
        }
        if (started_ && !successor()) {
            exhausted_ = true;
            return std::nullopt;
        }
        started_ = true;
        return current_;
    }

    void reset() {
        started_ = false;
        exhausted_ = false;
        slots_.clear();
        current_.clear();
        if (count_ == 0) {
            return;
        }
        base_.reset();
        slots_.push_back(base_);
        auto first = slots_[0].next();
        if (!first) {
            exhausted_ = true;
            return;
        }
        current_.push_back(std::move(*first));
        fill_from(0);
    }

private:
    // Make every slot after j repeat slot j.
    void fill_from(std::size_t j) {
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(j + 1), slots_.end());
        current_.erase(current_.begin() + static_cast<std::ptrdiff_t>(j + 1), current_.end());
        while (slots_.size() < count_) {
            slots_.push_back(slots_.back());
            current_.push_back(current_.back());
        }
    }

    bool successor() {
        for (std::size_t j = count_; j-- > 0;) {
            if (auto value = slots_[j].next()) {
                current_[j] = std::move(*value);
                fill_from(j);
                return true;
            }
        }
        return false;
    }

    Generator base_;
    std::size_t count_;
    std::vector<Generator> slots_;
    value_type current_;
    bool started_ = false;
    bool exhausted_ = false;
};

/**
 * Outer product of a list of generators: every choice of one value from
 * each, the last generator varying fastest. An empty list yields one
 * empty choice.
 */
template<typename Generator>
class OuterProduct {
public:
    using element_type = typename Generator::value_type;
    using value_type = std::vector<element_type>;

    explicit OuterProduct(std::vector<Generator> factors)
        : factors_(std::move(factors)) {
        reset();
    }

    std::optional<value_type> next() {
        if (exhausted_) {
            return std::nullopt;
        }
        if (started_ && !successor()) {
            exhausted_ = true;
            return std::nullopt;
        }
        started_ = true;
        return current_;
    }

    void reset() {
        started_ = false;
        exhausted_ = false;
        current_.clear();
        for (auto& factor : factors_) {
            factor.reset();
            auto value = factor.next();
            if (!value) {
                exhausted_ = true;
                return;
            }
            current_.push_back(std::move(*value));
        }
    }

private:
    bool successor() {
        for (std::size_t i = factors_.size(); i-- > 0;) {
            if (auto value = factors_[i].next()) {
                current_[i] = std::move(*value);
                // Every factor produced a value during reset(), so each
                // restarted one does again.
                for (std::size_t k = i + 1; k < factors_.size(); ++k) {
                    factors_[k].reset();
                    current_[k] = std::move(*factors_[k].next());
                }
                return true;
            }
        }
        return false;
    }

    std::vector<Generator> factors_;
    value_type current_;
    bool started_ = false;
    bool exhausted_ = false;
};

/**
 * For a multiset of keys (a partition), every multiset formed by picking
 * one value from factory(key) for each key. Equal keys are combined with
 * repetition, distinct keys by an outer product. Values produced for
 * distinct keys are assumed to differ, and so is each key's output
 * within itself, which makes every emitted multiset unique.
 *
 * Members come out grouped by key, in the order the keys appear.
 */
template<typename Generator>
class UnorderedProduct {
public:
    using element_type = typename Generator::value_type;
    using value_type = std::vector<element_type>;
    using Factory = std::function<Generator(Part)>;

    UnorderedProduct(const Partition& keys, const Factory& factory)
        : groups_(strands(keys, factory)) {}

    std::optional<value_type> next() {
        auto groups = groups_.next();
        if (!groups) {
            return std::nullopt;
        }
        value_type bundle;
        for (auto& group : *groups) {
            std::move(group.begin(), group.end(), std::back_inserter(bundle));
        }
        return bundle;
    }

    void reset() { groups_.reset(); }

private:
    static std::vector<CombinationsWithReplacement<Generator>> strands(const Partition& keys,
                                                                       const Factory& factory) {
        std::vector<CombinationsWithReplacement<Generator>> result;
        for (const auto& [key, multiplicity] : keys.multiplicities()) {
            result.emplace_back(factory(key), multiplicity);
        }
        return result;
    }

    OuterProduct<CombinationsWithReplacement<Generator>> groups_;
};

} // namespace funcstructs

#endif // FUNCSTRUCTS_UNORDERED_PRODUCT_HPP
