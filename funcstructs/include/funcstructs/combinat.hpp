#ifndef FUNCSTRUCTS_COMBINAT_HPP
#define FUNCSTRUCTS_COMBINAT_HPP

#include <cstdint>
#include <cstddef>
#include <vector>

namespace funcstructs {

using Count = std::uint64_t;

// Arithmetic on counts. Each throws std::overflow_error rather than wrap.
Count checked_add(Count a, Count b);
Count checked_multiply(Count a, Count b);
Count checked_power(Count base, std::size_t exponent);

// Divisors of n in increasing order; divisors(0) is empty.
std::vector<std::size_t> divisors(std::size_t n);

/**
 * Factorial and binomial tables for one counting task.
 *
 * Built once at construction up to a fixed bound and owned by whoever
 * asked for them; there is no process-wide cache.
 */
class CountingTables {
public:
    explicit CountingTables(std::size_t bound);

    std::size_t bound() const { return bound_; }

    Count factorial(std::size_t n) const;

    // n choose k, zero when k > n
    Count binomial(std::size_t n, std::size_t k) const;

    // Number of multisets of size r drawn from n kinds: C(n+r-1, r)
    Count multiset_coefficient(Count n, std::size_t r) const;

    // (sum parts)! / prod(part!)
    Count multinomial(const std::vector<std::size_t>& parts) const;

private:
    std::size_t bound_;
    std::vector<Count> factorials_;
    std::vector<std::vector<Count>> pascal_;
};

} // namespace funcstructs

#endif // FUNCSTRUCTS_COMBINAT_HPP
