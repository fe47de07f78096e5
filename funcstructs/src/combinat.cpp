#include <funcstructs/combinat.hpp>
#include <funcstructs/errors.hpp>
#include <limits>
#include <stdexcept>
#include <string>

namespace funcstructs {

Count checked_add(Count a, Count b) {
    if (a > std::numeric_limits<Count>::max() - b) {
        throw std::overflow_error("count exceeds 64-bit range in addition");
    }
    return a + b;
}

Count checked_multiply(Count a, Count b) {
    if (a != 0 && b > std::numeric_limits<Count>::max() / a) {
        throw std::overflow_error("count exceeds 64-bit range in multiplication");
    }
    return a * b;
}

Count checked_power(Count base, std::size_t exponent) {
    Count result = 1;
    for (std::size_t i = 0; i < exponent; ++i) {
        result = checked_multiply(result, base);
    }
    return result;
}

std::vector<std::size_t> divisors(std::size_t n) {
    std::vector<std::size_t> small;
    std::vector<std::size_t> large;
    for (std::size_t d = 1; d * d <= n; ++d) {
        if (n % d == 0) {
            small.push_back(d);
            if (d != n / d) {
                large.push_back(n / d);
            }
        }
    }
    small.insert(small.end(), large.rbegin(), large.rend());
    return small;
}

CountingTables::CountingTables(std::size_t bound)
    : bound_(bound) {
    // Factorials past 20! do not fit; entries beyond that stay zero and
    // factorial() reports the overflow on request.
    factorials_.assign(bound_ + 1, 0);
    factorials_[0] = 1;
    for (std::size_t i = 1; i <= bound_ && i <= 20; ++i) {
        factorials_[i] = factorials_[i - 1] * i;
    }

    pascal_.resize(bound_ + 1);
    for (std::size_t n = 0; n <= bound_; ++n) {
        pascal_[n].assign(n + 1, 1);
        for (std::size_t k = 1; k < n; ++k) {
            Count left = pascal_[n - 1][k - 1];
            Count right = pascal_[n - 1][k];
            // Saturate; binomial() re-checks before handing a value out.
            pascal_[n][k] = (left > std::numeric_limits<Count>::max() - right)
                ? std::numeric_limits<Count>::max()
                : left + right;
        }
    }
}

Count CountingTables::factorial(std::size_t n) const {
    if (n > bound_) {
        throw InvalidParameter("factorial of " + std::to_string(n) +
                               " exceeds table bound " + std::to_string(bound_));
    }
    if (n > 20) {
        throw std::overflow_error(std::to_string(n) + "! exceeds 64-bit range");
    }
    return factorials_[n];
}

Count CountingTables::binomial(std::size_t n, std::size_t k) const {
    if (k > n) {
        return 0;
    }
    if (n > bound_) {
        throw InvalidParameter("binomial row " + std::to_string(n) +
                               " exceeds table bound " + std::to_string(bound_));
    }
    Count value = pascal_[n][k];
    if (value == std::numeric_limits<Count>::max()) {
        throw std::overflow_error("binomial coefficient exceeds 64-bit range");
    }
    return value;
}

Count CountingTables::multiset_coefficient(Count n, std::size_t r) const {
    // Computed incrementally since n may be far larger than the table bound.
    // Each intermediate value is itself a binomial coefficient, so the
    // division is exact.
    Count value = 1;
    for (std::size_t i = 1; i <= r; ++i) {
        value = checked_multiply(value, n + r - i);
        value /= i;
    }
    return value;
}

Count CountingTables::multinomial(const std::vector<std::size_t>& parts) const {
    Count value = 1;
    std::size_t total = 0;
    for (std::size_t part : parts) {
        total += part;
        value = checked_multiply(value, binomial(total, part));
    }
    return value;
}

} // namespace funcstructs
