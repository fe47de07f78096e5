#include <gtest/gtest.h>
#include <funcstructs/combinat.hpp>
#include <funcstructs/errors.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace funcstructs;

class CountingTablesTest : public ::testing::Test {
protected:
    CountingTables tables{25};
};

// === CHECKED ARITHMETIC ===

TEST(CheckedArithmeticTest, AddAndMultiplyInRange) {
    EXPECT_EQ(checked_add(2, 3), 5u);
    EXPECT_EQ(checked_multiply(6, 7), 42u);
    EXPECT_EQ(checked_multiply(0, std::numeric_limits<Count>::max()), 0u);
    EXPECT_EQ(checked_power(3, 4), 81u);
    EXPECT_EQ(checked_power(10, 0), 1u);
}

TEST(CheckedArithmeticTest, OverflowThrows) {
    const Count max = std::numeric_limits<Count>::max();
    EXPECT_THROW(checked_add(max, 1), std::overflow_error);
    EXPECT_THROW(checked_multiply(max / 2 + 1, 2), std::overflow_error);
    EXPECT_THROW(checked_power(2, 64), std::overflow_error);
    EXPECT_EQ(checked_power(2, 63), Count{1} << 63);
}

TEST(DivisorsTest, IncreasingOrder) {
    EXPECT_EQ(divisors(1), (std::vector<std::size_t>{1}));
    EXPECT_EQ(divisors(12), (std::vector<std::size_t>{1, 2, 3, 4, 6, 12}));
    EXPECT_EQ(divisors(16), (std::vector<std::size_t>{1, 2, 4, 8, 16}));
    EXPECT_EQ(divisors(13), (std::vector<std::size_t>{1, 13}));
    EXPECT_TRUE(divisors(0).empty());
}

// === TABLES ===

TEST_F(CountingTablesTest, Factorials) {
    EXPECT_EQ(tables.factorial(0), 1u);
    EXPECT_EQ(tables.factorial(5), 120u);
    EXPECT_EQ(tables.factorial(20), 2432902008176640000ULL);
    EXPECT_THROW(tables.factorial(21), std::overflow_error);
    EXPECT_THROW(tables.factorial(26), InvalidParameter);
}

TEST_F(CountingTablesTest, Binomials) {
    EXPECT_EQ(tables.binomial(5, 2), 10u);
    EXPECT_EQ(tables.binomial(25, 12), 5200300u);
    EXPECT_EQ(tables.binomial(4, 0), 1u);
    EXPECT_EQ(tables.binomial(4, 4), 1u);
    EXPECT_EQ(tables.binomial(3, 5), 0u);
}

TEST_F(CountingTablesTest, MultisetCoefficients) {
    // C(n + r - 1, r)
    EXPECT_EQ(tables.multiset_coefficient(3, 2), 6u);
    EXPECT_EQ(tables.multiset_coefficient(1, 7), 1u);
    EXPECT_EQ(tables.multiset_coefficient(4, 0), 1u);
    EXPECT_EQ(tables.multiset_coefficient(0, 3), 0u);
    // Kinds far beyond the table bound
    EXPECT_EQ(tables.multiset_coefficient(1000, 2), 500500u);
}

TEST_F(CountingTablesTest, Multinomials) {
    EXPECT_EQ(tables.multinomial({3, 3}), 20u);
    EXPECT_EQ(tables.multinomial({1, 1, 1}), 6u);
    EXPECT_EQ(tables.multinomial({2, 1, 1}), 12u);
    EXPECT_EQ(tables.multinomial({}), 1u);
    EXPECT_EQ(tables.multinomial({5}), 1u);
}
