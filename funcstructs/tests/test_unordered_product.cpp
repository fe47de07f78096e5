#include <gtest/gtest.h>
#include <funcstructs/generator.hpp>
#include <funcstructs/partitions.hpp>
#include <funcstructs/rooted_trees.hpp>
#include <funcstructs/unordered_product.hpp>
#include <set>
#include <vector>

using namespace funcstructs;

using Tuple = std::vector<std::size_t>;

namespace {

// Position of every value in the base generator's output.
std::vector<std::size_t> positions(const std::vector<DominantSequence>& values, std::size_t n) {
    const auto all = collect(TreeGenerator(n));
    std::vector<std::size_t> result;
    for (const auto& value : values) {
        for (std::size_t i = 0; i < all.size(); ++i) {
            if (all[i] == value) {
                result.push_back(i);
            }
        }
    }
    return result;
}

} // namespace

// === COMBINATIONS WITH REPLACEMENT ===

TEST(CombinationsWithReplacementTest, PairsOfFourNodeTrees) {
    CombinationsWithReplacement<TreeGenerator> pairs(TreeGenerator(4), 2);
    std::vector<Tuple> indices;
    while (auto pair = pairs.next()) {
        indices.push_back(positions(*pair, 4));
    }
    std::vector<Tuple> expected = {
        {0, 0}, {0, 1}, {0, 2}, {0, 3},
        {1, 1}, {1, 2}, {1, 3},
        {2, 2}, {2, 3},
        {3, 3},
    };
    EXPECT_EQ(indices, expected);
}

TEST(CombinationsWithReplacementTest, CountIsMultisetCoefficient) {
    // 9 trees on 5 nodes, choose 3 with repetition: C(11, 3)
    EXPECT_EQ(count_values(CombinationsWithReplacement<TreeGenerator>(TreeGenerator(5), 3)), 165u);
    // Single kind
    EXPECT_EQ(count_values(CombinationsWithReplacement<TreeGenerator>(TreeGenerator(2), 4)), 1u);
}

TEST(CombinationsWithReplacementTest, DegenerateCases) {
    auto none = collect(CombinationsWithReplacement<TreeGenerator>(TreeGenerator(3), 0));
    ASSERT_EQ(none.size(), 1u);
    EXPECT_TRUE(none[0].empty());
    EXPECT_EQ(count_values(CombinationsWithReplacement<TreeGenerator>(TreeGenerator(0), 2)), 0u);
}

TEST(CombinationsWithReplacementTest, ResetRestarts) {
    CombinationsWithReplacement<PartitionGenerator> pairs(PartitionGenerator(6, 2), 2);
    auto all = collect(pairs);
    pairs.next();
    pairs.reset();
    EXPECT_EQ(collect(pairs), all);
    EXPECT_EQ(all.size(), 6u);
}

// === OUTER PRODUCT ===

TEST(OuterProductTest, LastFactorFastest) {
    OuterProduct<WeakCompositionGenerator> product({WeakCompositionGenerator(1, 2),
                                                    WeakCompositionGenerator(2, 2)});
    std::vector<std::vector<Tuple>> expected = {
        {{1, 0}, {2, 0}},
        {{1, 0}, {1, 1}},
        {{1, 0}, {0, 2}},
        {{0, 1}, {2, 0}},
        {{0, 1}, {1, 1}},
        {{0, 1}, {0, 2}},
    };
    EXPECT_EQ(collect(product), expected);
}

TEST(OuterProductTest, EmptyAndExhaustedFactors) {
    auto empty = collect(OuterProduct<TreeGenerator>({}));
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_TRUE(empty[0].empty());

    OuterProduct<TreeGenerator> blocked({TreeGenerator(3), TreeGenerator(0)});
    EXPECT_FALSE(blocked.next().has_value());
}

// === UNORDERED PRODUCT ===

TEST(UnorderedProductTest, GroupsEqualKeys) {
    UnorderedProduct<TreeGenerator> forests(Partition({3, 3, 1}),
                                            [](Part size) { return TreeGenerator(size); });
    std::set<std::vector<DominantSequence>> seen;
    while (auto trees = forests.next()) {
        ASSERT_EQ(trees->size(), 3u);
        EXPECT_EQ((*trees)[0].size(), 3u);
        EXPECT_EQ((*trees)[1].size(), 3u);
        EXPECT_EQ((*trees)[2].size(), 1u);
        EXPECT_TRUE(seen.insert(*trees).second);
    }
    // Two trees on 3 nodes, taken twice with repetition
    EXPECT_EQ(seen.size(), 3u);
}

TEST(UnorderedProductTest, EmptyKeys) {
    UnorderedProduct<TreeGenerator> nothing(Partition(), [](Part size) { return TreeGenerator(size); });
    auto all = collect(nothing);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].empty());
}
