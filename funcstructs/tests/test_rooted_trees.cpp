#include <gtest/gtest.h>
#include <funcstructs/generator.hpp>
#include <funcstructs/rooted_trees.hpp>
#include <set>
#include <vector>

using namespace funcstructs;

using Levels = std::vector<Level>;

class TreeGeneratorTest : public ::testing::Test {
protected:
    static std::vector<Levels> levels_of(std::size_t n) {
        std::vector<Levels> result;
        for (const auto& tree : collect(TreeGenerator(n))) {
            result.push_back(tree.levels());
        }
        return result;
    }
};

// === ORDER ===

TEST_F(TreeGeneratorTest, FourNodesInOrder) {
    std::vector<Levels> expected = {
        {0, 1, 2, 3},
        {0, 1, 2, 2},
        {0, 1, 2, 1},
        {0, 1, 1, 1},
    };
    EXPECT_EQ(levels_of(4), expected);
}

TEST_F(TreeGeneratorTest, DegenerateSizes) {
    EXPECT_TRUE(levels_of(0).empty());
    EXPECT_EQ(levels_of(1), (std::vector<Levels>{{0}}));
    EXPECT_EQ(levels_of(2), (std::vector<Levels>{{0, 1}}));
    EXPECT_EQ(levels_of(3), (std::vector<Levels>{{0, 1, 2}, {0, 1, 1}}));
}

TEST_F(TreeGeneratorTest, StrictlyDecreasing) {
    auto trees = levels_of(8);
    for (std::size_t i = 1; i < trees.size(); ++i) {
        EXPECT_GT(trees[i - 1], trees[i]) << "at position " << i;
    }
    EXPECT_EQ(trees.front(), (Levels{0, 1, 2, 3, 4, 5, 6, 7}));
    EXPECT_EQ(trees.back(), (Levels{0, 1, 1, 1, 1, 1, 1, 1}));
}

// === COUNTS ===

TEST_F(TreeGeneratorTest, MatchesUnlabelledRootedTreeCounts) {
    const std::vector<std::size_t> expected = {1, 1, 2, 4, 9, 20, 48, 115, 286, 719};
    for (std::size_t n = 1; n <= expected.size(); ++n) {
        EXPECT_EQ(count_values(TreeGenerator(n)), expected[n - 1]) << "n = " << n;
        EXPECT_EQ(TreeGenerator(n).cardinality(), expected[n - 1]) << "n = " << n;
    }
}

TEST_F(TreeGeneratorTest, EveryTreeCanonicalAndUnique) {
    for (std::size_t n = 1; n <= 9; ++n) {
        std::set<Levels> seen;
        TreeGenerator trees(n);
        while (auto tree = trees.next()) {
            EXPECT_EQ(DominantSequence(LevelSequence(tree->levels())), *tree) << tree->to_string();
            EXPECT_TRUE(seen.insert(tree->levels()).second) << tree->to_string();
        }
    }
}

TEST(TreeCountTest, OtterRecurrence) {
    auto counts = tree_counts_upto(12);
    ASSERT_EQ(counts.size(), 13u);
    EXPECT_EQ(counts[0], 0u);
    EXPECT_EQ(counts[10], 719u);
    EXPECT_EQ(counts[12], 4766u);
    EXPECT_EQ(tree_count(20), 12826228u);
}

// === PROTOCOL ===

TEST_F(TreeGeneratorTest, ResetRestarts) {
    TreeGenerator trees(5);
    auto first = trees.next();
    trees.next();
    trees.next();
    trees.reset();
    EXPECT_EQ(trees.next(), first);
    EXPECT_EQ(count_values(trees), 8u);
}

TEST_F(TreeGeneratorTest, CopyForksEnumeration) {
    TreeGenerator trees(6);
    trees.next();
    trees.next();
    TreeGenerator fork = trees;
    EXPECT_EQ(trees.next(), fork.next());
    EXPECT_EQ(count_values(trees), count_values(fork));
    EXPECT_EQ(count_values(trees), 17u);
}

TEST_F(TreeGeneratorTest, StaysExhausted) {
    TreeGenerator trees(3);
    EXPECT_TRUE(trees.next().has_value());
    EXPECT_TRUE(trees.next().has_value());
    EXPECT_FALSE(trees.next().has_value());
    EXPECT_FALSE(trees.next().has_value());
}
