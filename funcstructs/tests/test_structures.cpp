#include <gtest/gtest.h>
#include <funcstructs/errors.hpp>
#include <funcstructs/generator.hpp>
#include <funcstructs/structures.hpp>
#include <set>
#include <stdexcept>
#include <vector>

using namespace funcstructs;

using Levels = std::vector<Level>;
using Nodes = std::vector<Node>;

class StructureGeneratorTest : public ::testing::Test {
protected:
    static DominantSequence tree(Levels levels) {
        return DominantSequence(LevelSequence(std::move(levels)));
    }

    static Cycle cycle(std::vector<DominantSequence> trees) {
        return Cycle(std::move(trees));
    }

    static Count factorial(std::size_t n) {
        Count result = 1;
        for (std::size_t k = 2; k <= n; ++k) result *= k;
        return result;
    }
};

// === STRUCTURE VALUE ===

TEST_F(StructureGeneratorTest, CyclesAreSorted) {
    EndofunctionStructure a({cycle({tree({0, 1})}), cycle({tree({0}), tree({0})})});
    EndofunctionStructure b({cycle({tree({0}), tree({0})}), cycle({tree({0, 1})})});
    EXPECT_EQ(a, b);
    EXPECT_EQ(std::hash<EndofunctionStructure>{}(a), std::hash<EndofunctionStructure>{}(b));
    EXPECT_EQ(a.node_count(), 4u);
    EXPECT_EQ(a.cycle_type().parts(), (std::vector<Part>{2, 1}));
}

TEST_F(StructureGeneratorTest, ToString) {
    EndofunctionStructure s({cycle({tree({0, 1}), tree({0})})});
    EXPECT_EQ(s.to_string(), "EndofunctionStructure(Cycle([0], [0, 1]))");
    EXPECT_EQ(EndofunctionStructure().to_string(), "EndofunctionStructure()");
}

TEST_F(StructureGeneratorTest, RejectsEmptyCycle) {
    EXPECT_THROW((EndofunctionStructure({cycle({tree({0})}), Cycle()})), InvalidParameter);
    EXPECT_THROW((EndofunctionStructure({Cycle()})), InvalidParameter);
}

TEST_F(StructureGeneratorTest, FromFunction) {
    // 3 -> 0 -> 1 -> 2 -> 0, 4 -> 3, 5 -> 5
    Endofunction f(Nodes{1, 2, 0, 0, 3, 5});
    auto s = EndofunctionStructure::from_function(f);
    EndofunctionStructure expected({
        cycle({tree({0, 1, 2}), tree({0}), tree({0})}),
        cycle({tree({0})}),
    });
    EXPECT_EQ(s, expected);
    EXPECT_EQ(s.node_count(), 6u);
}

TEST_F(StructureGeneratorTest, ConjugatesShareStructure) {
    Endofunction f(Nodes{1, 2, 0, 0, 3, 5});
    // g = s f s^-1 for the relabelling s(x) = (x + 2) mod 6
    Nodes g(6);
    for (Node x = 0; x < 6; ++x) {
        g[(x + 2) % 6] = (f[x] + 2) % 6;
    }
    EXPECT_EQ(EndofunctionStructure::from_function(f),
              EndofunctionStructure::from_function(Endofunction(g)));

    // Turning the path into a cherry changes the class
    Endofunction h(Nodes{1, 2, 0, 0, 0, 5});
    EXPECT_NE(EndofunctionStructure::from_function(f), EndofunctionStructure::from_function(h));
}

TEST_F(StructureGeneratorTest, ToFunctionLayout) {
    EndofunctionStructure s({cycle({tree({0, 1, 1}), tree({0})})});
    // The single node comes first in the necklace: block 0, then the
    // cherry in block 1..3; roots 0 and 1 form the cycle
    EXPECT_EQ(s.to_function().images(), (Nodes{1, 0, 1, 1}));
}

TEST_F(StructureGeneratorTest, Degeneracy) {
    // Two fixed points: swapping them
    EndofunctionStructure two_fixed({cycle({tree({0})}), cycle({tree({0})})});
    EXPECT_EQ(two_fixed.degeneracy(), 2u);
    // A bare 3-cycle: its rotations
    EndofunctionStructure rotation({cycle({tree({0}), tree({0}), tree({0})})});
    EXPECT_EQ(rotation.degeneracy(), 3u);
    // Constant map on 3 nodes: the two leaves swap
    EndofunctionStructure constant({cycle({tree({0, 1, 1})})});
    EXPECT_EQ(constant.degeneracy(), 2u);
}

// === GENERATION ===

TEST_F(StructureGeneratorTest, CountsMatchKnownSequence) {
    const std::vector<std::size_t> expected = {1, 1, 3, 7, 19, 47, 130, 343, 951};
    for (std::size_t n = 0; n < expected.size(); ++n) {
        EXPECT_EQ(count_values(StructureGenerator(n)), expected[n]) << "n = " << n;
        EXPECT_EQ(structure_count(n), expected[n]) << "n = " << n;
    }
}

TEST_F(StructureGeneratorTest, EmptyMap) {
    auto all = collect(StructureGenerator(0));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].cycles().empty());
    EXPECT_EQ(all[0].node_count(), 0u);
}

TEST_F(StructureGeneratorTest, ThreeNodesByCycleType) {
    EXPECT_EQ(count_values(StructureGenerator(3, CycleType({3}))), 1u);
    EXPECT_EQ(count_values(StructureGenerator(3, CycleType({2, 1}))), 1u);
    EXPECT_EQ(count_values(StructureGenerator(3, CycleType({1, 1, 1}))), 1u);
    EXPECT_EQ(count_values(StructureGenerator(3, CycleType({2}))), 1u);
    EXPECT_EQ(count_values(StructureGenerator(3, CycleType({1, 1}))), 1u);

    // Rooted trees on 3 nodes hanging off one fixed point
    std::set<EndofunctionStructure> expected = {
        EndofunctionStructure({cycle({tree({0, 1, 2})})}),
        EndofunctionStructure({cycle({tree({0, 1, 1})})}),
    };
    auto single = collect(StructureGenerator(3, CycleType({1})));
    EXPECT_EQ(std::set<EndofunctionStructure>(single.begin(), single.end()), expected);
}

TEST_F(StructureGeneratorTest, CycleTypesPartitionTheWhole) {
    for (std::size_t n = 1; n <= 6; ++n) {
        std::size_t total = 0;
        for (std::size_t cyclic = 1; cyclic <= n; ++cyclic) {
            AllPartitionsGenerator cycle_types(cyclic);
            while (auto cycle_type = cycle_types.next()) {
                StructureGenerator structures(n, *cycle_type);
                while (auto s = structures.next()) {
                    EXPECT_EQ(s->cycle_type(), *cycle_type);
                    EXPECT_EQ(s->node_count(), n);
                    ++total;
                }
            }
        }
        EXPECT_EQ(total, structure_count(n)) << "n = " << n;
    }
}

TEST_F(StructureGeneratorTest, InvalidCycleTypes) {
    EXPECT_THROW(StructureGenerator(3, CycleType({2, 2})), InvalidParameter);
    EXPECT_THROW(StructureGenerator(3, CycleType()), InvalidParameter);
    EXPECT_NO_THROW(StructureGenerator(0, CycleType()));
}

TEST_F(StructureGeneratorTest, UniqueAndCanonical) {
    for (std::size_t n = 1; n <= 6; ++n) {
        std::set<EndofunctionStructure> seen;
        StructureGenerator structures(n);
        while (auto s = structures.next()) {
            EXPECT_TRUE(seen.insert(*s).second) << s->to_string();
            EXPECT_EQ(EndofunctionStructure::from_function(s->to_function()), *s) << s->to_string();
        }
    }
}

TEST_F(StructureGeneratorTest, LabellingsSumToAllMaps) {
    for (std::size_t n = 1; n <= 7; ++n) {
        Count labelled = 0;
        StructureGenerator structures(n);
        while (auto s = structures.next()) {
            EXPECT_EQ(factorial(n) % s->degeneracy(), 0u);
            labelled += factorial(n) / s->degeneracy();
        }
        EXPECT_EQ(labelled, checked_power(n, n)) << "n = " << n;
    }
}

TEST_F(StructureGeneratorTest, ImagePathMatchesRepresentative) {
    for (std::size_t n = 1; n <= 6; ++n) {
        StructureGenerator structures(n);
        while (auto s = structures.next()) {
            EXPECT_EQ(s->imagepath(), s->to_function().imagepath()) << s->to_string();
        }
    }
}

TEST_F(StructureGeneratorTest, ResetAndCopy) {
    StructureGenerator structures(5, CycleType({2, 1}));
    auto all = collect(structures);
    structures.next();
    StructureGenerator fork = structures;
    EXPECT_EQ(collect(fork), std::vector<EndofunctionStructure>(all.begin() + 1, all.end()));
    structures.reset();
    EXPECT_EQ(collect(structures), all);
}

// === COUNTING ===

TEST(StructureCountTest, LargerSizes) {
    EXPECT_EQ(structure_count(10), 7318u);
    EXPECT_EQ(structure_count(15), 1328993u);
    EXPECT_THROW(structure_count(21), std::overflow_error);
}
