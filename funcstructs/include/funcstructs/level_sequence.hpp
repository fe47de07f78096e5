#ifndef FUNCSTRUCTS_LEVEL_SEQUENCE_HPP
#define FUNCSTRUCTS_LEVEL_SEQUENCE_HPP

#include <funcstructs/combinat.hpp>
#include <funcstructs/types.hpp>
#include <vector>
#include <string>
#include <cstddef>
#include <functional>

namespace funcstructs {

/**
 * Unlabelled ordered rooted tree stored as a level sequence: the height of
 * every node above the root, listed in pre-order depth-first traversal.
 *
 * Node i is attached to the closest node before it whose level is one
 * lower, so the sequence fully determines the tree. Valid sequences are
 * non-empty, start at 0, and never rise by more than one from one
 * position to the next.
 */
class LevelSequence {
public:
    explicit LevelSequence(std::vector<Level> levels);

    // Pre-order level sequence of the tree in which children[x] lists the
    // nodes attached to x, read from root. children must be acyclic.
    static LevelSequence from_children(const std::vector<std::vector<Node>>& children,
                                       Node root);

    const std::vector<Level>& levels() const { return levels_; }
    std::size_t size() const { return levels_.size(); }
    Level operator[](std::size_t i) const { return levels_[i]; }
    std::vector<Level>::const_iterator begin() const { return levels_.begin(); }
    std::vector<Level>::const_iterator end() const { return levels_.end(); }

    // Parent of each node; the root is its own parent.
    std::vector<Node> parents() const;

    // Nodes attached to each node, in sequence order.
    std::vector<std::vector<Node>> children() const;

    // Nodes grouped by height, each group in sequence order.
    std::vector<std::vector<Node>> height_groups() const;

    std::vector<Node> breadth_first_traversal() const;

    // The branches hanging off the root, each re-rooted at level 0.
    std::vector<LevelSequence> subtrees() const;

    std::string to_string() const;

    bool operator==(const LevelSequence& other) const { return levels_ == other.levels_; }
    bool operator!=(const LevelSequence& other) const { return levels_ != other.levels_; }
    bool operator<(const LevelSequence& other) const { return levels_ < other.levels_; }
    bool operator>(const LevelSequence& other) const { return levels_ > other.levels_; }
    bool operator<=(const LevelSequence& other) const { return levels_ <= other.levels_; }
    bool operator>=(const LevelSequence& other) const { return levels_ >= other.levels_; }

protected:
    struct Unchecked {};
    LevelSequence(std::vector<Level> levels, Unchecked) : levels_(std::move(levels)) {}

    std::vector<Level> levels_;
};

/**
 * Canonical form of an unordered rooted tree: the lexicographically
 * largest level sequence among all orderings of its subtrees.
 *
 * Two level sequences describe the same unordered tree iff their dominant
 * sequences are equal. Canonicalizing a dominant sequence returns it
 * unchanged.
 */
class DominantSequence : public LevelSequence {
public:
    explicit DominantSequence(const LevelSequence& tree);

    // Wrap a sequence already known to be dominant, e.g. one produced by
    // TreeGenerator. Not checked.
    static DominantSequence trusted(std::vector<Level> levels);

    // Nodes that may be swapped by an automorphism, grouped in
    // breadth-first order: same parent and isomorphic subtrees.
    std::vector<std::vector<Node>> interchangeable_nodes() const;

    // Order of the tree's automorphism group; n!/degeneracy() is the
    // number of distinct labellings of the tree.
    Count degeneracy() const;

private:
    DominantSequence(std::vector<Level> levels, Unchecked)
        : LevelSequence(std::move(levels), Unchecked{}) {}
};

/**
 * Rooted tree held as an arena of nodes with parent and child indices.
 *
 * Built from a level sequence when a caller needs to walk parent/child
 * links; enumeration itself never builds one. Equality is isomorphism.
 */
class RootedTree {
public:
    struct TreeNode {
        Node parent;
        Level height;
        std::vector<Node> children;
    };

    explicit RootedTree(const LevelSequence& levels);

    std::size_t size() const { return nodes_.size(); }
    static constexpr Node root() { return 0; }

    const TreeNode& node(Node index) const { return nodes_.at(index); }
    Node parent(Node index) const { return nodes_.at(index).parent; }
    const std::vector<Node>& children(Node index) const { return nodes_.at(index).children; }

    // Size of the subtree rooted at each node.
    std::vector<std::size_t> subtree_sizes() const;

    LevelSequence level_sequence() const;
    DominantSequence dominant_sequence() const { return DominantSequence(level_sequence()); }

    bool operator==(const RootedTree& other) const {
        return dominant_sequence() == other.dominant_sequence();
    }
    bool operator!=(const RootedTree& other) const { return !(*this == other); }

private:
    std::vector<TreeNode> nodes_;
};

} // namespace funcstructs

namespace std {
    template<>
    struct hash<funcstructs::LevelSequence> {
        std::size_t operator()(const funcstructs::LevelSequence& seq) const {
            return funcstructs::hash_sequence(seq.levels());
        }
    };

    template<>
    struct hash<funcstructs::DominantSequence> {
        std::size_t operator()(const funcstructs::DominantSequence& seq) const {
            return funcstructs::hash_sequence(seq.levels());
        }
    };
}

#endif // FUNCSTRUCTS_LEVEL_SEQUENCE_HPP
