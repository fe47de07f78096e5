#include <funcstructs/level_sequence.hpp>
#include <funcstructs/combinat.hpp>
#include <funcstructs/errors.hpp>
#include <algorithm>
#include <sstream>
#include <utility>

namespace funcstructs {

namespace {

/**
 * Assign every node an integer key such that two nodes at the same height
 * share a key iff the subtrees rooted at them are isomorphic, and a larger
 * key means a larger dominant subtree.
 *
 * Works upwards one height at a time: each node is described by the list
 * of its children's keys, the nodes of a height are sorted on those lists,
 * and runs of equal lists receive a common key. Because the lower height
 * is already sorted when its keys are appended, the child lists arrive
 * in non-increasing order and need no sorting of their own.
 * O(k log k) for k nodes.
 */
std::vector<std::size_t> subtree_keys(const LevelSequence& tree) {
    const std::vector<Node> parent = tree.parents();
    std::vector<std::vector<Node>> groups = tree.height_groups();

    std::vector<std::size_t> keys(tree.size(), 0);
    std::vector<std::vector<std::size_t>> child_keys(tree.size());
    std::vector<Node> previous_level;
    std::size_t sort_value = tree.size();

    for (auto level = groups.rbegin(); level != groups.rend(); ++level) {
        for (Node x : previous_level) {
            child_keys[parent[x]].push_back(keys[x]);
        }
        std::stable_sort(level->begin(), level->end(), [&](Node a, Node b) {
            return child_keys[a] > child_keys[b];
        });
        for (std::size_t i = 0; i < level->size();) {
            --sort_value;
            std::size_t j = i;
            while (j < level->size() && child_keys[(*level)[j]] == child_keys[(*level)[i]]) {
                keys[(*level)[j]] = sort_value;
                ++j;
            }
            i = j;
        }
        previous_level = std::move(*level);
    }
    return keys;
}

} // namespace

LevelSequence::LevelSequence(std::vector<Level> levels)
    : levels_(std::move(levels)) {
    if (levels_.empty()) {
        throw InvalidParameter("a tree must have a root");
    }
    if (levels_[0] != 0) {
        throw InvalidParameter("root must have height 0, received " + std::to_string(levels_[0]));
    }
    for (std::size_t i = 1; i < levels_.size(); ++i) {
        if (levels_[i] < 1 || levels_[i] > levels_[i - 1] + 1) {
            throw InvalidParameter("invalid level sequence " + to_string());
        }
    }
}

LevelSequence LevelSequence::from_children(const std::vector<std::vector<Node>>& children,
                                           Node root) {
    if (root >= children.size()) {
        throw InvalidParameter("root " + std::to_string(root) + " is not a node");
    }

    // Managed stack rather than recursion: trees hanging off an
    // endofunction can be thousands of nodes deep.
    std::vector<Level> levels;
    std::vector<std::pair<Node, Level>> stack = {{root, 0}};
    while (!stack.empty()) {
        auto [x, level] = stack.back();
        stack.pop_back();
        levels.push_back(level);
        if (levels.size() > children.size()) {
            throw InvalidParameter("child lists contain a cycle");
        }
        const auto& attached = children[x];
        for (auto it = attached.rbegin(); it != attached.rend(); ++it) {
            stack.emplace_back(*it, level + 1);
        }
    }
    return LevelSequence(std::move(levels), Unchecked{});
}

std::vector<Node> LevelSequence::parents() const {
    // The sequence implicitly maps each node to the most recent node one
    // level down; keep the latest node seen at every level.
    std::vector<Node> grafting_point(levels_.size(), 0);
    std::vector<Node> result;
    result.reserve(levels_.size());
    for (Node node = 0; node < levels_.size(); ++node) {
        Level level = levels_[node];
        result.push_back(level == 0 ? 0 : grafting_point[level - 1]);
        grafting_point[level] = node;
    }
    return result;
}

std::vector<std::vector<Node>> LevelSequence::children() const {
    std::vector<std::vector<Node>> result(levels_.size());
    const std::vector<Node> parent = parents();
    for (Node node = 1; node < levels_.size(); ++node) {
        result[parent[node]].push_back(node);
    }
    return result;
}

std::vector<std::vector<Node>> LevelSequence::height_groups() const {
    std::vector<std::vector<Node>> groups;
    for (Node node = 0; node < levels_.size(); ++node) {
        if (levels_[node] + 1 > groups.size()) {
            groups.resize(levels_[node] + 1);
        }
        groups[levels_[node]].push_back(node);
    }
    return groups;
}

std::vector<Node> LevelSequence::breadth_first_traversal() const {
    std::vector<Node> order;
    order.reserve(levels_.size());
    for (const auto& group : height_groups()) {
        order.insert(order.end(), group.begin(), group.end());
    }
    return order;
}

std::vector<LevelSequence> LevelSequence::subtrees() const {
    std::vector<LevelSequence> branches;
    std::vector<Level> branch;
    for (std::size_t i = 1; i < levels_.size(); ++i) {
        if (levels_[i] == 1 && !branch.empty()) {
            branches.push_back(LevelSequence(std::move(branch), Unchecked{}));
            branch.clear();
        }
        branch.push_back(levels_[i] - 1);
    }
    if (!branch.empty()) {
        branches.push_back(LevelSequence(std::move(branch), Unchecked{}));
    }
    return branches;
}

std::string LevelSequence::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < levels_.size(); ++i) {
        oss << levels_[i];
        if (i < levels_.size() - 1) oss << ", ";
    }
    oss << "]";
    return oss.str();
}

DominantSequence::DominantSequence(const LevelSequence& tree)
    : LevelSequence(tree) {
    const std::vector<std::size_t> keys = subtree_keys(tree);
    std::vector<std::vector<Node>> attached = tree.children();
    for (auto& siblings : attached) {
        std::stable_sort(siblings.begin(), siblings.end(), [&](Node a, Node b) {
            return keys[a] > keys[b];
        });
    }
    levels_ = LevelSequence::from_children(attached, 0).levels();
}

DominantSequence DominantSequence::trusted(std::vector<Level> levels) {
    return DominantSequence(std::move(levels), Unchecked{});
}

std::vector<std::vector<Node>> DominantSequence::interchangeable_nodes() const {
    const std::vector<Node> parent = parents();
    const std::vector<std::size_t> keys = subtree_keys(*this);

    // Siblings of a dominant sequence are already sorted by subtree, so
    // isomorphic siblings sit next to each other in breadth-first order.
    std::vector<std::vector<Node>> groups;
    for (Node node : breadth_first_traversal()) {
        if (!groups.empty()) {
            Node last = groups.back().back();
            if (parent[last] == parent[node] && keys[last] == keys[node]) {
                groups.back().push_back(node);
                continue;
            }
        }
        groups.push_back({node});
    }
    return groups;
}

Count DominantSequence::degeneracy() const {
    Count result = 1;
    for (const auto& group : interchangeable_nodes()) {
        for (std::size_t k = 2; k <= group.size(); ++k) {
            result = checked_multiply(result, k);
        }
    }
    return result;
}

RootedTree::RootedTree(const LevelSequence& levels) {
    const std::vector<Node> parent = levels.parents();
    nodes_.resize(levels.size());
    for (Node node = 0; node < levels.size(); ++node) {
        nodes_[node].parent = parent[node];
        nodes_[node].height = levels[node];
        if (node != 0) {
            nodes_[parent[node]].children.push_back(node);
        }
    }
}

std::vector<std::size_t> RootedTree::subtree_sizes() const {
    // Parents always precede their children in pre-order, so a reverse
    // sweep sees every subtree complete before its parent.
    std::vector<std::size_t> sizes(nodes_.size(), 1);
    for (Node node = nodes_.size(); node-- > 1;) {
        sizes[nodes_[node].parent] += sizes[node];
    }
    return sizes;
}

LevelSequence RootedTree::level_sequence() const {
    std::vector<std::vector<Node>> attached;
    attached.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        attached.push_back(node.children);
    }
    return LevelSequence::from_children(attached, root());
}

} // namespace funcstructs
