#ifndef FUNCSTRUCTS_ENDOFUNCTIONS_HPP
#define FUNCSTRUCTS_ENDOFUNCTIONS_HPP

#include <funcstructs/types.hpp>
#include <string>
#include <vector>

namespace funcstructs {

/**
 * Map of {0, ..., n-1} into itself, stored as its table of images:
 * f[x] is the image of x.
 */
class Endofunction {
public:
    Endofunction() = default;
    explicit Endofunction(std::vector<Node> images);

    static Endofunction identity(std::size_t n);

    const std::vector<Node>& images() const { return images_; }
    std::size_t size() const { return images_.size(); }
    Node operator[](Node x) const { return images_[x]; }
    std::vector<Node>::const_iterator begin() const { return images_.begin(); }
    std::vector<Node>::const_iterator end() const { return images_.end(); }

    // (f * g)[x] == f[g[x]]. Both maps must share a domain.
    Endofunction operator*(const Endofunction& other) const;

    // k-fold iterate; power(0) is the identity.
    Endofunction power(std::size_t k) const;

    // Distinct images, ascending.
    std::vector<Node> image() const;

    // preimage()[y] lists every x with f[x] == y, ascending.
    std::vector<std::vector<Node>> preimage() const;

    // Each cycle listed along the map, starting from its smallest node.
    // Cycles are ordered by that node.
    std::vector<std::vector<Node>> cycles() const;

    // Nodes lying on some cycle, ascending.
    std::vector<Node> limitset() const;

    // acyclic_ancestors()[y]: nodes off every cycle that map to y.
    std::vector<std::vector<Node>> acyclic_ancestors() const;

    // Entry k-1 is the size of the image of the k-th iterate, for
    // k = 1, ..., max(1, n-1). Empty for the empty map.
    std::vector<std::size_t> imagepath() const;

    std::string to_string() const;

    bool operator==(const Endofunction& other) const { return images_ == other.images_; }
    bool operator!=(const Endofunction& other) const { return images_ != other.images_; }
    bool operator<(const Endofunction& other) const { return images_ < other.images_; }

private:
    std::vector<bool> cyclic_nodes() const;

    std::vector<Node> images_;
};

} // namespace funcstructs

namespace std {
    template<>
    struct hash<funcstructs::Endofunction> {
        std::size_t operator()(const funcstructs::Endofunction& f) const {
            return funcstructs::hash_sequence(f.images());
        }
    };
}

#endif // FUNCSTRUCTS_ENDOFUNCTIONS_HPP
