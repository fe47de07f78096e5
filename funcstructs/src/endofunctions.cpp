#include <funcstructs/endofunctions.hpp>
#include <funcstructs/errors.hpp>
#include <algorithm>
#include <numeric>
#include <sstream>

namespace funcstructs {

Endofunction::Endofunction(std::vector<Node> images)
    : images_(std::move(images)) {
    for (std::size_t x = 0; x < images_.size(); ++x) {
        if (images_[x] >= images_.size()) {
            throw InvalidParameter("image " + std::to_string(images_[x]) + " of node " +
                                   std::to_string(x) + " is outside a domain of " +
                                   std::to_string(images_.size()) + " nodes");
        }
    }
}

Endofunction Endofunction::identity(std::size_t n) {
    std::vector<Node> images(n);
    std::iota(images.begin(), images.end(), Node{0});
    return Endofunction(std::move(images));
}

Endofunction Endofunction::operator*(const Endofunction& other) const {
    if (size() != other.size()) {
        throw InvalidParameter("cannot compose maps on " + std::to_string(size()) +
                               " and " + std::to_string(other.size()) + " nodes");
    }
    std::vector<Node> composed(other.size());
    for (std::size_t x = 0; x < other.size(); ++x) {
        composed[x] = images_[other[x]];
    }
    return Endofunction(std::move(composed));
}

Endofunction Endofunction::power(std::size_t k) const {
    // Square and multiply
    Endofunction result = identity(size());
    Endofunction base = *this;
    while (k > 0) {
        if (k & 1) {
            result = result * base;
        }
        base = base * base;
        k >>= 1;
    }
    return result;
}

std::vector<Node> Endofunction::image() const {
    std::vector<bool> hit(size(), false);
    for (Node y : images_) {
        hit[y] = true;
    }
    std::vector<Node> result;
    for (Node y = 0; y < size(); ++y) {
        if (hit[y]) result.push_back(y);
    }
    return result;
}

std::vector<std::vector<Node>> Endofunction::preimage() const {
    std::vector<std::vector<Node>> result(size());
    for (Node x = 0; x < size(); ++x) {
        result[images_[x]].push_back(x);
    }
    return result;
}

std::vector<bool> Endofunction::cyclic_nodes() const {
    enum : unsigned char { UNSEEN, ON_PATH, DONE };
    std::vector<unsigned char> state(size(), UNSEEN);
    std::vector<bool> cyclic(size(), false);
    std::vector<Node> path;

    for (Node start = 0; start < size(); ++start) {
        if (state[start] != UNSEEN) continue;
        path.clear();
        Node x = start;
        while (state[x] == UNSEEN) {
            state[x] = ON_PATH;
            path.push_back(x);
            x = images_[x];
        }
        // Walking back into the current path closes a new cycle at x.
        if (state[x] == ON_PATH) {
            Node y = x;
            do {
                cyclic[y] = true;
                y = images_[y];
            } while (y != x);
        }
        for (Node visited : path) {
            state[visited] = DONE;
        }
    }
    return cyclic;
}

std::vector<std::vector<Node>> Endofunction::cycles() const {
    const std::vector<bool> cyclic = cyclic_nodes();
    std::vector<bool> listed(size(), false);
    std::vector<std::vector<Node>> result;
    for (Node start = 0; start < size(); ++start) {
        if (!cyclic[start] || listed[start]) continue;
        std::vector<Node> cycle;
        Node x = start;
        do {
            cycle.push_back(x);
            listed[x] = true;
            x = images_[x];
        } while (x != start);
        result.push_back(std::move(cycle));
    }
    return result;
}

std::vector<Node> Endofunction::limitset() const {
    const std::vector<bool> cyclic = cyclic_nodes();
    std::vector<Node> result;
    for (Node x = 0; x < size(); ++x) {
        if (cyclic[x]) result.push_back(x);
    }
    return result;
}

std::vector<std::vector<Node>> Endofunction::acyclic_ancestors() const {
    const std::vector<bool> cyclic = cyclic_nodes();
    std::vector<std::vector<Node>> result(size());
    for (Node x = 0; x < size(); ++x) {
        if (!cyclic[x]) {
            result[images_[x]].push_back(x);
        }
    }
    return result;
}

std::vector<std::size_t> Endofunction::imagepath() const {
    const std::size_t n = size();
    if (n == 0) {
        return {};
    }
    const std::size_t iterates = std::max<std::size_t>(1, n - 1);
    std::vector<std::size_t> cardinalities;
    cardinalities.reserve(iterates);

    // The image of f^k is f applied to the image of f^(k-1).
    std::vector<bool> current(n, true);
    std::size_t previous = n;
    for (std::size_t k = 1; k <= iterates; ++k) {
        std::vector<bool> following(n, false);
        std::size_t count = 0;
        for (Node x = 0; x < n; ++x) {
            if (current[x] && !following[images_[x]]) {
                following[images_[x]] = true;
                ++count;
            }
        }
        cardinalities.push_back(count);
        if (count == previous) {
            // Reached the limit set; every later iterate agrees.
            cardinalities.resize(iterates, count);
            break;
        }
        previous = count;
        current.swap(following);
    }
    return cardinalities;
}

std::string Endofunction::to_string() const {
    std::ostringstream oss;
    oss << "Endofunction([";
    for (std::size_t x = 0; x < images_.size(); ++x) {
        oss << images_[x];
        if (x < images_.size() - 1) oss << ", ";
    }
    oss << "])";
    return oss.str();
}

} // namespace funcstructs
