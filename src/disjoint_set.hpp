#pragma once

#include <cstddef>
#include <vector>

// Union-find over dense indices [0, n).
//
// Path compression on find(), union by size on unite(). componentCount() is
// maintained incrementally so "is everything connected yet?" is O(1).
class DisjointSet {
public:
    DisjointSet() = default;
    explicit DisjointSet(std::size_t n);

    void reset(std::size_t n);

    std::size_t size() const { return parent_.size(); }

    std::size_t find(std::size_t i);

    // Merges the sets containing i and j. Returns true if they were separate.
    bool unite(std::size_t i, std::size_t j);

    bool same(std::size_t i, std::size_t j) { return find(i) == find(j); }

    // Number of elements in i's set.
    std::size_t setSize(std::size_t i) { return size_[find(i)]; }

    std::size_t componentCount() const { return components_; }

    // True when there is at most one component (an empty set counts as connected).
    bool fullyConnected() const { return components_ <= 1; }

private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> size_;
    std::size_t components_ = 0;
};
