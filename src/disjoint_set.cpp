#include "disjoint_set.hpp"

#include <utility>

DisjointSet::DisjointSet(std::size_t n) {
    reset(n);
}

void DisjointSet::reset(std::size_t n) {
    parent_.resize(n);
    size_.assign(n, 1);
    for (std::size_t i = 0; i < n; ++i) parent_[i] = i;
    components_ = n;
}

std::size_t DisjointSet::find(std::size_t i) {
    std::size_t root = i;
    while (parent_[root] != root) root = parent_[root];

    // Second pass: point everything on the path straight at the root.
    while (parent_[i] != root) {
        const std::size_t next = parent_[i];
        parent_[i] = root;
        i = next;
    }
    return root;
}

bool DisjointSet::unite(std::size_t i, std::size_t j) {
    std::size_t a = find(i);
    std::size_t b = find(j);
    if (a == b) return false;

    if (size_[a] < size_[b]) std::swap(a, b);
    parent_[b] = a;
    size_[a] += size_[b];
    --components_;
    return true;
}
