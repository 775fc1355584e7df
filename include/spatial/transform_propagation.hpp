#pragma once
#include "config.hpp"
#include "transform.hpp"
#include "world_transform.hpp"

#include <cstddef>
#include <limits>
#include <queue>
#include <vector>

namespace spatial {

/** @brief Parent index of a root node. */
inline constexpr std::size_t NO_PARENT = std::numeric_limits<std::size_t>::max();

/**
 * @brief One node of a transform hierarchy as handed over by the scene each frame.
 */
struct TransformNode {
    /** @brief Transform relative to the parent. */
    LocalTransform local;
    /** @brief Index of the parent node, or NO_PARENT for a root. */
    std::size_t parent = NO_PARENT;
};

/**
 * @brief Propagates LocalTransforms to WorldTransforms through the hierarchy.
 * @details Performs a Breadth-First Search (BFS) starting from root nodes. Each child is
 * visited after its parent's WorldTransform is final, so nodes may arrive in any order.
 *
 * Roots: WorldTransform = LocalTransform
 * Children: WorldTransform = Parent.WorldTransform * LocalTransform
 *
 * A parent index out of range, or a node not reachable from any root (a cycle), is a
 * contract violation: it asserts in debug builds and keeps the identity transform.
 *
 * @param nodes The hierarchy, one entry per object.
 * @param out Resized to `nodes.size()`; `out[i]` receives node i's world transform.
 */
inline void propagate_transforms(const std::vector<TransformNode>& nodes,
                                 std::vector<WorldTransform>& out) {
    const std::size_t n = nodes.size();
    out.assign(n, WorldTransform::identity());

    // Child lists in one flat array: children of i are child_index[first_child[i]..first_child[i+1])
    std::vector<std::size_t> first_child(n + 1, 0);
    for (const auto& node : nodes) {
        if (node.parent == NO_PARENT)
            continue;
        SPATIAL_ASSERT(node.parent < n, "parent index out of range");
        if (node.parent < n)
            ++first_child[node.parent + 1];
    }
    for (std::size_t i = 0; i < n; ++i)
        first_child[i + 1] += first_child[i];

    std::vector<std::size_t> child_index(first_child[n]);
    std::vector<std::size_t> cursor(first_child.begin(), first_child.end() - 1);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t p = nodes[i].parent;
        if (p != NO_PARENT && p < n)
            child_index[cursor[p]++] = i;
    }

    std::queue<std::size_t> queue;
    std::size_t visited = 0;

    // Seed the BFS with the roots
    for (std::size_t i = 0; i < n; ++i) {
        if (nodes[i].parent != NO_PARENT)
            continue;
        out[i] = WorldTransform(nodes[i].local);
        ++visited;
        for (std::size_t c = first_child[i]; c < first_child[i + 1]; ++c)
            queue.push(child_index[c]);
    }

    // BFS through children
    while (!queue.empty()) {
        const std::size_t i = queue.front();
        queue.pop();

        // Child World = Parent World * Local
        out[i] = out[nodes[i].parent].mul_transform(nodes[i].local);
        ++visited;

        for (std::size_t c = first_child[i]; c < first_child[i + 1]; ++c)
            queue.push(child_index[c]);
    }

    SPATIAL_ASSERT(visited == n, "transform hierarchy contains a cycle or a dangling parent");
    (void)visited;
}

/** @brief Convenience overload returning the world transforms. */
inline std::vector<WorldTransform> propagate_transforms(const std::vector<TransformNode>& nodes) {
    std::vector<WorldTransform> out;
    propagate_transforms(nodes, out);
    return out;
}

} // namespace spatial
