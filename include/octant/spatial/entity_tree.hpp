#pragma once

/// @file entity_tree.hpp
/// @brief Dynamic AABB tree over indexed entities
///
/// Bounding volume hierarchy with surface-area sibling selection and
/// height-balancing rotations. Leaves store slightly fattened boxes so small
/// moves do not restructure the tree. Used by SpatialIndex to cull subtrees
/// that cannot hold entities near a query plane.

#include "fwd.hpp"

#include <octant/math/vec.hpp>
#include <octant/math/bounds.hpp>
#include <octant/math/plane.hpp>

#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>

namespace octant_spatial {

// =============================================================================
// Constants
// =============================================================================

/// AABB fattening margin for leaves
constexpr float k_tree_margin = 0.05f;

/// Null node index
constexpr int k_null_node = -1;

// =============================================================================
// Tree Node
// =============================================================================

/// Tree node; leaves carry the entity ID
template<typename ID>
struct EntityTreeNode {
    octant_math::AABB aabb;         ///< Bounding box (fattened for leaves)
    int parent = k_null_node;       ///< Parent node
    int left = k_null_node;         ///< Left child (or next free node)
    int right = k_null_node;        ///< Right child
    int height = 0;                 ///< Tree height at this node
    bool is_leaf = false;           ///< True if leaf node
    ID entity{};                    ///< Entity ID (leaf only)
};

// =============================================================================
// EntityTree
// =============================================================================

/// Dynamic AABB tree keyed by entity ID
/// @tparam ID Hashable, equality-comparable entity identifier
template<typename ID>
class EntityTree {
public:
    using Node = EntityTreeNode<ID>;

    explicit EntityTree(float margin = k_tree_margin)
        : m_margin(margin) {
        m_nodes.reserve(256);
    }

    // =========================================================================
    // Proxy Management
    // =========================================================================

    /// Insert an entity box. An existing entry for the same ID is replaced.
    /// @return Leaf node index
    int insert(const ID& entity, const octant_math::AABB& aabb) {
        if (m_leaf_map.count(entity) != 0) {
            remove(entity);
        }

        int node_idx = allocate_node();
        Node& node = m_nodes[node_idx];
        node.aabb = aabb.expanded(m_margin);
        node.is_leaf = true;
        node.entity = entity;
        node.height = 0;

        insert_leaf(node_idx);
        m_leaf_map[entity] = node_idx;

        return node_idx;
    }

    /// Remove an entity
    /// @return false if the entity was not in the tree
    bool remove(const ID& entity) {
        auto it = m_leaf_map.find(entity);
        if (it == m_leaf_map.end()) {
            return false;
        }

        int node_idx = it->second;
        m_leaf_map.erase(it);

        remove_leaf(node_idx);
        free_node(node_idx);
        return true;
    }

    /// Update an entity box
    /// @return true if the leaf was moved in the tree
    bool update(const ID& entity, const octant_math::AABB& aabb) {
        auto it = m_leaf_map.find(entity);
        if (it == m_leaf_map.end()) {
            insert(entity, aabb);
            return true;
        }

        int node_idx = it->second;
        if (m_nodes[node_idx].aabb.contains_aabb(aabb)) {
            return false;
        }

        remove_leaf(node_idx);
        m_nodes[node_idx].aabb = aabb.expanded(m_margin);
        insert_leaf(node_idx);
        return true;
    }

    void clear() {
        m_nodes.clear();
        m_leaf_map.clear();
        m_root = k_null_node;
        m_free_list = k_null_node;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool contains(const ID& entity) const {
        return m_leaf_map.find(entity) != m_leaf_map.end();
    }

    /// Visit entities whose boxes come within tolerance of the plane.
    /// Subtrees whose box lies entirely beyond the tolerance are skipped.
    /// @param tolerance Cull distance; <= 0 visits every entity
    /// @param visit `bool(const ID&)`, return false to stop early
    template<typename Visitor>
    void query_plane(const octant_math::Plane& plane, float tolerance, Visitor&& visit) const {
        if (m_root == k_null_node) return;

        std::vector<int> pending;
        pending.reserve(static_cast<std::size_t>(height()) * 2 + 2);
        pending.push_back(m_root);

        while (!pending.empty()) {
            const Node& node = m_nodes[pending.back()];
            pending.pop_back();

            if (tolerance > 0.0f &&
                !octant_math::signed_distance_range(plane, node.aabb).within(tolerance)) {
                continue;
            }

            if (node.is_leaf) {
                if (!visit(node.entity)) {
                    return;
                }
                continue;
            }

            // Left subtree first
            pending.push_back(node.right);
            pending.push_back(node.left);
        }
    }

    // =========================================================================
    // Statistics
    // =========================================================================

    /// Number of entities (leaf nodes)
    [[nodiscard]] std::size_t size() const { return m_leaf_map.size(); }

    /// Allocated node slots, free ones included
    [[nodiscard]] std::size_t node_count() const { return m_nodes.size(); }

    [[nodiscard]] int height() const {
        if (m_root == k_null_node) return 0;
        return m_nodes[m_root].height;
    }

    /// Stored (fattened) box of an entity, nullptr if absent
    [[nodiscard]] const octant_math::AABB* fat_aabb(const ID& entity) const {
        auto it = m_leaf_map.find(entity);
        return it != m_leaf_map.end() ? &m_nodes[it->second].aabb : nullptr;
    }

    /// Check parent links, heights and that every branch encloses its children
    [[nodiscard]] bool validate() const {
        if (m_root == k_null_node) return m_leaf_map.empty();
        return validate_node(m_root, k_null_node);
    }

private:
    // =========================================================================
    // Node Allocation
    // =========================================================================

    int allocate_node() {
        if (m_free_list != k_null_node) {
            int node_idx = m_free_list;
            m_free_list = m_nodes[node_idx].left;
            m_nodes[node_idx] = Node{};
            return node_idx;
        }

        int node_idx = static_cast<int>(m_nodes.size());
        m_nodes.push_back(Node{});
        return node_idx;
    }

    void free_node(int node_idx) {
        m_nodes[node_idx] = Node{};
        m_nodes[node_idx].left = m_free_list;
        m_nodes[node_idx].height = -1;
        m_free_list = node_idx;
    }

    // =========================================================================
    // Tree Operations
    // =========================================================================

    void insert_leaf(int leaf_idx) {
        if (m_root == k_null_node) {
            m_root = leaf_idx;
            m_nodes[leaf_idx].parent = k_null_node;
            return;
        }

        octant_math::AABB leaf_aabb = m_nodes[leaf_idx].aabb;
        int sibling = find_best_sibling(leaf_aabb);

        int old_parent = m_nodes[sibling].parent;
        int new_parent = allocate_node();

        m_nodes[new_parent].parent = old_parent;
        m_nodes[new_parent].aabb = octant_math::combine(leaf_aabb, m_nodes[sibling].aabb);
        m_nodes[new_parent].height = m_nodes[sibling].height + 1;
        m_nodes[new_parent].is_leaf = false;

        replace_child(old_parent, sibling, new_parent);

        m_nodes[new_parent].left = sibling;
        m_nodes[new_parent].right = leaf_idx;
        m_nodes[sibling].parent = new_parent;
        m_nodes[leaf_idx].parent = new_parent;

        rebalance(m_nodes[leaf_idx].parent);
    }

    void remove_leaf(int leaf_idx) {
        if (leaf_idx == m_root) {
            m_root = k_null_node;
            return;
        }

        int parent = m_nodes[leaf_idx].parent;
        int grandparent = m_nodes[parent].parent;
        int sibling = (m_nodes[parent].left == leaf_idx)
            ? m_nodes[parent].right
            : m_nodes[parent].left;

        replace_child(grandparent, parent, sibling);
        m_nodes[sibling].parent = grandparent;
        free_node(parent);

        if (grandparent != k_null_node) {
            rebalance(grandparent);
        }

        m_nodes[leaf_idx].parent = k_null_node;
    }

    /// Point `parent`'s link to `old_child` at `new_child`; a null parent means the root
    void replace_child(int parent, int old_child, int new_child) {
        if (parent == k_null_node) {
            m_root = new_child;
        } else if (m_nodes[parent].left == old_child) {
            m_nodes[parent].left = new_child;
        } else {
            m_nodes[parent].right = new_child;
        }
    }

    int find_best_sibling(const octant_math::AABB& aabb) const {
        int best = m_root;
        float best_cost = octant_math::combine(aabb, m_nodes[m_root].aabb).surface_area();

        // (node, cost already paid by enlarging its ancestors)
        std::vector<std::pair<int, float>> pending;
        pending.emplace_back(m_root, 0.0f);

        while (!pending.empty()) {
            auto [node_idx, inherited_cost] = pending.back();
            pending.pop_back();

            const Node& node = m_nodes[node_idx];
            float direct_cost = octant_math::combine(aabb, node.aabb).surface_area();

            float cost = direct_cost + inherited_cost;
            if (cost < best_cost) {
                best_cost = cost;
                best = node_idx;
            }

            if (!node.is_leaf) {
                float child_inherited = inherited_cost + (direct_cost - node.aabb.surface_area());

                // Lower bound on child costs
                float child_lower_bound = aabb.surface_area() + child_inherited;
                if (child_lower_bound < best_cost) {
                    pending.emplace_back(node.left, child_inherited);
                    pending.emplace_back(node.right, child_inherited);
                }
            }
        }

        return best;
    }

    void rebalance(int node_idx) {
        while (node_idx != k_null_node) {
            node_idx = balance(node_idx);

            Node& node = m_nodes[node_idx];
            node.height = 1 + std::max(m_nodes[node.left].height, m_nodes[node.right].height);
            node.aabb = octant_math::combine(m_nodes[node.left].aabb, m_nodes[node.right].aabb);

            node_idx = node.parent;
        }
    }

    /// Promote the taller child of an unbalanced node
    /// @return Index of the node now at this position
    int balance(int node_idx) {
        Node& node = m_nodes[node_idx];

        if (node.is_leaf || node.height < 2) {
            return node_idx;
        }

        int balance_factor = m_nodes[node.right].height - m_nodes[node.left].height;

        if (balance_factor > 1) {
            return rotate_up(node_idx, node.right, node.left, true);
        }
        if (balance_factor < -1) {
            return rotate_up(node_idx, node.left, node.right, false);
        }
        return node_idx;
    }

    /// Rotate child `up` into the place of `node_idx`. The shorter grandchild
    /// under `up` moves down to replace `up` beneath node_idx.
    int rotate_up(int node_idx, int up, int other, bool up_is_right) {
        int up_left = m_nodes[up].left;
        int up_right = m_nodes[up].right;

        m_nodes[up].left = node_idx;
        m_nodes[up].parent = m_nodes[node_idx].parent;
        m_nodes[node_idx].parent = up;

        replace_child(m_nodes[up].parent, node_idx, up);

        int keep = up_left;
        int give = up_right;
        if (m_nodes[up_left].height <= m_nodes[up_right].height) {
            keep = up_right;
            give = up_left;
        }

        m_nodes[up].right = keep;
        if (up_is_right) {
            m_nodes[node_idx].right = give;
        } else {
            m_nodes[node_idx].left = give;
        }
        m_nodes[give].parent = node_idx;

        m_nodes[node_idx].aabb = octant_math::combine(m_nodes[other].aabb, m_nodes[give].aabb);
        m_nodes[up].aabb = octant_math::combine(m_nodes[node_idx].aabb, m_nodes[keep].aabb);

        m_nodes[node_idx].height = 1 + std::max(m_nodes[other].height, m_nodes[give].height);
        m_nodes[up].height = 1 + std::max(m_nodes[node_idx].height, m_nodes[keep].height);

        return up;
    }

    [[nodiscard]] bool validate_node(int node_idx, int expected_parent) const {
        if (node_idx == k_null_node) return false;

        const Node& node = m_nodes[node_idx];

        if (node.parent != expected_parent) return false;

        if (node.is_leaf) {
            if (node.left != k_null_node || node.right != k_null_node) return false;
            if (node.height != 0) return false;
            auto it = m_leaf_map.find(node.entity);
            return it != m_leaf_map.end() && it->second == node_idx;
        }

        if (!validate_node(node.left, node_idx)) return false;
        if (!validate_node(node.right, node_idx)) return false;

        int expected_height = 1 + std::max(m_nodes[node.left].height, m_nodes[node.right].height);
        if (node.height != expected_height) return false;

        return node.aabb.contains_aabb(m_nodes[node.left].aabb) &&
               node.aabb.contains_aabb(m_nodes[node.right].aabb);
    }

    float m_margin;
    std::vector<Node> m_nodes;
    std::unordered_map<ID, int> m_leaf_map;
    int m_root = k_null_node;
    int m_free_list = k_null_node;
};

} // namespace octant_spatial
