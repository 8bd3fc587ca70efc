#ifndef ARBOR_TREE_TREE_H
#define ARBOR_TREE_TREE_H

#include <functional>
#include <vector>
#include "arbor/comparator.h"
#include "node.h"

namespace Arbor {

/*
 * Copy-on-write binary search tree algorithms. Nothing here modifies an existing node. Each mutation returns a new
 * root reference: nodes on the path from the root to the change are rebuilt, and every other subtree is shared with
 * the old root by reference, addresses and all. The tree is not balanced, so every walk keeps its path in a vector
 * rather than on the call stack.
 */
class PersistentTree final {
public:
    using Callback = std::function<void(const Slice &key, const Slice &value)>;

    PersistentTree(const Storage &storage, const Comparator &comparator)
        : m_storage {&storage},
          m_comparator {&comparator}
    {}

    // Returns a not found status if "key" does not exist.
    [[nodiscard]] auto search(const NodeRef &root, const Slice &key, std::string &value) const -> Status;

    // Insert a new record, or replace the value of an existing one.
    [[nodiscard]] auto insert(const NodeRef &root, const Slice &key, const ValueRef &value, NodeRef &out) const -> Status;

    // Returns a not found status if "key" does not exist.
    [[nodiscard]] auto erase(const NodeRef &root, const Slice &key, NodeRef &out) const -> Status;

    // Locate the leftmost node in a nonempty subtree. "out" has its referent loaded.
    [[nodiscard]] auto find_min(const NodeRef &root, NodeRef &out) const -> Status;

    // Remove the leftmost node from a nonempty subtree.
    [[nodiscard]] auto delete_min(const NodeRef &root, NodeRef &out) const -> Status;

    // Number of records in the subtree. 0 if "root" is absent.
    [[nodiscard]] auto size(const NodeRef &root, Size &out) const -> Status;

    // Check the ordering and size invariants of every node in the subtree.
    [[nodiscard]] auto TEST_validate(const NodeRef &root) const -> Status;

    // Visit every record in the subtree, in key order.
    [[nodiscard]] auto TEST_traverse(const NodeRef &root, const Callback &callback) const -> Status;

private:
    [[nodiscard]] auto compare(const Slice &lhs, const Slice &rhs) const -> ThreeWayComparison
    {
        return m_comparator->compare(lhs, rhs);
    }

    // Nodes visited on the way down to a change, from the root, and the direction taken out of each one.
    struct Step {
        NodeRef::Referent node;
        bool went_left {};
    };
    using Path = std::vector<Step>;

    [[nodiscard]] auto load(const NodeRef &ref, NodeRef::Referent &out) const -> Status;
    [[nodiscard]] auto rebuild(const Node &base, const NodeRef &left, const NodeRef &right, NodeRef &out) const -> Status;

    // Rebuild each node on "path", bottom-up, around "child", the replacement for the subtree below the last step.
    [[nodiscard]] auto rebuild_path(const Path &path, NodeRef child, NodeRef &out) const -> Status;

    const Storage *m_storage {};
    const Comparator *m_comparator {};
};

} // namespace Arbor

#endif // ARBOR_TREE_TREE_H
