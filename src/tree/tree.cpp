#include "tree.h"
#include <vector>
#include <fmt/format.h>
#include "utils/logging.h"

namespace Arbor {

[[nodiscard]]
static auto make_node(std::string key, ValueRef value, NodeRef left, NodeRef right, Size size) -> NodeRef
{
    auto node = std::make_shared<Node>();
    node->key = std::move(key);
    node->value = std::move(value);
    node->left = std::move(left);
    node->right = std::move(right);
    node->size = size;
    return NodeRef::from_referent(std::move(node));
}

auto PersistentTree::load(const NodeRef &ref, NodeRef::Referent &out) const -> Status
{
    return ref.get(*m_storage, out);
}

auto PersistentTree::size(const NodeRef &root, Size &out) const -> Status
{
    NodeRef::Referent node;
    Arbor_Try(load(root, node));
    out = node ? node->size : 0;
    return Status::ok();
}

// Build a copy of "base" with new children. The subtree size is recomputed from the children, never carried over.
auto PersistentTree::rebuild(const Node &base, const NodeRef &left, const NodeRef &right, NodeRef &out) const -> Status
{
    Size left_size {};
    Size right_size {};
    Arbor_Try(size(left, left_size));
    Arbor_Try(size(right, right_size));
    out = make_node(base.key, base.value, left, right, 1 + left_size + right_size);
    return Status::ok();
}

auto PersistentTree::search(const NodeRef &root, const Slice &key, std::string &value) const -> Status
{
    NodeRef::Referent node;
    Arbor_Try(load(root, node));

    while (node) {
        NodeRef next;
        switch (compare(key, node->key)) {
            case ThreeWayComparison::LT:
                next = node->left;
                break;
            case ThreeWayComparison::GT:
                next = node->right;
                break;
            default: {
                ValueRef::Referent referent;
                Arbor_Try(node->value.get(*m_storage, referent));
                if (referent == nullptr) {
                    return Status::corruption("node is missing a value");
                }
                value = referent->data;
                return Status::ok();
            }
        }
        Arbor_Try(load(next, node));
    }
    return Status::not_found("key does not exist");
}

auto PersistentTree::rebuild_path(const Path &path, NodeRef child, NodeRef &out) const -> Status
{
    for (auto itr = path.rbegin(); itr != path.rend(); ++itr) {
        const auto &node = *itr->node;
        NodeRef parent;
        if (itr->went_left) {
            Arbor_Try(rebuild(node, child, node.right, parent));
        } else {
            Arbor_Try(rebuild(node, node.left, child, parent));
        }
        child = std::move(parent);
    }
    out = std::move(child);
    return Status::ok();
}

auto PersistentTree::insert(const NodeRef &root, const Slice &key, const ValueRef &value, NodeRef &out) const -> Status
{
    Path path;
    NodeRef::Referent node;
    Arbor_Try(load(root, node));

    while (node) {
        const auto cmp = compare(key, node->key);
        if (cmp == ThreeWayComparison::EQ) {
            // Only the value changes, so the children, and the subtree size, are exactly as before.
            return rebuild_path(path, make_node(node->key, value, node->left, node->right, node->size), out);
        }
        const auto go_left = cmp == ThreeWayComparison::LT;
        NodeRef::Referent next;
        Arbor_Try(load(go_left ? node->left : node->right, next));
        path.push_back({std::move(node), go_left});
        node = std::move(next);
    }
    return rebuild_path(path, make_node(key.to_string(), value, {}, {}, 1), out);
}

auto PersistentTree::erase(const NodeRef &root, const Slice &key, NodeRef &out) const -> Status
{
    Path path;
    NodeRef::Referent node;
    Arbor_Try(load(root, node));

    for (; ; ) {
        if (node == nullptr) {
            return Status::not_found("key does not exist");
        }
        const auto cmp = compare(key, node->key);
        if (cmp == ThreeWayComparison::EQ) {
            break;
        }
        const auto go_left = cmp == ThreeWayComparison::LT;
        NodeRef::Referent next;
        Arbor_Try(load(go_left ? node->left : node->right, next));
        path.push_back({std::move(node), go_left});
        node = std::move(next);
    }

    if (node->left.is_absent()) {
        return rebuild_path(path, node->right, out);
    }
    if (node->right.is_absent()) {
        return rebuild_path(path, node->left, out);
    }

    // Two children: replace this node with its in-order successor.
    NodeRef successor;
    Arbor_Try(find_min(node->right, successor));
    const auto min = successor.peek();
    ARBOR_EXPECT_NE(min, nullptr);

    NodeRef right;
    NodeRef replacement;
    Arbor_Try(delete_min(node->right, right));
    Arbor_Try(rebuild(*min, node->left, right, replacement));
    return rebuild_path(path, std::move(replacement), out);
}

auto PersistentTree::find_min(const NodeRef &root, NodeRef &out) const -> Status
{
    NodeRef::Referent node;
    Arbor_Try(load(root, node));
    if (node == nullptr) {
        return Status::not_found("subtree is empty");
    }
    out = root;
    while (!node->left.is_absent()) {
        out = node->left;
        Arbor_Try(load(out, node));
        if (node == nullptr) {
            return Status::corruption("child reference is empty");
        }
    }
    return Status::ok();
}

auto PersistentTree::delete_min(const NodeRef &root, NodeRef &out) const -> Status
{
    Path path;
    NodeRef::Referent node;
    Arbor_Try(load(root, node));
    if (node == nullptr) {
        return Status::not_found("subtree is empty");
    }
    while (!node->left.is_absent()) {
        NodeRef::Referent next;
        Arbor_Try(load(node->left, next));
        path.push_back({std::move(node), true});
        node = std::move(next);
    }
    return rebuild_path(path, node->right, out);
}

auto PersistentTree::TEST_validate(const NodeRef &root) const -> Status
{
    // Post-order walk. A frame is visited once on the way down, to check the key bounds and push the children, and
    // once on the way up, when the counts of its children are on top of "counts".
    struct Frame {
        NodeRef::Referent node;
        const std::string *lower {};
        const std::string *upper {};
        Size children {};
        bool expanded {};
    };
    std::vector<Frame> stack;
    std::vector<Size> counts;

    NodeRef::Referent node;
    Arbor_Try(load(root, node));
    if (node) {
        stack.push_back({std::move(node)});
    }

    while (!stack.empty()) {
        if (stack.back().expanded) {
            const auto frame = std::move(stack.back());
            stack.pop_back();
            Size count {1};
            for (Size i {}; i < frame.children; ++i) {
                count += counts.back();
                counts.pop_back();
            }
            if (frame.node->size != count) {
                return Status::corruption(fmt::format("node \"{}\" has size {} but should have {}",
                                                      escape_string(frame.node->key), frame.node->size, count));
            }
            counts.push_back(count);
            continue;
        }

        auto &frame = stack.back();
        frame.expanded = true;
        const auto current = frame.node;
        const auto *lower = frame.lower;
        const auto *upper = frame.upper;

        if ((lower && compare(*lower, current->key) != ThreeWayComparison::LT) ||
            (upper && compare(current->key, *upper) != ThreeWayComparison::LT)) {
            return Status::corruption(fmt::format("key \"{}\" is out of order", escape_string(current->key)));
        }
        NodeRef::Referent left;
        NodeRef::Referent right;
        Arbor_Try(load(current->left, left));
        Arbor_Try(load(current->right, right));
        frame.children = (left ? 1 : 0) + (right ? 1 : 0);

        // "frame" is invalidated below. The keys stay put, since each node is kept alive by its own frame.
        if (left) {
            stack.push_back({std::move(left), lower, &current->key});
        }
        if (right) {
            stack.push_back({std::move(right), &current->key, upper});
        }
    }
    return Status::ok();
}

auto PersistentTree::TEST_traverse(const NodeRef &root, const Callback &callback) const -> Status
{
    std::vector<NodeRef::Referent> stack;
    NodeRef::Referent node;
    Arbor_Try(load(root, node));

    while (node || !stack.empty()) {
        while (node) {
            NodeRef::Referent next;
            Arbor_Try(load(node->left, next));
            stack.push_back(std::move(node));
            node = std::move(next);
        }
        node = std::move(stack.back());
        stack.pop_back();

        ValueRef::Referent value;
        Arbor_Try(node->value.get(*m_storage, value));
        if (value == nullptr) {
            return Status::corruption("node is missing a value");
        }
        callback(node->key, value->data);

        NodeRef::Referent next;
        Arbor_Try(load(node->right, next));
        node = std::move(next);
    }
    return Status::ok();
}

} // namespace Arbor
