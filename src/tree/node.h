#ifndef ARBOR_TREE_NODE_H
#define ARBOR_TREE_NODE_H

#include "reference.h"

namespace Arbor {

/* Record tags. Every record payload begins with one of these. */
static constexpr std::uint8_t NODE_RECORD_TAG {1};
static constexpr std::uint8_t VALUE_RECORD_TAG {2};

struct Value {
    std::string data;
};

struct Node;

using NodeRef = Reference<Node>;
using ValueRef = Reference<Value>;

/*
 * Immutable tree node. "size" is the number of nodes in the subtree rooted here, including this one.
 */
struct Node {
    Node() = default;
    Node(const Node &) = default;
    auto operator=(const Node &) -> Node & = default;

    // Children that nothing else refers to are unlinked one at a time, so tearing down a long chain does not recurse.
    ~Node();

    std::string key;
    ValueRef value;
    NodeRef left;
    NodeRef right;
    Size size {1};
};

/* Node Record Format:
 *     Size    Name
 *     1       tag
 *     8       left_address
 *     4       key_size
 *     n       key
 *     8       value_address
 *     8       right_address
 *     8       size
 *
 * Child and value references are decoded as unloaded Reference objects. Records are appended children first, so a
 * nonzero child or value address must be less than the address of the node record itself.
 */
template<>
struct Codec<Node> {
    static auto encode(const Node &node, std::string &out) -> void;
    [[nodiscard]] static auto decode(const Slice &in, Address address, Node &out) -> Status;
    [[nodiscard]] static auto prepare_to_store(const Node &node, Storage &storage) -> Status;
};

/* Value Record Format:
 *     Size    Name
 *     1       tag
 *     n       data
 */
template<>
struct Codec<Value> {
    static auto encode(const Value &value, std::string &out) -> void;
    [[nodiscard]] static auto decode(const Slice &in, Address address, Value &out) -> Status;

    [[nodiscard]] static auto prepare_to_store(const Value &, Storage &) -> Status
    {
        return Status::ok();
    }
};

} // namespace Arbor

#endif // ARBOR_TREE_NODE_H
