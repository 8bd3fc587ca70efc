#include "node.h"
#include <vector>
#include <fmt/format.h>
#include "utils/encoding.h"

namespace Arbor {

Node::~Node()
{
    std::vector<std::shared_ptr<Node>> pending;
    const auto unlink = [&pending](NodeRef &ref) {
        if (auto node = ref.detach()) {
            pending.emplace_back(std::move(node));
        }
    };
    unlink(left);
    unlink(right);

    while (!pending.empty()) {
        const auto node = std::move(pending.back());
        pending.pop_back();
        unlink(node->left);
        unlink(node->right);
    }
}

auto Codec<Node>::encode(const Node &node, std::string &out) -> void
{
    // All references must be absent or stored. prepare_to_store() makes sure of this.
    ARBOR_EXPECT_TRUE(node.left.is_absent() || node.left.is_stored());
    ARBOR_EXPECT_TRUE(node.right.is_absent() || node.right.is_stored());
    ARBOR_EXPECT_TRUE(node.value.is_stored());
    ARBOR_EXPECT_LE(node.key.size(), MAXIMUM_RECORD_SIZE);

    out.clear();
    out.reserve(1 + 8 + 4 + node.key.size() + 8 + 8 + 8);
    append_u8(out, NODE_RECORD_TAG);
    append_u64(out, node.left.address().value);
    append_u32(out, static_cast<std::uint32_t>(node.key.size()));
    out.append(node.key);
    append_u64(out, node.value.address().value);
    append_u64(out, node.right.address().value);
    append_u64(out, node.size);
}

auto Codec<Node>::decode(const Slice &in, Address address, Node &out) -> Status
{
    auto rest = in;
    std::uint8_t tag {};
    std::uint64_t left {};
    std::uint32_t key_size {};
    Slice key;
    std::uint64_t value {};
    std::uint64_t right {};
    std::uint64_t size {};

    if (!consume_u8(rest, tag) || tag != NODE_RECORD_TAG) {
        return Status::corruption("record is not a node");
    }
    if (!consume_u64(rest, left) ||
        !consume_u32(rest, key_size) ||
        !consume_bytes(rest, key_size, key) ||
        !consume_u64(rest, value) ||
        !consume_u64(rest, right) ||
        !consume_u64(rest, size)) {
        return Status::corruption("node record is truncated");
    }
    if (!rest.is_empty()) {
        return Status::corruption("node record has trailing bytes");
    }
    if (value == Address::null_value) {
        return Status::corruption("node record is missing a value");
    }
    if (size == 0) {
        return Status::corruption("node record has an invalid subtree size");
    }
    // A reference to this record, or to one written after it, would form a cycle.
    for (const auto target: {left, value, right}) {
        if (target >= address.value && target != Address::null_value) {
            return Status::corruption(fmt::format("node record at address {} refers forward to address {}",
                                                  address.value, target));
        }
    }

    out.key = key.to_string();
    out.value = ValueRef::from_address(Address {value});
    out.left = NodeRef::from_address(Address {left});
    out.right = NodeRef::from_address(Address {right});
    out.size = size;
    return Status::ok();
}

auto Codec<Node>::prepare_to_store(const Node &node, Storage &storage) -> Status
{
    // Children must be written before the parent record that refers to them. New descendants are visited in
    // post-order using an explicit stack. When a node is popped, its children already have addresses, so storing it
    // only writes its value and the node record itself.
    struct Pending {
        NodeRef ref;
        bool expanded {};
    };
    std::vector<Pending> stack;
    const auto push = [&stack](const NodeRef &ref) {
        if (!ref.is_absent() && !ref.is_stored()) {
            stack.push_back({ref});
        }
    };

    Address ignored;
    Arbor_Try(node.value.store(storage, ignored));
    push(node.right);
    push(node.left);

    while (!stack.empty()) {
        if (stack.back().expanded) {
            const auto ref = std::move(stack.back().ref);
            stack.pop_back();
            Arbor_Try(ref.store(storage, ignored));
            continue;
        }
        stack.back().expanded = true;
        const auto referent = stack.back().ref.peek();
        ARBOR_EXPECT_NE(referent, nullptr);
        push(referent->right);
        push(referent->left);
    }
    return Status::ok();
}

auto Codec<Value>::encode(const Value &value, std::string &out) -> void
{
    out.clear();
    out.reserve(1 + value.data.size());
    append_u8(out, VALUE_RECORD_TAG);
    out.append(value.data);
}

auto Codec<Value>::decode(const Slice &in, Address, Value &out) -> Status
{
    auto rest = in;
    std::uint8_t tag {};
    if (!consume_u8(rest, tag) || tag != VALUE_RECORD_TAG) {
        return Status::corruption("record is not a value");
    }
    out.data = rest.to_string();
    return Status::ok();
}

} // namespace Arbor
