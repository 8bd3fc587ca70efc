#include <fmt/format.h>
#include <gtest/gtest.h>
#include <map>
#include "arbor/comparator.h"
#include "tree/node.h"
#include "tree/tree.h"
#include "unit_tests.h"
#include "utils/encoding.h"

namespace Arbor {

[[nodiscard]]
static auto make_value(const std::string &data) -> ValueRef
{
    auto value = std::make_shared<Value>();
    value->data = data;
    return ValueRef::from_referent(std::move(value));
}

class ReferenceTests : public TestWithHeapStorage {};

TEST_F(ReferenceTests, DefaultReferenceIsAbsent)
{
    ValueRef ref;
    ASSERT_TRUE(ref.is_absent());
    ASSERT_FALSE(ref.is_loaded());
    ASSERT_FALSE(ref.is_stored());

    ValueRef::Referent referent;
    ASSERT_OK(ref.get(*storage, referent));
    ASSERT_EQ(referent, nullptr);

    Address address {123};
    const auto before = state->data.size();
    ASSERT_OK(ref.store(*storage, address));
    ASSERT_TRUE(address.is_null());
    ASSERT_EQ(state->data.size(), before);
}

TEST_F(ReferenceTests, NullAddressProducesAbsentReference)
{
    ASSERT_TRUE(ValueRef::from_address(Address::null()).is_absent());
}

TEST_F(ReferenceTests, StoreIsIdempotent)
{
    const auto ref = make_value("hello");
    ASSERT_TRUE(ref.is_loaded());
    ASSERT_FALSE(ref.is_stored());

    Address first, second;
    ASSERT_OK(ref.store(*storage, first));
    const auto size = state->data.size();
    ASSERT_OK(ref.store(*storage, second));
    ASSERT_EQ(first, second);
    ASSERT_EQ(state->data.size(), size);
    ASSERT_EQ(ref.address(), first);
}

TEST_F(ReferenceTests, CopiesShareAddress)
{
    const auto ref = make_value("hello");
    const auto copy = ref;
    ASSERT_TRUE(copy.is_same(ref));

    Address address;
    ASSERT_OK(copy.store(*storage, address));
    ASSERT_TRUE(ref.is_stored());
    ASSERT_EQ(ref.address(), address);
}

TEST_F(ReferenceTests, LoadsLazily)
{
    Address address;
    ASSERT_OK(make_value("hello").store(*storage, address));

    const auto ref = ValueRef::from_address(address);
    ASSERT_TRUE(ref.is_stored());
    ASSERT_FALSE(ref.is_loaded());
    ASSERT_EQ(ref.peek(), nullptr);

    ValueRef::Referent referent;
    ASSERT_OK(ref.get(*storage, referent));
    ASSERT_EQ(referent->data, "hello");
    ASSERT_TRUE(ref.is_loaded());

    // Cached after the first load.
    state->on_read = fail_after(0);
    ValueRef::Referent again;
    ASSERT_OK(ref.get(*storage, again));
    ASSERT_EQ(again, referent);
}

TEST_F(ReferenceTests, FailedStoreCanBeRetried)
{
    const auto ref = make_value("hello");
    state->on_write = fail_after(0);
    Address address;
    ASSERT_TRUE(ref.store(*storage, address).is_system_error());
    ASSERT_FALSE(ref.is_stored());

    state->on_write = nullptr;
    ASSERT_OK(ref.store(*storage, address));
    ASSERT_FALSE(address.is_null());
}

TEST_F(ReferenceTests, WrongRecordTypeIsCorrupt)
{
    Address address;
    ASSERT_OK(make_value("hello").store(*storage, address));

    NodeRef::Referent node;
    ASSERT_TRUE(NodeRef::from_address(address).get(*storage, node).is_corruption());
}

TEST_F(ReferenceTests, NodeStoresItsReferencesFirst)
{
    auto node = std::make_shared<Node>();
    node->key = "key";
    node->value = make_value("value");
    auto child = std::make_shared<Node>();
    child->key = "a";
    child->value = make_value("child");
    node->left = NodeRef::from_referent(child);
    node->size = 2;

    const auto ref = NodeRef::from_referent(node);
    Address address;
    ASSERT_OK(ref.store(*storage, address));
    ASSERT_TRUE(node->value.is_stored());
    ASSERT_TRUE(node->left.is_stored());
    ASSERT_LT(node->value.address(), address);
    ASSERT_LT(node->left.address(), address);

    NodeRef::Referent loaded;
    ASSERT_OK(NodeRef::from_address(address).get(*storage, loaded));
    ASSERT_EQ(loaded->key, "key");
    ASSERT_EQ(loaded->size, 2);
    ASSERT_EQ(loaded->left.address(), node->left.address());
    ASSERT_EQ(loaded->value.address(), node->value.address());
    ASSERT_TRUE(loaded->right.is_absent());
    ASSERT_FALSE(loaded->left.is_loaded());
}

TEST(NodeCodecTests, EncodingLayout)
{
    Node node;
    node.key = "k";
    node.value = ValueRef::from_address(Address {100});
    node.left = NodeRef::from_address(Address {200});
    node.size = 3;

    std::string data;
    Codec<Node>::encode(node, data);
    ASSERT_EQ(data.size(), 1 + 8 + 4 + 1 + 8 + 8 + 8);
    ASSERT_EQ(static_cast<std::uint8_t>(data[0]), NODE_RECORD_TAG);
    ASSERT_EQ(get_u64(data.data() + 1), 200);
    ASSERT_EQ(get_u32(data.data() + 9), 1);
    ASSERT_EQ(data[13], 'k');
    ASSERT_EQ(get_u64(data.data() + 14), 100);
    ASSERT_EQ(get_u64(data.data() + 22), 0);
    ASSERT_EQ(get_u64(data.data() + 30), 3);
}

TEST(NodeCodecTests, RejectsMalformedRecords)
{
    static constexpr Address ADDRESS {1'000};
    Node node;
    node.key = "key";
    node.value = ValueRef::from_address(Address {100});
    std::string data;
    Codec<Node>::encode(node, data);

    Node out;
    ASSERT_OK(Codec<Node>::decode(data, ADDRESS, out));
    ASSERT_TRUE(Codec<Node>::decode(data.substr(0, data.size() - 1), ADDRESS, out).is_corruption());
    ASSERT_TRUE(Codec<Node>::decode(data + "x", ADDRESS, out).is_corruption());
    ASSERT_TRUE(Codec<Node>::decode("", ADDRESS, out).is_corruption());

    auto bad_tag = data;
    bad_tag[0] = static_cast<Byte>(VALUE_RECORD_TAG);
    ASSERT_TRUE(Codec<Node>::decode(bad_tag, ADDRESS, out).is_corruption());

    auto no_value = data;
    put_u64(no_value.data() + 1 + 8 + 4 + 3, 0);
    ASSERT_TRUE(Codec<Node>::decode(no_value, ADDRESS, out).is_corruption());

    auto no_size = data;
    put_u64(no_size.data() + no_size.size() - 8, 0);
    ASSERT_TRUE(Codec<Node>::decode(no_size, ADDRESS, out).is_corruption());
}

TEST(NodeCodecTests, RejectsCycles)
{
    static constexpr Address ADDRESS {1'000};
    Node node;
    node.key = "key";
    node.value = ValueRef::from_address(Address {100});
    node.left = NodeRef::from_address(Address {200});
    node.right = NodeRef::from_address(Address {300});
    std::string data;
    Codec<Node>::encode(node, data);

    Node out;
    ASSERT_OK(Codec<Node>::decode(data, ADDRESS, out));

    // A record can only refer to records written before it.
    ASSERT_TRUE(Codec<Node>::decode(data, Address {300}, out).is_corruption());
    ASSERT_TRUE(Codec<Node>::decode(data, Address {250}, out).is_corruption());
    ASSERT_TRUE(Codec<Node>::decode(data, Address {100}, out).is_corruption());

    auto self_right = data;
    put_u64(self_right.data() + self_right.size() - 16, ADDRESS.value);
    ASSERT_TRUE(Codec<Node>::decode(self_right, ADDRESS, out).is_corruption());

    auto later_left = data;
    put_u64(later_left.data() + 1, ADDRESS.value + 50);
    ASSERT_TRUE(Codec<Node>::decode(later_left, ADDRESS, out).is_corruption());
}

class PersistentTreeTests : public TestWithHeapStorage {
public:
    PersistentTreeTests()
        : tree {*storage, *bytewise_comparator()}
    {}

    auto insert(const std::string &key, const std::string &value) -> void
    {
        NodeRef next;
        ASSERT_OK(tree.insert(root, key, make_value(value), next));
        root = next;
    }

    auto erase(const std::string &key) -> void
    {
        NodeRef next;
        ASSERT_OK(tree.erase(root, key, next));
        root = next;
    }

    [[nodiscard]] auto lookup(const std::string &key) const -> std::string
    {
        std::string value;
        EXPECT_OK(tree.search(root, key, value));
        return value;
    }

    [[nodiscard]] auto record_count() const -> Size
    {
        Size size {};
        EXPECT_OK(tree.size(root, size));
        return size;
    }

    [[nodiscard]] auto collect(const NodeRef &ref) const -> std::map<std::string, std::string>
    {
        std::map<std::string, std::string> records;
        EXPECT_OK(tree.TEST_traverse(ref, [&records](const Slice &key, const Slice &value) {
            records.emplace(key.to_string(), value.to_string());
        }));
        return records;
    }

    // Store the current root and start over from its address, so that every node must be read back.
    auto store_and_reload() -> void
    {
        Address address;
        ASSERT_OK(root.store(*storage, address));
        root = NodeRef::from_address(address);
    }

    /*
     * Build a tree with "n" records that is a single chain, without going through insert(). Ascending keys hang off
     * the right child of each node, and descending keys off the left.
     */
    [[nodiscard]] static auto build_chain(Size n, bool ascending) -> NodeRef
    {
        NodeRef chain;
        for (Size i {}; i < n; ++i) {
            const auto index = ascending ? n - i - 1 : i;
            auto node = std::make_shared<Node>();
            node->key = make_key(index);
            node->value = make_value(node->key);
            (ascending ? node->right : node->left) = chain;
            node->size = i + 1;
            chain = NodeRef::from_referent(std::move(node));
        }
        return chain;
    }

    [[nodiscard]] static auto make_key(Size index) -> std::string
    {
        return fmt::format("{:08d}", index);
    }

    PersistentTree tree;
    NodeRef root;
};

TEST_F(PersistentTreeTests, EmptyTree)
{
    std::string value;
    NodeRef next;
    ASSERT_TRUE(tree.search(root, "x", value).is_not_found());
    ASSERT_TRUE(tree.erase(root, "x", next).is_not_found());
    ASSERT_TRUE(tree.find_min(root, next).is_not_found());
    ASSERT_TRUE(tree.delete_min(root, next).is_not_found());
    ASSERT_EQ(record_count(), 0);
    ASSERT_OK(tree.TEST_validate(root));
}

TEST_F(PersistentTreeTests, InsertAndSearch)
{
    insert("b", "2");
    insert("a", "1");
    insert("c", "3");
    ASSERT_EQ(lookup("a"), "1");
    ASSERT_EQ(lookup("b"), "2");
    ASSERT_EQ(lookup("c"), "3");
    ASSERT_EQ(record_count(), 3);

    std::string value;
    ASSERT_TRUE(tree.search(root, "d", value).is_not_found());
    ASSERT_OK(tree.TEST_validate(root));
}

TEST_F(PersistentTreeTests, ReplaceValueKeepsSize)
{
    insert("b", "2");
    insert("a", "1");
    insert("b", "two");
    ASSERT_EQ(lookup("b"), "two");
    ASSERT_EQ(record_count(), 2);
    ASSERT_OK(tree.TEST_validate(root));
}

TEST_F(PersistentTreeTests, OldRootsAreUnchanged)
{
    insert("b", "2");
    insert("a", "1");
    const auto before = root;

    insert("c", "3");
    erase("a");
    insert("b", "two");

    const auto old_records = collect(before);
    ASSERT_EQ(old_records.size(), 2);
    ASSERT_EQ(old_records.at("a"), "1");
    ASSERT_EQ(old_records.at("b"), "2");

    const auto new_records = collect(root);
    ASSERT_EQ(new_records.size(), 2);
    ASSERT_EQ(new_records.at("b"), "two");
    ASSERT_EQ(new_records.at("c"), "3");
}

TEST_F(PersistentTreeTests, UntouchedSubtreesAreShared)
{
    insert("m", "m");
    insert("c", "c");
    insert("t", "t");
    store_and_reload();

    NodeRef::Referent before;
    ASSERT_OK(root.get(*storage, before));
    const auto left_address = before->left.address();
    ASSERT_FALSE(left_address.is_null());

    insert("x", "x");
    NodeRef::Referent after;
    ASSERT_OK(root.get(*storage, after));

    // The path to "x" goes right, so the left child is reused without being rewritten.
    ASSERT_TRUE(after->left.is_same(before->left));
    ASSERT_FALSE(root.is_stored());

    const auto size = state->data.size();
    store_and_reload();
    ASSERT_OK(root.get(*storage, after));
    ASSERT_EQ(after->left.address(), left_address);

    // New records: one value, plus the nodes for "x", "t", and "m".
    ASSERT_GT(state->data.size(), size);
}

TEST_F(PersistentTreeTests, EraseLeafAndSingleChildNodes)
{
    for (const auto *key: {"d", "b", "f", "a", "g"}) {
        insert(key, key);
    }
    erase("a");
    erase("f");
    ASSERT_EQ(record_count(), 3);
    ASSERT_OK(tree.TEST_validate(root));

    const auto records = collect(root);
    ASSERT_EQ(records.count("a"), 0);
    ASSERT_EQ(records.count("f"), 0);
    ASSERT_EQ(records.at("g"), "g");
}

TEST_F(PersistentTreeTests, EraseNodeWithTwoChildren)
{
    for (const auto *key: {"d", "b", "f", "a", "c", "e", "g"}) {
        insert(key, key);
    }
    erase("d");
    ASSERT_EQ(record_count(), 6);
    ASSERT_OK(tree.TEST_validate(root));

    // The in-order successor takes the place of the erased root.
    NodeRef::Referent node;
    ASSERT_OK(root.get(*storage, node));
    ASSERT_EQ(node->key, "e");
    ASSERT_EQ(node->size, 6);

    std::string value;
    ASSERT_TRUE(tree.search(root, "d", value).is_not_found());
}

TEST_F(PersistentTreeTests, EraseMissingKey)
{
    insert("a", "1");
    NodeRef next;
    ASSERT_TRUE(tree.erase(root, "b", next).is_not_found());
    ASSERT_EQ(record_count(), 1);
}

TEST_F(PersistentTreeTests, FindAndDeleteMinimum)
{
    for (const auto *key: {"m", "f", "t", "c", "h"}) {
        insert(key, key);
    }
    NodeRef min;
    ASSERT_OK(tree.find_min(root, min));
    ASSERT_EQ(min.peek()->key, "c");

    NodeRef next;
    ASSERT_OK(tree.delete_min(root, next));
    root = next;
    ASSERT_OK(tree.find_min(root, min));
    ASSERT_EQ(min.peek()->key, "f");
    ASSERT_EQ(record_count(), 4);
    ASSERT_OK(tree.TEST_validate(root));
}

TEST_F(PersistentTreeTests, WorksAfterReload)
{
    for (const auto *key: {"d", "b", "f", "a", "c", "e", "g"}) {
        insert(key, key);
    }
    store_and_reload();
    ASSERT_EQ(lookup("c"), "c");
    ASSERT_EQ(record_count(), 7);

    store_and_reload();
    erase("d");
    insert("h", "h");
    store_and_reload();
    ASSERT_EQ(record_count(), 7);
    ASSERT_OK(tree.TEST_validate(root));
}

TEST_F(PersistentTreeTests, ValidateDetectsBadSize)
{
    insert("b", "b");
    insert("a", "a");

    NodeRef::Referent node;
    ASSERT_OK(root.get(*storage, node));
    auto broken = std::make_shared<Node>(*node);
    broken->size = 5;
    ASSERT_TRUE(tree.TEST_validate(NodeRef::from_referent(broken)).is_corruption());
}

TEST_F(PersistentTreeTests, ValidateDetectsBadOrder)
{
    insert("b", "b");
    insert("a", "a");

    NodeRef::Referent node;
    ASSERT_OK(root.get(*storage, node));
    auto broken = std::make_shared<Node>(*node);
    broken->key = "0";
    ASSERT_TRUE(tree.TEST_validate(NodeRef::from_referent(broken)).is_corruption());
}

TEST_F(PersistentTreeTests, FailedReadIsPropagated)
{
    insert("b", "b");
    insert("a", "a");
    store_and_reload();

    state->on_read = fail_after(0);
    std::string value;
    ASSERT_TRUE(tree.search(root, "a", value).is_system_error());
}

TEST_F(PersistentTreeTests, CyclicRecordIsCorrupt)
{
    Address value;
    ASSERT_OK(make_value("v").store(*storage, value));

    // The right child is the address this record is about to be written at.
    Node node;
    node.key = "k";
    node.value = ValueRef::from_address(value);
    node.right = NodeRef::from_address(Address {state->data.size()});
    std::string data;
    Codec<Node>::encode(node, data);
    Address address;
    ASSERT_OK(storage->write(data, address));
    ASSERT_EQ(address, node.right.address());

    std::string out;
    NodeRef next;
    root = NodeRef::from_address(address);
    ASSERT_TRUE(tree.search(root, "z", out).is_corruption());
    ASSERT_TRUE(tree.insert(root, "z", make_value("z"), next).is_corruption());
    ASSERT_TRUE(tree.erase(root, "z", next).is_corruption());
    ASSERT_TRUE(tree.delete_min(root, next).is_corruption());
    ASSERT_TRUE(tree.TEST_validate(root).is_corruption());
}

TEST_F(PersistentTreeTests, SortedInsertsAndErases)
{
    static constexpr Size NUM_RECORDS {5'000};
    for (Size i {}; i < NUM_RECORDS; ++i) {
        insert(make_key(i), make_key(i));
    }
    ASSERT_EQ(record_count(), NUM_RECORDS);
    ASSERT_OK(tree.TEST_validate(root));
    store_and_reload();
    ASSERT_EQ(lookup(make_key(NUM_RECORDS - 1)), make_key(NUM_RECORDS - 1));

    for (Size i {}; i < NUM_RECORDS; ++i) {
        erase(make_key(NUM_RECORDS - i - 1));
    }
    ASSERT_EQ(record_count(), 0);
    ASSERT_TRUE(root.is_absent());
}

TEST_F(PersistentTreeTests, DeepAscendingChain)
{
    static constexpr Size NUM_RECORDS {100'000};
    root = build_chain(NUM_RECORDS, true);
    ASSERT_EQ(record_count(), NUM_RECORDS);
    ASSERT_OK(tree.TEST_validate(root));

    // Every node is on the path to the end of the chain, so all of them are rebuilt.
    insert(make_key(NUM_RECORDS), "end");
    ASSERT_EQ(record_count(), NUM_RECORDS + 1);
    store_and_reload();
    ASSERT_EQ(lookup(make_key(NUM_RECORDS)), "end");
    ASSERT_OK(tree.TEST_validate(root));

    erase(make_key(NUM_RECORDS));
    erase(make_key(NUM_RECORDS / 2));
    erase(make_key(0));
    ASSERT_EQ(record_count(), NUM_RECORDS - 2);
    ASSERT_OK(tree.TEST_validate(root));

    Size visited {};
    ASSERT_OK(tree.TEST_traverse(root, [&visited](const Slice &, const Slice &) {
        visited++;
    }));
    ASSERT_EQ(visited, NUM_RECORDS - 2);

    store_and_reload();
    ASSERT_EQ(record_count(), NUM_RECORDS - 2);
    root = {};
}

TEST_F(PersistentTreeTests, DeepDescendingChain)
{
    static constexpr Size NUM_RECORDS {100'000};
    root = build_chain(NUM_RECORDS, false);
    ASSERT_OK(tree.TEST_validate(root));

    NodeRef min;
    ASSERT_OK(tree.find_min(root, min));
    ASSERT_EQ(min.peek()->key, make_key(0));

    NodeRef next;
    ASSERT_OK(tree.delete_min(root, next));
    root = next;
    ASSERT_OK(tree.find_min(root, min));
    ASSERT_EQ(min.peek()->key, make_key(1));
    ASSERT_EQ(record_count(), NUM_RECORDS - 1);

    store_and_reload();
    erase(make_key(1));
    ASSERT_OK(tree.TEST_validate(root));
    ASSERT_EQ(record_count(), NUM_RECORDS - 2);
}

TEST_F(PersistentTreeTests, SanityCheck)
{
    static constexpr Size NUM_RECORDS {500};
    std::map<std::string, std::string> records;

    for (Size i {}; i < NUM_RECORDS; ++i) {
        const auto key = random.get_string(1, 10);
        const auto value = random.get_string(0, 20);
        insert(key, value);
        records[key] = value;
        if (random.get(10) == 0) {
            store_and_reload();
        }
    }
    ASSERT_OK(tree.TEST_validate(root));
    ASSERT_EQ(record_count(), records.size());
    ASSERT_EQ(collect(root), records);

    std::vector<std::string> keys;
    for (const auto &[key, value]: records) {
        keys.emplace_back(key);
    }
    random.shuffle(keys);

    for (Size i {}; i < keys.size(); ++i) {
        if (i % 2 == 0) {
            erase(keys[i]);
            records.erase(keys[i]);
        }
        if (random.get(10) == 0) {
            store_and_reload();
        }
    }
    ASSERT_OK(tree.TEST_validate(root));
    ASSERT_EQ(record_count(), records.size());
    ASSERT_EQ(collect(root), records);
}

} // namespace Arbor
