#ifndef ARBOR_TREE_REFERENCE_H
#define ARBOR_TREE_REFERENCE_H

#include <memory>
#include <string>
#include "storage/storage.h"
#include "utils/types.h"

namespace Arbor {

/*
 * Per-referent serialization hooks. Specializations provide:
 *
 *     static auto encode(const T &, std::string &out) -> void;
 *     static auto decode(const Slice &in, Address address, T &out) -> Status;
 *     static auto prepare_to_store(const T &, Storage &) -> Status;
 *
 * decode() is given the address the record was read from. prepare_to_store() runs before the referent is encoded,
 * and must store anything that the encoded form refers to by address.
 */
template<class T>
struct Codec;

/*
 * Lazy, write-once handle to a value of type T that lives in memory, in the database file, or both. Copies of a
 * Reference share state, so a referent loaded or an address assigned through one copy is visible through all of
 * them. A default-constructed Reference is absent: it refers to nothing and is never written.
 *
 *     State               | Referent | Address
 *    ---------------------|----------|---------
 *     Absent              | no       | no
 *     Unstored            | yes      | no
 *     Unloaded            | no       | yes
 *     Loaded              | yes      | yes
 */
template<class T>
class Reference final {
public:
    using Referent = std::shared_ptr<const T>;

    Reference() = default;

    [[nodiscard]] static auto from_referent(Referent referent) -> Reference
    {
        ARBOR_EXPECT_NE(referent, nullptr);
        return Reference {Address::null(), std::move(referent)};
    }

    [[nodiscard]] static auto from_address(Address address) -> Reference
    {
        if (address.is_null()) {
            return Reference {};
        }
        return Reference {address, nullptr};
    }

    [[nodiscard]] auto is_absent() const -> bool
    {
        return m_state == nullptr;
    }

    [[nodiscard]] auto is_loaded() const -> bool
    {
        return m_state && m_state->referent;
    }

    [[nodiscard]] auto is_stored() const -> bool
    {
        return m_state && !m_state->address.is_null();
    }

    // Null if this Reference is absent or has not been written yet.
    [[nodiscard]] auto address() const -> Address
    {
        return m_state ? m_state->address : Address::null();
    }

    // Null unless the referent is already in memory. Never reads from storage.
    [[nodiscard]] auto peek() const -> Referent
    {
        return m_state ? m_state->referent : nullptr;
    }

    // True if both handles share the same state (i.e. one is a copy of the other).
    [[nodiscard]] auto is_same(const Reference &rhs) const -> bool
    {
        return m_state == rhs.m_state;
    }

    /*
     * Get the referent, reading and decoding it if it is not cached. An absent Reference produces a null referent.
     */
    [[nodiscard]] auto get(const Storage &storage, Referent &out) const -> Status
    {
        if (m_state == nullptr) {
            out = nullptr;
            return Status::ok();
        }
        if (m_state->referent == nullptr) {
            ARBOR_EXPECT_FALSE(m_state->address.is_null());
            std::string data;
            Arbor_Try(storage.read(m_state->address, data));
            auto referent = std::make_shared<T>();
            Arbor_Try(Codec<T>::decode(data, m_state->address, *referent));
            m_state->referent = std::move(referent);
        }
        out = m_state->referent;
        return Status::ok();
    }

    /*
     * Write the referent, and everything it depends on, unless it already has an address. An absent Reference
     * produces a null address without writing anything.
     */
    [[nodiscard]] auto store(Storage &storage, Address &out) const -> Status
    {
        if (m_state == nullptr) {
            out = Address::null();
            return Status::ok();
        }
        if (m_state->address.is_null()) {
            ARBOR_EXPECT_NE(m_state->referent, nullptr);
            Arbor_Try(Codec<T>::prepare_to_store(*m_state->referent, storage));

            std::string data;
            Codec<T>::encode(*m_state->referent, data);
            Address address;
            Arbor_Try(storage.write(data, address));
            m_state->address = address;
        }
        out = m_state->address;
        return Status::ok();
    }

    /*
     * Drop this handle. If it was the only handle to its state, and the state held the only pointer to the referent,
     * the referent is handed back so that the caller can take it apart. Otherwise, returns null.
     */
    [[nodiscard]] auto detach() -> std::shared_ptr<T>
    {
        const auto state = std::move(m_state);
        if (state == nullptr || state.use_count() != 1 || state->referent.use_count() != 1) {
            return nullptr;
        }
        const auto referent = std::move(state->referent);
        return std::const_pointer_cast<T>(referent);
    }

private:
    struct State {
        Address address;
        Referent referent;
    };

    Reference(Address address, Referent referent)
        : m_state {std::make_shared<State>(State {address, std::move(referent)})}
    {}

    std::shared_ptr<State> m_state;
};

} // namespace Arbor

#endif // ARBOR_TREE_REFERENCE_H
