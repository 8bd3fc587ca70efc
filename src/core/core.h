#ifndef ARBOR_CORE_CORE_H
#define ARBOR_CORE_CORE_H

#include "arbor/options.h"
#include "tree/tree.h"
#include "utils/system.h"

namespace Arbor {

class Storage;

/*
 * UNATTACHED: no root has been read from storage yet.
 * ATTACHED:   the root reflects the root address read from storage.
 * MUTATED:    the root has uncommitted changes. The file lock is held.
 * COMMITTED:  the root was just published by this session.
 */
enum class CoreState {
    UNATTACHED,
    ATTACHED,
    MUTATED,
    COMMITTED,
};

/*
 * Binds the tree algorithms to storage. Readers that do not hold the file lock refresh the root before each read,
 * so they always see the latest committed tree. Writers take the lock on their first mutation, refresh once, and
 * keep working against their own uncommitted root until commit() publishes it.
 */
class Core final {
public:
    struct Parameters {
        Storage *storage {};
        const Comparator *comparator {};
        LockPolicy lock_policy {};
        LogPtr log;
    };

    explicit Core(const Parameters &param);

    [[nodiscard]] auto get(const Slice &key, std::string &value) -> Status;
    [[nodiscard]] auto contains(const Slice &key, bool &exists) -> Status;
    [[nodiscard]] auto size(Size &out) -> Status;
    [[nodiscard]] auto put(const Slice &key, const Slice &value) -> Status;
    [[nodiscard]] auto erase(const Slice &key) -> Status;
    [[nodiscard]] auto commit() -> Status;

    // Drop uncommitted changes and the file lock, and forget the current root.
    auto release() -> void;

    [[nodiscard]] auto state() const -> CoreState
    {
        return m_state;
    }

    [[nodiscard]] auto root() const -> const NodeRef &
    {
        return m_root;
    }

    [[nodiscard]] auto tree() const -> const PersistentTree &
    {
        return m_tree;
    }

private:
    [[nodiscard]] auto refresh() -> Status;
    [[nodiscard]] auto prepare_read() -> Status;
    [[nodiscard]] auto prepare_write() -> Status;

    PersistentTree m_tree;
    NodeRef m_root;
    LogPtr m_log;
    Storage *m_storage {};
    LockPolicy m_lock_policy {};
    CoreState m_state {CoreState::UNATTACHED};
};

} // namespace Arbor

#endif // ARBOR_CORE_CORE_H
