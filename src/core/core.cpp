#include "core.h"
#include "storage/storage.h"

namespace Arbor {

Core::Core(const Parameters &param)
    : m_tree {*param.storage, *param.comparator},
      m_log {param.log},
      m_storage {param.storage},
      m_lock_policy {param.lock_policy}
{
    ARBOR_EXPECT_NE(m_log, nullptr);
}

auto Core::refresh() -> Status
{
    ARBOR_EXPECT_NE(m_state, CoreState::MUTATED);

    Address address;
    Arbor_Try(m_storage->get_root_address(address));

    // Keep the cached tree if nobody has committed since we last looked.
    if (m_state != CoreState::UNATTACHED && address == m_root.address()) {
        return Status::ok();
    }
    Arbor_Trace("refreshing root: {} -> {}", m_root.address().value, address.value);
    m_root = NodeRef::from_address(address);
    m_state = CoreState::ATTACHED;
    return Status::ok();
}

auto Core::prepare_read() -> Status
{
    if (!m_storage->is_locked() || m_state == CoreState::UNATTACHED) {
        return refresh();
    }
    return Status::ok();
}

auto Core::prepare_write() -> Status
{
    if (m_storage->is_read_only()) {
        return Status::logic_error("database is read-only");
    }
    bool acquired {};
    Arbor_Try(m_storage->lock(acquired));

    // Another writer may have committed between our last read and taking the lock.
    if (acquired || m_state == CoreState::UNATTACHED) {
        Arbor_Try(refresh());
    }
    return Status::ok();
}

auto Core::get(const Slice &key, std::string &value) -> Status
{
    Arbor_Try(prepare_read());
    return m_tree.search(m_root, key, value);
}

auto Core::contains(const Slice &key, bool &exists) -> Status
{
    std::string value;
    auto s = get(key, value);
    exists = s.is_ok();
    return s.is_not_found() ? Status::ok() : s;
}

auto Core::size(Size &out) -> Status
{
    Arbor_Try(prepare_read());
    return m_tree.size(m_root, out);
}

auto Core::put(const Slice &key, const Slice &value) -> Status
{
    Arbor_Try(prepare_write());

    auto referent = std::make_shared<Value>();
    referent->data = value.to_string();

    NodeRef root;
    Arbor_Try(m_tree.insert(m_root, key, ValueRef::from_referent(std::move(referent)), root));
    m_root = std::move(root);
    m_state = CoreState::MUTATED;
    return Status::ok();
}

auto Core::erase(const Slice &key) -> Status
{
    Arbor_Try(prepare_write());

    NodeRef root;
    Arbor_Try(m_tree.erase(m_root, key, root));
    m_root = std::move(root);
    m_state = CoreState::MUTATED;
    return Status::ok();
}

auto Core::commit() -> Status
{
    if (m_state == CoreState::MUTATED) {
        const auto before = m_storage->bytes_written();

        // Store the new nodes bottom-up, then publish the root. If either step fails, the committed root in the
        // file is untouched and this session stays in the MUTATED state so that commit() can be retried.
        Address address;
        Arbor_Try(m_root.store(*m_storage, address));
        Arbor_Try(m_storage->commit_root_address(address));
        m_state = CoreState::COMMITTED;

        Arbor_Info("committed root address {} ({} B written)", address.value,
                   m_storage->bytes_written() - before);
    }

    if (m_lock_policy == LockPolicy::RELEASE_ON_COMMIT) {
        m_storage->unlock();
    }
    return Status::ok();
}

auto Core::release() -> void
{
    if (m_state == CoreState::MUTATED) {
        Arbor_Warn("discarding uncommitted changes");
    }
    m_root = NodeRef {};
    m_state = CoreState::UNATTACHED;
    m_storage->unlock();
}

} // namespace Arbor
