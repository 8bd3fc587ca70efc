#include "arbor/database.h"
#include "arbor/status.h"
#include "database_impl.h"
#include <new>

namespace Arbor {

Database::Database()
    : m_impl {std::make_unique<DatabaseImpl>()}
{}

Database::~Database()
{
    (void)m_impl->close();
}

auto Database::open(const Slice &path, const Options &options, Database **db) -> Status
{
    auto *ptr = new(std::nothrow) Database;
    if (ptr == nullptr) {
        return Status::system_error("cannot allocate database object: out of memory");
    }
    if (auto s = ptr->m_impl->open(path, options); !s.is_ok()) {
        delete ptr;
        return s;
    }
    *db = ptr;
    return Status::ok();
}

auto Database::destroy(const Slice &path) -> Status
{
    return DatabaseImpl::destroy(path.to_string());
}

auto Database::path() const -> std::string
{
    return m_impl->path();
}

auto Database::get(const Slice &key, std::string &value) const -> Status
{
    return m_impl->get(key, value);
}

auto Database::contains(const Slice &key, bool &exists) const -> Status
{
    return m_impl->contains(key, exists);
}

auto Database::size(Size &out) const -> Status
{
    return m_impl->size(out);
}

auto Database::put(const Slice &key, const Slice &value) -> Status
{
    return m_impl->put(key, value);
}

auto Database::erase(const Slice &key) -> Status
{
    return m_impl->erase(key);
}

auto Database::commit() -> Status
{
    return m_impl->commit();
}

auto Database::close() -> Status
{
    return m_impl->close();
}

} // namespace Arbor
