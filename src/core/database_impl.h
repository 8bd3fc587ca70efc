#ifndef ARBOR_CORE_DATABASE_IMPL_H
#define ARBOR_CORE_DATABASE_IMPL_H

#include "arbor/database.h"
#include "core.h"
#include "storage/storage.h"
#include "utils/system.h"
#include <memory>

namespace Arbor {

class DatabaseImpl final {
public:
    friend class Database;

    DatabaseImpl() = default;
    ~DatabaseImpl();

    [[nodiscard]] static auto destroy(const std::string &path) -> Status;
    [[nodiscard]] auto open(const Slice &path, const Options &options) -> Status;
    [[nodiscard]] auto close() -> Status;

    [[nodiscard]] auto get(const Slice &key, std::string &value) -> Status;
    [[nodiscard]] auto contains(const Slice &key, bool &exists) -> Status;
    [[nodiscard]] auto size(Size &out) -> Status;
    [[nodiscard]] auto put(const Slice &key, const Slice &value) -> Status;
    [[nodiscard]] auto erase(const Slice &key) -> Status;
    [[nodiscard]] auto commit() -> Status;

    [[nodiscard]] auto path() const -> std::string
    {
        return m_path;
    }

    [[nodiscard]] auto is_closed() const -> bool
    {
        return m_core == nullptr;
    }

private:
    [[nodiscard]] auto check_open() const -> Status;
    auto report(const Status &s, const char *operation, const Slice &key) const -> Status;

    std::string m_path;
    std::unique_ptr<System> m_system;
    std::unique_ptr<Storage> m_storage;
    std::unique_ptr<Core> m_core;
    LogPtr m_log;
};

[[nodiscard]] auto sanitize_options(const Options &options) -> Options;

} // namespace Arbor

#endif // ARBOR_CORE_DATABASE_IMPL_H
