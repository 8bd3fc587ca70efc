#ifndef ARBOR_DATABASE_H
#define ARBOR_DATABASE_H

#include <memory>
#include <string>
#include "options.h"
#include "slice.h"

namespace Arbor {

class DatabaseImpl;
class Status;

/*
 * Handle to a single database file. Destroying the handle closes it, so holding it in a std::unique_ptr releases
 * the file and its lock on every exit path.
 */
class Database final {
public:
    /*
     * Open the database at "path", creating the file if it does not exist.
     */
    [[nodiscard]] static auto open(const Slice &path, const Options &options, Database **db) -> Status;

    /*
     * Remove the database file and its log files. The database must not be open.
     */
    [[nodiscard]] static auto destroy(const Slice &path) -> Status;

    ~Database();
    Database(const Database &) = delete;
    auto operator=(const Database &) -> Database & = delete;

    [[nodiscard]] auto path() const -> std::string;

    /*
     * Read operations see the most recent committed tree, unless this handle holds the writer lock, in which case
     * they also see its uncommitted changes.
     */
    [[nodiscard]] auto get(const Slice &key, std::string &value) const -> Status;
    [[nodiscard]] auto contains(const Slice &key, bool &exists) const -> Status;
    [[nodiscard]] auto size(Size &out) const -> Status;

    /*
     * Mutations are invisible to other handles until commit() succeeds.
     */
    [[nodiscard]] auto put(const Slice &key, const Slice &value) -> Status;
    [[nodiscard]] auto erase(const Slice &key) -> Status;
    [[nodiscard]] auto commit() -> Status;

    /*
     * Release the file. Uncommitted changes are discarded. Every other method returns a logic error afterward.
     */
    [[nodiscard]] auto close() -> Status;

private:
    Database();

    std::unique_ptr<DatabaseImpl> m_impl;
};

} // namespace Arbor

#endif // ARBOR_DATABASE_H
