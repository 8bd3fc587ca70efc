#ifndef ARBOR_STORAGE_FILE_H
#define ARBOR_STORAGE_FILE_H

#include "arbor/slice.h"
#include "arbor/status.h"

namespace Arbor {

/*
 * Random-access handle to the database file. The interface is modeled after the editor objects in
 * https://github.com/google/leveldb/blob/main/include/leveldb/env.h, plus an exclusive advisory lock.
 */
class File {
public:
    virtual ~File() = default;

    // Read up to "size" bytes at "offset". On return, "size" holds the number of bytes actually read, which is
    // less than requested only at the end of the file.
    [[nodiscard]] virtual auto read(Byte *out, Size &size, Size offset) -> Status = 0;
    [[nodiscard]] virtual auto write(Slice in, Size offset) -> Status = 0;
    [[nodiscard]] virtual auto sync() -> Status = 0;
    [[nodiscard]] virtual auto size(Size &out) const -> Status = 0;

    // Take the exclusive lock, waiting at most "timeout" microseconds (0 means wait forever). Returns a busy status
    // if the lock could not be acquired in time.
    [[nodiscard]] virtual auto lock(Size timeout) -> Status = 0;
    virtual auto unlock() -> void = 0;
};

} // namespace Arbor

#endif // ARBOR_STORAGE_FILE_H
