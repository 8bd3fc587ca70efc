#ifndef ARBOR_STORAGE_STORAGE_H
#define ARBOR_STORAGE_STORAGE_H

#include <memory>
#include <string>
#include "file.h"
#include "utils/system.h"
#include "utils/types.h"

namespace Arbor {

/*
 * File layout:
 *
 *     Offset | Size | Field
 *    --------|------|-------------------------------------------
 *     0      | 8    | Root address, big-endian (0 = empty tree)
 *     8      | 4    | Magic code
 *     12     | 1    | Format version
 *     13     | 1    | Comparator name length
 *     14     | 2    | Reserved
 *     16     | 48   | Comparator name, zero-padded
 *     64     | ...  | Records: [4-byte big-endian length][payload]
 */
static constexpr Size FILE_HEADER_SIZE {64};
static constexpr Size ROOT_ADDRESS_OFFSET {0};
static constexpr Size MAGIC_CODE_OFFSET {8};
static constexpr Size FORMAT_VERSION_OFFSET {12};
static constexpr Size COMPARATOR_NAME_SIZE_OFFSET {13};
static constexpr Size COMPARATOR_NAME_OFFSET {16};
static constexpr Size MAXIMUM_COMPARATOR_NAME_SIZE {FILE_HEADER_SIZE - COMPARATOR_NAME_OFFSET};
static constexpr std::uint32_t MAGIC_CODE {0x41524252}; // "ARBR"
static constexpr std::uint8_t FORMAT_VERSION {1};
static constexpr Size RECORD_PREFIX_SIZE {sizeof(std::uint32_t)};
static constexpr Size MAXIMUM_RECORD_SIZE {0xFFFFFFFF};

/*
 * Append-only record store with an in-place root pointer. Records are never overwritten, so an address, once
 * returned by write(), identifies the same bytes for the lifetime of the file. The root pointer is the only
 * mutable state on disk, and commit_root_address() is the only thing that changes it.
 */
class Storage final {
public:
    struct Parameters {
        Size lock_timeout {};
        bool sync {true};
        bool read_only {};
        std::string comparator_name;
    };

    // Take ownership of "file". An empty file is initialized with a header describing an empty tree; otherwise the
    // header is validated. The comparator name is recorded in a new header, and must match the one recorded in an
    // existing header.
    [[nodiscard]] static auto open(std::unique_ptr<File> file, const Parameters &param, LogPtr log,
                                   std::unique_ptr<Storage> &out) -> Status;

    ~Storage();

    [[nodiscard]] auto write(const Slice &payload, Address &out) -> Status;
    [[nodiscard]] auto read(Address address, std::string &out) const -> Status;
    [[nodiscard]] auto get_root_address(Address &out) const -> Status;
    [[nodiscard]] auto commit_root_address(Address address) -> Status;
    [[nodiscard]] auto flush() -> Status;

    // Set "acquired" to true only if this call took the lock. Calling while the lock is held is a no-op.
    [[nodiscard]] auto lock(bool &acquired) -> Status;
    auto unlock() -> void;

    // Release the lock, if held, and the file. Every other method returns a logic error afterward.
    auto close() -> void;

    [[nodiscard]] auto is_locked() const -> bool
    {
        return m_is_locked;
    }

    [[nodiscard]] auto is_closed() const -> bool
    {
        return m_file == nullptr;
    }

    [[nodiscard]] auto is_read_only() const -> bool
    {
        return m_param.read_only;
    }

    [[nodiscard]] auto bytes_written() const -> Size
    {
        return m_bytes_written;
    }

    [[nodiscard]] auto file_size(Size &out) const -> Status;

private:
    Storage(std::unique_ptr<File> file, const Parameters &param, LogPtr log);
    [[nodiscard]] auto initialize() -> Status;
    [[nodiscard]] auto check_writable() const -> Status;

    Parameters m_param;
    std::unique_ptr<File> m_file;
    LogPtr m_log;
    Size m_bytes_written {};
    bool m_is_locked {};
};

} // namespace Arbor

#endif // ARBOR_STORAGE_STORAGE_H
