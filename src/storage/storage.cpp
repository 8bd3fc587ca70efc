#include "storage.h"
#include <cstring>
#include "helpers.h"
#include "utils/encoding.h"
#include <fmt/format.h>

namespace Arbor {

[[nodiscard]]
static auto closed_error() -> Status
{
    return Status::logic_error("storage is closed");
}

Storage::Storage(std::unique_ptr<File> file, const Parameters &param, LogPtr log)
    : m_param {param},
      m_file {std::move(file)},
      m_log {std::move(log)}
{
    ARBOR_EXPECT_NE(m_file, nullptr);
    ARBOR_EXPECT_NE(m_log, nullptr);
}

Storage::~Storage()
{
    close();
}

auto Storage::open(std::unique_ptr<File> file, const Parameters &param, LogPtr log, std::unique_ptr<Storage> &out)
    -> Status
{
    std::unique_ptr<Storage> storage {new Storage {std::move(file), param, std::move(log)}};
    Arbor_Try(storage->initialize());
    out = std::move(storage);
    return Status::ok();
}

auto Storage::initialize() -> Status
{
    const auto &name = m_param.comparator_name;
    if (name.size() > MAXIMUM_COMPARATOR_NAME_SIZE) {
        return Status::invalid_argument(fmt::format("comparator name \"{}\" is longer than {} bytes",
                                                    name, MAXIMUM_COMPARATOR_NAME_SIZE));
    }

    Size file_size {};
    Arbor_Try(m_file->size(file_size));

    if (file_size == 0) {
        if (m_param.read_only) {
            return Status::invalid_argument("cannot initialize a database opened in read-only mode");
        }
        Byte header[FILE_HEADER_SIZE] {};
        put_u64(header + ROOT_ADDRESS_OFFSET, Address::null().value);
        put_u32(header + MAGIC_CODE_OFFSET, MAGIC_CODE);
        header[FORMAT_VERSION_OFFSET] = static_cast<Byte>(FORMAT_VERSION);
        header[COMPARATOR_NAME_SIZE_OFFSET] = static_cast<Byte>(name.size());
        std::memcpy(header + COMPARATOR_NAME_OFFSET, name.data(), name.size());
        Arbor_Try(m_file->write({header, sizeof(header)}, 0));
        Arbor_Try(m_file->sync());
        Arbor_Info("initialized new database file");
        return Status::ok();
    }

    if (file_size < FILE_HEADER_SIZE) {
        return Status::corruption("file is too small to contain a header");
    }
    Byte header[FILE_HEADER_SIZE];
    Arbor_Try(read_exact_at(*m_file, header, sizeof(header), 0));

    if (get_u32(header + MAGIC_CODE_OFFSET) != MAGIC_CODE) {
        return Status::corruption("magic code is incorrect");
    }
    if (static_cast<std::uint8_t>(header[FORMAT_VERSION_OFFSET]) != FORMAT_VERSION) {
        return Status::corruption("format version is not supported");
    }
    const Size name_size = static_cast<std::uint8_t>(header[COMPARATOR_NAME_SIZE_OFFSET]);
    if (name_size > MAXIMUM_COMPARATOR_NAME_SIZE) {
        return Status::corruption("comparator name length is out of range");
    }
    const auto root = get_u64(header + ROOT_ADDRESS_OFFSET);
    if (root != Address::null_value && (root < FILE_HEADER_SIZE || root >= file_size)) {
        return Status::corruption("root address is out of range");
    }
    const std::string stored_name(header + COMPARATOR_NAME_OFFSET, name_size);
    if (stored_name != name) {
        return Status::invalid_argument(fmt::format("comparator \"{}\" does not match \"{}\", the comparator "
                                                    "that the file was created with", name, stored_name));
    }
    Arbor_Info("opened database file of {} B with root address {}", file_size, root);
    return Status::ok();
}

auto Storage::check_writable() const -> Status
{
    if (is_closed()) {
        return closed_error();
    }
    if (m_param.read_only) {
        return Status::logic_error("database is read-only");
    }
    return Status::ok();
}

auto Storage::write(const Slice &payload, Address &out) -> Status
{
    Arbor_Try(check_writable());
    if (payload.size() > MAXIMUM_RECORD_SIZE) {
        return Status::invalid_argument("record is too large");
    }

    Size end {};
    Arbor_Try(m_file->size(end));
    ARBOR_EXPECT_GE(end, FILE_HEADER_SIZE);

    std::string record(RECORD_PREFIX_SIZE, '\x00');
    put_u32(record.data(), static_cast<std::uint32_t>(payload.size()));
    record.append(payload.data(), payload.size());

    Arbor_Try(m_file->write(record, end));
    m_bytes_written += record.size();
    out = Address {end};
    return Status::ok();
}

auto Storage::read(Address address, std::string &out) const -> Status
{
    if (is_closed()) {
        return closed_error();
    }
    Size file_size {};
    Arbor_Try(m_file->size(file_size));

    if (address.value < FILE_HEADER_SIZE || address.value >= file_size ||
        file_size - address.value < RECORD_PREFIX_SIZE) {
        return Status::corruption(fmt::format("record address {} is out of range", address.value));
    }

    Byte prefix[RECORD_PREFIX_SIZE];
    Arbor_Try(read_exact_at(*m_file, prefix, sizeof(prefix), address.value));
    const Size length = get_u32(prefix);

    if (length > file_size - address.value - RECORD_PREFIX_SIZE) {
        return Status::corruption(fmt::format("record at address {} extends past the end of the file", address.value));
    }
    out.resize(length);
    if (length) {
        Arbor_Try(read_exact_at(*m_file, out.data(), length, address.value + RECORD_PREFIX_SIZE));
    }
    return Status::ok();
}

auto Storage::get_root_address(Address &out) const -> Status
{
    if (is_closed()) {
        return closed_error();
    }
    Byte slot[sizeof(std::uint64_t)];
    Arbor_Try(read_exact_at(*m_file, slot, sizeof(slot), ROOT_ADDRESS_OFFSET));
    out = Address {get_u64(slot)};
    return Status::ok();
}

auto Storage::commit_root_address(Address address) -> Status
{
    Arbor_Try(check_writable());
    if (!address.is_null() && address.value < FILE_HEADER_SIZE) {
        return Status::invalid_argument("root address overlaps the file header");
    }

    // Every record reachable from the new root must be durable before the root pointer refers to it.
    if (m_param.sync) {
        Arbor_Try(m_file->sync());
    }
    Byte slot[sizeof(std::uint64_t)];
    put_u64(slot, address.value);
    Arbor_Try(m_file->write({slot, sizeof(slot)}, ROOT_ADDRESS_OFFSET));
    if (m_param.sync) {
        Arbor_Try(m_file->sync());
    }
    Arbor_Trace("committed root address {}", address.value);
    return Status::ok();
}

auto Storage::flush() -> Status
{
    if (is_closed()) {
        return closed_error();
    }
    return m_file->sync();
}

auto Storage::lock(bool &acquired) -> Status
{
    acquired = false;
    if (is_closed()) {
        return closed_error();
    }
    if (m_is_locked) {
        return Status::ok();
    }
    if (auto s = m_file->lock(m_param.lock_timeout); !s.is_ok()) {
        Arbor_Warn("cannot acquire file lock: {}", s.what().data());
        return s;
    }
    m_is_locked = true;
    acquired = true;
    Arbor_Trace("acquired file lock");
    return Status::ok();
}

auto Storage::unlock() -> void
{
    if (m_is_locked) {
        ARBOR_EXPECT_FALSE(is_closed());
        m_file->unlock();
        m_is_locked = false;
        Arbor_Trace("released file lock");
    }
}

auto Storage::close() -> void
{
    if (!is_closed()) {
        unlock();
        m_file.reset();
    }
}

auto Storage::file_size(Size &out) const -> Status
{
    if (is_closed()) {
        return closed_error();
    }
    return m_file->size(out);
}

} // namespace Arbor
