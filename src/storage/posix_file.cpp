#include "posix_file.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <new>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace Arbor {

static constexpr int FILE_PERMISSIONS {0644}; // -rw-r--r--
static constexpr Size LOCK_POLL_INTERVAL {1'000}; // 1 ms

[[nodiscard]]
static auto to_status(int code) -> Status
{
    switch (code) {
        case ENOENT:
            return Status::not_found(std::strerror(code));
        case EINVAL:
            return Status::invalid_argument(std::strerror(code));
        case EEXIST:
            return Status::logic_error(std::strerror(code));
        case EWOULDBLOCK:
            return Status::busy(std::strerror(code));
        default:
            return Status::system_error(std::strerror(code));
    }
}

[[nodiscard]]
static auto errno_to_status() -> Status
{
    const auto code = errno;
    errno = 0;
    return to_status(code);
}

static auto file_open(const std::string &name, int mode, int permissions, int &out) -> Status
{
    if (const auto fd = ::open(name.c_str(), mode, permissions); fd >= 0) {
        out = fd;
        return Status::ok();
    }
    return errno_to_status();
}

static auto file_close(int fd) -> Status
{
    if (::close(fd)) {
        return errno_to_status();
    }
    return Status::ok();
}

static auto file_read(int file, Byte *out, Size &size, Size offset) -> Status
{
    Size total {};
    while (total < size) {
        const auto n = ::pread(file, out + total, size - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_to_status();
        } else if (n == 0) {
            break;
        }
        total += static_cast<Size>(n);
    }
    size = total;
    return Status::ok();
}

static auto file_write(int file, Slice in, Size offset) -> Status
{
    while (!in.is_empty()) {
        if (const auto n = ::pwrite(file, in.data(), in.size(), static_cast<off_t>(offset)); n >= 0) {
            in.advance(static_cast<Size>(n));
            offset += static_cast<Size>(n);
        } else if (errno != EINTR) {
            return errno_to_status();
        }
    }
    return Status::ok();
}

static auto file_sync(int fd) -> Status
{
    if (::fsync(fd)) {
        return errno_to_status();
    }
    return Status::ok();
}

auto PosixFile::open(const std::string &path, bool read_only, File **out) -> Status
{
    int file {};
    const auto mode = read_only ? O_RDONLY : O_CREAT | O_RDWR;
    Arbor_Try(file_open(path, mode, FILE_PERMISSIONS, file));
    *out = new(std::nothrow) PosixFile {path, file};
    if (*out == nullptr) {
        (void)file_close(file);
        return Status::system_error("out of memory");
    }
    return Status::ok();
}

PosixFile::~PosixFile()
{
    unlock();
    (void)file_close(m_file);
}

auto PosixFile::read(Byte *out, Size &size, Size offset) -> Status
{
    return file_read(m_file, out, size, offset);
}

auto PosixFile::write(Slice in, Size offset) -> Status
{
    return file_write(m_file, in, offset);
}

auto PosixFile::sync() -> Status
{
    return file_sync(m_file);
}

auto PosixFile::size(Size &out) const -> Status
{
    struct stat st;
    if (fstat(m_file, &st)) {
        return errno_to_status();
    }
    out = static_cast<Size>(st.st_size);
    return Status::ok();
}

// flock() locks belong to the open file description, so two handles on the same file conflict even when they are
// held by the same process.
auto PosixFile::lock(Size timeout) -> Status
{
    if (m_is_locked) {
        return Status::ok();
    }
    if (timeout == 0) {
        while (::flock(m_file, LOCK_EX)) {
            if (errno != EINTR) {
                return errno_to_status();
            }
        }
        m_is_locked = true;
        return Status::ok();
    }

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::microseconds {timeout};
    for (; ; ) {
        if (::flock(m_file, LOCK_EX | LOCK_NB) == 0) {
            m_is_locked = true;
            return Status::ok();
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            return errno_to_status();
        }
        if (Clock::now() >= deadline) {
            return Status::busy("timed out waiting for the file lock");
        }
        std::this_thread::sleep_for(std::chrono::microseconds {LOCK_POLL_INTERVAL});
    }
}

auto PosixFile::unlock() -> void
{
    if (m_is_locked) {
        // Only fails for a bad descriptor or flags, neither of which can happen here.
        (void)::flock(m_file, LOCK_UN);
        m_is_locked = false;
    }
}

auto file_exists(const std::string &path) -> Status
{
    if (struct stat st; stat(path.c_str(), &st)) {
        return Status::not_found("not found");
    }
    return Status::ok();
}

auto remove_file(const std::string &path) -> Status
{
    if (unlink(path.c_str())) {
        return errno_to_status();
    }
    return Status::ok();
}

} // namespace Arbor
