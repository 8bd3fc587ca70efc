#include "fakes.h"
#include <algorithm>
#include <cstring>

namespace Arbor {

#define INTERCEPT(interceptor) \
    do { \
        if (interceptor) { \
            if (auto intercept_s = (interceptor)(); !intercept_s.is_ok()) { \
                return intercept_s; \
            } \
        } \
    } while (0)

HeapFile::~HeapFile()
{
    unlock();
}

auto HeapFile::read(Byte *out, Size &size, Size offset) -> Status
{
    INTERCEPT(m_state->on_read);

    const auto &data = m_state->data;
    Size n {};
    if (offset < data.size()) {
        n = std::min<Size>(size, data.size() - offset);
        std::memcpy(out, data.data() + offset, n);
    }
    size = n;
    return Status::ok();
}

auto HeapFile::write(Slice in, Size offset) -> Status
{
    INTERCEPT(m_state->on_write);

    auto &data = m_state->data;
    if (const auto write_end = offset + in.size(); data.size() < write_end) {
        data.resize(write_end);
    }
    std::memcpy(data.data() + offset, in.data(), in.size());
    return Status::ok();
}

auto HeapFile::sync() -> Status
{
    INTERCEPT(m_state->on_sync);
    m_state->sync_count++;
    return Status::ok();
}

auto HeapFile::size(Size &out) const -> Status
{
    out = m_state->data.size();
    return Status::ok();
}

auto HeapFile::lock(Size) -> Status
{
    if (m_state->lock_owner == this) {
        return Status::ok();
    }
    if (m_state->lock_owner != nullptr) {
        return Status::busy("file is locked by another handle");
    }
    m_state->lock_owner = this;
    return Status::ok();
}

auto HeapFile::unlock() -> void
{
    if (m_state->lock_owner == this) {
        m_state->lock_owner = nullptr;
    }
}

auto injected_error() -> Status
{
    return Status::system_error("42");
}

auto fail_after(Size n) -> Interceptor
{
    return [n]() mutable {
        if (n == 0) {
            return injected_error();
        }
        n--;
        return Status::ok();
    };
}

#undef INTERCEPT

} // namespace Arbor
