/*
 * encoding.h: Fixed-width integer serialization. Everything on disk is big-endian.
 */
#ifndef ARBOR_UTILS_ENCODING_H
#define ARBOR_UTILS_ENCODING_H

#include "arbor/slice.h"
#include <cstdint>

namespace Arbor {

inline auto get_u32(const Byte *in) noexcept -> std::uint32_t
{
    const auto src = reinterpret_cast<const std::uint8_t *>(in);
    return static_cast<std::uint32_t>(src[0]) << 24 |
           static_cast<std::uint32_t>(src[1]) << 16 |
           static_cast<std::uint32_t>(src[2]) << 8 |
           static_cast<std::uint32_t>(src[3]);
}

inline auto get_u32(const Slice &in) noexcept -> std::uint32_t
{
    return get_u32(in.data());
}

inline auto get_u64(const Byte *in) noexcept -> std::uint64_t
{
    const auto src = reinterpret_cast<const std::uint8_t *>(in);
    return static_cast<std::uint64_t>(src[0]) << 56 |
           static_cast<std::uint64_t>(src[1]) << 48 |
           static_cast<std::uint64_t>(src[2]) << 40 |
           static_cast<std::uint64_t>(src[3]) << 32 |
           static_cast<std::uint64_t>(src[4]) << 24 |
           static_cast<std::uint64_t>(src[5]) << 16 |
           static_cast<std::uint64_t>(src[6]) << 8 |
           static_cast<std::uint64_t>(src[7]);
}

inline auto get_u64(const Slice &in) noexcept -> std::uint64_t
{
    return get_u64(in.data());
}

inline auto put_u32(Byte *out, std::uint32_t value) noexcept -> void
{
    auto *dst = reinterpret_cast<std::uint8_t *>(out);
    dst[0] = static_cast<std::uint8_t>(value >> 24);
    dst[1] = static_cast<std::uint8_t>(value >> 16);
    dst[2] = static_cast<std::uint8_t>(value >> 8);
    dst[3] = static_cast<std::uint8_t>(value);
}

inline auto put_u64(Byte *out, std::uint64_t value) noexcept -> void
{
    auto *dst = reinterpret_cast<std::uint8_t *>(out);
    dst[0] = static_cast<std::uint8_t>(value >> 56);
    dst[1] = static_cast<std::uint8_t>(value >> 48);
    dst[2] = static_cast<std::uint8_t>(value >> 40);
    dst[3] = static_cast<std::uint8_t>(value >> 32);
    dst[4] = static_cast<std::uint8_t>(value >> 24);
    dst[5] = static_cast<std::uint8_t>(value >> 16);
    dst[6] = static_cast<std::uint8_t>(value >> 8);
    dst[7] = static_cast<std::uint8_t>(value);
}

/*
 * Append helpers used by the record codecs.
 */
inline auto append_u8(std::string &out, std::uint8_t value) -> void
{
    out.push_back(static_cast<Byte>(value));
}

inline auto append_u32(std::string &out, std::uint32_t value) -> void
{
    Byte buffer[sizeof(value)];
    put_u32(buffer, value);
    out.append(buffer, sizeof(buffer));
}

inline auto append_u64(std::string &out, std::uint64_t value) -> void
{
    Byte buffer[sizeof(value)];
    put_u64(buffer, value);
    out.append(buffer, sizeof(buffer));
}

/*
 * Consume helpers. Each returns false, leaving "in" untouched, if there are not enough bytes left.
 */
[[nodiscard]]
inline auto consume_u8(Slice &in, std::uint8_t &out) -> bool
{
    if (in.size() < sizeof(out))
        return false;
    out = static_cast<std::uint8_t>(in[0]);
    in.advance(sizeof(out));
    return true;
}

[[nodiscard]]
inline auto consume_u32(Slice &in, std::uint32_t &out) -> bool
{
    if (in.size() < sizeof(out))
        return false;
    out = get_u32(in);
    in.advance(sizeof(out));
    return true;
}

[[nodiscard]]
inline auto consume_u64(Slice &in, std::uint64_t &out) -> bool
{
    if (in.size() < sizeof(out))
        return false;
    out = get_u64(in);
    in.advance(sizeof(out));
    return true;
}

[[nodiscard]]
inline auto consume_bytes(Slice &in, Size n, Slice &out) -> bool
{
    if (in.size() < n)
        return false;
    out = in.range(0, n);
    in.advance(n);
    return true;
}

} // namespace Arbor

#endif // ARBOR_UTILS_ENCODING_H
