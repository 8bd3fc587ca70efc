#ifndef ARBOR_UTILS_TYPES_H
#define ARBOR_UTILS_TYPES_H

#include "arbor/slice.h"
#include "utils.h"

namespace Arbor {

/*
 * Byte offset of a record in the database file. Offset 0 is covered by the file header, so no record can live
 * there and the value doubles as "no address".
 */
struct Address {
    static constexpr Size null_value {0};

    struct Hash {
        auto operator()(const Address &address) const -> Size
        {
            return address.value;
        }
    };

    [[nodiscard]] static constexpr auto null() noexcept -> Address
    {
        return {null_value};
    }

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool
    {
        return value == null_value;
    }

    Size value {};
};

inline auto operator<(Address lhs, Address rhs) -> bool
{
    return lhs.value < rhs.value;
}

inline auto operator>(Address lhs, Address rhs) -> bool
{
    return lhs.value > rhs.value;
}

inline auto operator<=(Address lhs, Address rhs) -> bool
{
    return lhs.value <= rhs.value;
}

inline auto operator>=(Address lhs, Address rhs) -> bool
{
    return lhs.value >= rhs.value;
}

inline auto operator==(Address lhs, Address rhs) -> bool
{
    return lhs.value == rhs.value;
}

inline auto operator!=(Address lhs, Address rhs) -> bool
{
    return lhs.value != rhs.value;
}

} // namespace Arbor

#endif // ARBOR_UTILS_TYPES_H
