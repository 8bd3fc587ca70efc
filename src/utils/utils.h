#ifndef ARBOR_UTILS_UTILS_H
#define ARBOR_UTILS_UTILS_H

#include <cstdio>
#include <cstdlib>
#include <string>
#include "arbor/status.h"

#if NDEBUG
#  define ARBOR_EXPECT_(expr, file, line)
#else
#  define ARBOR_EXPECT_(expr, file, line) Impl::expect(expr, #expr, file, line)
#endif // NDEBUG

#define ARBOR_EXPECT_TRUE(expr) ARBOR_EXPECT_(expr, __FILE__, __LINE__)
#define ARBOR_EXPECT_FALSE(expr) ARBOR_EXPECT_TRUE(!(expr))
#define ARBOR_EXPECT_EQ(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) == (rhs))
#define ARBOR_EXPECT_NE(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) != (rhs))
#define ARBOR_EXPECT_LT(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) < (rhs))
#define ARBOR_EXPECT_LE(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) <= (rhs))
#define ARBOR_EXPECT_GT(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) > (rhs))
#define ARBOR_EXPECT_GE(lhs, rhs) ARBOR_EXPECT_TRUE((lhs) >= (rhs))

#define Arbor_Try(expr) \
    do { \
        if (auto __arbor_try_s = (expr); !__arbor_try_s.is_ok()) { \
            return __arbor_try_s; \
        } \
    } while (0)

namespace Arbor {

namespace Impl {

    inline constexpr auto expect(bool cond, const char *repr, const char *file, int line) noexcept -> void
    {
        if (!cond) {
            std::fprintf(stderr, "expectation (%s) failed at %s:%d\n", repr, file, line);
            std::abort();
        }
    }

} // namespace Impl

[[nodiscard]]
inline auto get_status_name(const Status &s) noexcept -> const char *
{
    if (s.is_not_found()) {
        return "not found";
    } else if (s.is_system_error()) {
        return "system error";
    } else if (s.is_logic_error()) {
        return "logic error";
    } else if (s.is_corruption()) {
        return "corruption";
    } else if (s.is_invalid_argument()) {
        return "invalid argument";
    } else if (s.is_busy()) {
        return "busy";
    }
    ARBOR_EXPECT_TRUE(s.is_ok());
    return "ok";
}

} // namespace Arbor

#endif // ARBOR_UTILS_UTILS_H
