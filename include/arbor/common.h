#ifndef ARBOR_COMMON_H
#define ARBOR_COMMON_H

#include <cstdint>

#define ARBOR_VERSION_MAJOR 0
#define ARBOR_VERSION_MINOR 1
#define ARBOR_VERSION_PATCH 0

namespace Arbor {

// Common types.
using Byte = char;
using Size = std::uint64_t;

} // namespace Arbor

#endif // ARBOR_COMMON_H
