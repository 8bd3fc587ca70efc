/*
 * Key ordering. Interface based off of https://github.com/google/leveldb/blob/main/include/leveldb/comparator.h.
 */

#ifndef ARBOR_COMPARATOR_H
#define ARBOR_COMPARATOR_H

#include "slice.h"

namespace Arbor {

class Comparator {
public:
    virtual ~Comparator() = default;

    // Must define a total order over keys. Equal keys denote the same record.
    [[nodiscard]] virtual auto compare(const Slice &lhs, const Slice &rhs) const -> ThreeWayComparison = 0;
    [[nodiscard]] virtual auto name() const -> const char * = 0;
};

/*
 * Lexicographic ordering of the raw key bytes. The returned object is static and must not be deleted.
 */
[[nodiscard]] auto bytewise_comparator() -> const Comparator *;

} // namespace Arbor

#endif // ARBOR_COMPARATOR_H
