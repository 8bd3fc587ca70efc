#include "arbor/comparator.h"

namespace Arbor {

class BytewiseComparator : public Comparator {
public:
    ~BytewiseComparator() override = default;

    [[nodiscard]] auto compare(const Slice &lhs, const Slice &rhs) const -> ThreeWayComparison override
    {
        return compare_three_way(lhs, rhs);
    }

    [[nodiscard]] auto name() const -> const char * override
    {
        return "arbor.BytewiseComparator";
    }
};

auto bytewise_comparator() -> const Comparator *
{
    static const BytewiseComparator comparator {};
    return &comparator;
}

} // namespace Arbor
