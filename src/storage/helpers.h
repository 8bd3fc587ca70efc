#ifndef ARBOR_STORAGE_HELPERS_H
#define ARBOR_STORAGE_HELPERS_H

#include "file.h"
#include "utils/utils.h"

namespace Arbor {

template<class Reader>
[[nodiscard]] auto read_exact_at(Reader &reader, Byte *out, Size size, Size offset) -> Status
{
    auto requested = size;
    auto s = reader.read(out, requested, offset);

    if (s.is_ok() && size != requested) {
        return Status::system_error("incomplete read");
    }
    return s;
}

} // namespace Arbor

#endif // ARBOR_STORAGE_HELPERS_H
