#ifndef ARBOR_STORAGE_POSIX_FILE_H
#define ARBOR_STORAGE_POSIX_FILE_H

#include "file.h"
#include "utils/utils.h"
#include <string>

namespace Arbor {

class PosixFile : public File {
public:
    // Open "path" for reading and writing, creating it if it does not exist, or for reading only.
    [[nodiscard]] static auto open(const std::string &path, bool read_only, File **out) -> Status;

    PosixFile(std::string path, int file)
        : m_path {std::move(path)},
          m_file {file}
    {
        ARBOR_EXPECT_GE(file, 0);
    }

    ~PosixFile() override;
    [[nodiscard]] auto read(Byte *out, Size &size, Size offset) -> Status override;
    [[nodiscard]] auto write(Slice in, Size offset) -> Status override;
    [[nodiscard]] auto sync() -> Status override;
    [[nodiscard]] auto size(Size &out) const -> Status override;
    [[nodiscard]] auto lock(Size timeout) -> Status override;
    auto unlock() -> void override;

private:
    std::string m_path;
    int m_file {};
    bool m_is_locked {};
};

[[nodiscard]] auto file_exists(const std::string &path) -> Status;
[[nodiscard]] auto remove_file(const std::string &path) -> Status;

} // namespace Arbor

#endif // ARBOR_STORAGE_POSIX_FILE_H
