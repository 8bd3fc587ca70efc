#ifndef ARBOR_TEST_UNIT_TESTS_H
#define ARBOR_TEST_UNIT_TESTS_H

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include "arbor/options.h"
#include "arbor/status.h"
#include "fakes.h"
#include "random.h"
#include "storage/storage.h"
#include "utils/system.h"

namespace Arbor {

namespace UnitTests {
    extern std::uint32_t random_seed;
} // namespace UnitTests

auto check_status(const char *expr, const Status &s) -> testing::AssertionResult;

#define ASSERT_OK(s) ASSERT_PRED_FORMAT1(Arbor::check_status, s)
#define EXPECT_OK(s) EXPECT_PRED_FORMAT1(Arbor::check_status, s)

auto PrintTo(const Status &s, std::ostream *os) -> void;
auto PrintTo(const Slice &s, std::ostream *os) -> void;

/*
 * Storage over an in-memory file. Tests can reach into "state" to inspect the file contents or to inject faults.
 */
class TestWithHeapStorage : public testing::Test {
public:
    TestWithHeapStorage();
    ~TestWithHeapStorage() override = default;

    // Open another Storage object on the same in-memory file.
    [[nodiscard]] auto open_storage(std::unique_ptr<Storage> &out) -> Status;

    std::shared_ptr<HeapFileState> state {std::make_shared<HeapFileState>()};
    Storage::Parameters param;
    System system {"test", Options {}};
    std::unique_ptr<Storage> storage;
    Random random {UnitTests::random_seed};
};

/*
 * Provides a fresh directory that is removed when the test is finished.
 */
class TestOnDisk : public testing::Test {
public:
    static constexpr auto BASE = "/tmp/__arbor_unit_tests";

    TestOnDisk()
    {
        std::error_code ignore;
        std::filesystem::remove_all(BASE, ignore);
        std::filesystem::create_directory(BASE);
    }

    ~TestOnDisk() override
    {
        std::error_code ignore;
        std::filesystem::remove_all(BASE, ignore);
    }

    std::string path {std::string {BASE} + "/test.arbor"};
    Random random {UnitTests::random_seed};
};

} // namespace Arbor

#endif // ARBOR_TEST_UNIT_TESTS_H
