/**
 * @file test_atomic_file.cpp
 * @brief Replace-by-rename writes: committed content, failed writers, temp cleanup
 */

#include <gtest/gtest.h>
#include <storage/atomic_file.hpp>
#include "../support/test_support.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace Repealer;
using Repealer::test::TempDir;

namespace {

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

} // namespace

TEST(AtomicFileTest, ReplacesContentAndLeavesNoTemp) {
    TempDir dir;
    const auto path = dir.path() / "chunks.json";

    write_file_atomic(path, [](std::ostream& out) { out << "first"; });
    write_file_atomic(path, [](std::ostream& out) { out << "second"; });

    EXPECT_EQ(slurp(path), "second");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "chunks.json.tmp"));
}

TEST(AtomicFileTest, FailedWriterKeepsOriginal) {
    TempDir dir;
    const auto path = dir.path() / "vectors.bin";
    write_file_atomic(path, [](std::ostream& out) { out << "intact"; });

    EXPECT_THROW(write_file_atomic(path, [](std::ostream& out) {
        out << "partial";
        throw std::runtime_error("disk full");
    }), std::runtime_error);

    EXPECT_EQ(slurp(path), "intact");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "vectors.bin.tmp"));
}

TEST(AtomicFileTest, PathWriterMustProduceFile) {
    TempDir dir;
    const auto path = dir.path() / "index.bin";

    write_path_atomic(path, [](const std::filesystem::path& tmp) {
        std::ofstream(tmp, std::ios::binary) << "index";
    });
    EXPECT_EQ(slurp(path), "index");

    EXPECT_THROW(write_path_atomic(path, [](const std::filesystem::path&) {}), std::runtime_error);
    EXPECT_EQ(slurp(path), "index");
}

TEST(AtomicFileTest, MissingDirectoryFailsWithoutPartialFile) {
    TempDir dir;
    const auto path = dir.path() / "absent" / "chunks.json";
    EXPECT_THROW(write_file_atomic(path, [](std::ostream& out) { out << "x"; }), std::runtime_error);
    EXPECT_FALSE(std::filesystem::exists(path));
}
