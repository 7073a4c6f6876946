#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>

#include "adapters/fs.hpp"
#include "test_helpers.hpp"

using namespace reflux;

namespace {

void write_bytes(const std::filesystem::path& path, std::size_t size) {
    std::ofstream out(path, std::ios::binary);
    for (std::size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i * 31 % 251));
    }
}

auto read_all(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST(FsAdapterTest, CopiesContentIntoNewDirectory)
{
    test::TempDir dir;
    const auto src = dir.path() / "src.bin";
    const auto dst = dir.path() / "nested" / "out" / "dst.bin";
    write_bytes(src, 200 * 1024 + 17);

    auto copied = adapters::fs::copy_file_buffered(src, dst);
    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_EQ(*copied, 200u * 1024 + 17);
    EXPECT_EQ(read_all(src), read_all(dst));
    EXPECT_TRUE(adapters::fs::is_complete_copy(src, dst));
}

TEST(FsAdapterTest, MissingSourceIsIoFailure)
{
    test::TempDir dir;
    auto copied = adapters::fs::copy_file_buffered(dir.path() / "nope", dir.path() / "dst");
    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, infra::ErrorCode::IoFailure);
}

TEST(FsAdapterTest, StoppedCopyIsInterruptedAndLeavesNoTarget)
{
    test::TempDir dir;
    const auto src = dir.path() / "src.bin";
    const auto dst = dir.path() / "dst.bin";
    write_bytes(src, 1024);

    std::stop_source stop;
    stop.request_stop();
    auto copied = adapters::fs::copy_file_buffered(src, dst, stop.get_token());
    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code, infra::ErrorCode::Interrupted);
    EXPECT_FALSE(std::filesystem::exists(dst));
}

TEST(FsAdapterTest, SizeMismatchIsNotComplete)
{
    test::TempDir dir;
    const auto src = dir.path() / "src.bin";
    const auto dst = dir.path() / "dst.bin";
    write_bytes(src, 100);
    write_bytes(dst, 50);

    EXPECT_FALSE(adapters::fs::is_complete_copy(src, dst));
    EXPECT_FALSE(adapters::fs::is_complete_copy(src, dir.path() / "absent"));
}
