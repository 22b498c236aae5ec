#include "livephoto/stream_copy.h"

#include "live_test_files.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>

namespace livephoto {
namespace {

    static Bytes counting_bytes(size_t n)
    {
        Bytes out(n);
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<std::byte>(i & 0xFFU);
        }
        return out;
    }

}  // namespace

TEST(StreamCopy, CopiesWholeFileInSmallChunks)
{
    ScratchDir dir;
    const Bytes data = counting_bytes(1000);
    ASSERT_TRUE(write_file(dir.file("in.bin"), data));

    FileHandle src;
    FileHandle dst;
    ASSERT_EQ(src.open(dir.file("in.bin").c_str(), FileMode::Read),
              FileStatus::Ok);
    ASSERT_EQ(dst.open(dir.file("out.bin").c_str(), FileMode::Create),
              FileStatus::Ok);

    StreamCopyOptions opts;
    opts.chunk_bytes = 7;
    const StreamCopyResult r = copy_all(src, dst, opts);
    EXPECT_EQ(r.status, StreamStatus::Ok);
    EXPECT_EQ(r.copied, 1000U);
    ASSERT_TRUE(dst.close());

    EXPECT_EQ(read_file(dir.file("out.bin")), data);
}


TEST(StreamCopy, CopyNStopsExactlyAtTheBoundary)
{
    ScratchDir dir;
    const Bytes data = counting_bytes(300);
    ASSERT_TRUE(write_file(dir.file("in.bin"), data));

    FileHandle src;
    FileHandle dst;
    ASSERT_EQ(src.open(dir.file("in.bin").c_str(), FileMode::Read),
              FileStatus::Ok);
    ASSERT_EQ(dst.open(dir.file("out.bin").c_str(), FileMode::Create),
              FileStatus::Ok);

    StreamCopyOptions opts;
    opts.chunk_bytes = 64;
    const StreamCopyResult r = copy_n(src, dst, 100, opts);
    EXPECT_EQ(r.status, StreamStatus::Ok);
    EXPECT_EQ(r.copied, 100U);
    ASSERT_TRUE(dst.close());
    EXPECT_EQ(read_file(dir.file("out.bin")), slice(data, 0, 100));

    // The source cursor sits on the first byte that was not copied.
    std::array<std::byte, 1> next {};
    size_t n = 0;
    ASSERT_EQ(src.read(std::span<std::byte>(next), &n), FileStatus::Ok);
    ASSERT_EQ(n, 1U);
    EXPECT_EQ(next[0], data[100]);
}


TEST(StreamCopy, CopyNReportsShortRead)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("in.bin"), counting_bytes(50)));

    FileHandle src;
    FileHandle dst;
    ASSERT_EQ(src.open(dir.file("in.bin").c_str(), FileMode::Read),
              FileStatus::Ok);
    ASSERT_EQ(dst.open(dir.file("out.bin").c_str(), FileMode::Create),
              FileStatus::Ok);

    const StreamCopyResult r = copy_n(src, dst, 80);
    EXPECT_EQ(r.status, StreamStatus::ShortRead);
    EXPECT_EQ(r.copied, 50U);
}


TEST(StreamCopy, CopyFromOffsetCopiesTheTail)
{
    ScratchDir dir;
    const Bytes data = counting_bytes(500);
    ASSERT_TRUE(write_file(dir.file("in.bin"), data));

    FileHandle src;
    FileHandle dst;
    ASSERT_EQ(src.open(dir.file("in.bin").c_str(), FileMode::Read),
              FileStatus::Ok);
    ASSERT_EQ(dst.open(dir.file("out.bin").c_str(), FileMode::Create),
              FileStatus::Ok);

    const StreamCopyResult r = copy_from_offset(src, dst, 123);
    EXPECT_EQ(r.status, StreamStatus::Ok);
    EXPECT_EQ(r.copied, 377U);
    ASSERT_TRUE(dst.close());
    EXPECT_EQ(read_file(dir.file("out.bin")), slice(data, 123, 377));
}


TEST(StreamCopy, AppendModeKeepsExistingBytes)
{
    ScratchDir dir;
    const Bytes head = counting_bytes(40);
    const Bytes tail = make_mp4(60);
    ASSERT_TRUE(write_file(dir.file("out.bin"), head));
    ASSERT_TRUE(write_file(dir.file("in.bin"), tail));

    FileHandle src;
    FileHandle dst;
    ASSERT_EQ(src.open(dir.file("in.bin").c_str(), FileMode::Read),
              FileStatus::Ok);
    ASSERT_EQ(dst.open(dir.file("out.bin").c_str(), FileMode::Append),
              FileStatus::Ok);
    EXPECT_EQ(copy_all(src, dst).status, StreamStatus::Ok);
    ASSERT_TRUE(dst.close());

    EXPECT_EQ(read_file(dir.file("out.bin")), concat(head, tail));
}


TEST(StreamCopy, OpenFailsForMissingFile)
{
    ScratchDir dir;
    FileHandle src;
    EXPECT_EQ(src.open(dir.file("missing.bin").c_str(), FileMode::Read),
              FileStatus::OpenFailed);
    EXPECT_FALSE(src.is_open());

    uint64_t size = 0;
    EXPECT_NE(file_size(dir.file("missing.bin").c_str(), &size),
              FileStatus::Ok);
}


TEST(StreamCopy, StatusNames)
{
    EXPECT_STREQ(stream_status_name(StreamStatus::Ok), "ok");
    EXPECT_STREQ(stream_status_name(StreamStatus::ShortRead), "short_read");
    EXPECT_STREQ(stream_status_name(StreamStatus::SeekFailed), "seek_failed");
}

}  // namespace livephoto
