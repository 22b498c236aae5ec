#include "livephoto/offset_resolver.h"

#include "livephoto/motion_tags.h"

#include "live_test_files.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <string>

namespace livephoto {
namespace {

    static ResolveResult scan_file(const std::string& path, size_t chunk)
    {
        FileHandle file;
        if (file.open(path.c_str(), FileMode::Read) != FileStatus::Ok) {
            ResolveResult r;
            r.status = ResolveStatus::IoError;
            return r;
        }
        StreamCopyOptions opts;
        opts.chunk_bytes = chunk;
        return scan_video_offset(file, opts);
    }


    static ResolveResult resolve_file(const std::string& path,
                                      const TagSnapshot& tags)
    {
        FileHandle file;
        if (file.open(path.c_str(), FileMode::Read) != FileStatus::Ok) {
            ResolveResult r;
            r.status = ResolveStatus::IoError;
            return r;
        }
        return resolve_video_offset(file, tags);
    }

}  // namespace

TEST(MarkerMatcher, FindsMarkerAcrossEverySplit)
{
    Bytes data;
    append_fill(&data, 20, 0x41);
    append_bytes(&data, "ftyp");
    append_fill(&data, 20, 0x42);

    for (size_t split = 0; split <= data.size(); ++split) {
        MarkerMatcher m(kMp4Marker);
        const std::span<const std::byte> all(data.data(), data.size());
        const std::optional<size_t> a = m.feed(all.first(split));
        size_t end                    = 0;
        if (a) {
            end = *a;
        } else {
            const std::optional<size_t> b = m.feed(all.subspan(split));
            ASSERT_TRUE(b.has_value()) << "split=" << split;
            end = split + *b;
        }
        EXPECT_EQ(end, 23U) << "split=" << split;
    }
}


TEST(MarkerMatcher, HandlesPartialRestart)
{
    Bytes data;
    append_bytes(&data, "fftfty");
    append_bytes(&data, "ftyp");

    MarkerMatcher m(kMp4Marker);
    const std::optional<size_t> last = m.feed(
        std::span<const std::byte>(data.data(), data.size()));
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, 9U);
}


TEST(OffsetResolver, ScanFindsVideoAfterImage)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(2000))));

    const ResolveResult r = scan_file(path, kDefaultChunkBytes);
    EXPECT_EQ(r.status, ResolveStatus::Ok);
    EXPECT_EQ(r.source, OffsetSource::Scan);
    EXPECT_EQ(r.video_offset, 1000);
    EXPECT_EQ(r.file_size, 3000U);
}


TEST(OffsetResolver, ScanIsIndependentOfChunkBoundaries)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(64))));

    // The marker occupies bytes 1004..1007; these chunk sizes put the first
    // boundary before, inside and after it.
    for (size_t chunk = 1000; chunk <= 1009; ++chunk) {
        const ResolveResult r = scan_file(path, chunk);
        EXPECT_EQ(r.status, ResolveStatus::Ok) << "chunk=" << chunk;
        EXPECT_EQ(r.video_offset, 1000) << "chunk=" << chunk;
    }
    for (size_t chunk = 1; chunk <= 9; ++chunk) {
        EXPECT_EQ(scan_file(path, chunk).video_offset, 1000)
            << "chunk=" << chunk;
    }
}


TEST(OffsetResolver, LeftmostMarkerWins)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    Bytes data = concat(make_jpeg(100), make_mp4(400));
    data       = concat(data, make_mp4(100));
    ASSERT_TRUE(write_file(path, data));

    EXPECT_EQ(scan_file(path, 16).video_offset, 100);
}


TEST(OffsetResolver, NoMarkerIsNotFound)
{
    ScratchDir dir;
    const std::string path = dir.file("plain.jpg");
    ASSERT_TRUE(write_file(path, make_jpeg(800)));

    const ResolveResult r = scan_file(path, 64);
    EXPECT_EQ(r.status, ResolveStatus::NotFound);
    EXPECT_EQ(r.video_offset, -1);
}


TEST(OffsetResolver, MarkerTooCloseToStartIsNotFound)
{
    ScratchDir dir;
    const std::string path = dir.file("odd.bin");
    Bytes data;
    append_bytes(&data, "ftyp");
    append_fill(&data, 60, 0x20);
    ASSERT_TRUE(write_file(path, data));

    EXPECT_EQ(scan_file(path, 8).status, ResolveStatus::NotFound);
}


TEST(OffsetResolver, ParsesReverseOffsetStrictly)
{
    EXPECT_EQ(parse_reverse_offset("4000"), 4000);
    EXPECT_EQ(parse_reverse_offset(""), 0);
    EXPECT_EQ(parse_reverse_offset("-5"), 0);
    EXPECT_EQ(parse_reverse_offset("12x"), 0);
    EXPECT_EQ(parse_reverse_offset(" 12"), 0);
    EXPECT_EQ(parse_reverse_offset("99999999999999999999999"), 0);
}


TEST(OffsetResolver, ModernOffsetTagTakesPriority)
{
    const MotionTagRow& row = motion_tag_row(MotionTagKind::Offset);

    TagSnapshot tags;
    tags.set(row.legacy_key, "700");
    EXPECT_EQ(tag_reverse_offset(tags), 700);

    tags.set(row.modern_key, "500");
    EXPECT_EQ(tag_reverse_offset(tags), 500);

    // An unusable modern value falls back to the legacy one.
    tags.set(row.modern_key, "abc");
    EXPECT_EQ(tag_reverse_offset(tags), 700);

    tags.set(row.modern_key, "0");
    tags.set(row.legacy_key, "0");
    EXPECT_EQ(tag_reverse_offset(tags), 0);
}


TEST(OffsetResolver, TrustsTagWithoutProbing)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(6000), make_mp4(4000))));

    TagSnapshot tags;
    tags.set(motion_tag_row(MotionTagKind::Offset).modern_key, "500");

    const ResolveResult r = resolve_file(path, tags);
    EXPECT_EQ(r.status, ResolveStatus::Ok);
    EXPECT_EQ(r.source, OffsetSource::Tag);
    EXPECT_EQ(r.file_size, 10000U);
    EXPECT_EQ(r.video_offset, 9500);
}


TEST(OffsetResolver, TagLargerThanFileIsNotFound)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(100), make_mp4(100))));

    TagSnapshot tags;
    tags.set(motion_tag_row(MotionTagKind::Offset).legacy_key, "201");
    EXPECT_EQ(resolve_file(path, tags).status, ResolveStatus::NotFound);

    tags.set(motion_tag_row(MotionTagKind::Offset).legacy_key, "200");
    const ResolveResult r = resolve_file(path, tags);
    EXPECT_EQ(r.status, ResolveStatus::Ok);
    EXPECT_EQ(r.video_offset, 0);
}


TEST(OffsetResolver, ResolveFallsBackToScanWithoutTags)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(500))));

    const ResolveResult r = resolve_file(path, TagSnapshot {});
    EXPECT_EQ(r.status, ResolveStatus::Ok);
    EXPECT_EQ(r.source, OffsetSource::Scan);
    EXPECT_EQ(r.video_offset, 1000);
}


TEST(OffsetResolver, ProbeChecksMarkerAtOffset)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(500))));

    FileHandle file;
    ASSERT_EQ(file.open(path.c_str(), FileMode::Read), FileStatus::Ok);
    EXPECT_TRUE(probe_marker(file, 1000));
    EXPECT_FALSE(probe_marker(file, 999));
    EXPECT_FALSE(probe_marker(file, 1496));
    EXPECT_FALSE(probe_marker(file, -1));
}

}  // namespace livephoto
