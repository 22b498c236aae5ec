#include "livephoto/live_photo.h"

#include "livephoto/motion_tags.h"

#include "live_test_files.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace livephoto {
namespace {

    using TagList = std::vector<std::pair<std::string, std::string>>;

    static std::string modern(MotionTagKind kind)
    {
        return std::string(motion_tag_row(kind).modern_key);
    }


    static std::string legacy(MotionTagKind kind)
    {
        return std::string(motion_tag_row(kind).legacy_key);
    }


    // Writes a tagged JPEG, pads it with spaces to `video_at` (when larger)
    // and appends `video`. Returns the offset where the video starts.
    static uint64_t write_live(const std::string& path, const TagList& tags,
                               const Bytes& video, uint64_t video_at = 0)
    {
        EXPECT_TRUE(write_file(path, make_jpeg(1000)));
        if (!tags.empty()) {
            TagStore store;
            EXPECT_EQ(store.open(path.c_str()), TagStatus::Ok);
            for (const auto& [key, value] : tags) {
                EXPECT_EQ(store.set_string(key, value), TagStatus::Ok) << key;
            }
            EXPECT_EQ(store.save(path.c_str()), TagStatus::Ok);
        }
        Bytes body = read_file(path);
        if (video_at > body.size()) {
            append_fill(&body, static_cast<size_t>(video_at) - body.size(),
                        0x20);
        }
        const uint64_t start = body.size();
        EXPECT_TRUE(write_file(path, concat(body, video)));
        return start;
    }


    static std::unique_ptr<LivePhoto>
    open_live(const std::string& path,
              const LivePhotoOptions& options = LivePhotoOptions {})
    {
        std::unique_ptr<LivePhoto> photo;
        const LiveOpenResult r = LivePhoto::open(path, options, &photo);
        EXPECT_EQ(r.status, LiveStatus::Ok) << r.message;
        return photo;
    }


    static TagSnapshot tags_on_disk(const std::string& path)
    {
        TagStore store;
        EXPECT_EQ(store.open(path.c_str()), TagStatus::Ok);
        return store.snapshot();
    }


    static void expect_consistent_motion_tags(const TagSnapshot& tags,
                                              std::string_view reverse)
    {
        for (const MotionTagRow& row : kMotionTagTable) {
            EXPECT_EQ(tags.get(row.legacy_key), tags.get(row.modern_key))
                << row.modern_key;
        }
        EXPECT_EQ(tags.get(modern(MotionTagKind::Flag)), "1");
        EXPECT_EQ(tags.get(modern(MotionTagKind::Version)), "1");
        EXPECT_EQ(tags.get(modern(MotionTagKind::Offset)), reverse);
        EXPECT_EQ(
            tags.get("Xmp.Container.Directory[2]/Container:Item/Item:Length"),
            reverse);
        EXPECT_EQ(
            tags.get("Xmp.Container.Directory[1]/Container:Item/Item:Mime"),
            "image/jpeg");
        EXPECT_EQ(
            tags.get("Xmp.Container.Directory[2]/Container:Item/Item:Mime"),
            "video/mp4");
    }

}  // namespace

TEST(LivePhoto, OpensBySignatureScan)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    const Bytes image      = make_jpeg(1000);
    const Bytes video      = make_mp4(2500);
    ASSERT_TRUE(write_file(path, concat(image, video)));

    LivePhotoOptions options;
    options.dest_dir = dir.file("out");
    ASSERT_TRUE(std::filesystem::create_directories(options.dest_dir));
    const std::unique_ptr<LivePhoto> photo = open_live(path, options);
    ASSERT_NE(photo, nullptr);
    EXPECT_EQ(photo->video_offset(), 1000);
    EXPECT_EQ(photo->file_size(), 3500U);
    EXPECT_EQ(photo->offset_source(), OffsetSource::Scan);

    const ExportResult img = photo->export_main_image();
    ASSERT_EQ(img.status, LiveStatus::Ok) << img.message;
    EXPECT_EQ(img.output_path, dir.file("out") + "/live_0.jpg");
    EXPECT_EQ(img.bytes, 1000U);
    EXPECT_EQ(read_file(img.output_path), image);

    const ExportResult vid = photo->export_video();
    ASSERT_EQ(vid.status, LiveStatus::Ok) << vid.message;
    EXPECT_EQ(vid.output_path, dir.file("out") + "/VID_live.mp4");
    EXPECT_EQ(vid.bytes, 2500U);
    EXPECT_EQ(read_file(vid.output_path), video);
}


TEST(LivePhoto, RejectsFilesWithoutVideo)
{
    ScratchDir dir;
    std::unique_ptr<LivePhoto> photo;

    ASSERT_TRUE(write_file(dir.file("plain.jpg"), make_jpeg(900)));
    LiveOpenResult r = LivePhoto::open(dir.file("plain.jpg"),
                                       LivePhotoOptions {}, &photo);
    EXPECT_EQ(r.status, LiveStatus::NotLiveLikeFile);
    EXPECT_EQ(r.resolve_status, ResolveStatus::NotFound);
    EXPECT_EQ(photo, nullptr);

    ASSERT_TRUE(write_file(dir.file("clip.mp4"), make_mp4(900)));
    r = LivePhoto::open(dir.file("clip.mp4"), LivePhotoOptions {}, &photo);
    EXPECT_EQ(r.status, LiveStatus::NotLiveLikeFile);
    EXPECT_EQ(r.tag_status, TagStatus::Unsupported);

    r = LivePhoto::open(dir.file("missing.jpg"), LivePhotoOptions {}, &photo);
    EXPECT_EQ(r.status, LiveStatus::NotLiveLikeFile);
    EXPECT_EQ(r.tag_status, TagStatus::OpenFailed);
}


TEST(LivePhoto, RejectsOffsetTagBeyondFileSize)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    (void)write_live(path, { { modern(MotionTagKind::Offset), "999999" } },
                     make_mp4(300));

    std::unique_ptr<LivePhoto> photo;
    const LiveOpenResult r = LivePhoto::open(path, LivePhotoOptions {},
                                             &photo);
    EXPECT_EQ(r.status, LiveStatus::NotLiveLikeFile);
    EXPECT_EQ(photo, nullptr);
}


TEST(LivePhoto, TrustsTagOnOpenAndRepairValidatesIt)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    const Bytes video      = make_mp4(4000);
    const uint64_t start   = write_live(
        path, { { modern(MotionTagKind::Offset), "500" } }, video, 6000);
    ASSERT_EQ(start, 6000U);

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);
    EXPECT_EQ(photo->file_size(), 10000U);
    EXPECT_EQ(photo->video_offset(), 9500);
    EXPECT_EQ(photo->offset_source(), OffsetSource::Tag);

    const RepairResult r = photo->repair();
    ASSERT_EQ(r.status, LiveStatus::Ok) << r.message;
    const std::vector<RepairState> expected = {
        RepairState::TrustExisting,
        RepairState::Validate,
        RepairState::Scan,
        RepairState::Persist,
    };
    EXPECT_EQ(r.states, expected);
    EXPECT_EQ(r.reverse_offset, 4000);

    uint64_t size = 0;
    ASSERT_EQ(file_size(path.c_str(), &size), FileStatus::Ok);
    EXPECT_EQ(photo->file_size(), size);
    EXPECT_EQ(photo->video_offset(), static_cast<int64_t>(size) - 4000);
    EXPECT_EQ(r.video_offset, photo->video_offset());

    const ExportResult vid = photo->export_video(dir.file("out.mp4"));
    ASSERT_EQ(vid.status, LiveStatus::Ok);
    EXPECT_EQ(read_file(dir.file("out.mp4")), video);

    expect_consistent_motion_tags(tags_on_disk(path), "4000");
    // The loaded snapshot stays free of motion photo tags.
    EXPECT_FALSE(photo->tags().contains(modern(MotionTagKind::Offset)));
}


TEST(LivePhoto, RepairKeepsFilePermissions)
{
    namespace fs = std::filesystem;

    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(2000))));
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);
    const RepairResult r = photo->repair();
    ASSERT_EQ(r.status, LiveStatus::Ok) << r.message;

    EXPECT_EQ(fs::status(path).permissions() & fs::perms::mask,
              fs::perms::owner_read | fs::perms::owner_write);
}


TEST(LivePhoto, RepairKeepsValidOffset)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(2000))));

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);

    const RepairResult r = photo->repair();
    ASSERT_EQ(r.status, LiveStatus::Ok) << r.message;
    const std::vector<RepairState> expected = {
        RepairState::TrustExisting,
        RepairState::Validate,
        RepairState::Persist,
    };
    EXPECT_EQ(r.states, expected);
    EXPECT_EQ(r.reverse_offset, 2000);
    expect_consistent_motion_tags(tags_on_disk(path), "2000");
}


TEST(LivePhoto, ForcedRepairIsIdempotent)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    (void)write_live(path, { { legacy(MotionTagKind::Offset), "10" } },
                     make_mp4(1500));

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);

    RepairOptions force;
    force.force = true;
    const RepairResult first = photo->repair(force);
    ASSERT_EQ(first.status, LiveStatus::Ok) << first.message;
    const std::vector<RepairState> expected = {
        RepairState::TrustExisting,
        RepairState::Scan,
        RepairState::Persist,
    };
    EXPECT_EQ(first.states, expected);
    EXPECT_EQ(first.reverse_offset, 1500);
    const Bytes after_first = read_file(path);

    const RepairResult second = photo->repair(force);
    ASSERT_EQ(second.status, LiveStatus::Ok) << second.message;
    EXPECT_EQ(second.reverse_offset, first.reverse_offset);
    EXPECT_EQ(second.video_offset, first.video_offset);
    EXPECT_EQ(read_file(path), after_first);
}


TEST(LivePhoto, RepairPreservesPresentationTimestamp)
{
    ScratchDir dir;

    const std::string a = dir.file("a.jpg");
    (void)write_live(
        a, { { legacy(MotionTagKind::PresentationTimestamp), "123456" } },
        make_mp4(800));
    std::unique_ptr<LivePhoto> photo = open_live(a);
    ASSERT_NE(photo, nullptr);
    ASSERT_EQ(photo->repair().status, LiveStatus::Ok);
    TagSnapshot tags = tags_on_disk(a);
    expect_consistent_motion_tags(tags, "800");
    EXPECT_EQ(tags.get(modern(MotionTagKind::PresentationTimestamp)),
              "123456");

    const std::string b = dir.file("b.jpg");
    (void)write_live(
        b,
        { { legacy(MotionTagKind::PresentationTimestamp), "2" },
          { modern(MotionTagKind::PresentationTimestamp), "1" } },
        make_mp4(800));
    photo = open_live(b);
    ASSERT_NE(photo, nullptr);
    ASSERT_EQ(photo->repair().status, LiveStatus::Ok);
    tags = tags_on_disk(b);
    expect_consistent_motion_tags(tags, "800");
    EXPECT_EQ(tags.get(legacy(MotionTagKind::PresentationTimestamp)), "1");

    const std::string c = dir.file("c.jpg");
    (void)write_live(c, {}, make_mp4(800));
    photo = open_live(c);
    ASSERT_NE(photo, nullptr);
    ASSERT_EQ(photo->repair().status, LiveStatus::Ok);
    tags = tags_on_disk(c);
    EXPECT_FALSE(tags.contains(modern(MotionTagKind::PresentationTimestamp)));
    EXPECT_FALSE(tags.contains(legacy(MotionTagKind::PresentationTimestamp)));
}


TEST(LivePhoto, ManualVideoSize)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    ASSERT_TRUE(write_file(path, concat(make_jpeg(1000), make_mp4(2000))));

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);

    RepairOptions too_big;
    too_big.manual_video_size = 3001;
    const RepairResult bad = photo->repair(too_big);
    EXPECT_EQ(bad.status, LiveStatus::OffsetNotFound);
    ASSERT_FALSE(bad.states.empty());
    EXPECT_EQ(bad.states.back(), RepairState::Failed);
    EXPECT_EQ(read_file(path), concat(make_jpeg(1000), make_mp4(2000)));

    RepairOptions manual;
    manual.manual_video_size = 2000;
    const RepairResult r = photo->repair(manual);
    ASSERT_EQ(r.status, LiveStatus::Ok) << r.message;
    const std::vector<RepairState> expected = {
        RepairState::TrustExisting,
        RepairState::Persist,
    };
    EXPECT_EQ(r.states, expected);
    expect_consistent_motion_tags(tags_on_disk(path), "2000");
}


TEST(LivePhoto, RepairFailsWithoutAnyMarker)
{
    ScratchDir dir;
    const std::string path = dir.file("live.jpg");
    Bytes junk;
    append_fill(&junk, 3000, 0x20);
    (void)write_live(path, { { modern(MotionTagKind::Offset), "500" } },
                     junk);
    const Bytes before = read_file(path);

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);

    const RepairResult r = photo->repair();
    EXPECT_EQ(r.status, LiveStatus::OffsetNotFound);
    const std::vector<RepairState> expected = {
        RepairState::TrustExisting,
        RepairState::Validate,
        RepairState::Scan,
        RepairState::Failed,
    };
    EXPECT_EQ(r.states, expected);
    EXPECT_EQ(read_file(path), before);
}


TEST(LivePhoto, ExportedImageKeepsOnlyPlainTags)
{
    ScratchDir dir;
    const std::string path = dir.file("MVIMG_5.jpg");
    (void)write_live(path,
                     { { "Xmp.xmp.CreatorTool", "camera" },
                       { modern(MotionTagKind::Flag), "1" },
                       { legacy(MotionTagKind::Flag), "1" },
                       { modern(MotionTagKind::Offset), "600" } },
                     make_mp4(600));

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);
    EXPECT_EQ(photo->tags().size(), 1U);

    const ExportResult with_tags = photo->export_main_image();
    ASSERT_EQ(with_tags.status, LiveStatus::Ok) << with_tags.message;
    EXPECT_EQ(with_tags.output_path, dir.file("IMG_5.jpg"));
    const TagSnapshot exported = tags_on_disk(with_tags.output_path);
    EXPECT_EQ(exported.get("Xmp.xmp.CreatorTool"), "camera");
    EXPECT_EQ(exported.size(), 1U);

    // Not a motion photo any more: no marker and no offset tag.
    std::unique_ptr<LivePhoto> reopened;
    EXPECT_EQ(LivePhoto::open(with_tags.output_path, LivePhotoOptions {},
                              &reopened)
                  .status,
              LiveStatus::NotLiveLikeFile);

    photo->set_export_metadata(false);
    const ExportResult bare = photo->export_main_image(dir.file("bare.jpg"));
    ASSERT_EQ(bare.status, LiveStatus::Ok) << bare.message;
    EXPECT_EQ(read_file(dir.file("bare.jpg")), make_jpeg(1000));
}


TEST(LivePhoto, ImageTagFailureKeepsExportedPixels)
{
    // The CDATA value decodes fine but needs four bytes per '<' once
    // escaped again, which no longer fits one APP1 segment.
    std::string packet(
        "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\">"
        "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">"
        "<rdf:Description rdf:about=\"\" "
        "xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
        "<dc:source><![CDATA[");
    packet.append(20000, '<');
    packet.append("]]></dc:source></rdf:Description></rdf:RDF></x:xmpmeta>");

    Bytes image;
    append_u8(&image, 0xFF);
    append_u8(&image, 0xD8);
    std::string payload(kJpegXmpSignature);
    payload.append(packet);
    append_segment(&image, 0xE1, payload);
    append_segment(&image, 0xDA, std::string_view("\x01\x01\x00\x00\x3F\x00", 6));
    append_fill(&image, 200, 0x5A);
    append_u8(&image, 0xFF);
    append_u8(&image, 0xD9);

    ScratchDir dir;
    const std::string path = dir.file("MVIMG_9.jpg");
    const Bytes combined   = concat(image, make_mp4(500));
    ASSERT_TRUE(write_file(path, combined));

    const std::unique_ptr<LivePhoto> photo = open_live(path);
    ASSERT_NE(photo, nullptr);
    ASSERT_EQ(photo->video_offset(), static_cast<int64_t>(image.size()));
    EXPECT_EQ(photo->tags().get("Xmp.dc.source"), std::string(20000, '<'));

    const ExportResult r = photo->export_main_image();
    EXPECT_EQ(r.status, LiveStatus::TagError);
    EXPECT_EQ(r.tag_status, TagStatus::LimitExceeded);
    EXPECT_EQ(r.output_path, dir.file("IMG_9.jpg"));
    ASSERT_TRUE(std::filesystem::exists(r.output_path));
    EXPECT_EQ(read_file(r.output_path), image);
}


TEST(LivePhoto, StatusNames)
{
    EXPECT_STREQ(live_status_name(LiveStatus::NotLiveLikeFile),
                 "not_live_like_file");
    EXPECT_STREQ(repair_state_name(RepairState::Validate), "validate");
}

}  // namespace livephoto
