#include "livephoto/live_maker.h"

#include "livephoto/motion_tags.h"

#include "live_test_files.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace livephoto {
namespace {

    static TagSnapshot tags_on_disk(const std::string& path)
    {
        TagStore store;
        EXPECT_EQ(store.open(path.c_str()), TagStatus::Ok);
        return store.snapshot();
    }

}  // namespace

TEST(LiveMaker, RoundTripsImageAndVideo)
{
    ScratchDir dir;
    const Bytes image = make_jpeg(1000);
    const Bytes video = make_mp4(3000);
    ASSERT_TRUE(write_file(dir.file("IMG_1.jpg"), image));
    ASSERT_TRUE(write_file(dir.file("VID_1.mp4"), video));

    const LiveMaker maker(dir.file("VID_1.mp4"), dir.file("IMG_1.jpg"));
    EXPECT_EQ(maker.dest_path(), dir.file("MVIMG_1.jpg"));

    const MakeResult made = maker.make();
    ASSERT_EQ(made.status, LiveStatus::Ok) << made.message;
    EXPECT_EQ(made.video_size, 3000U);
    EXPECT_EQ(made.dest_path, dir.file("MVIMG_1.jpg"));

    const TagSnapshot tags = tags_on_disk(made.dest_path);
    EXPECT_EQ(tags.get("Xmp.GCamera.MotionPhotoOffset"), "3000");
    EXPECT_EQ(tags.get("Xmp.GCamera.MicroVideoOffset"), "3000");
    EXPECT_EQ(tags.get("Xmp.GCamera.MotionPhoto"), "1");
    EXPECT_EQ(tags.get("Xmp.GCamera.MicroVideo"), "1");
    EXPECT_EQ(tags.get("Xmp.Container.Directory[2]/Container:Item/Item:Length"),
              "3000");

    std::unique_ptr<LivePhoto> photo;
    ASSERT_EQ(LivePhoto::open(made.dest_path, LivePhotoOptions {}, &photo)
                  .status,
              LiveStatus::Ok);
    EXPECT_EQ(photo->offset_source(), OffsetSource::Tag);

    const ExportResult img = photo->export_main_image(dir.file("img.jpg"));
    ASSERT_EQ(img.status, LiveStatus::Ok) << img.message;
    EXPECT_EQ(read_file(dir.file("img.jpg")), image);

    const ExportResult vid = photo->export_video(dir.file("vid.mp4"));
    ASSERT_EQ(vid.status, LiveStatus::Ok) << vid.message;
    EXPECT_EQ(read_file(dir.file("vid.mp4")), video);
}


TEST(LiveMaker, RemakeOverwritesDestination)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("a.jpg"), make_jpeg(700)));
    ASSERT_TRUE(write_file(dir.file("a.mp4"), make_mp4(900)));

    const LiveMaker maker(dir.file("a.mp4"), dir.file("a.jpg"),
                          dir.file("out.jpg"));
    ASSERT_EQ(maker.make().status, LiveStatus::Ok);
    const Bytes first = read_file(dir.file("out.jpg"));
    ASSERT_EQ(maker.make().status, LiveStatus::Ok);
    EXPECT_EQ(read_file(dir.file("out.jpg")), first);
}


TEST(LiveMaker, MetadataFlagControlsImageTags)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("photo.jpg"), make_jpeg(800)));
    TagStore store;
    ASSERT_EQ(store.open(dir.file("photo.jpg").c_str()), TagStatus::Ok);
    ASSERT_EQ(store.set_string("Xmp.xmp.CreatorTool", "camera"),
              TagStatus::Ok);
    ASSERT_EQ(store.save(dir.file("photo.jpg").c_str()), TagStatus::Ok);
    ASSERT_TRUE(write_file(dir.file("clip.mp4"), make_mp4(500)));

    const LiveMaker keep(dir.file("clip.mp4"), dir.file("photo.jpg"),
                         dir.file("keep.jpg"));
    ASSERT_EQ(keep.make().status, LiveStatus::Ok);
    EXPECT_EQ(tags_on_disk(dir.file("keep.jpg")).get("Xmp.xmp.CreatorTool"),
              "camera");

    LiveMakerOptions options;
    options.export_metadata = false;
    const LiveMaker drop(dir.file("clip.mp4"), dir.file("photo.jpg"),
                         dir.file("drop.jpg"), options);
    ASSERT_EQ(drop.make().status, LiveStatus::Ok);
    const TagSnapshot dropped = tags_on_disk(dir.file("drop.jpg"));
    EXPECT_FALSE(dropped.contains("Xmp.xmp.CreatorTool"));
    EXPECT_EQ(dropped.get("Xmp.GCamera.MotionPhotoOffset"), "500");
}


TEST(LiveMaker, MissingInputsAreIoErrors)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("a.jpg"), make_jpeg(700)));

    const LiveMaker no_video(dir.file("missing.mp4"), dir.file("a.jpg"),
                             dir.file("out.jpg"));
    const MakeResult r = no_video.make();
    EXPECT_EQ(r.status, LiveStatus::IoError);
    EXPECT_EQ(r.stream_status, StreamStatus::OpenFailed);

    ASSERT_TRUE(write_file(dir.file("a.mp4"), make_mp4(100)));
    const LiveMaker no_image(dir.file("a.mp4"), dir.file("missing.jpg"),
                             dir.file("out2.jpg"));
    EXPECT_EQ(no_image.make().status, LiveStatus::IoError);
}


TEST(LiveMaker, VideoOnlyNeedsFrameExporter)
{
    ScratchDir dir;
    ASSERT_TRUE(write_file(dir.file("VID_3.mp4"), make_mp4(400)));

    LiveMakerOptions options;
    options.frames.ffmpeg_path = dir.file("no-such-ffmpeg");
    const LiveMaker maker(dir.file("VID_3.mp4"), {}, {}, options);
    EXPECT_EQ(maker.dest_path(), dir.file("MVIMG_3.jpg"));

    const MakeResult r = maker.make();
    EXPECT_EQ(r.status, LiveStatus::DecodeError);
    EXPECT_EQ(r.exporter.status, FrameExportStatus::DecodeFailed);
    EXPECT_EQ(r.message.rfind("command `", 0), 0U);
}

}  // namespace livephoto
