#include "livephoto/build_info.h"
#include "livephoto/console_format.h"
#include "livephoto/frame_export.h"
#include "livephoto/live_maker.h"
#include "livephoto/live_photo.h"
#include "livephoto/stream_copy.h"
#include "livephoto/tag_store.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

namespace livephoto {
namespace {

    struct ToolOptions final {
        std::string dest_dir;
        bool image_only  = false;
        bool video_only  = false;
        bool metadata    = true;
        bool repair      = false;
        bool dump_tags   = false;
        bool verbose     = false;
        bool make        = false;
        std::string frames_format;
        RepairOptions repair_options;
        FrameExportOptions frame_options;
        StreamCopyOptions copy;

        std::string make_video;
        std::string make_image;
        std::string make_dest;
    };

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("       %s --make --video V [--image I] [--dest D] [--no-metadata]\n",
                    argv0);
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --dest-dir DIR       output directory (default: beside the file)\n");
        std::printf("  --image-only         export only the main image\n");
        std::printf("  --video-only         export only the video\n");
        std::printf("  --no-metadata        do not copy tags into exported images/frames\n");
        std::printf("  --frames FMT         split the video into FMT frames (needs ffmpeg)\n");
        std::printf("  --repair             repair the offset tags in place\n");
        std::printf("  --force              with --repair: always rescan the file\n");
        std::printf("  --video-size N       with --repair: trust N as the video size\n");
        std::printf("  --dump-tags          print the XMP tags and the video offset\n");
        std::printf("  --ffmpeg PATH        ffmpeg executable (default: ffmpeg)\n");
        std::printf("  --chunk-bytes N      copy/scan chunk size (default: 16384)\n");
        std::printf("  --verbose            print progress lines\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());

        const std::string_view runtime = expat_runtime_version();
        if (!runtime.empty()) {
            std::printf("runtime %.*s\n", static_cast<int>(runtime.size()),
                        runtime.data());
        }
    }

    static void print_export(const char* what, const ExportResult& r,
                             bool verbose)
    {
        if (!verbose) {
            return;
        }
        std::string size;
        append_byte_size(r.bytes, &size);
        std::printf("exported %s `%s` (%s)\n", what,
                    console_escaped(r.output_path).c_str(), size.c_str());
    }

    static void dump_tags(const char* path, const LivePhoto& photo)
    {
        TagStore store;
        const TagStatus st = store.open(path);
        std::printf("== %s\n", console_escaped(path).c_str());
        std::printf("video_offset=%lld file_size=%llu source=%s\n",
                    static_cast<long long>(photo.video_offset()),
                    static_cast<unsigned long long>(photo.file_size()),
                    photo.offset_source() == OffsetSource::Tag ? "tag"
                                                               : "scan");
        if (st != TagStatus::Ok) {
            std::printf("tags: %s\n", tag_status_name(st));
            return;
        }
        for (const auto& [key, value] : store.snapshot()) {
            std::printf("%s = %s\n", console_escaped(key).c_str(),
                        console_escaped(value, 256).c_str());
        }
    }

    // Returns false when the file failed.
    static bool run_repair(const char* path, LivePhoto& photo,
                           const ToolOptions& opts)
    {
        const RepairResult r = photo.repair(opts.repair_options);
        if (opts.verbose) {
            std::string trail;
            for (const RepairState s : r.states) {
                if (!trail.empty()) {
                    trail.append(" -> ");
                }
                trail.append(repair_state_name(s));
            }
            std::printf("repair `%s`: %s\n", console_escaped(path).c_str(),
                        trail.c_str());
        }
        if (r.status != LiveStatus::Ok) {
            std::fprintf(stderr, "livephotoconv: repair of `%s` failed: %s (%s)\n",
                         console_escaped(path).c_str(),
                         live_status_name(r.status),
                         console_escaped(r.message).c_str());
            return false;
        }
        if (opts.verbose) {
            std::printf("video_offset=%lld reverse_offset=%lld\n",
                        static_cast<long long>(r.video_offset),
                        static_cast<long long>(r.reverse_offset));
        }
        return true;
    }

    static bool run_export(const char* path, const LivePhoto& photo,
                           const ToolOptions& opts)
    {
        bool ok = true;
        if (!opts.video_only) {
            const ExportResult r = photo.export_main_image();
            if (r.status == LiveStatus::TagError) {
                std::fprintf(stderr, "livephotoconv: warning: `%s`: %s\n",
                             console_escaped(r.output_path).c_str(),
                             console_escaped(r.message).c_str());
                print_export("image", r, opts.verbose);
            } else if (r.status != LiveStatus::Ok) {
                std::fprintf(stderr, "livephotoconv: `%s`: image export failed: %s\n",
                             console_escaped(path).c_str(),
                             console_escaped(r.message).c_str());
                ok = false;
            } else {
                print_export("image", r, opts.verbose);
            }
        }
        if (!opts.image_only) {
            const ExportResult r = photo.export_video();
            if (r.status != LiveStatus::Ok) {
                std::fprintf(stderr, "livephotoconv: `%s`: video export failed: %s\n",
                             console_escaped(path).c_str(),
                             console_escaped(r.message).c_str());
                ok = false;
            } else {
                print_export("video", r, opts.verbose);
            }
        }
        if (!opts.frames_format.empty()) {
            const SplitFramesResult r = photo.split_frames(opts.frame_options,
                                                           opts.frames_format);
            if (r.status != LiveStatus::Ok) {
                std::fprintf(stderr, "livephotoconv: `%s`: %s\n",
                             console_escaped(path).c_str(),
                             console_escaped(r.message).c_str());
                ok = false;
            } else {
                if (r.tag_failures > 0U) {
                    std::fprintf(stderr,
                                 "livephotoconv: warning: tags not written to %u frame(s)\n",
                                 r.tag_failures);
                }
                if (opts.verbose) {
                    std::printf("exported %u frame(s)\n", r.frames);
                }
            }
        }
        return ok;
    }

    static int run_make(const ToolOptions& opts)
    {
        if (opts.make_video.empty()) {
            std::fprintf(stderr, "livephotoconv: --make needs --video\n");
            return 2;
        }
        LiveMakerOptions mopts;
        mopts.export_metadata = opts.metadata;
        mopts.copy            = opts.copy;
        mopts.frames          = opts.frame_options;

        const LiveMaker maker(opts.make_video, opts.make_image, opts.make_dest,
                              mopts);
        const MakeResult r = maker.make();
        if (r.status != LiveStatus::Ok) {
            std::fprintf(stderr, "livephotoconv: make `%s` failed: %s (%s)\n",
                         console_escaped(r.dest_path).c_str(),
                         live_status_name(r.status),
                         console_escaped(r.message).c_str());
            return 1;
        }
        if (opts.verbose) {
            std::string size;
            append_byte_size(r.video_size, &size);
            std::printf("made `%s` (video %s)\n",
                        console_escaped(r.dest_path).c_str(), size.c_str());
        }
        return 0;
    }

}  // namespace
}  // namespace livephoto

int
main(int argc, char** argv)
{
    using namespace livephoto;

    ToolOptions opts;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--dest-dir") == 0 && has_value) {
            opts.dest_dir = argv[++i];
            first_path    = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--image-only") == 0) {
            opts.image_only = true;
            first_path      = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--video-only") == 0) {
            opts.video_only = true;
            first_path      = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--no-metadata") == 0) {
            opts.metadata = false;
            first_path    = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--frames") == 0 && has_value) {
            opts.frames_format = argv[++i];
            first_path         = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--repair") == 0) {
            opts.repair = true;
            first_path  = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            opts.repair_options.force = true;
            first_path                = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--video-size") == 0 && has_value) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v) || v == 0U) {
                std::fprintf(stderr, "invalid --video-size value\n");
                return 2;
            }
            opts.repair_options.manual_video_size = v;
            i += 1;
            first_path = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--dump-tags") == 0) {
            opts.dump_tags = true;
            first_path     = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--ffmpeg") == 0 && has_value) {
            opts.frame_options.ffmpeg_path = argv[++i];
            first_path                     = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--chunk-bytes") == 0 && has_value) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v) || v == 0U
                || v > 64ULL * 1024ULL * 1024ULL) {
                std::fprintf(stderr, "invalid --chunk-bytes value\n");
                return 2;
            }
            opts.copy.chunk_bytes = static_cast<size_t>(v);
            i += 1;
            first_path = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            first_path   = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--make") == 0) {
            opts.make  = true;
            first_path = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--video") == 0 && has_value) {
            opts.make_video = argv[++i];
            first_path      = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--image") == 0 && has_value) {
            opts.make_image = argv[++i];
            first_path      = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--dest") == 0 && has_value) {
            opts.make_dest = argv[++i];
            first_path     = i + 1;
            continue;
        }
        if (std::strcmp(arg, "--") == 0) {
            first_path = i + 1;
            break;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "livephotoconv: unknown option `%s`\n",
                         console_escaped(arg).c_str());
            usage(argv[0]);
            return 2;
        }
        first_path = i;
        break;
    }

    if (opts.make) {
        if (first_path < argc) {
            usage(argv[0]);
            return 2;
        }
        return run_make(opts);
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }
    if (opts.image_only && opts.video_only) {
        std::fprintf(stderr,
                     "livephotoconv: --image-only and --video-only are exclusive\n");
        return 2;
    }

    LivePhotoOptions live_options;
    live_options.dest_dir        = opts.dest_dir;
    live_options.export_metadata = opts.metadata;
    live_options.copy            = opts.copy;

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }

        std::unique_ptr<LivePhoto> photo;
        const LiveOpenResult opened = LivePhoto::open(path, live_options,
                                                      &photo);
        if (opened.status != LiveStatus::Ok) {
            std::fprintf(stderr, "livephotoconv: skipping `%s`: %s\n",
                         console_escaped(path).c_str(),
                         console_escaped(opened.message).c_str());
            continue;
        }

        if (opts.dump_tags) {
            dump_tags(path, *photo);
            continue;
        }

        const bool ok = opts.repair ? run_repair(path, *photo, opts)
                                    : run_export(path, *photo, opts);
        if (!ok) {
            exit_code = 1;
        }
    }

    return exit_code;
}
