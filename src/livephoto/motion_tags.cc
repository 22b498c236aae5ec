#include "livephoto/motion_tags.h"

#include <cctype>
#include <string>

namespace livephoto {
namespace {

    static constexpr std::string_view kPrimaryItem
        = "Xmp.Container.Directory[1]/Container:Item";
    static constexpr std::string_view kVideoItem
        = "Xmp.Container.Directory[2]/Container:Item";

    static bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            const int ca = std::tolower(static_cast<unsigned char>(a[i]));
            const int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) {
                return false;
            }
        }
        return true;
    }


    static void set_item_field(TagSnapshot& tags, std::string_view item,
                               std::string_view field, std::string_view value)
    {
        std::string key(item);
        key.append("/Item:");
        key.append(field);
        tags.set(key, value);
    }

}  // namespace

const MotionTagRow&
motion_tag_row(MotionTagKind kind) noexcept
{
    for (const MotionTagRow& row : kMotionTagTable) {
        if (row.kind == kind) {
            return row;
        }
    }
    return kMotionTagTable[0];
}


std::string_view
image_mime_for_extension(std::string_view extension) noexcept
{
    if (iequals(extension, "heic") || iequals(extension, "heif")) {
        return "image/heic";
    }
    if (iequals(extension, "avif")) {
        return "image/avif";
    }
    return "image/jpeg";
}


std::string_view
preserved_timestamp(const TagSnapshot& tags) noexcept
{
    const MotionTagRow& row = motion_tag_row(
        MotionTagKind::PresentationTimestamp);
    const std::string_view modern = tags.get(row.modern_key);
    if (!modern.empty()) {
        return modern;
    }
    return tags.get(row.legacy_key);
}


uint32_t
clear_motion_photo_tags(TagSnapshot& tags) noexcept
{
    uint32_t removed = 0;
    for (const MotionTagRow& row : kMotionTagTable) {
        removed += tags.erase_tree(row.legacy_key);
        removed += tags.erase_tree(row.modern_key);
    }
    removed += tags.erase_tree(kContainerDirectoryKey);
    return removed;
}


void
stage_motion_photo_tags(TagSnapshot& tags, uint64_t reverse_offset,
                        std::string_view image_mime)
{
    // Copy before clearing: the view points into `tags`.
    const std::string timestamp(preserved_timestamp(tags));
    const std::string offset = std::to_string(reverse_offset);

    (void)clear_motion_photo_tags(tags);

    for (const MotionTagRow& row : kMotionTagTable) {
        std::string_view value;
        switch (row.kind) {
        case MotionTagKind::Flag:
        case MotionTagKind::Version: value = "1"; break;
        case MotionTagKind::Offset: value = offset; break;
        case MotionTagKind::PresentationTimestamp: value = timestamp; break;
        }
        if (value.empty()) {
            continue;
        }
        tags.set(row.legacy_key, value);
        tags.set(row.modern_key, value);
    }

    set_item_field(tags, kPrimaryItem, "Mime", image_mime);
    set_item_field(tags, kPrimaryItem, "Semantic", "Primary");
    set_item_field(tags, kVideoItem, "Mime", "video/mp4");
    set_item_field(tags, kVideoItem, "Semantic", "MotionPhoto");
    set_item_field(tags, kVideoItem, "Length", offset);
}

}  // namespace livephoto
