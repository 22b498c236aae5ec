#include "livephoto/tag_store.h"

#include "livephoto/xmp_encode.h"

#include <cstdio>
#include <string>

namespace livephoto {
namespace {

    static TagStatus from_jpeg_status(JpegStatus status) noexcept
    {
        switch (status) {
        case JpegStatus::Ok: return TagStatus::Ok;
        case JpegStatus::ReadFailed: return TagStatus::OpenFailed;
        case JpegStatus::WriteFailed: return TagStatus::WriteFailed;
        case JpegStatus::Unsupported: return TagStatus::Unsupported;
        case JpegStatus::Malformed: return TagStatus::Malformed;
        case JpegStatus::LimitExceeded: return TagStatus::LimitExceeded;
        }
        return TagStatus::Malformed;
    }


    static TagStatus from_xmp_status(XmpDecodeStatus status) noexcept
    {
        switch (status) {
        case XmpDecodeStatus::Ok: return TagStatus::Ok;
        case XmpDecodeStatus::Unsupported:
        case XmpDecodeStatus::Malformed: return TagStatus::Malformed;
        case XmpDecodeStatus::LimitExceeded: return TagStatus::LimitExceeded;
        }
        return TagStatus::Malformed;
    }

}  // namespace

TagStatus
TagStore::open(const char* path, const TagStoreLimits& limits) noexcept
{
    path_.clear();
    tags_.clear();
    forms_.clear();
    namespaces_ = XmpNamespaces();
    limits_     = limits;

    FileHandle file;
    if (file.open(path, FileMode::Read) != FileStatus::Ok) {
        return TagStatus::OpenFailed;
    }

    const JpegScanResult scan = scan_jpeg_header(file, limits.jpeg);
    if (scan.status != JpegStatus::Ok) {
        return from_jpeg_status(scan.status);
    }

    const int32_t xmp_index = find_xmp_segment(scan);
    if (xmp_index >= 0) {
        std::vector<std::byte> packet;
        const JpegStatus rs = read_segment_data(
            file, scan.segments[static_cast<size_t>(xmp_index)], &packet);
        if (rs != JpegStatus::Ok) {
            return from_jpeg_status(rs);
        }
        if (!packet.empty()) {
            const XmpDecodeResult decoded = decode_xmp_packet(
                std::span<const std::byte>(packet.data(), packet.size()),
                namespaces_, tags_, &forms_, limits.xmp);
            if (decoded.status != XmpDecodeStatus::Ok) {
                tags_.clear();
                forms_.clear();
                return from_xmp_status(decoded.status);
            }
        }
    }

    path_.assign(path);
    return TagStatus::Ok;
}


const std::string*
TagStore::get_string(std::string_view key) const noexcept
{
    return tags_.find(key);
}


TagStatus
TagStore::validate_key(std::string_view key) const noexcept
{
    std::vector<XmpPathStep> steps;
    if (!parse_xmp_key(key, &steps)) {
        return TagStatus::InvalidKey;
    }
    for (const XmpPathStep& step : steps) {
        if (step.index == 0U && namespaces_.uri_for(step.prefix).empty()) {
            return TagStatus::UnknownNamespace;
        }
    }
    return TagStatus::Ok;
}


TagStatus
TagStore::set_string(std::string_view key, std::string_view value) noexcept
{
    const TagStatus st = validate_key(key);
    if (st != TagStatus::Ok) {
        return st;
    }
    tags_.set(key, value);
    return TagStatus::Ok;
}


bool
TagStore::clear(std::string_view key) noexcept
{
    return tags_.erase_tree(key) > 0U;
}


uint32_t
TagStore::clear_prefix(std::string_view prefix) noexcept
{
    std::vector<std::string> doomed;
    for (const auto& [key, value] : tags_) {
        if (std::string_view(key).substr(0, prefix.size()) == prefix) {
            doomed.push_back(key);
        }
    }
    for (const std::string& key : doomed) {
        (void)tags_.erase(key);
    }
    return static_cast<uint32_t>(doomed.size());
}


void
TagStore::clear_all() noexcept
{
    tags_.clear();
}


std::vector<std::string>
TagStore::keys() const
{
    return tags_.keys();
}


TagStatus
TagStore::replace_snapshot(const TagSnapshot& tags) noexcept
{
    for (const auto& [key, value] : tags) {
        const TagStatus st = validate_key(key);
        if (st != TagStatus::Ok) {
            return st;
        }
    }
    tags_ = tags;
    return TagStatus::Ok;
}


bool
TagStore::register_namespace(std::string_view prefix, std::string_view uri)
{
    return namespaces_.register_namespace(prefix, uri);
}


TagStatus
TagStore::save(const char* path, const StreamCopyOptions& options) const noexcept
{
    if (!path || !*path) {
        return TagStatus::OpenFailed;
    }

    std::string packet;
    if (!tags_.empty()) {
        const XmpEncodeResult enc = encode_xmp_packet(tags_, namespaces_,
                                                      &forms_, &packet);
        if (enc.status == XmpEncodeStatus::InvalidKey) {
            return TagStatus::InvalidKey;
        }
        if (enc.status == XmpEncodeStatus::UnknownNamespace) {
            return TagStatus::UnknownNamespace;
        }
    }

    FileHandle src;
    if (src.open(path, FileMode::Read) != FileStatus::Ok) {
        return TagStatus::OpenFailed;
    }
    const JpegScanResult scan = scan_jpeg_header(src, limits_.jpeg);
    if (scan.status != JpegStatus::Ok) {
        return from_jpeg_status(scan.status);
    }
    if (kJpegXmpSignature.size() + packet.size() > kJpegMaxSegmentPayload) {
        return TagStatus::LimitExceeded;
    }

    std::string temp_path;
    FileHandle dst;
    if (dst.open_temp(path, &temp_path) != FileStatus::Ok) {
        return TagStatus::WriteFailed;
    }
    // The replacement keeps the permissions of the file it renames over.
    if (dst.copy_mode_from(src) != FileStatus::Ok) {
        (void)dst.close();
        (void)std::remove(temp_path.c_str());
        return TagStatus::WriteFailed;
    }

    const JpegStatus ws = rewrite_jpeg_xmp(src, scan, packet, dst, options);
    const bool closed   = dst.close();
    if (ws != JpegStatus::Ok || !closed) {
        (void)std::remove(temp_path.c_str());
        return ws != JpegStatus::Ok ? from_jpeg_status(ws)
                                    : TagStatus::WriteFailed;
    }

    if (std::rename(temp_path.c_str(), path) != 0) {
        (void)std::remove(temp_path.c_str());
        return TagStatus::WriteFailed;
    }
    return TagStatus::Ok;
}


const char*
tag_status_name(TagStatus status) noexcept
{
    switch (status) {
    case TagStatus::Ok: return "ok";
    case TagStatus::OpenFailed: return "open_failed";
    case TagStatus::Unsupported: return "unsupported";
    case TagStatus::Malformed: return "malformed";
    case TagStatus::LimitExceeded: return "limit_exceeded";
    case TagStatus::InvalidKey: return "invalid_key";
    case TagStatus::UnknownNamespace: return "unknown_namespace";
    case TagStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}

}  // namespace livephoto
