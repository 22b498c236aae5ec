#include "livephoto/xmp_namespaces.h"

#include <array>

namespace livephoto {
namespace {

    struct BuiltinNs final {
        std::string_view prefix;
        std::string_view uri;
    };

    static constexpr std::array<BuiltinNs, 14> kBuiltinNamespaces = { {
        { "GCamera", kXmpNsGCamera },
        { "Container", kXmpNsContainer },
        { "Item", kXmpNsContainerItem },
        { "Camera", "http://ns.google.com/photos/dd/1.0/camera/" },
        { "GImage", "http://ns.google.com/photos/1.0/image/" },
        { "GAudio", "http://ns.google.com/photos/1.0/audio/" },
        { "GDepth", "http://ns.google.com/photos/1.0/depthmap/" },
        { "hdrgm", "http://ns.adobe.com/hdr-gain-map/1.0/" },
        { "xmp", "http://ns.adobe.com/xap/1.0/" },
        { "xmpMM", "http://ns.adobe.com/xap/1.0/mm/" },
        { "dc", "http://purl.org/dc/elements/1.1/" },
        { "tiff", "http://ns.adobe.com/tiff/1.0/" },
        { "exif", "http://ns.adobe.com/exif/1.0/" },
        { "photoshop", "http://ns.adobe.com/photoshop/1.0/" },
    } };

}  // namespace

XmpNamespaces::XmpNamespaces()
{
    for (const BuiltinNs& ns : kBuiltinNamespaces) {
        (void)register_namespace(ns.prefix, ns.uri);
    }
}


bool
XmpNamespaces::register_namespace(std::string_view prefix,
                                  std::string_view uri)
{
    if (prefix.empty() || uri.empty()) {
        return false;
    }

    const auto old = by_prefix_.find(prefix);
    if (old != by_prefix_.end()) {
        const auto rev = by_uri_.find(old->second);
        if (rev != by_uri_.end() && rev->second == prefix) {
            by_uri_.erase(rev);
        }
        old->second.assign(uri.data(), uri.size());
    } else {
        by_prefix_.emplace(std::string(prefix), std::string(uri));
    }
    by_uri_.insert_or_assign(std::string(uri), std::string(prefix));
    return true;
}


void
XmpNamespaces::learn(std::string_view prefix, std::string_view uri)
{
    if (prefix.empty() || uri.empty()) {
        return;
    }
    if (!prefix_for(uri).empty()) {
        return;
    }
    if (!uri_for(prefix).empty()) {
        return;
    }
    (void)register_namespace(prefix, uri);
}


std::string_view
XmpNamespaces::uri_for(std::string_view prefix) const noexcept
{
    const auto it = by_prefix_.find(prefix);
    return it == by_prefix_.end() ? std::string_view {}
                                  : std::string_view(it->second);
}


std::string_view
XmpNamespaces::prefix_for(std::string_view uri) const noexcept
{
    const auto it = by_uri_.find(uri);
    return it == by_uri_.end() ? std::string_view {}
                               : std::string_view(it->second);
}

}  // namespace livephoto
