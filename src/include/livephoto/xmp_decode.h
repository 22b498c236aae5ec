#pragma once

#include "livephoto/tag_snapshot.h"
#include "livephoto/xmp_namespaces.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>

/**
 * \file xmp_decode.h
 * \brief Decoder for XMP packets (RDF/XML) into flat tag keys.
 */

namespace livephoto {

/// XMP decode result status.
enum class XmpDecodeStatus : uint8_t {
    Ok,
    Unsupported,
    Malformed,
    LimitExceeded,
};

/// RDF array container used for an array-valued property.
enum class XmpArrayForm : uint8_t {
    Seq,
    Bag,
    Alt,
};

/// Array form per flat key (e.g. `Xmp.Container.Directory` -> Seq).
using XmpArrayForms = std::map<std::string, XmpArrayForm, std::less<>>;

/// Resource limits applied during XMP decode to bound hostile inputs.
struct XmpDecodeLimits final {
    uint32_t max_depth      = 128;
    uint32_t max_properties = 200000;

    /// Caps the input XMP packet size (0 = unlimited).
    uint64_t max_input_bytes = 64ULL * 1024ULL * 1024ULL;

    /// Max bytes per decoded key.
    uint32_t max_path_bytes = 1024;

    /// Max text bytes per decoded value.
    uint32_t max_value_bytes = 8U * 1024U * 1024U;
};

struct XmpDecodeResult final {
    XmpDecodeStatus status   = XmpDecodeStatus::Ok;
    uint32_t entries_decoded = 0;
};

/**
 * \brief Decodes an XMP packet and stores every property value in \p out.
 *
 * Keys follow the Exiv2 naming scheme: `Xmp.<prefix>.<name>` for top-level
 * properties, `[n]` (1-based) for array items and `/<prefix>:<name>` for
 * struct fields, e.g. `Xmp.Container.Directory[1]/Container:Item/Item:Mime`.
 *
 * Prefixes come from \p namespaces; namespaces declared in the packet that
 * the registry does not know yet are learned under their declared prefix.
 * A property repeated in the packet keeps its last value.
 *
 * \param forms Optional output for the RDF container of array properties.
 */
XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes,
                  XmpNamespaces& namespaces, TagSnapshot& out,
                  XmpArrayForms* forms         = nullptr,
                  const XmpDecodeLimits& limits = XmpDecodeLimits {}) noexcept;

}  // namespace livephoto
