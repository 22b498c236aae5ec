#pragma once

#include "livephoto/tag_snapshot.h"
#include "livephoto/xmp_decode.h"
#include "livephoto/xmp_namespaces.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file xmp_encode.h
 * \brief Serializes a \ref TagSnapshot back into an XMP packet.
 */

namespace livephoto {

/// XMP encode result status.
enum class XmpEncodeStatus : uint8_t {
    Ok,
    /// A key is not of the form `Xmp.<prefix>.<name>[...]`.
    InvalidKey,
    /// A key uses a prefix that has no namespace URI.
    UnknownNamespace,
};

struct XmpEncodeResult final {
    XmpEncodeStatus status = XmpEncodeStatus::Ok;
    uint32_t properties    = 0;
    /// First offending key when `status != Ok`.
    std::string key;
};

/// One parsed step of a flat tag key.
struct XmpPathStep final {
    /// Array item index (1-based); 0 for a named field.
    uint32_t index = 0;
    std::string_view prefix;
    std::string_view name;
};

/**
 * \brief Splits `Xmp.<prefix>.<name>[n]/<p>:<f>...` into steps.
 *
 * The first step is always the top-level property. Returns false for keys
 * that do not follow the scheme.
 */
bool
parse_xmp_key(std::string_view key, std::vector<XmpPathStep>* out);

/**
 * \brief Emits a complete `<?xpacket?>`-wrapped XMP packet for \p tags.
 *
 * Simple top-level properties become attributes of `rdf:Description`;
 * arrays and structs become nested elements (`rdf:parseType="Resource"`
 * for structs). Array containers default to `rdf:Seq` unless \p forms says
 * otherwise. On failure \p out is left empty.
 */
XmpEncodeResult
encode_xmp_packet(const TagSnapshot& tags, const XmpNamespaces& namespaces,
                  const XmpArrayForms* forms, std::string* out);

}  // namespace livephoto
