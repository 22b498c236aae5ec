#pragma once

#include "livephoto/jpeg_segments.h"
#include "livephoto/stream_copy.h"
#include "livephoto/tag_snapshot.h"
#include "livephoto/xmp_decode.h"
#include "livephoto/xmp_namespaces.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file tag_store.h
 * \brief Read/modify/write access to the XMP tags of a JPEG file.
 */

namespace livephoto {

/// Tag store status.
enum class TagStatus : uint8_t {
    Ok,
    OpenFailed,
    /// The file is not a JPEG stream.
    Unsupported,
    Malformed,
    LimitExceeded,
    /// Key does not follow `Xmp.<prefix>.<name>[...]`.
    InvalidKey,
    /// Key prefix has no registered namespace URI.
    UnknownNamespace,
    WriteFailed,
};

struct TagStoreLimits final {
    JpegScanLimits jpeg;
    XmpDecodeLimits xmp;
};

/**
 * \brief Flat XMP tag map bound to a JPEG file.
 *
 * \ref open reads the first standard XMP packet of the file. Changes are
 * staged in memory; \ref save writes the whole tag set at once by
 * rewriting the file header into a temporary sibling and renaming it over
 * the target, so a failed save leaves the target untouched.
 */
class TagStore final {
public:
    TagStore() = default;

    /// Loads tags from \p path (replaces any previous state).
    TagStatus open(const char* path,
                   const TagStoreLimits& limits = TagStoreLimits {}) noexcept;

    /// Path passed to the last successful \ref open.
    const std::string& path() const noexcept { return path_; }

    /// Value of \p key, or nullptr when absent.
    const std::string* get_string(std::string_view key) const noexcept;

    TagStatus set_string(std::string_view key, std::string_view value) noexcept;

    /// Removes \p key and its array items/struct fields.
    bool clear(std::string_view key) noexcept;
    /// Removes every key starting with \p prefix. Returns the count removed.
    uint32_t clear_prefix(std::string_view prefix) noexcept;
    void clear_all() noexcept;

    std::vector<std::string> keys() const;
    const TagSnapshot& snapshot() const noexcept { return tags_; }

    /// Replaces all tags; fails without changes if any key is rejected.
    TagStatus replace_snapshot(const TagSnapshot& tags) noexcept;

    bool register_namespace(std::string_view prefix, std::string_view uri);
    const XmpNamespaces& namespaces() const noexcept { return namespaces_; }

    /// Checks \p key against the key grammar and the namespace registry.
    TagStatus validate_key(std::string_view key) const noexcept;

    /**
     * \brief Writes the staged tags into the JPEG file at \p path.
     *
     * \p path may differ from the opened file; its header is rewritten and
     * its remaining bytes are streamed through unchanged.
     */
    TagStatus save(const char* path,
                   const StreamCopyOptions& options
                   = StreamCopyOptions {}) const noexcept;

private:
    std::string path_;
    TagSnapshot tags_;
    XmpNamespaces namespaces_;
    XmpArrayForms forms_;
    TagStoreLimits limits_;
};

const char*
tag_status_name(TagStatus status) noexcept;

}  // namespace livephoto
