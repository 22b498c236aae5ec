#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file tag_snapshot.h
 * \brief Ordered, flat key/value view of a file's XMP tags.
 */

namespace livephoto {

/**
 * \brief Ordered string-keyed tag map (unique keys).
 *
 * Keys use the flat `Xmp.<prefix>.<path>` form, for example
 * `Xmp.GCamera.MicroVideoOffset` or
 * `Xmp.Container.Directory[2]/Container:Item/Item:Mime`.
 *
 * Iteration order is lexicographic by key.
 */
class TagSnapshot final {
public:
    using Map            = std::map<std::string, std::string, std::less<>>;
    using const_iterator = Map::const_iterator;

    TagSnapshot() = default;

    /// Returns the value for \p key, or nullptr when absent.
    const std::string* find(std::string_view key) const noexcept;
    /// Returns the value for \p key, or an empty view when absent.
    std::string_view get(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Inserts or overwrites \p key.
    void set(std::string_view key, std::string_view value);
    /// Removes \p key. Returns true when it was present.
    bool erase(std::string_view key) noexcept;
    /// Removes \p key and every key that continues it with `[` or `/`.
    uint32_t erase_tree(std::string_view key) noexcept;
    void clear() noexcept;

    size_t size() const noexcept;
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    std::vector<std::string> keys() const;

    friend bool operator==(const TagSnapshot& a,
                           const TagSnapshot& b) = default;

private:
    Map map_;
};

}  // namespace livephoto
