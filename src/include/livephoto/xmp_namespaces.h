#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

/**
 * \file xmp_namespaces.h
 * \brief Prefix <-> namespace URI registry used to name XMP tag keys.
 */

namespace livephoto {

inline constexpr std::string_view kXmpNsGCamera
    = "http://ns.google.com/photos/1.0/camera/";
inline constexpr std::string_view kXmpNsContainer
    = "http://ns.google.com/photos/1.0/container/";
inline constexpr std::string_view kXmpNsContainerItem
    = "http://ns.google.com/photos/1.0/container/item/";
inline constexpr std::string_view kXmpNsRdf
    = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kXmpNsXml
    = "http://www.w3.org/XML/1998/namespace";
inline constexpr std::string_view kXmpNsX = "adobe:ns:meta/";

/**
 * \brief Maps short prefixes (`GCamera`) to namespace URIs and back.
 *
 * A default-constructed registry knows the Google camera/container schemas
 * and the common Adobe/Dublin Core schemas. Prefixes declared in decoded
 * packets are learned on the fly (\ref learn).
 */
class XmpNamespaces final {
public:
    XmpNamespaces();

    /// Registers or replaces \p prefix. Returns false for empty input.
    bool register_namespace(std::string_view prefix, std::string_view uri);

    /**
     * \brief Records a declaration seen in a packet.
     *
     * Known URIs keep their registered prefix; a new URI is registered under
     * \p prefix unless that prefix already names another URI.
     */
    void learn(std::string_view prefix, std::string_view uri);

    /// URI registered for \p prefix, or empty.
    std::string_view uri_for(std::string_view prefix) const noexcept;
    /// Prefix registered for \p uri, or empty.
    std::string_view prefix_for(std::string_view uri) const noexcept;

private:
    std::map<std::string, std::string, std::less<>> by_prefix_;
    std::map<std::string, std::string, std::less<>> by_uri_;
};

}  // namespace livephoto
