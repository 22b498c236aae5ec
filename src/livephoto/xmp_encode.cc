#include "livephoto/xmp_encode.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace livephoto {
namespace {

    static constexpr std::string_view kKeyPrefix = "Xmp.";

    static constexpr const char* kIndent1 = "  ";
    static constexpr const char* kIndent2 = "    ";

    struct Node final {
        bool has_value = false;
        std::string value;
        std::map<uint32_t, std::unique_ptr<Node>> items;
        std::map<std::string, std::unique_ptr<Node>> fields;
    };

    struct RootProperty final {
        std::string prefix;
        std::string name;
        Node node;
    };

    static bool is_name_char(char c) noexcept
    {
        return c != '.' && c != '/' && c != '[' && c != ']' && c != ':'
               && c != ' ' && c != '\0';
    }


    static size_t scan_name(std::string_view s, size_t pos) noexcept
    {
        size_t e = pos;
        while (e < s.size() && is_name_char(s[e])) {
            e += 1;
        }
        return e;
    }


    static Node* child_item(Node* node, uint32_t index)
    {
        std::unique_ptr<Node>& slot = node->items[index];
        if (!slot) {
            slot = std::make_unique<Node>();
        }
        return slot.get();
    }


    static Node* child_field(Node* node, std::string_view qualified)
    {
        std::unique_ptr<Node>& slot = node->fields[std::string(qualified)];
        if (!slot) {
            slot = std::make_unique<Node>();
        }
        return slot.get();
    }


    static void append_xml_escaped(std::string_view s, std::string* out)
    {
        for (size_t i = 0; i < s.size(); ++i) {
            const uint8_t c = static_cast<uint8_t>(s[i]);
            if (c == static_cast<uint8_t>('&')) {
                out->append("&amp;");
                continue;
            }
            if (c == static_cast<uint8_t>('<')) {
                out->append("&lt;");
                continue;
            }
            if (c == static_cast<uint8_t>('>')) {
                out->append("&gt;");
                continue;
            }
            if (c == static_cast<uint8_t>('\"')) {
                out->append("&quot;");
                continue;
            }
            if (c == static_cast<uint8_t>('\'')) {
                out->append("&apos;");
                continue;
            }

            // XML 1.0 cannot carry other C0 controls; they are dropped.
            if (c == 0x09U || c == 0x0AU || c == 0x0DU
                || (c >= 0x20U && c != 0x7FU)) {
                out->push_back(static_cast<char>(c));
                continue;
            }
            if (c == 0x7FU) {
                out->append("&#x7F;");
            }
        }
    }


    static void append_indent(uint32_t depth, std::string* out)
    {
        out->append(kIndent2);
        for (uint32_t i = 0; i < depth; ++i) {
            out->append(kIndent1);
        }
    }


    static const char* array_tag(XmpArrayForm form) noexcept
    {
        switch (form) {
        case XmpArrayForm::Seq: return "rdf:Seq";
        case XmpArrayForm::Bag: return "rdf:Bag";
        case XmpArrayForm::Alt: return "rdf:Alt";
        }
        return "rdf:Seq";
    }


    static XmpArrayForm lookup_form(const XmpArrayForms* forms,
                                    std::string_view flat_key) noexcept
    {
        if (!forms) {
            return XmpArrayForm::Seq;
        }
        const auto it = forms->find(flat_key);
        return it == forms->end() ? XmpArrayForm::Seq : it->second;
    }


    static void emit_property(std::string_view qualified, const Node& node,
                              const std::string& flat_key,
                              const XmpArrayForms* forms, uint32_t depth,
                              std::string* out);

    static void emit_array(const Node& node, const std::string& flat_key,
                           const XmpArrayForms* forms, uint32_t depth,
                           std::string* out)
    {
        const XmpArrayForm form = lookup_form(forms, flat_key);
        const char* tag         = array_tag(form);

        append_indent(depth, out);
        out->push_back('<');
        out->append(tag);
        out->append(">\n");

        for (const auto& [index, item] : node.items) {
            const std::string item_key = flat_key + "["
                                         + std::to_string(index) + "]";
            append_indent(depth + 1, out);
            out->append("<rdf:li");
            if (form == XmpArrayForm::Alt && index == 1U) {
                out->append(" xml:lang=\"x-default\"");
            }

            if (!item->items.empty()) {
                out->append(">\n");
                emit_array(*item, item_key, forms, depth + 2, out);
                append_indent(depth + 1, out);
                out->append("</rdf:li>\n");
            } else if (!item->fields.empty()) {
                out->append(" rdf:parseType=\"Resource\">\n");
                for (const auto& [qn, child] : item->fields) {
                    emit_property(qn, *child, item_key + "/" + qn, forms,
                                  depth + 2, out);
                }
                append_indent(depth + 1, out);
                out->append("</rdf:li>\n");
            } else {
                out->push_back('>');
                append_xml_escaped(item->value, out);
                out->append("</rdf:li>\n");
            }
        }

        append_indent(depth, out);
        out->append("</");
        out->append(tag);
        out->append(">\n");
    }


    static void emit_property(std::string_view qualified, const Node& node,
                              const std::string& flat_key,
                              const XmpArrayForms* forms, uint32_t depth,
                              std::string* out)
    {
        append_indent(depth, out);
        out->push_back('<');
        out->append(qualified);

        if (!node.items.empty()) {
            out->append(">\n");
            emit_array(node, flat_key, forms, depth + 1, out);
            append_indent(depth, out);
        } else if (!node.fields.empty()) {
            out->append(" rdf:parseType=\"Resource\">\n");
            for (const auto& [qn, child] : node.fields) {
                emit_property(qn, *child, flat_key + "/" + qn, forms,
                              depth + 1, out);
            }
            append_indent(depth, out);
        } else {
            out->push_back('>');
            append_xml_escaped(node.value, out);
        }

        out->append("</");
        out->append(qualified);
        out->append(">\n");
    }


    static bool is_simple(const Node& node) noexcept
    {
        return node.items.empty() && node.fields.empty();
    }

}  // namespace

bool
parse_xmp_key(std::string_view key, std::vector<XmpPathStep>* out)
{
    if (!out) {
        return false;
    }
    out->clear();

    if (key.size() <= kKeyPrefix.size()
        || key.substr(0, kKeyPrefix.size()) != kKeyPrefix) {
        return false;
    }

    size_t pos          = kKeyPrefix.size();
    const size_t pre_end = scan_name(key, pos);
    if (pre_end == pos || pre_end >= key.size() || key[pre_end] != '.') {
        return false;
    }
    XmpPathStep root;
    root.prefix = key.substr(pos, pre_end - pos);
    pos         = pre_end + 1;

    const size_t name_end = scan_name(key, pos);
    if (name_end == pos) {
        return false;
    }
    root.name = key.substr(pos, name_end - pos);
    out->push_back(root);
    pos = name_end;

    while (pos < key.size()) {
        if (key[pos] == '[') {
            const size_t close = key.find(']', pos);
            if (close == std::string_view::npos || close == pos + 1) {
                return false;
            }
            uint64_t index = 0;
            for (size_t i = pos + 1; i < close; ++i) {
                const char c = key[i];
                if (c < '0' || c > '9') {
                    return false;
                }
                index = index * 10U + static_cast<uint64_t>(c - '0');
                if (index > UINT32_MAX) {
                    return false;
                }
            }
            if (index == 0U) {
                return false;
            }
            XmpPathStep step;
            step.index = static_cast<uint32_t>(index);
            out->push_back(step);
            pos = close + 1;
            continue;
        }
        if (key[pos] == '/') {
            const size_t p_begin = pos + 1;
            const size_t p_end   = scan_name(key, p_begin);
            if (p_end == p_begin || p_end >= key.size() || key[p_end] != ':') {
                return false;
            }
            const size_t n_begin = p_end + 1;
            const size_t n_end   = scan_name(key, n_begin);
            if (n_end == n_begin) {
                return false;
            }
            XmpPathStep step;
            step.prefix = key.substr(p_begin, p_end - p_begin);
            step.name   = key.substr(n_begin, n_end - n_begin);
            out->push_back(step);
            pos = n_end;
            continue;
        }
        return false;
    }
    return true;
}


XmpEncodeResult
encode_xmp_packet(const TagSnapshot& tags, const XmpNamespaces& namespaces,
                  const XmpArrayForms* forms, std::string* out)
{
    XmpEncodeResult result;
    if (!out) {
        result.status = XmpEncodeStatus::InvalidKey;
        return result;
    }
    out->clear();

    std::map<std::string, RootProperty> roots;
    std::map<std::string, std::string_view> used_ns;
    std::vector<XmpPathStep> steps;

    for (const auto& [key, value] : tags) {
        if (!parse_xmp_key(key, &steps)) {
            result.status = XmpEncodeStatus::InvalidKey;
            result.key    = key;
            return result;
        }
        for (const XmpPathStep& step : steps) {
            if (step.index != 0U) {
                continue;
            }
            const std::string_view uri = namespaces.uri_for(step.prefix);
            if (uri.empty()) {
                result.status = XmpEncodeStatus::UnknownNamespace;
                result.key    = key;
                return result;
            }
            used_ns.emplace(std::string(step.prefix), uri);
        }

        const XmpPathStep& head = steps.front();
        std::string root_key("Xmp.");
        root_key.append(head.prefix);
        root_key.push_back('.');
        root_key.append(head.name);

        RootProperty& root = roots[root_key];
        root.prefix.assign(head.prefix.data(), head.prefix.size());
        root.name.assign(head.name.data(), head.name.size());

        Node* node = &root.node;
        for (size_t i = 1; i < steps.size(); ++i) {
            const XmpPathStep& step = steps[i];
            if (step.index != 0U) {
                node = child_item(node, step.index);
            } else {
                std::string qn(step.prefix);
                qn.push_back(':');
                qn.append(step.name);
                node = child_field(node, qn);
            }
        }
        node->has_value = true;
        node->value     = value;
        result.properties += 1;
    }

    std::string& w = *out;
    w.append("<?xpacket begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n");
    w.append("<x:xmpmeta xmlns:x=\"");
    w.append(kXmpNsX);
    w.append("\" x:xmptk=\"livephoto\">\n");
    w.append(kIndent1);
    w.append("<rdf:RDF xmlns:rdf=\"");
    w.append(kXmpNsRdf);
    w.append("\">\n");
    w.append(kIndent1);
    w.append(kIndent1);
    w.append("<rdf:Description rdf:about=\"\"");
    for (const auto& [prefix, uri] : used_ns) {
        w.append("\n");
        w.append(kIndent2);
        w.append(kIndent1);
        w.append("xmlns:");
        w.append(prefix);
        w.append("=\"");
        append_xml_escaped(uri, &w);
        w.append("\"");
    }
    for (const auto& [root_key, root] : roots) {
        if (!is_simple(root.node)) {
            continue;
        }
        w.append("\n");
        w.append(kIndent2);
        w.append(kIndent1);
        w.append(root.prefix);
        w.push_back(':');
        w.append(root.name);
        w.append("=\"");
        append_xml_escaped(root.node.value, &w);
        w.append("\"");
    }
    w.append(">\n");

    for (const auto& [root_key, root] : roots) {
        if (is_simple(root.node)) {
            continue;
        }
        const std::string qualified = root.prefix + ":" + root.name;
        emit_property(qualified, root.node, root_key, forms, 1, &w);
    }

    w.append(kIndent1);
    w.append(kIndent1);
    w.append("</rdf:Description>\n");
    w.append(kIndent1);
    w.append("</rdf:RDF>\n");
    w.append("</x:xmpmeta>\n");
    w.append("<?xpacket end=\"w\"?>");
    return result;
}

}  // namespace livephoto
