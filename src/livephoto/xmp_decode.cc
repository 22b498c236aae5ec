#include "livephoto/xmp_decode.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <expat.h>

namespace livephoto {
namespace {

    struct NameParts final {
        std::string_view uri;
        std::string_view local;
    };

    static NameParts split_name(std::string_view name) noexcept
    {
        const size_t sep = name.find('|');
        if (sep == std::string_view::npos) {
            return NameParts { std::string_view {}, name };
        }
        return NameParts { name.substr(0, sep), name.substr(sep + 1) };
    }


    static bool is_ascii_ws(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }


    static std::string_view trim_ascii_ws(std::string_view s) noexcept
    {
        size_t b = 0;
        while (b < s.size() && is_ascii_ws(s[b])) {
            b += 1;
        }
        size_t e = s.size();
        while (e > b && is_ascii_ws(s[e - 1])) {
            e -= 1;
        }
        return s.substr(b, e - b);
    }


    // JPEG APP1 payloads are often padded with NUL/whitespace after the
    // closing processing instruction.
    static std::span<const std::byte>
    trim_packet_padding(std::span<const std::byte> bytes) noexcept
    {
        size_t e = bytes.size();
        while (e > 0) {
            const char c = static_cast<char>(
                std::to_integer<uint8_t>(bytes[e - 1]));
            if (c != '\0' && !is_ascii_ws(c)) {
                break;
            }
            e -= 1;
        }
        return bytes.first(e);
    }


    struct Frame final {
        bool is_description      = false;
        bool is_array_container  = false;
        bool is_li               = false;
        bool is_nonrdf           = false;
        bool contributed_to_path = false;
        bool had_child_element   = false;
        bool emitted_value       = false;
        uint32_t path_len_before = 0;
        uint32_t li_counter      = 0;  // used for Seq/Bag/Alt
        std::string text;
    };

    struct Ctx final {
        TagSnapshot* out          = nullptr;
        XmpNamespaces* namespaces = nullptr;
        XmpArrayForms* forms      = nullptr;
        XmpDecodeLimits limits;
        XmpDecodeResult result;

        XML_Parser parser = nullptr;

        uint32_t description_depth = 0;

        // Key suffix after "Xmp.<root_prefix>.".
        std::string path;
        std::string root_prefix;

        std::vector<Frame> stack;
    };

    static bool should_stop(const Ctx* ctx) noexcept
    {
        return !ctx || !ctx->parser
               || ctx->result.status != XmpDecodeStatus::Ok;
    }


    static void stop_parser(Ctx* ctx, XmpDecodeStatus status) noexcept
    {
        if (!ctx) {
            return;
        }
        if (ctx->result.status == XmpDecodeStatus::Ok) {
            ctx->result.status = status;
        }
        if (ctx->parser) {
            XML_StopParser(ctx->parser, XML_FALSE);
        }
    }


    static bool path_fits(Ctx* ctx, uint64_t extra) noexcept
    {
        const uint32_t max_path = ctx->limits.max_path_bytes;
        const uint64_t needed   = static_cast<uint64_t>(ctx->path.size())
                                + static_cast<uint64_t>(ctx->root_prefix.size())
                                + 5U + extra;
        if (max_path != 0U && needed > max_path) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return false;
        }
        return true;
    }


    // Appends "/<prefix>:<local>" (or the bare root name when the path is
    // empty). Returns false when the namespace has no usable prefix.
    static bool path_append_field(Ctx* ctx, NameParts name) noexcept
    {
        const std::string_view prefix = ctx->namespaces->prefix_for(name.uri);
        if (prefix.empty() || name.local.empty()) {
            return false;
        }
        if (ctx->path.empty()) {
            if (!path_fits(ctx, name.local.size() + prefix.size())) {
                return false;
            }
            ctx->root_prefix.assign(prefix.data(), prefix.size());
            ctx->path.append(name.local.data(), name.local.size());
            return true;
        }
        if (!path_fits(ctx, prefix.size() + name.local.size() + 2U)) {
            return false;
        }
        ctx->path.push_back('/');
        ctx->path.append(prefix.data(), prefix.size());
        ctx->path.push_back(':');
        ctx->path.append(name.local.data(), name.local.size());
        return true;
    }


    static bool path_append_index(Ctx* ctx, uint32_t index) noexcept
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "[%u]", static_cast<unsigned>(index));
        const std::string_view s(buf, std::strlen(buf));
        if (!path_fits(ctx, s.size())) {
            return false;
        }
        ctx->path.append(s.data(), s.size());
        return true;
    }


    static std::string current_key(const Ctx* ctx)
    {
        std::string key;
        key.reserve(5U + ctx->root_prefix.size() + ctx->path.size());
        key.append("Xmp.");
        key.append(ctx->root_prefix);
        key.push_back('.');
        key.append(ctx->path);
        return key;
    }


    static Frame* find_nearest_array_container(Ctx* ctx) noexcept
    {
        for (size_t i = ctx->stack.size(); i > 0; --i) {
            Frame& f = ctx->stack[i - 1];
            if (f.is_array_container) {
                return &f;
            }
        }
        return nullptr;
    }


    static bool emit_value(Ctx* ctx, std::string_view value) noexcept
    {
        if (!ctx || !ctx->out || ctx->path.empty()
            || ctx->root_prefix.empty()) {
            return false;
        }
        if (ctx->result.entries_decoded >= ctx->limits.max_properties) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return false;
        }
        ctx->out->set(current_key(ctx), value);
        ctx->result.entries_decoded += 1;
        return true;
    }


    // Emits "<path>/<attr>" (or a root property when the path is empty) for
    // every attribute outside the rdf/xml namespaces.
    static bool emit_attribute_fields(Ctx* ctx, const XML_Char** atts) noexcept
    {
        bool emitted = false;
        if (!atts) {
            return emitted;
        }
        for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
            const std::string_view an(atts[i], std::strlen(atts[i]));
            const NameParts ap = split_name(an);
            if (ap.uri.empty() || ap.local.empty()) {
                continue;
            }
            if (ap.uri == kXmpNsRdf || ap.uri == kXmpNsXml) {
                continue;
            }

            const uint32_t path_before = static_cast<uint32_t>(
                ctx->path.size());
            const std::string root_before = ctx->root_prefix;
            if (!path_append_field(ctx, ap)) {
                if (should_stop(ctx)) {
                    return emitted;
                }
                continue;
            }
            const std::string_view av(atts[i + 1], std::strlen(atts[i + 1]));
            emitted |= emit_value(ctx, trim_ascii_ws(av));
            ctx->path.resize(path_before);
            ctx->root_prefix = root_before;
            if (should_stop(ctx)) {
                return emitted;
            }
        }
        return emitted;
    }


    static XmpArrayForm array_form(std::string_view local) noexcept
    {
        if (local == "Bag") {
            return XmpArrayForm::Bag;
        }
        if (local == "Alt") {
            return XmpArrayForm::Alt;
        }
        return XmpArrayForm::Seq;
    }


    static void XMLCALL start_namespace(void* user_data,
                                        const XML_Char* prefix,
                                        const XML_Char* uri)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !prefix || !uri) {
            return;
        }
        ctx->namespaces->learn(std::string_view(prefix, std::strlen(prefix)),
                               std::string_view(uri, std::strlen(uri)));
    }


    static void XMLCALL start_element(void* user_data, const XML_Char* name_c,
                                      const XML_Char** atts)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !name_c) {
            return;
        }

        if (ctx->stack.size() >= ctx->limits.max_depth) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return;
        }

        if (!ctx->stack.empty()) {
            ctx->stack.back().had_child_element = true;
        }

        const std::string_view name(name_c, std::strlen(name_c));
        const NameParts parts = split_name(name);
        const bool is_rdf     = (parts.uri == kXmpNsRdf);
        const bool is_xml     = (parts.uri == kXmpNsXml);
        const bool is_desc    = is_rdf && (parts.local == "Description");
        const bool is_seq     = is_rdf
                            && (parts.local == "Seq" || parts.local == "Bag"
                                || parts.local == "Alt");
        const bool is_li = is_rdf && (parts.local == "li");

        Frame frame;
        frame.is_description     = is_desc;
        frame.is_array_container = is_seq;
        frame.is_li              = is_li;
        frame.is_nonrdf          = (!is_rdf && !is_xml);
        frame.path_len_before    = static_cast<uint32_t>(ctx->path.size());

        if (frame.is_description) {
            ctx->description_depth += 1;
        }

        // A non-rdf element inside rdf:Description is a property path component.
        if (ctx->description_depth > 0 && frame.is_nonrdf) {
            if (path_append_field(ctx, parts)) {
                frame.contributed_to_path = true;
            } else if (should_stop(ctx)) {
                return;
            }
        }

        if (ctx->description_depth > 0 && is_seq && !ctx->path.empty()
            && ctx->forms) {
            ctx->forms->insert_or_assign(current_key(ctx),
                                         array_form(parts.local));
        }

        // Array item: append an index to the current property path.
        if (ctx->description_depth > 0 && frame.is_li && !ctx->path.empty()) {
            Frame* container = find_nearest_array_container(ctx);
            if (container) {
                if (container->li_counter == UINT32_MAX) {
                    stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
                    return;
                }
                container->li_counter += 1;
                frame.contributed_to_path = true;
                if (!path_append_index(ctx, container->li_counter)) {
                    return;
                }
            }
        }

        if (ctx->description_depth > 0 && atts) {
            if (frame.contributed_to_path) {
                for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
                    const std::string_view an(atts[i], std::strlen(atts[i]));
                    const NameParts ap = split_name(an);
                    if (ap.uri == kXmpNsRdf && ap.local == "resource") {
                        const std::string_view av(atts[i + 1],
                                                  std::strlen(atts[i + 1]));
                        frame.emitted_value = emit_value(ctx,
                                                         trim_ascii_ws(av));
                        break;
                    }
                }
            }
            // Attributes on rdf:Description (top-level or nested struct),
            // property elements and array items become fields.
            if (frame.is_description || frame.contributed_to_path) {
                if (emit_attribute_fields(ctx, atts)) {
                    frame.emitted_value = true;
                }
            }
            if (should_stop(ctx)) {
                return;
            }
        }

        ctx->stack.push_back(std::move(frame));
    }


    static void XMLCALL end_element(void* user_data, const XML_Char* /*name_c*/)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx)) {
            return;
        }
        if (ctx->stack.empty()) {
            stop_parser(ctx, XmpDecodeStatus::Malformed);
            return;
        }

        Frame frame = std::move(ctx->stack.back());
        ctx->stack.pop_back();

        // Leaf values only.
        if (ctx->description_depth > 0 && !ctx->path.empty()
            && frame.contributed_to_path && !frame.emitted_value
            && !frame.had_child_element) {
            if (frame.is_li || frame.is_nonrdf) {
                (void)emit_value(ctx, trim_ascii_ws(frame.text));
            }
        }

        if (frame.contributed_to_path) {
            if (frame.path_len_before <= ctx->path.size()) {
                ctx->path.resize(frame.path_len_before);
            } else {
                stop_parser(ctx, XmpDecodeStatus::Malformed);
                return;
            }
            if (ctx->path.empty()) {
                ctx->root_prefix.clear();
            }
        }

        if (frame.is_description) {
            if (ctx->description_depth == 0) {
                stop_parser(ctx, XmpDecodeStatus::Malformed);
                return;
            }
            ctx->description_depth -= 1;
        }
    }


    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !s || len <= 0) {
            return;
        }
        if (ctx->stack.empty()) {
            return;
        }

        Frame& frame = ctx->stack.back();
        if (ctx->description_depth == 0 || ctx->path.empty()) {
            return;
        }
        if (!frame.contributed_to_path || frame.emitted_value) {
            return;
        }

        const uint64_t have = static_cast<uint64_t>(frame.text.size());
        const uint32_t max_val = ctx->limits.max_value_bytes;
        if (max_val != 0U && have + static_cast<uint64_t>(len) > max_val) {
            stop_parser(ctx, XmpDecodeStatus::LimitExceeded);
            return;
        }
        frame.text.append(s, static_cast<size_t>(len));
    }

}  // namespace

XmpDecodeResult
decode_xmp_packet(std::span<const std::byte> xmp_bytes,
                  XmpNamespaces& namespaces, TagSnapshot& out,
                  XmpArrayForms* forms, const XmpDecodeLimits& limits) noexcept
{
    XmpDecodeResult result;

    xmp_bytes = trim_packet_padding(xmp_bytes);
    if (xmp_bytes.empty()) {
        result.status = XmpDecodeStatus::Unsupported;
        return result;
    }

    const uint64_t max_in = limits.max_input_bytes;
    if ((max_in != 0U && xmp_bytes.size() > max_in)
        || xmp_bytes.size() > static_cast<size_t>(INT32_MAX)) {
        result.status = XmpDecodeStatus::LimitExceeded;
        return result;
    }

    Ctx ctx;
    ctx.out        = &out;
    ctx.namespaces = &namespaces;
    ctx.forms      = forms;
    ctx.limits     = limits;
    ctx.path.reserve(limits.max_path_bytes);
    ctx.stack.reserve(limits.max_depth);

    ctx.parser = XML_ParserCreateNS(nullptr, '|');
    if (!ctx.parser) {
        result.status = XmpDecodeStatus::Malformed;
        return result;
    }

    XML_SetUserData(ctx.parser, &ctx);
    XML_SetElementHandler(ctx.parser, &start_element, &end_element);
    XML_SetCharacterDataHandler(ctx.parser, &char_data);
    XML_SetStartNamespaceDeclHandler(ctx.parser, &start_namespace);

    const char* data = reinterpret_cast<const char*>(xmp_bytes.data());
    const int size   = static_cast<int>(xmp_bytes.size());

    const XML_Status st = XML_Parse(ctx.parser, data, size, XML_TRUE);
    if (st == XML_STATUS_ERROR && ctx.result.status == XmpDecodeStatus::Ok) {
        // Treat "not XML" as Unsupported, otherwise Malformed.
        const enum XML_Error err = XML_GetErrorCode(ctx.parser);
        if (err == XML_ERROR_SYNTAX || err == XML_ERROR_NO_ELEMENTS) {
            ctx.result.status = XmpDecodeStatus::Unsupported;
        } else {
            ctx.result.status = XmpDecodeStatus::Malformed;
        }
    }

    XML_ParserFree(ctx.parser);
    ctx.parser = nullptr;

    result = ctx.result;
    return result;
}

}  // namespace livephoto
