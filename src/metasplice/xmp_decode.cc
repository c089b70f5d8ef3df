#include "metasplice/xmp_decode.h"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <expat.h>

namespace metasplice {
namespace {

    /// Expat name triplet: `uri|local|prefix`, `uri|local` or `local`.
    struct NameParts final {
        std::string_view uri;
        std::string_view local;
        std::string_view prefix;
    };

    static NameParts split_name(const XML_Char* name_c) noexcept
    {
        const std::string_view name(name_c, std::strlen(name_c));
        NameParts parts;
        const size_t sep = name.find('|');
        if (sep == std::string_view::npos) {
            parts.local = name;
            return parts;
        }
        parts.uri                 = name.substr(0, sep);
        const std::string_view rest = name.substr(sep + 1);
        const size_t sep2           = rest.find('|');
        if (sep2 == std::string_view::npos) {
            parts.local = rest;
            return parts;
        }
        parts.local  = rest.substr(0, sep2);
        parts.prefix = rest.substr(sep2 + 1);
        return parts;
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


    static void append_joined(std::string* out, std::string_view item)
    {
        if (!out->empty()) {
            out->append("; ");
        }
        out->append(item);
    }


    enum class FrameKind : uint8_t {
        Other,
        Description,
        Property,
        Container,
        Item,
        Nested,
    };

    struct Frame final {
        FrameKind kind         = FrameKind::Other;
        bool had_child_element = false;
        std::string text;
        std::string lang;
    };

    /// State of the top-level property being decoded.
    struct PropertyState final {
        bool active = false;
        size_t depth = 0;
        std::string uri;
        std::string prefix;
        std::string name;
        uint64_t start_offset = 0;
        uint64_t start_end    = 0;
        XmpForm form          = XmpForm::Simple;
        bool complex          = false;
        bool has_resource     = false;
        std::string resource;
        std::vector<std::pair<std::string, std::string>> items;
        std::string leaf_text;
        /// `xmlns` attributes the raw start tag needs to stand alone.
        std::string scope_decls;
    };

    struct Ctx final {
        XmpPacket* packet = nullptr;
        XmpDecodeOptions options;
        CodecStatus status = CodecStatus::Ok;
        XML_Parser parser  = nullptr;
        std::string_view input;

        uint32_t description_depth = 0;
        uint32_t properties_seen   = 0;
        PropertyState prop;
        std::vector<Frame> stack;
        /// Namespace bindings in scope, innermost last. An empty prefix is
        /// the default namespace.
        std::vector<XmpNamespace> scope;
        /// Bindings declared on the element about to start.
        size_t pending_decls = 0;
    };

    static bool should_stop(const Ctx* ctx) noexcept
    {
        return !ctx || !ctx->parser || ctx->status != CodecStatus::Ok;
    }


    static void stop_parser(Ctx* ctx, CodecStatus status) noexcept
    {
        merge_status(&ctx->status, status);
        XML_StopParser(ctx->parser, XML_FALSE);
    }


    static bool count_property(Ctx* ctx) noexcept
    {
        const uint32_t max_props = ctx->options.limits.max_properties;
        if (max_props != 0U && ctx->properties_seen >= max_props) {
            stop_parser(ctx, CodecStatus::ResourceLimitExceeded);
            return false;
        }
        ctx->properties_seen += 1;
        return true;
    }


    /// Stores \p prop unless the name repeats. Properties whose prefix is
    /// missing or bound elsewhere get a generated prefix; their raw markup
    /// carries its own declarations.
    static void store_property(Ctx* ctx, XmpProperty prop)
    {
        if (ctx->packet->find(prop.ns_uri, prop.name)) {
            return;
        }
        if (prop.prefix.empty()
            || ctx->packet->namespace_uri(prop.prefix) != prop.ns_uri) {
            prop.prefix = ctx->packet->ensure_namespace(prop.ns_uri, "");
            if (prop.raw_xml.empty() && prop.form == XmpForm::Raw) {
                prop.form = XmpForm::Simple;
            }
        }
        ctx->packet->upsert(std::move(prop));
    }


    static void append_attr_escaped(std::string* out, std::string_view s)
    {
        for (const char c : s) {
            switch (c) {
            case '&': out->append("&amp;"); break;
            case '<': out->append("&lt;"); break;
            case '"': out->append("&quot;"); break;
            default: out->push_back(c); break;
            }
        }
    }


    /// Builds the declarations for outer bindings that the packet-level
    /// namespaces do not reproduce. \p own_decls bindings at the top of the
    /// scope belong to the property element itself.
    static std::string outer_scope_decls(const Ctx* ctx, size_t own_decls)
    {
        const std::vector<XmpNamespace>& scope = ctx->scope;
        const size_t outer = scope.size() - own_decls;
        std::string decls;
        std::vector<std::string_view> seen;
        for (size_t i = scope.size(); i > 0; --i) {
            const XmpNamespace& b = scope[i - 1];
            bool shadowed = false;
            for (const std::string_view s : seen) {
                if (s == b.prefix) {
                    shadowed = true;
                    break;
                }
            }
            if (shadowed) {
                continue;
            }
            seen.push_back(b.prefix);
            if (i - 1 >= outer || b.prefix == "xml") {
                continue;
            }
            if (b.prefix.empty()) {
                if (b.uri.empty()) {
                    continue;
                }
                decls.append(" xmlns=\"");
            } else {
                if ((b.prefix == "x" && b.uri == kXmpNsMeta)
                    || (b.prefix == "rdf" && b.uri == kXmpNsRdf)
                    || ctx->packet->namespace_uri(b.prefix) == b.uri) {
                    continue;
                }
                decls.append(" xmlns:");
                decls.append(b.prefix);
                decls.append("=\"");
            }
            append_attr_escaped(&decls, b.uri);
            decls.push_back('"');
        }
        return decls;
    }


    /// Inserts \p decls after the element name of the start tag in \p raw.
    static void insert_start_tag_decls(std::string* raw,
                                       std::string_view decls)
    {
        if (decls.empty() || raw->empty() || (*raw)[0] != '<') {
            return;
        }
        size_t pos = 1;
        while (pos < raw->size() && !is_ascii_ws((*raw)[pos])
               && (*raw)[pos] != '/' && (*raw)[pos] != '>') {
            pos += 1;
        }
        raw->insert(pos, decls);
    }


    static void decode_description_attributes(Ctx* ctx,
                                              const XML_Char** atts)
    {
        for (int i = 0; atts[i] && atts[i + 1]; i += 2) {
            const NameParts ap = split_name(atts[i]);
            if (ap.uri.empty() || ap.local.empty() || ap.uri == kXmpNsRdf
                || ap.uri == kXmpNsXml) {
                continue;
            }
            if (!count_property(ctx)) {
                return;
            }
            XmpProperty prop;
            prop.ns_uri.assign(ap.uri);
            prop.prefix.assign(ap.prefix);
            prop.name.assign(ap.local);
            prop.value.assign(atts[i + 1]);
            store_property(ctx, std::move(prop));
        }
    }


    static void begin_property(Ctx* ctx, const NameParts& parts,
                               const XML_Char** atts, size_t own_decls)
    {
        PropertyState& p = ctx->prop;
        p                = PropertyState {};
        p.active         = true;
        p.depth          = ctx->stack.size();
        p.uri.assign(parts.uri);
        p.prefix.assign(parts.prefix);
        p.name.assign(parts.local);
        p.scope_decls = outer_scope_decls(ctx, own_decls);
        p.start_offset = static_cast<uint64_t>(
            XML_GetCurrentByteIndex(ctx->parser));
        p.start_end = p.start_offset
                      + static_cast<uint64_t>(
                          XML_GetCurrentByteCount(ctx->parser));

        for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
            const NameParts ap = split_name(atts[i]);
            if (ap.uri == kXmpNsXml && ap.local == "lang") {
                continue;
            }
            if (ap.uri == kXmpNsRdf && ap.local == "resource") {
                p.has_resource = true;
                p.resource.assign(atts[i + 1]);
            }
            p.complex = true;
        }
    }


    static void finish_property(Ctx* ctx)
    {
        PropertyState& p = ctx->prop;
        p.active         = false;
        if (!count_property(ctx)) {
            return;
        }

        uint64_t end = static_cast<uint64_t>(
                           XML_GetCurrentByteIndex(ctx->parser))
                       + static_cast<uint64_t>(
                           XML_GetCurrentByteCount(ctx->parser));
        if (end < p.start_end) {
            end = p.start_end;
        }

        XmpProperty prop;
        prop.ns_uri = std::move(p.uri);
        prop.prefix = std::move(p.prefix);
        prop.name   = std::move(p.name);
        if (p.start_offset <= end && end <= ctx->input.size()) {
            prop.raw_xml.assign(ctx->input.substr(
                static_cast<size_t>(p.start_offset),
                static_cast<size_t>(end - p.start_offset)));
            insert_start_tag_decls(&prop.raw_xml, p.scope_decls);
        }

        if (p.has_resource) {
            prop.form  = XmpForm::Raw;
            prop.value = std::move(p.resource);
        } else if (p.complex) {
            prop.form = XmpForm::Raw;
            for (const auto& item : p.items) {
                const std::string_view t = trim_ascii_ws(item.second);
                if (!t.empty()) {
                    append_joined(&prop.value, t);
                }
            }
            if (!p.leaf_text.empty()) {
                append_joined(&prop.value, p.leaf_text);
            }
        } else if (p.form == XmpForm::LangAlt) {
            prop.form = XmpForm::LangAlt;
            for (const auto& item : p.items) {
                if (item.first == "x-default") {
                    prop.value = item.second;
                    break;
                }
            }
            if (prop.value.empty() && !p.items.empty()) {
                prop.value = p.items.front().second;
            }
        } else if (p.form == XmpForm::Seq || p.form == XmpForm::Bag) {
            prop.form = p.form;
            for (const auto& item : p.items) {
                append_joined(&prop.value, item.second);
            }
        } else {
            prop.form  = XmpForm::Simple;
            prop.value = std::move(p.leaf_text);
        }
        store_property(ctx, std::move(prop));
    }


    static XmpForm container_form(std::string_view local) noexcept
    {
        if (local == "Alt") {
            return XmpForm::LangAlt;
        }
        if (local == "Seq") {
            return XmpForm::Seq;
        }
        if (local == "Bag") {
            return XmpForm::Bag;
        }
        return XmpForm::Raw;
    }


    static bool only_lang_attribute(const XML_Char** atts, std::string* lang)
    {
        for (int i = 0; atts && atts[i] && atts[i + 1]; i += 2) {
            const NameParts ap = split_name(atts[i]);
            if (ap.uri == kXmpNsXml && ap.local == "lang") {
                lang->assign(atts[i + 1]);
                continue;
            }
            return false;
        }
        return true;
    }


    static void XMLCALL start_element(void* user_data, const XML_Char* name_c,
                                      const XML_Char** atts)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (!ctx) {
            return;
        }
        const size_t own_decls = ctx->pending_decls;
        ctx->pending_decls     = 0;
        if (should_stop(ctx) || !name_c) {
            return;
        }
        const uint32_t max_depth = ctx->options.limits.max_depth;
        if (max_depth != 0U && ctx->stack.size() >= max_depth) {
            stop_parser(ctx, CodecStatus::ResourceLimitExceeded);
            return;
        }

        Frame* parent = ctx->stack.empty() ? nullptr : &ctx->stack.back();
        if (parent) {
            parent->had_child_element = true;
        }

        const NameParts parts = split_name(name_c);
        const bool is_rdf     = (parts.uri == kXmpNsRdf);

        Frame frame;
        PropertyState& p = ctx->prop;
        if (p.active) {
            const size_t rel = ctx->stack.size() - p.depth;
            if (rel == 1 && is_rdf && container_form(parts.local) != XmpForm::Raw
                && p.form == XmpForm::Simple && !p.complex) {
                frame.kind = FrameKind::Container;
                p.form     = container_form(parts.local);
                if (atts && atts[0]) {
                    p.complex = true;
                }
            } else if (rel == 2 && parent->kind == FrameKind::Container
                       && is_rdf && parts.local == "li"
                       && only_lang_attribute(atts, &frame.lang)) {
                frame.kind = FrameKind::Item;
            } else {
                frame.kind = FrameKind::Nested;
                p.complex  = true;
            }
        } else if (is_rdf && parts.local == "Description") {
            frame.kind = FrameKind::Description;
            ctx->description_depth += 1;
            if (ctx->options.decode_description_attributes && atts) {
                decode_description_attributes(ctx, atts);
            }
        } else if (ctx->description_depth > 0 && parent
                   && parent->kind == FrameKind::Description && !is_rdf
                   && !parts.uri.empty()) {
            frame.kind = FrameKind::Property;
            begin_property(ctx, parts, atts, own_decls);
        }
        ctx->stack.push_back(std::move(frame));
    }


    static void XMLCALL end_element(void* user_data, const XML_Char* /*name*/)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx)) {
            return;
        }
        if (ctx->stack.empty()) {
            stop_parser(ctx, CodecStatus::MalformedContainer);
            return;
        }

        Frame frame = std::move(ctx->stack.back());
        ctx->stack.pop_back();
        PropertyState& p = ctx->prop;

        switch (frame.kind) {
        case FrameKind::Description:
            ctx->description_depth -= 1;
            break;
        case FrameKind::Item:
            p.items.emplace_back(std::move(frame.lang), std::move(frame.text));
            break;
        case FrameKind::Nested:
            if (!frame.had_child_element) {
                const std::string_view t = trim_ascii_ws(frame.text);
                if (!t.empty()) {
                    append_joined(&p.leaf_text, t);
                }
            }
            break;
        case FrameKind::Property:
            if (!p.complex && p.form == XmpForm::Simple) {
                p.leaf_text = std::move(frame.text);
            }
            finish_property(ctx);
            break;
        default: break;
        }
    }


    static void XMLCALL char_data(void* user_data, const XML_Char* s, int len)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx) || !s || len <= 0 || ctx->stack.empty()) {
            return;
        }
        Frame& frame = ctx->stack.back();
        if (frame.kind == FrameKind::Other
            || frame.kind == FrameKind::Description) {
            return;
        }
        const uint32_t max_val = ctx->options.limits.max_value_bytes;
        if (max_val != 0U
            && frame.text.size() + static_cast<size_t>(len) > max_val) {
            stop_parser(ctx, CodecStatus::ResourceLimitExceeded);
            return;
        }
        frame.text.append(s, static_cast<size_t>(len));
    }


    static void XMLCALL start_namespace(void* user_data,
                                        const XML_Char* prefix,
                                        const XML_Char* uri)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx)) {
            return;
        }
        XmpNamespace binding;
        if (prefix) {
            binding.prefix.assign(prefix);
        }
        if (uri) {
            binding.uri.assign(uri);
        }
        ctx->scope.push_back(std::move(binding));
        ctx->pending_decls += 1;
        if (!prefix || !uri) {
            return;
        }
        const std::string_view pfx(prefix);
        const std::string_view u(uri);
        if ((pfx == "x" && u == kXmpNsMeta) || (pfx == "rdf" && u == kXmpNsRdf)
            || pfx == "xml") {
            return;
        }
        // A prefix rebound to a second URI is resolved per property.
        (void)ctx->packet->declare_namespace(pfx, u);
    }


    static void XMLCALL end_namespace(void* user_data, const XML_Char* prefix)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (should_stop(ctx)) {
            return;
        }
        const std::string_view pfx = prefix ? std::string_view(prefix)
                                            : std::string_view();
        for (size_t i = ctx->scope.size(); i > 0; --i) {
            if (ctx->scope[i - 1].prefix == pfx) {
                ctx->scope.erase(ctx->scope.begin()
                                 + static_cast<std::ptrdiff_t>(i - 1));
                return;
            }
        }
    }


    static void XMLCALL start_doctype(void* user_data,
                                      const XML_Char* /*name*/,
                                      const XML_Char* /*sysid*/,
                                      const XML_Char* /*pubid*/,
                                      int /*has_internal_subset*/)
    {
        Ctx* ctx = reinterpret_cast<Ctx*>(user_data);
        if (!should_stop(ctx)) {
            stop_parser(ctx, CodecStatus::MalformedContainer);
        }
    }

}  // namespace

CodecStatus
decode_xmp_packet(std::span<const std::byte> xmp_bytes,
                  const XmpDecodeOptions& options, XmpPacket* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }

    // JPEG writers sometimes pad the packet with NULs.
    size_t size = xmp_bytes.size();
    while (size > 0 && xmp_bytes[size - 1] == std::byte { 0 }) {
        size -= 1;
    }
    if (size == 0) {
        return CodecStatus::MalformedContainer;
    }
    const uint64_t max_in = options.limits.max_input_bytes;
    if ((max_in != 0U && size > max_in)
        || size > static_cast<size_t>(INT_MAX)) {
        return CodecStatus::ResourceLimitExceeded;
    }

    Ctx ctx;
    ctx.packet  = out;
    ctx.options = options;
    ctx.input   = std::string_view(reinterpret_cast<const char*>(
                                     xmp_bytes.data()),
                                 size);

    ctx.parser = XML_ParserCreateNS(nullptr, '|');
    if (!ctx.parser) {
        return CodecStatus::ResourceLimitExceeded;
    }
    XML_SetReturnNSTriplet(ctx.parser, XML_TRUE);
    XML_SetUserData(ctx.parser, &ctx);
    XML_SetElementHandler(ctx.parser, &start_element, &end_element);
    XML_SetCharacterDataHandler(ctx.parser, &char_data);
    XML_SetStartNamespaceDeclHandler(ctx.parser, &start_namespace);
    XML_SetEndNamespaceDeclHandler(ctx.parser, &end_namespace);
    XML_SetStartDoctypeDeclHandler(ctx.parser, &start_doctype);

    const XML_Status st = XML_Parse(ctx.parser, ctx.input.data(),
                                    static_cast<int>(size), XML_TRUE);
    if (st == XML_STATUS_ERROR && ctx.status == CodecStatus::Ok) {
        merge_status(&ctx.status, CodecStatus::MalformedContainer);
    }

    XML_ParserFree(ctx.parser);
    ctx.parser = nullptr;
    return ctx.status;
}

}  // namespace metasplice
