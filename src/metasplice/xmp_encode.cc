#include "metasplice/xmp_encode.h"

#include <algorithm>
#include <cstdint>
#include <string>

namespace metasplice {
namespace {

    static constexpr std::string_view kIndent1 = " ";
    static constexpr std::string_view kIndent2 = "  ";
    static constexpr std::string_view kIndent3 = "   ";
    static constexpr std::string_view kIndent4 = "    ";
    static constexpr std::string_view kIndent5 = "     ";

    struct PacketWriter final {
        std::vector<std::byte>* out = nullptr;
        uint64_t max_output         = 0;
        bool limit_hit              = false;

        PacketWriter(std::vector<std::byte>* dst,
                     uint64_t max_output_bytes) noexcept
            : out(dst)
            , max_output(max_output_bytes)
        {
        }

        void append(std::string_view s)
        {
            if (limit_hit || s.empty()) {
                return;
            }
            if (max_output != 0U
                && static_cast<uint64_t>(out->size()) + s.size() > max_output) {
                limit_hit = true;
                return;
            }
            const std::byte* p = reinterpret_cast<const std::byte*>(s.data());
            out->insert(out->end(), p, p + s.size());
        }

        void append_char(char c) { append(std::string_view(&c, 1)); }
    };


    /// Text and attribute escaping. Values are validated UTF-8 without
    /// disallowed control characters, so only markup needs escaping.
    static void append_xml_escaped(std::string_view s, PacketWriter* w)
    {
        for (char c : s) {
            switch (c) {
            case '&': w->append("&amp;"); break;
            case '<': w->append("&lt;"); break;
            case '>': w->append("&gt;"); break;
            case '"': w->append("&quot;"); break;
            case '\r': w->append("&#xD;"); break;
            default: w->append_char(c); break;
            }
        }
    }


    static void append_qname(const XmpProperty& p, PacketWriter* w)
    {
        w->append(p.prefix);
        w->append_char(':');
        w->append(p.name);
    }


    static void emit_array(const XmpProperty& p, std::string_view container,
                           PacketWriter* w)
    {
        w->append(kIndent3);
        w->append_char('<');
        append_qname(p, w);
        w->append(">\n");
        w->append(kIndent4);
        w->append("<rdf:");
        w->append(container);
        w->append(">\n");
        w->append(kIndent5);
        if (p.form == XmpForm::LangAlt) {
            w->append("<rdf:li xml:lang=\"x-default\">");
        } else {
            w->append("<rdf:li>");
        }
        append_xml_escaped(p.value, w);
        w->append("</rdf:li>\n");
        w->append(kIndent4);
        w->append("</rdf:");
        w->append(container);
        w->append(">\n");
        w->append(kIndent3);
        w->append("</");
        append_qname(p, w);
        w->append(">\n");
    }


    static void emit_property(const XmpProperty& p, PacketWriter* w)
    {
        if (!p.raw_xml.empty()) {
            w->append(kIndent3);
            w->append(p.raw_xml);
            w->append_char('\n');
            return;
        }
        switch (p.form) {
        case XmpForm::LangAlt: emit_array(p, "Alt", w); return;
        case XmpForm::Seq: emit_array(p, "Seq", w); return;
        case XmpForm::Bag: emit_array(p, "Bag", w); return;
        default: break;
        }
        w->append(kIndent3);
        w->append_char('<');
        append_qname(p, w);
        w->append_char('>');
        append_xml_escaped(p.value, w);
        w->append("</");
        append_qname(p, w);
        w->append(">\n");
    }

}  // namespace

CodecStatus
encode_xmp_packet(const XmpPacket& packet, const XmpLimits& limits,
                  std::vector<std::byte>* out)
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    out->clear();

    std::vector<const XmpNamespace*> decls;
    decls.reserve(packet.namespaces().size());
    for (const XmpNamespace& ns : packet.namespaces()) {
        decls.push_back(&ns);
    }
    std::sort(decls.begin(), decls.end(),
              [](const XmpNamespace* a, const XmpNamespace* b) {
                  return a->prefix < b->prefix;
              });

    PacketWriter w(out, limits.max_packet_bytes);
    w.append("<?xpacket begin=\"\xEF\xBB\xBF\" id=\"");
    w.append(kXmpPacketId);
    w.append("\"?>\n");
    w.append("<x:xmpmeta xmlns:x=\"");
    w.append(kXmpNsMeta);
    w.append("\">\n");
    w.append(kIndent1);
    w.append("<rdf:RDF xmlns:rdf=\"");
    w.append(kXmpNsRdf);
    w.append("\">\n");
    w.append(kIndent2);
    w.append("<rdf:Description rdf:about=\"\"");
    for (const XmpNamespace* ns : decls) {
        w.append("\n");
        w.append(kIndent4);
        w.append("xmlns:");
        w.append(ns->prefix);
        w.append("=\"");
        append_xml_escaped(ns->uri, &w);
        w.append("\"");
    }
    w.append(">\n");

    for (const XmpProperty& p : packet.properties()) {
        emit_property(p, &w);
    }

    w.append(kIndent2);
    w.append("</rdf:Description>\n");
    w.append(kIndent1);
    w.append("</rdf:RDF>\n");
    w.append("</x:xmpmeta>\n");
    w.append("<?xpacket end=\"w\"?>");

    if (w.limit_hit) {
        out->clear();
        return CodecStatus::ResourceLimitExceeded;
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
