#include "metasplice/xmp_packet.h"

#include "metasplice/datetime_format.h"

#include "text_encoding_internal.h"

#include <cstdio>
#include <utility>

namespace metasplice {
namespace {

    struct XmpFieldMapping final {
        std::string_view key;
        std::string_view ns_uri;
        std::string_view name;
        XmpForm form;
    };

    static constexpr XmpFieldMapping kFieldMappings[] = {
        { "description", kXmpNsDc, "description", XmpForm::LangAlt },
        { "artist", kXmpNsDc, "creator", XmpForm::Seq },
        { "copyright", kXmpNsDc, "rights", XmpForm::LangAlt },
        { "software", kXmpNsXmp, "CreatorTool", XmpForm::Simple },
        { "user_comment", kXmpNsXmp, "Label", XmpForm::Simple },
        { "datetime", kXmpNsXmp, "ModifyDate", XmpForm::Simple },
    };

    struct WellKnownNamespace final {
        std::string_view prefix;
        std::string_view uri;
    };

    static constexpr WellKnownNamespace kWellKnown[] = {
        { "dc", kXmpNsDc },
        { "xmp", kXmpNsXmp },
        { "xmpMM", "http://ns.adobe.com/xap/1.0/mm/" },
        { "exif", "http://ns.adobe.com/exif/1.0/" },
        { "tiff", "http://ns.adobe.com/tiff/1.0/" },
        { "photoshop", "http://ns.adobe.com/photoshop/1.0/" },
        { kXmpServicePrefix, kXmpNsService },
    };

    static const XmpFieldMapping* mapping_by_key(std::string_view key) noexcept
    {
        for (const XmpFieldMapping& m : kFieldMappings) {
            if (m.key == key) {
                return &m;
            }
        }
        return nullptr;
    }


    static const XmpFieldMapping* mapping_by_name(std::string_view ns_uri,
                                                  std::string_view name) noexcept
    {
        for (const XmpFieldMapping& m : kFieldMappings) {
            if (m.ns_uri == ns_uri && m.name == name) {
                return &m;
            }
        }
        return nullptr;
    }


    static std::string_view well_known_uri(std::string_view prefix) noexcept
    {
        for (const WellKnownNamespace& ns : kWellKnown) {
            if (ns.prefix == prefix) {
                return ns.uri;
            }
        }
        return {};
    }


    static std::string_view well_known_prefix(std::string_view uri) noexcept
    {
        for (const WellKnownNamespace& ns : kWellKnown) {
            if (ns.uri == uri) {
                return ns.prefix;
            }
        }
        return "ns";
    }


    static bool is_name_start(char c) noexcept
    {
        const unsigned char u = static_cast<unsigned char>(c);
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'
               || u >= 0x80U;
    }


    static bool is_name_char(char c) noexcept
    {
        return is_name_start(c) || (c >= '0' && c <= '9') || c == '-'
               || c == '.';
    }


    /// XML name without a colon. Non-ASCII UTF-8 is accepted as name chars.
    static bool is_ncname(std::string_view s) noexcept
    {
        if (s.empty() || !is_name_start(s[0])) {
            return false;
        }
        for (char c : s) {
            if (!is_name_char(c)) {
                return false;
            }
        }
        return text_internal::is_valid_utf8(s);
    }


    static bool is_xml_safe_text(std::string_view s) noexcept
    {
        for (char c : s) {
            const unsigned char u = static_cast<unsigned char>(c);
            if (u < 0x20U && c != '\t' && c != '\n' && c != '\r') {
                return false;
            }
            if (u == 0x7FU) {
                return false;
            }
        }
        return text_internal::is_valid_utf8(s);
    }


    struct ResolvedUpdate final {
        std::string ns_uri;
        std::string preferred_prefix;
        std::string name;
        XmpForm new_form = XmpForm::Simple;
        std::string value;
    };

    static CodecStatus resolve_update(const XmpPacket& packet,
                                      const MetaField& field,
                                      ResolvedUpdate* out)
    {
        if (!is_xml_safe_text(field.value)) {
            return CodecStatus::InvalidFieldValue;
        }

        const XmpFieldMapping* m = mapping_by_key(field.key);
        if (m) {
            out->ns_uri.assign(m->ns_uri);
            out->name.assign(m->name);
        } else {
            const size_t colon = field.key.find(':');
            if (colon == std::string::npos) {
                if (!is_ncname(field.key)) {
                    return CodecStatus::InvalidFieldValue;
                }
                out->ns_uri.assign(kXmpNsService);
                out->name = field.key;
            } else {
                const std::string_view key(field.key);
                const std::string_view prefix = key.substr(0, colon);
                const std::string_view local  = key.substr(colon + 1);
                if (!is_ncname(prefix) || !is_ncname(local)) {
                    return CodecStatus::InvalidFieldValue;
                }
                std::string_view uri = packet.namespace_uri(prefix);
                if (uri.empty()) {
                    uri = well_known_uri(prefix);
                }
                if (uri.empty()) {
                    return CodecStatus::InvalidFieldValue;
                }
                out->ns_uri.assign(uri);
                out->preferred_prefix.assign(prefix);
                out->name.assign(local);
            }
        }
        if (out->preferred_prefix.empty()) {
            out->preferred_prefix.assign(well_known_prefix(out->ns_uri));
        }

        const XmpFieldMapping* standard = mapping_by_name(out->ns_uri,
                                                          out->name);
        out->new_form = standard ? standard->form : XmpForm::Simple;
        if (standard && standard->key == "datetime") {
            return normalize_xmp_datetime(field.value, &out->value);
        }
        out->value = field.value;
        return CodecStatus::Ok;
    }

}  // namespace

std::string
XmpPacket::index_key(std::string_view ns_uri, std::string_view name)
{
    std::string key;
    key.reserve(ns_uri.size() + name.size() + 1);
    key.append(ns_uri);
    key.push_back('|');
    key.append(name);
    return key;
}


const XmpProperty*
XmpPacket::find(std::string_view ns_uri, std::string_view name) const noexcept
{
    const auto it = index_.find(index_key(ns_uri, name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &props_[it->second];
}


void
XmpPacket::upsert(XmpProperty prop)
{
    std::string key = index_key(prop.ns_uri, prop.name);
    const auto it   = index_.find(key);
    if (it != index_.end()) {
        props_[it->second] = std::move(prop);
        return;
    }
    index_.emplace(std::move(key), props_.size());
    props_.push_back(std::move(prop));
}


bool
XmpPacket::declare_namespace(std::string_view prefix, std::string_view uri)
{
    const std::string_view bound = namespace_uri(prefix);
    if (!bound.empty()) {
        return bound == uri;
    }
    XmpNamespace ns;
    ns.prefix.assign(prefix);
    ns.uri.assign(uri);
    namespaces_.push_back(std::move(ns));
    return true;
}


std::string_view
XmpPacket::namespace_uri(std::string_view prefix) const noexcept
{
    for (const XmpNamespace& ns : namespaces_) {
        if (ns.prefix == prefix) {
            return ns.uri;
        }
    }
    return {};
}


std::string_view
XmpPacket::namespace_prefix(std::string_view uri) const noexcept
{
    for (const XmpNamespace& ns : namespaces_) {
        if (ns.uri == uri) {
            return ns.prefix;
        }
    }
    return {};
}


std::string
XmpPacket::ensure_namespace(std::string_view uri, std::string_view preferred)
{
    const std::string_view existing = namespace_prefix(uri);
    if (!existing.empty()) {
        return std::string(existing);
    }
    if (!preferred.empty() && declare_namespace(preferred, uri)) {
        return std::string(preferred);
    }
    char buf[32];
    for (uint32_t n = 1;; ++n) {
        std::snprintf(buf, sizeof(buf), "ns%u", static_cast<unsigned>(n));
        if (declare_namespace(buf, uri)) {
            return std::string(buf);
        }
    }
}


std::span<const XmpProperty>
XmpPacket::properties() const noexcept
{
    return props_;
}


std::span<const XmpNamespace>
XmpPacket::namespaces() const noexcept
{
    return namespaces_;
}


size_t
XmpPacket::size() const noexcept
{
    return props_.size();
}


bool
XmpPacket::empty() const noexcept
{
    return props_.empty();
}


CodecStatus
apply_xmp_updates(std::span<const MetaField> updates, XmpPacket* packet,
                  std::string* failed_key) noexcept
{
    if (!packet) {
        return CodecStatus::UnsupportedOperation;
    }

    std::vector<ResolvedUpdate> resolved(updates.size());
    for (size_t i = 0; i < updates.size(); ++i) {
        const CodecStatus st = resolve_update(*packet, updates[i],
                                              &resolved[i]);
        if (st != CodecStatus::Ok) {
            if (failed_key) {
                *failed_key = updates[i].key;
            }
            return st;
        }
    }

    for (ResolvedUpdate& u : resolved) {
        XmpProperty prop;
        const XmpProperty* old = packet->find(u.ns_uri, u.name);
        if (old) {
            prop.prefix = old->prefix;
            prop.form   = (old->form == XmpForm::Raw) ? XmpForm::Simple
                                                      : old->form;
        } else {
            prop.prefix = packet->ensure_namespace(u.ns_uri,
                                                   u.preferred_prefix);
            prop.form   = u.new_form;
        }
        prop.ns_uri = std::move(u.ns_uri);
        prop.name   = std::move(u.name);
        prop.value  = std::move(u.value);
        packet->upsert(std::move(prop));
    }
    return CodecStatus::Ok;
}


void
collect_xmp_fields(const XmpPacket& packet, FieldMap* out)
{
    std::string key;
    for (const XmpProperty& p : packet.properties()) {
        const XmpFieldMapping* m = mapping_by_name(p.ns_uri, p.name);
        TypeHint hint            = TypeHint::Utf8;
        if (m) {
            key.assign(m->key);
            if (m->key == "datetime") {
                hint = TypeHint::DateTime;
            }
        } else if (p.ns_uri == kXmpNsService) {
            key = p.name;
        } else {
            key = p.prefix;
            key.push_back(':');
            key.append(p.name);
        }
        (void)out->insert_if_absent(key, p.value, hint);
    }
}

}  // namespace metasplice
