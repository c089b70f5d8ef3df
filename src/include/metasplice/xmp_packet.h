#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/meta_field.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * \file xmp_packet.h
 * \brief Ordered XMP property model and the key mapping used by requests.
 */

namespace metasplice {

inline constexpr std::string_view kXmpNsRdf
    = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kXmpNsMeta = "adobe:ns:meta/";
inline constexpr std::string_view kXmpNsXml
    = "http://www.w3.org/XML/1998/namespace";
inline constexpr std::string_view kXmpNsDc = "http://purl.org/dc/elements/1.1/";
inline constexpr std::string_view kXmpNsXmp = "http://ns.adobe.com/xap/1.0/";

/// Namespace that carries keys without a standard XMP mapping.
inline constexpr std::string_view kXmpNsService
    = "https://example.com/image-metadata-service/1.0/";
inline constexpr std::string_view kXmpServicePrefix = "ims";

/// Resource limits for XMP parsing and serialization.
struct XmpLimits final {
    uint32_t max_depth      = 128;
    uint32_t max_properties = 20000;
    /// Packets above this size are rejected before parsing (0 = unlimited).
    uint64_t max_input_bytes = 16ULL * 1024ULL * 1024ULL;
    /// Max text bytes per decoded property value (0 = unlimited).
    uint32_t max_value_bytes = 8U * 1024U * 1024U;
    /// Serialized packets above this size are rejected (0 = unlimited).
    uint64_t max_packet_bytes = 16ULL * 1024ULL * 1024ULL;
};

/// How a property value is shaped in RDF.
enum class XmpForm : uint8_t {
    Simple,
    /// rdf:Alt of language-tagged items; the value is the x-default item.
    LangAlt,
    /// rdf:Seq; the value joins the items with "; ".
    Seq,
    /// rdf:Bag; the value joins the items with "; ".
    Bag,
    /// Anything else. Re-serialized from \ref XmpProperty::raw_xml.
    Raw,
};

/**
 * \brief One top-level property of the packet.
 *
 * \ref raw_xml holds the source markup of a decoded property and is emitted
 * verbatim until the property is updated.
 */
struct XmpProperty final {
    std::string ns_uri;
    std::string prefix;
    std::string name;
    XmpForm form = XmpForm::Simple;
    std::string value;
    std::string raw_xml;
};

struct XmpNamespace final {
    std::string prefix;
    std::string uri;
};

/**
 * \brief Properties in document order plus the namespace declarations seen.
 *
 * Lookups by (namespace URI, local name) go through a hash index; replacing
 * a property keeps its position.
 */
class XmpPacket final {
public:
    const XmpProperty* find(std::string_view ns_uri,
                            std::string_view name) const noexcept;

    /// Inserts \p prop or replaces the property with the same name.
    void upsert(XmpProperty prop);

    /// Records `prefix -> uri`. Returns false when \p prefix is already
    /// bound to a different URI.
    bool declare_namespace(std::string_view prefix, std::string_view uri);

    /// Returns the URI bound to \p prefix, or an empty view.
    std::string_view namespace_uri(std::string_view prefix) const noexcept;

    /// Returns the first prefix bound to \p uri, or an empty view.
    std::string_view namespace_prefix(std::string_view uri) const noexcept;

    /**
     * \brief Returns a prefix bound to \p uri, declaring one if needed.
     *
     * \p preferred is used when free; otherwise `ns1`, `ns2`, ... are tried.
     */
    std::string ensure_namespace(std::string_view uri,
                                 std::string_view preferred);

    std::span<const XmpProperty> properties() const noexcept;
    std::span<const XmpNamespace> namespaces() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

private:
    static std::string index_key(std::string_view ns_uri,
                                 std::string_view name);

    std::vector<XmpProperty> props_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<XmpNamespace> namespaces_;
};

/**
 * \brief Applies key/value updates to \p packet.
 *
 * Keys resolve as follows:
 * - `description`, `artist`, `copyright`, `software`, `user_comment` and
 *   `datetime` map to their standard properties (`datetime` is normalized
 *   to the XMP date form)
 * - `prefix:local` updates a property in a namespace declared by the packet
 *   or a well-known one (dc, xmp, xmpMM, exif, tiff, photoshop, ims)
 * - any other XML name goes to the service namespace
 *
 * Invalid names, invalid UTF-8 and control characters other than tab, LF and
 * CR fail with \ref CodecStatus::InvalidFieldValue; \p failed_key receives
 * the offending key. The packet is left untouched on failure.
 */
CodecStatus
apply_xmp_updates(std::span<const MetaField> updates, XmpPacket* packet,
                  std::string* failed_key) noexcept;

/**
 * \brief Surfaces every property of \p packet as a field.
 *
 * Standard properties use their friendly names, service-namespace
 * properties their local name and everything else `prefix:local`. The first
 * property wins when two surface under the same key.
 */
void
collect_xmp_fields(const XmpPacket& packet, FieldMap* out);

}  // namespace metasplice
