#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * \file meta_field.h
 * \brief Namespaced key/value metadata fields and their ordered container.
 */

namespace metasplice {

/// Metadata family a field was read from or is written to.
enum class MetaNamespace : uint8_t {
    Exif,
    PngText,
    Xmp,
};

/// Optional hint describing how a value was (or will be) stored on the wire.
enum class TypeHint : uint8_t {
    None,
    Ascii,
    Latin1,
    Utf8,
    Utf16,
    Rational,
    DateTime,
    Undefined,
};

/// Returns "exif", "png_text" or "xmp".
std::string_view
meta_namespace_name(MetaNamespace ns) noexcept;

/**
 * \brief A single decoded or requested metadata value.
 *
 * Keys are case-sensitive. Values are UTF-8.
 */
struct MetaField final {
    MetaNamespace ns = MetaNamespace::Exif;
    std::string key;
    std::string value;
    TypeHint type_hint = TypeHint::None;
};

/**
 * \brief Insertion-ordered map of unique keys within one namespace.
 *
 * Storage is an array of fields plus a hash index, so iteration keeps the
 * order keys were first inserted in while lookups stay O(1). Replacing the
 * value of an existing key keeps its position.
 */
class FieldMap final {
public:
    FieldMap() = default;
    explicit FieldMap(MetaNamespace ns) noexcept;

    MetaNamespace ns() const noexcept;

    /// Inserts or replaces \p key. Returns true when the key was new.
    bool set(std::string_view key, std::string_view value,
             TypeHint hint = TypeHint::None);

    /// Inserts \p key only when it is not present yet. Returns true on insert.
    bool insert_if_absent(std::string_view key, std::string_view value,
                          TypeHint hint = TypeHint::None);

    const MetaField* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Removes \p key and closes the gap, preserving the order of the rest.
    bool erase(std::string_view key);

    std::span<const MetaField> entries() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;
    void clear() noexcept;

private:
    void rebuild_index();

    MetaNamespace ns_ = MetaNamespace::Exif;
    std::vector<MetaField> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace metasplice
