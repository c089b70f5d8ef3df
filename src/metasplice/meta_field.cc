#include "metasplice/meta_field.h"

namespace metasplice {

std::string_view
meta_namespace_name(MetaNamespace ns) noexcept
{
    switch (ns) {
    case MetaNamespace::Exif: return "exif";
    case MetaNamespace::PngText: return "png_text";
    case MetaNamespace::Xmp: return "xmp";
    }
    return "unknown";
}


FieldMap::FieldMap(MetaNamespace ns) noexcept
    : ns_(ns)
{
}


MetaNamespace
FieldMap::ns() const noexcept
{
    return ns_;
}


bool
FieldMap::set(std::string_view key, std::string_view value, TypeHint hint)
{
    const auto it = index_.find(std::string(key));
    if (it != index_.end()) {
        MetaField& f = entries_[it->second];
        f.value.assign(value.data(), value.size());
        f.type_hint = hint;
        return false;
    }

    MetaField f;
    f.ns = ns_;
    f.key.assign(key.data(), key.size());
    f.value.assign(value.data(), value.size());
    f.type_hint = hint;
    index_.emplace(f.key, entries_.size());
    entries_.push_back(std::move(f));
    return true;
}


bool
FieldMap::insert_if_absent(std::string_view key, std::string_view value,
                           TypeHint hint)
{
    if (contains(key)) {
        return false;
    }
    return set(key, value, hint);
}


const MetaField*
FieldMap::find(std::string_view key) const noexcept
{
    const auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}


bool
FieldMap::contains(std::string_view key) const noexcept
{
    return find(key) != nullptr;
}


bool
FieldMap::erase(std::string_view key)
{
    const auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}


std::span<const MetaField>
FieldMap::entries() const noexcept
{
    return std::span<const MetaField>(entries_.data(), entries_.size());
}


size_t
FieldMap::size() const noexcept
{
    return entries_.size();
}


bool
FieldMap::empty() const noexcept
{
    return entries_.empty();
}


void
FieldMap::clear() noexcept
{
    entries_.clear();
    index_.clear();
}


void
FieldMap::rebuild_index()
{
    index_.clear();
    index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].key, i);
    }
}

}  // namespace metasplice
