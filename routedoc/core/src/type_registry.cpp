#include "routedoc/core/type_registry.hpp"

namespace routedoc {

type_handle type_registry::primitive(std::string_view name) {
    return intern(type_kind::primitive, std::string(name), nullptr);
}

type_handle type_registry::composite(std::string_view name) {
    return intern(type_kind::composite, std::string(name), nullptr);
}

type_handle type_registry::pointer_to(type_handle pointee) {
    if (!pointee) {
        return nullptr;
    }
    std::string name;
    name.reserve(pointee->name().size() + 1);
    name.push_back('*');
    name.append(pointee->name());
    return intern(type_kind::pointer, std::move(name), pointee);
}

type_handle type_registry::array_of(type_handle element) {
    if (!element) {
        return nullptr;
    }
    std::string name;
    name.reserve(element->name().size() + 2);
    name.append("[]");
    name.append(element->name());
    return intern(type_kind::array, std::move(name), element);
}

type_handle type_registry::find(std::string_view name) const noexcept {
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

type_handle type_registry::intern(type_kind kind, std::string name, type_handle element) {
    if (auto it = by_name_.find(name); it != by_name_.end()) {
        // A name registered under another kind is a conflicting declaration.
        return it->second->kind() == kind ? it->second : nullptr;
    }
    types_.emplace_back(kind, name, element);
    type_handle h = &types_.back();
    by_name_.emplace(std::move(name), h);
    return h;
}

} // namespace routedoc
