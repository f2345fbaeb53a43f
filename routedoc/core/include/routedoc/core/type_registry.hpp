#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace routedoc {

enum class type_kind : uint8_t { primitive, composite, pointer, array };

// Structural description of a model type. Pointer and array descriptors
// carry the handle of their pointee/element.
class type_descriptor {
public:
    type_descriptor(type_kind kind, std::string name, const type_descriptor* element = nullptr)
        : kind_(kind), name_(std::move(name)), element_(element) {}

    [[nodiscard]] type_kind kind() const noexcept { return kind_; }
    [[nodiscard]] std::string_view name() const noexcept { return name_; }
    [[nodiscard]] const type_descriptor* element() const noexcept { return element_; }

    [[nodiscard]] bool is_pointer() const noexcept { return kind_ == type_kind::pointer; }
    [[nodiscard]] bool is_array() const noexcept { return kind_ == type_kind::array; }

private:
    type_kind kind_;
    std::string name_;
    const type_descriptor* element_;
};

using type_handle = const type_descriptor*;

namespace detail {

template <typename T> struct sequence_traits : std::false_type {};

template <typename T, typename A> struct sequence_traits<std::vector<T, A>> : std::true_type {
    using element_type = T;
};

template <typename T, size_t N> struct sequence_traits<std::array<T, N>> : std::true_type {
    using element_type = T;
};

template <typename T> struct is_duration : std::false_type {};

template <typename R, typename P> struct is_duration<std::chrono::duration<R, P>> : std::true_type {};

template <typename T> constexpr std::string_view integer_name() noexcept {
    if constexpr (std::is_same_v<T, char> || std::is_same_v<T, char8_t>) {
        return "byte";
    } else if constexpr (std::is_same_v<T, char32_t>) {
        return "rune";
    } else if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "int8";
        else if constexpr (sizeof(T) == 2) return "int16";
        else if constexpr (sizeof(T) == 4) return "int32";
        else return "int64";
    } else {
        if constexpr (sizeof(T) == 1) return "uint8";
        else if constexpr (sizeof(T) == 2) return "uint16";
        else if constexpr (sizeof(T) == 4) return "uint32";
        else return "uint64";
    }
}

} // namespace detail

// Interning pool of type descriptors. Handles stay valid for the lifetime
// of the registry; descriptors with the same name and kind are shared.
class type_registry {
public:
    type_registry() = default;

    type_registry(const type_registry&) = delete;
    type_registry& operator=(const type_registry&) = delete;

    type_handle primitive(std::string_view name);
    type_handle composite(std::string_view name);
    // Returns nullptr for a null pointee/element.
    type_handle pointer_to(type_handle pointee);
    type_handle array_of(type_handle element);

    [[nodiscard]] type_handle find(std::string_view name) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return types_.size(); }

    // Binds a C++ class to a composite descriptor so that of<T>() can find it.
    template <typename T> type_handle declare(std::string_view name) {
        type_handle h = composite(name);
        if (h) {
            declared_[std::type_index(typeid(T))] = h;
        }
        return h;
    }

    // Descriptor for a C++ type. Undeclared class types yield nullptr.
    template <typename T> type_handle of() {
        using U = std::remove_cv_t<std::remove_reference_t<T>>;
        if constexpr (std::is_pointer_v<U>) {
            return pointer_to(of<std::remove_pointer_t<U>>());
        } else if constexpr (detail::sequence_traits<U>::value) {
            return array_of(of<typename detail::sequence_traits<U>::element_type>());
        } else if constexpr (std::is_same_v<U, bool>) {
            return primitive("bool");
        } else if constexpr (std::is_integral_v<U>) {
            return primitive(detail::integer_name<U>());
        } else if constexpr (std::is_same_v<U, float>) {
            return primitive("float32");
        } else if constexpr (std::is_floating_point_v<U>) {
            return primitive("float64");
        } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>) {
            return primitive("string");
        } else if constexpr (std::is_same_v<U, std::chrono::system_clock::time_point>) {
            return primitive("timestamp");
        } else if constexpr (detail::is_duration<U>::value) {
            return primitive("duration");
        } else {
            auto it = declared_.find(std::type_index(typeid(U)));
            return it == declared_.end() ? nullptr : it->second;
        }
    }

private:
    type_handle intern(type_kind kind, std::string name, type_handle element);

    std::deque<type_descriptor> types_;
    std::unordered_map<std::string, type_handle> by_name_;
    std::unordered_map<std::type_index, type_handle> declared_;
};

} // namespace routedoc
