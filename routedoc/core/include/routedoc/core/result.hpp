#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace routedoc {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    invalid_type_reference = 1,
    unresolved_type_name = 2,
    unknown_method = 3,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "routedoc"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::invalid_type_reference:
            return "invalid type reference";
        case ec::unresolved_type_name:
            return "naming policy could not resolve a type name";
        case ec::unknown_method:
            return "unknown http method";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace routedoc

namespace std {
template <> struct is_error_code_enum<routedoc::error_code> : true_type {};
} // namespace std
