#pragma once

#include "core.hpp"
#include <expected>
#include <system_error>

namespace co::batch {

// =============================================================================
// Error Category
// =============================================================================
//
// Every violation of the batch writing rules is one error kind ("invalid
// batch operation") carrying an error_code reason. Results are expressed as
// std::error_code so that failures of the output sink pass through the
// writer with their own category untouched.

class batch_error_category final : public std::error_category {
public:
    const char* name() const noexcept override { return "invalid batch operation"; }

    std::string message(int ev) const override {
        return to_string(static_cast<error_code>(ev));
    }
};

inline const std::error_category& batch_category() noexcept {
    static const batch_error_category category;
    return category;
}

inline std::error_code make_error_code(error_code e) noexcept {
    return {static_cast<int>(e), batch_category()};
}

// Result of a fallible batch operation
template<typename T>
using result = std::expected<T, std::error_code>;

inline std::unexpected<std::error_code> fail(error_code e) noexcept {
    return std::unexpected(make_error_code(e));
}

inline bool is_batch_error(const std::error_code& ec) noexcept {
    return ec.category() == batch_category();
}

} // namespace co::batch

template<>
struct std::is_error_code_enum<co::batch::error_code> : std::true_type {};
