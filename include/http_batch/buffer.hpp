#pragma once

#include <string>
#include <string_view>
#include <span>
#include <cstdint>

namespace co::batch {

// =============================================================================
// Output Buffer Interface
// =============================================================================

class output_buffer {
public:
    output_buffer() = default;
    explicit output_buffer(size_t initial_capacity);

    // Non-copyable, movable
    output_buffer(const output_buffer&) = delete;
    output_buffer& operator=(const output_buffer&) = delete;
    output_buffer(output_buffer&&) = default;
    output_buffer& operator=(output_buffer&&) = default;

    // Append data
    void append(std::string_view data);
    void append(std::span<const uint8_t> data);
    void append_line(std::string_view line);
    void append_line();

    // Access data
    std::string_view view() const noexcept;
    std::span<const uint8_t> span() const noexcept;
    size_t size() const noexcept;
    bool empty() const noexcept;

    void clear() noexcept;

    // Transfer ownership
    std::string release_string();

private:
    std::string buffer_;
};

} // namespace co::batch

// Include implementation
#include "detail/buffer_impl.hpp"
