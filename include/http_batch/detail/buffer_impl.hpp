#pragma once

#include "../buffer.hpp"
#include "../core.hpp"

namespace co::batch {

// =============================================================================
// Output Buffer Implementation
// =============================================================================

inline output_buffer::output_buffer(size_t initial_capacity) {
    buffer_.reserve(initial_capacity);
}

inline void output_buffer::append(std::string_view data) {
    buffer_.append(data);
}

inline void output_buffer::append(std::span<const uint8_t> data) {
    buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());
}

inline void output_buffer::append_line(std::string_view line) {
    buffer_.append(line);
    buffer_.append(constants::crlf);
}

inline void output_buffer::append_line() {
    buffer_.append(constants::crlf);
}

inline std::string_view output_buffer::view() const noexcept {
    return std::string_view{buffer_};
}

inline std::span<const uint8_t> output_buffer::span() const noexcept {
    return std::span<const uint8_t>{
        reinterpret_cast<const uint8_t*>(buffer_.data()),
        buffer_.size()
    };
}

inline size_t output_buffer::size() const noexcept {
    return buffer_.size();
}

inline bool output_buffer::empty() const noexcept {
    return buffer_.empty();
}

inline void output_buffer::clear() noexcept {
    buffer_.clear();
}

inline std::string output_buffer::release_string() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

} // namespace co::batch
