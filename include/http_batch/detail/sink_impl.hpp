#pragma once

#include "../sink.hpp"

namespace co::batch {

// =============================================================================
// Memory Sink Implementation
// =============================================================================

inline result<void> memory_sink::write(std::string_view data) {
    buffer_.append(data);
    ++write_count_;
    return {};
}

inline result<void> memory_sink::flush() {
    ++flush_count_;
    return {};
}

inline std::future<result<void>> memory_sink::flush_async() {
    std::promise<result<void>> done;
    done.set_value(flush());
    return done.get_future();
}

// =============================================================================
// Text Writer Implementation
// =============================================================================

inline void text_writer::write(std::string_view text) {
    buffer_.append(text);
}

inline void text_writer::write_line(std::string_view line) {
    buffer_.append_line(line);
}

inline void text_writer::write_line() {
    buffer_.append_line();
}

inline result<void> text_writer::flush() {
    if (buffer_.empty()) {
        return {};
    }
    auto written = sink_->write(buffer_.view());
    if (!written) {
        return std::unexpected(written.error());
    }
    buffer_.clear();
    return {};
}

} // namespace co::batch
