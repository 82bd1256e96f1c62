#pragma once

#include "operation_message.hpp"
#include "sink.hpp"
#include <variant>

namespace co::batch {

// =============================================================================
// Pending Message Buffer
// =============================================================================
//
// Holds the operation whose preamble (status line for responses, headers,
// Content-ID, separator line) has not been written yet. Exactly zero or one
// of request/response is set at any time.

class pending_message_buffer {
public:
    pending_message_buffer() = default;

    void set(std::shared_ptr<operation_request_message> request);
    void set(std::shared_ptr<operation_response_message> response);

    // Drops the current handles without writing anything
    void reset() noexcept;

    bool has_message() const noexcept;
    bool is_current(const operation_message& message) const noexcept;

    operation_message* current() const noexcept;
    std::shared_ptr<operation_request_message> request() const noexcept;
    std::shared_ptr<operation_response_message> response() const noexcept;

    // Writes the preamble owed by the current message and completes it. With
    // report_completed the handles are released, so a second flush is a no-op.
    // Returns the number of bytes handed to the writer.
    size_t flush(text_writer& writer, version protocol_version, bool report_completed);

private:
    using message_variant = std::variant<
        std::monostate,
        std::shared_ptr<operation_request_message>,
        std::shared_ptr<operation_response_message>>;

    message_variant current_;
    bool preamble_written_ = false;
};

} // namespace co::batch

// Include implementation
#include "detail/pending_buffer_impl.hpp"
