#pragma once

#include "../pending_buffer.hpp"

namespace co::batch {

// =============================================================================
// Pending Message Buffer Implementation
// =============================================================================

inline void pending_message_buffer::set(std::shared_ptr<operation_request_message> request) {
    current_ = std::move(request);
    preamble_written_ = false;
}

inline void pending_message_buffer::set(std::shared_ptr<operation_response_message> response) {
    current_ = std::move(response);
    preamble_written_ = false;
}

inline void pending_message_buffer::reset() noexcept {
    current_ = std::monostate{};
    preamble_written_ = false;
}

inline bool pending_message_buffer::has_message() const noexcept {
    return current() != nullptr;
}

inline bool pending_message_buffer::is_current(const operation_message& message) const noexcept {
    return current() == &message;
}

inline operation_message* pending_message_buffer::current() const noexcept {
    if (auto* req = std::get_if<std::shared_ptr<operation_request_message>>(&current_)) {
        return req->get();
    }
    if (auto* resp = std::get_if<std::shared_ptr<operation_response_message>>(&current_)) {
        return resp->get();
    }
    return nullptr;
}

inline std::shared_ptr<operation_request_message> pending_message_buffer::request() const noexcept {
    if (auto* req = std::get_if<std::shared_ptr<operation_request_message>>(&current_)) {
        return *req;
    }
    return nullptr;
}

inline std::shared_ptr<operation_response_message> pending_message_buffer::response() const noexcept {
    if (auto* resp = std::get_if<std::shared_ptr<operation_response_message>>(&current_)) {
        return *resp;
    }
    return nullptr;
}

inline size_t pending_message_buffer::flush(text_writer& writer, version protocol_version, bool report_completed) {
    auto* message = current();
    if (message == nullptr) {
        return 0;
    }

    size_t before = writer.buffered();

    if (!preamble_written_) {
        if (auto resp = response()) {
            auto code = resp->status_code();
            writer.write(to_string(protocol_version));
            writer.write(" ");
            writer.write(std::to_string(code));
            writer.write(" ");
            writer.write_line(reason_phrase(code));
        }

        for (const auto& h : message->headers()) {
            writer.write(h.name);
            writer.write(": ");
            writer.write_line(h.value);
        }

        if (!message->content_id().empty() && !message->headers().contains(constants::content_id_header)) {
            writer.write(constants::content_id_header);
            writer.write(": ");
            writer.write_line(message->content_id());
        }

        // Separator between the preamble and the body
        writer.write_line();
        preamble_written_ = true;
        message->mark_completed();
    }

    size_t written = writer.buffered() - before;

    if (report_completed) {
        reset();
    }

    return written;
}

} // namespace co::batch
