#pragma once

#include "../operation_message.hpp"
#include "../log.hpp"

namespace co::batch {

// =============================================================================
// Operation Stream Implementation
// =============================================================================

inline operation_stream::~operation_stream() {
    if (!disposed()) {
        if (auto r = dispose(); !r) {
            log::warn("operation stream disposal failed: {}", r.error().message());
        }
    }
}

inline operation_stream::operation_stream(operation_stream&& other) noexcept
    : sink_(std::exchange(other.sink_, nullptr)),
      listener_(std::exchange(other.listener_, nullptr)) {}

inline operation_stream& operation_stream::operator=(operation_stream&& other) noexcept {
    if (this != &other) {
        if (!disposed()) {
            if (auto r = dispose(); !r) {
                log::warn("operation stream disposal failed: {}", r.error().message());
            }
        }
        sink_ = std::exchange(other.sink_, nullptr);
        listener_ = std::exchange(other.listener_, nullptr);
    }
    return *this;
}

inline result<void> operation_stream::write(std::string_view data) {
    if (disposed()) {
        return fail(error_code::stream_already_disposed);
    }
    return sink_->write(data);
}

inline result<void> operation_stream::write(std::span<const uint8_t> data) {
    return write(std::string_view{reinterpret_cast<const char*>(data.data()), data.size()});
}

inline result<void> operation_stream::dispose() {
    if (disposed()) {
        return fail(error_code::stream_already_disposed);
    }
    auto* listener = std::exchange(listener_, nullptr);
    sink_ = nullptr;
    return listener->stream_disposed();
}

// =============================================================================
// Operation Message Implementation
// =============================================================================

inline result<void> operation_message::verify_not_completed() const {
    if (completed_) {
        return fail(error_code::operation_message_completed);
    }
    return {};
}

inline result<void> operation_message::set_header(std::string name, std::string value) {
    if (auto ok = verify_not_completed(); !ok) {
        return ok;
    }
    headers_.set(std::move(name), std::move(value));
    return {};
}

inline result<void> operation_message::remove_header(std::string_view name) {
    if (auto ok = verify_not_completed(); !ok) {
        return ok;
    }
    headers_.remove(name);
    return {};
}

inline result<operation_stream> operation_message::get_stream() {
    auto requested = listener_->stream_requested(*this);
    if (!requested) {
        return std::unexpected(requested.error());
    }
    return operation_stream{*sink_, *listener_};
}

inline std::future<result<operation_stream>> operation_message::get_stream_async() {
    auto requested = listener_->stream_requested_async(*this);
    return std::async(std::launch::deferred,
        [sink = sink_, listener = listener_, requested = std::move(requested)]() mutable
                -> result<operation_stream> {
            auto ready = requested.get();
            if (!ready) {
                return std::unexpected(ready.error());
            }
            return operation_stream{*sink, *listener};
        });
}

inline void operation_message::mark_completed() {
    if (completed_) {
        return;
    }
    completed_ = true;
    if (on_completed_) {
        on_completed_(*this);
    }
}

inline result<void> operation_response_message::set_status_code(unsigned int code) {
    if (auto ok = verify_not_completed(); !ok) {
        return ok;
    }
    status_code_ = code;
    return {};
}

} // namespace co::batch
