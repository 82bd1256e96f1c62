#pragma once

#include "core.hpp"
#include "error.hpp"
#include "sink.hpp"
#include <functional>
#include <future>
#include <memory>
#include <span>

namespace co::batch {

class operation_message;

// =============================================================================
// Stream Listener
// =============================================================================
//
// Implemented by batch writers. An operation message reports through it when
// its body stream is requested and when that stream is disposed again.

class stream_listener {
public:
    virtual ~stream_listener() = default;

    virtual result<void> stream_requested(const operation_message& message) = 0;
    virtual std::future<result<void>> stream_requested_async(const operation_message& message) = 0;
    virtual result<void> stream_disposed() = 0;
};

// =============================================================================
// Operation Body Stream
// =============================================================================
//
// Writes an operation body straight into the sink. Disposal (explicit, or on
// destruction) hands the sink back to the batch writer.

class operation_stream {
public:
    operation_stream() = default;
    operation_stream(output_sink& sink, stream_listener& listener)
        : sink_(&sink), listener_(&listener) {}
    ~operation_stream();

    // Non-copyable, movable
    operation_stream(const operation_stream&) = delete;
    operation_stream& operator=(const operation_stream&) = delete;
    operation_stream(operation_stream&& other) noexcept;
    operation_stream& operator=(operation_stream&& other) noexcept;

    result<void> write(std::string_view data);
    result<void> write(std::span<const uint8_t> data);

    result<void> dispose();
    bool disposed() const noexcept { return listener_ == nullptr; }

private:
    output_sink* sink_ = nullptr;
    stream_listener* listener_ = nullptr;
};

// =============================================================================
// Operation Messages
// =============================================================================
//
// Handles for the operation currently being written. Headers may be changed
// until the writer flushes the operation preamble; afterwards the message is
// completed and mutation fails. A message must not outlive its writer.

class operation_message {
public:
    using completion_callback = std::function<void(const operation_message&)>;

    virtual ~operation_message() = default;

    // Non-copyable, non-movable (the writer tracks it by address)
    operation_message(const operation_message&) = delete;
    operation_message& operator=(const operation_message&) = delete;

    const header_list& headers() const noexcept { return headers_; }
    std::optional<std::string_view> get_header(std::string_view name) const noexcept {
        return headers_.get(name);
    }
    result<void> set_header(std::string name, std::string value);
    result<void> remove_header(std::string_view name);

    const std::string& content_id() const noexcept { return content_id_; }
    bool is_completed() const noexcept { return completed_; }

    // Fired once, when the preamble has been written
    void on_completed(completion_callback callback) { on_completed_ = std::move(callback); }

    result<operation_stream> get_stream();
    std::future<result<operation_stream>> get_stream_async();

protected:
    operation_message(output_sink& sink, stream_listener& listener, std::string content_id)
        : sink_(&sink), listener_(&listener), content_id_(std::move(content_id)) {}

    result<void> verify_not_completed() const;

private:
    friend class pending_message_buffer;

    void mark_completed();

    output_sink* sink_;
    stream_listener* listener_;
    std::string content_id_;
    header_list headers_;
    bool completed_ = false;
    completion_callback on_completed_;
};

class operation_request_message : public operation_message {
public:
    operation_request_message(output_sink& sink, stream_listener& listener,
                              std::string method, std::string uri, std::string content_id)
        : operation_message(sink, listener, std::move(content_id)),
          method_(std::move(method)), uri_(std::move(uri)) {}

    const std::string& method() const noexcept { return method_; }

    // The URI after resolution, as written on the request line's source
    const std::string& uri() const noexcept { return uri_; }

private:
    std::string method_;
    std::string uri_;
};

class operation_response_message : public operation_message {
public:
    operation_response_message(output_sink& sink, stream_listener& listener, std::string content_id)
        : operation_message(sink, listener, std::move(content_id)) {}

    unsigned int status_code() const noexcept { return status_code_; }
    result<void> set_status_code(unsigned int code);

private:
    unsigned int status_code_ = 200;
};

} // namespace co::batch

// Include implementation
#include "detail/operation_message_impl.hpp"
