#pragma once

#include "../multipart_writer.hpp"
#include "../log.hpp"

namespace co::batch {

// =============================================================================
// Construction
// =============================================================================

inline multipart_mixed_writer::multipart_mixed_writer(output_sink& sink, writer_settings settings)
    : settings_(std::move(settings)),
      sink_(&sink),
      text_(sink),
      boundaries_(settings_.boundary_id_source) {
    batch_boundary_ = settings_.batch_boundary.empty()
        ? boundaries_.batch_boundary(settings_.writing_response)
        : settings_.batch_boundary;
}

inline result<std::unique_ptr<multipart_mixed_writer>> multipart_mixed_writer::create(
        output_sink& sink, writer_settings settings) {
    if (auto valid = settings.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return std::make_unique<multipart_mixed_writer>(sink, std::move(settings));
}

// =============================================================================
// Batch
// =============================================================================

inline result<void> multipart_mixed_writer::start_batch() {
    if (auto ok = verify_transition(writer_state::batch_started); !ok) {
        return ok;
    }
    enter_state(writer_state::batch_started);
    return {};
}

inline result<void> multipart_mixed_writer::end_batch() {
    if (auto ok = verify_call_allowed(true); !ok) {
        return ok;
    }
    if (auto ok = verify_transition(writer_state::batch_completed); !ok) {
        return ok;
    }

    write_end_batch();

    if (auto ok = flush_text(); !ok) {
        return ok;
    }
    return sink_->flush();
}

inline std::future<result<void>> multipart_mixed_writer::end_batch_async() {
    if (auto ok = verify_call_allowed(false); !ok) {
        return ready(std::move(ok));
    }
    if (auto ok = verify_transition(writer_state::batch_completed); !ok) {
        return ready(std::move(ok));
    }

    write_end_batch();

    if (auto ok = flush_text(); !ok) {
        return ready(std::move(ok));
    }
    return sink_->flush_async();
}

inline void multipart_mixed_writer::write_end_batch() {
    write_pending_message_data(true);

    enter_state(writer_state::batch_completed);

    // A batch without any part still gets its closing delimiter
    write_end_boundary(text_, batch_boundary_, !batch_start_written_);

    // Trailing CRLF expected by older batch readers
    text_.write_line();
}

// =============================================================================
// Changesets
// =============================================================================

inline result<void> multipart_mixed_writer::start_changeset() {
    if (auto ok = verify_transition(writer_state::changeset_started); !ok) {
        return ok;
    }
    if (batch_parts_ + 1 > settings_.max_parts_per_batch) {
        return fault(error_code::max_batch_size_exceeded);
    }
    ++batch_parts_;

    write_pending_message_data(true);

    // Allocates the changeset boundary
    enter_state(writer_state::changeset_started);

    write_start_boundary(text_, batch_boundary_, !batch_start_written_);
    batch_start_written_ = true;

    write_changeset_preamble(text_, changeset_boundary_);
    changeset_start_written_ = false;
    return {};
}

inline result<void> multipart_mixed_writer::end_changeset() {
    if (auto ok = verify_transition(writer_state::changeset_completed); !ok) {
        return ok;
    }

    write_pending_message_data(true);

    std::string boundary = changeset_boundary_;
    enter_state(writer_state::changeset_completed);

    // An empty changeset is only its closing delimiter; the opening one is
    // never written after the fact.
    write_end_boundary(text_, boundary, !changeset_start_written_);

    // The last Content-ID of a changeset cannot be referenced any more
    previous_content_id_.reset();
    return {};
}

// =============================================================================
// Operations
// =============================================================================

inline result<std::shared_ptr<operation_request_message>>
multipart_mixed_writer::create_operation_request_message(std::string_view method, std::string_view uri,
                                                         std::string_view content_id, uri_option option) {
    if (auto ok = verify_not_faulted(); !ok) {
        return std::unexpected(ok.error());
    }
    if (settings_.writing_response) {
        return fault(error_code::cannot_create_request_when_writing_response);
    }
    if (auto ok = verify_transition(writer_state::operation_created); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_changeset_request(method, content_id, changeset_active()); !ok) {
        return fault(ok.error());
    }
    if (!content_id.empty() &&
        (content_ids_.contains(content_id) ||
         (previous_content_id_ && previous_content_id_->first == content_id))) {
        return fault(error_code::duplicate_content_id);
    }
    if (auto ok = verify_operation_quota(); !ok) {
        return std::unexpected(ok.error());
    }

    write_pending_message_data(true);

    // The previous operation's Content-ID becomes visible only now, so an
    // operation can never reference itself.
    remember_previous_content_id();

    auto resolved = settings_.resolver
        ? settings_.resolver(uri, settings_.base_uri, content_ids_)
        : resolve_operation_uri(uri, settings_.base_uri, content_ids_);
    if (!resolved) {
        return fault(resolved.error());
    }

    auto target = format_request_uri(*resolved, settings_.base_uri, option);
    if (!target) {
        return fault(target.error());
    }

    auto message = std::make_shared<operation_request_message>(
        *sink_, *this, std::string{method}, *resolved, std::string{content_id});

    // Only changeset operations may be referenced
    if (!content_id.empty() && changeset_active()) {
        previous_content_id_.emplace(std::string{content_id}, *resolved);
    }

    enter_state(writer_state::operation_created);

    write_start_boundary_for_operation();
    write_operation_part_headers();

    // Request line; headers stay pending until the next flush point
    text_.write(method);
    text_.write(" ");
    text_.write(target->target);
    text_.write(" ");
    text_.write_line(to_string(settings_.protocol_version));
    if (target->host) {
        text_.write(constants::host_header);
        text_.write(": ");
        text_.write_line(*target->host);
    }

    pending_.set(message);

    log::trace("request operation {} {} ({}, Content-ID '{}')",
               method, target->target, to_string(option), content_id);
    return message;
}

inline result<std::shared_ptr<operation_response_message>>
multipart_mixed_writer::create_operation_response_message(std::string_view content_id) {
    if (auto ok = verify_not_faulted(); !ok) {
        return std::unexpected(ok.error());
    }
    if (!settings_.writing_response) {
        return fault(error_code::cannot_create_response_when_writing_request);
    }
    if (auto ok = verify_transition(writer_state::operation_created); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = verify_operation_quota(); !ok) {
        return std::unexpected(ok.error());
    }

    write_pending_message_data(true);

    auto message = std::make_shared<operation_response_message>(*sink_, *this, std::string{content_id});

    enter_state(writer_state::operation_created);

    write_start_boundary_for_operation();
    write_operation_part_headers();

    // Status line is written with the headers so the status stays settable
    pending_.set(message);

    log::trace("response operation (Content-ID '{}')", content_id);
    return message;
}

// =============================================================================
// Flushing
// =============================================================================

inline result<void> multipart_mixed_writer::flush() {
    if (auto ok = verify_call_allowed(true); !ok) {
        return ok;
    }
    if (auto ok = verify_not_faulted(); !ok) {
        return ok;
    }
    if (state_ == writer_state::operation_stream_requested) {
        return fail(error_code::flush_in_stream_requested_state);
    }
    if (auto ok = flush_text(); !ok) {
        return ok;
    }
    return sink_->flush();
}

inline std::future<result<void>> multipart_mixed_writer::flush_async() {
    if (auto ok = verify_call_allowed(false); !ok) {
        return ready(std::move(ok));
    }
    if (auto ok = verify_not_faulted(); !ok) {
        return ready(std::move(ok));
    }
    if (state_ == writer_state::operation_stream_requested) {
        return ready(fail(error_code::flush_in_stream_requested_state));
    }
    if (auto ok = flush_text(); !ok) {
        return ready(std::move(ok));
    }
    return sink_->flush_async();
}

inline result<void> multipart_mixed_writer::flush_text() {
    auto size = text_.buffered();
    if (auto ok = text_.flush(); !ok) {
        log::warn("batch writer: sink write failed: {}", ok.error().message());
        return ok;
    }
    if (size > 0) {
        log::trace("batch writer: {} bytes handed to the sink", size);
    }
    return {};
}

inline std::future<result<void>> multipart_mixed_writer::ready(result<void> value) {
    std::promise<result<void>> done;
    done.set_value(std::move(value));
    return done.get_future();
}

// =============================================================================
// In-stream Errors
// =============================================================================

inline result<void> multipart_mixed_writer::on_in_stream_error() {
    bool body_open = state_ == writer_state::operation_stream_requested;
    state_ = writer_state::error;

    if (!body_open && text_.attached()) {
        if (auto ok = text_.flush(); !ok) {
            log::warn("batch writer: flush before in-stream error failed: {}", ok.error().message());
        }
    }

    // multipart/mixed has no way to carry an error inside the payload
    log::warn("batch writer: in-stream error requested, writer faulted");
    return fail(body_open
        ? error_code::in_stream_error_in_operation_body
        : error_code::in_stream_error_not_supported);
}

// =============================================================================
// Body Streams
// =============================================================================

inline result<void> multipart_mixed_writer::verify_can_request_stream(const operation_message& message) {
    if (auto ok = verify_not_faulted(); !ok) {
        return ok;
    }
    if (!pending_.is_current(message)) {
        return fault(error_code::invalid_state_transition);
    }
    return verify_transition(writer_state::operation_stream_requested);
}

inline result<void> multipart_mixed_writer::stream_requested(const operation_message& message) {
    if (auto ok = verify_call_allowed(true); !ok) {
        return ok;
    }
    if (auto ok = verify_can_request_stream(message); !ok) {
        return ok;
    }

    // Headers are written, but the message stays current until disposal
    write_pending_message_data(false);

    if (auto ok = flush_text(); !ok) {
        return ok;
    }
    if (auto ok = sink_->flush(); !ok) {
        return ok;
    }

    // The caller owns the sink until the stream is disposed
    text_.detach();
    enter_state(writer_state::operation_stream_requested);
    return {};
}

inline std::future<result<void>> multipart_mixed_writer::stream_requested_async(const operation_message& message) {
    if (auto ok = verify_call_allowed(false); !ok) {
        return ready(std::move(ok));
    }
    if (auto ok = verify_can_request_stream(message); !ok) {
        return ready(std::move(ok));
    }

    write_pending_message_data(false);

    if (auto ok = flush_text(); !ok) {
        return ready(std::move(ok));
    }

    // Only the transport flush is deferred
    text_.detach();
    enter_state(writer_state::operation_stream_requested);

    auto flushed = sink_->flush_async();
    return std::async(std::launch::deferred,
        [this, flushed = std::move(flushed)]() mutable -> result<void> {
            auto ok = flushed.get();
            // Still waiting for this operation's stream
            if (!ok && state_ == writer_state::operation_stream_requested) {
                if (auto released = stream_disposed(); !released) {
                    log::warn("batch writer: release after failed flush: {}", released.error().message());
                }
            }
            return ok;
        });
}

inline result<void> multipart_mixed_writer::stream_disposed() {
    if (auto ok = verify_transition(writer_state::operation_stream_disposed); !ok) {
        return ok;
    }

    enter_state(writer_state::operation_stream_disposed);
    pending_.reset();
    text_.attach();
    return {};
}

// =============================================================================
// State Handling
// =============================================================================

inline std::unexpected<std::error_code> multipart_mixed_writer::fault(std::error_code ec) {
    log::warn("batch writer faulted in state {}: {}", to_string(state_), ec.message());
    state_ = writer_state::error;
    return std::unexpected(ec);
}

inline result<void> multipart_mixed_writer::verify_call_allowed(bool synchronous_call) const {
    bool synchronous_writer = settings_.mode == execution_mode::synchronous;
    if (synchronous_call && !synchronous_writer) {
        return fail(error_code::sync_call_on_async_writer);
    }
    if (!synchronous_call && synchronous_writer) {
        return fail(error_code::async_call_on_sync_writer);
    }
    return {};
}

inline result<void> multipart_mixed_writer::verify_not_faulted() const {
    if (state_ == writer_state::error) {
        return fail(error_code::invalid_state_transition);
    }
    return {};
}

inline result<void> multipart_mixed_writer::verify_transition(writer_state to) {
    if (auto ok = verify_not_faulted(); !ok) {
        return ok;
    }
    if (auto ok = validate_changeset_scope(to, changeset_active()); !ok) {
        return fault(ok.error());
    }
    if (auto ok = validate_transition(state_, to); !ok) {
        return fault(ok.error());
    }
    return {};
}

inline result<void> multipart_mixed_writer::verify_operation_quota() {
    if (changeset_active()) {
        if (changeset_operations_ + 1 > settings_.max_operations_per_changeset) {
            return fault(error_code::max_changeset_size_exceeded);
        }
        ++changeset_operations_;
    } else {
        if (batch_parts_ + 1 > settings_.max_parts_per_batch) {
            return fault(error_code::max_batch_size_exceeded);
        }
        ++batch_parts_;
    }
    return {};
}

inline void multipart_mixed_writer::enter_state(writer_state to) {
    switch (to) {
        case writer_state::changeset_started:
            changeset_boundary_ = boundaries_.changeset_boundary(settings_.writing_response);
            changeset_operations_ = 0;
            break;
        case writer_state::changeset_completed:
            changeset_boundary_.clear();
            break;
        default:
            break;
    }

    log::debug("batch writer: {} -> {}", to_string(state_), to_string(to));
    state_ = to;
}

// =============================================================================
// Wire Helpers
// =============================================================================

inline void multipart_mixed_writer::write_pending_message_data(bool report_message_completed) {
    pending_.flush(text_, settings_.protocol_version, report_message_completed);
}

inline void multipart_mixed_writer::write_start_boundary_for_operation() {
    if (!changeset_active()) {
        write_start_boundary(text_, batch_boundary_, !batch_start_written_);
        batch_start_written_ = true;
    } else {
        write_start_boundary(text_, changeset_boundary_, !changeset_start_written_);
        changeset_start_written_ = true;
    }
}

inline void multipart_mixed_writer::write_operation_part_headers() {
    text_.write(constants::content_type_header);
    text_.write(": ");
    text_.write_line(constants::application_http);
    text_.write(constants::content_transfer_encoding_header);
    text_.write(": ");
    text_.write_line(constants::binary_encoding);
    text_.write_line();
}

inline void multipart_mixed_writer::remember_previous_content_id() {
    if (!previous_content_id_) {
        return;
    }
    auto [id, uri] = std::move(*previous_content_id_);
    previous_content_id_.reset();
    if (auto added = content_ids_.add(id, uri); !added) {
        log::warn("Content-ID '{}' already registered", id);
    }
}

} // namespace co::batch
