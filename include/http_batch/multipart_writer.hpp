#pragma once

#include "boundary.hpp"
#include "config.hpp"
#include "content_id.hpp"
#include "pending_buffer.hpp"
#include "sink.hpp"
#include "state_machine.hpp"

namespace co::batch {

// =============================================================================
// multipart/mixed Batch Writer
// =============================================================================
//
// Writes a batch request or batch response as a MIME multipart/mixed payload.
// Each call validates the transition first, then writes whatever preamble the
// previous operation still owes, then the delimiter and preamble of the new
// scope. Preamble text is buffered in a text writer and handed to the sink
// when an operation body is requested, on flush, and at the end of the batch.
//
// Compatibility behaviour kept on the wire:
//  - an empty changeset is written as its closing delimiter only
//  - an empty batch is written as its closing delimiter only
//  - one extra CRLF follows the closing batch delimiter

class multipart_mixed_writer final : public batch_writer, public stream_listener {
public:
    // Settings are expected to be valid; use create() to have them checked
    explicit multipart_mixed_writer(output_sink& sink, writer_settings settings = {});
    ~multipart_mixed_writer() override = default;

    // Non-copyable, non-movable (operation messages point back at the writer)
    multipart_mixed_writer(const multipart_mixed_writer&) = delete;
    multipart_mixed_writer& operator=(const multipart_mixed_writer&) = delete;

    static result<std::unique_ptr<multipart_mixed_writer>> create(output_sink& sink, writer_settings settings);

    // =============================================================================
    // batch_writer
    // =============================================================================

    result<void> start_batch() override;
    result<void> end_batch() override;
    std::future<result<void>> end_batch_async() override;

    result<void> start_changeset() override;
    result<void> end_changeset() override;

    result<std::shared_ptr<operation_request_message>> create_operation_request_message(
        std::string_view method, std::string_view uri, std::string_view content_id = {},
        uri_option option = uri_option::absolute_uri) override;

    result<std::shared_ptr<operation_response_message>> create_operation_response_message(
        std::string_view content_id = {}) override;

    result<void> flush() override;
    std::future<result<void>> flush_async() override;

    result<void> on_in_stream_error() override;

    writer_state state() const noexcept override { return state_; }

    // =============================================================================
    // stream_listener
    // =============================================================================

    result<void> stream_requested(const operation_message& message) override;
    std::future<result<void>> stream_requested_async(const operation_message& message) override;
    result<void> stream_disposed() override;

    // =============================================================================
    // Inspection
    // =============================================================================

    const std::string& batch_boundary() const noexcept { return batch_boundary_; }
    const std::string& changeset_boundary() const noexcept { return changeset_boundary_; }
    bool changeset_active() const noexcept { return !changeset_boundary_.empty(); }
    const content_id_table& content_ids() const noexcept { return content_ids_; }
    const writer_settings& settings() const noexcept { return settings_; }

private:
    // Faults the writer; every later call fails with invalid_state_transition
    std::unexpected<std::error_code> fault(std::error_code ec);
    std::unexpected<std::error_code> fault(error_code e) { return fault(make_error_code(e)); }

    result<void> verify_call_allowed(bool synchronous_call) const;
    result<void> verify_not_faulted() const;
    result<void> verify_transition(writer_state to);
    result<void> verify_operation_quota();
    result<void> verify_can_request_stream(const operation_message& message);

    void enter_state(writer_state to);

    void write_pending_message_data(bool report_message_completed);
    void write_start_boundary_for_operation();
    void write_operation_part_headers();
    void write_end_batch();
    void remember_previous_content_id();

    // Pushes buffered text into the sink (no transport flush)
    result<void> flush_text();

    static std::future<result<void>> ready(result<void> value);

    writer_settings settings_;
    output_sink* sink_;
    text_writer text_;
    boundary_allocator boundaries_;

    std::string batch_boundary_;
    std::string changeset_boundary_;
    bool batch_start_written_ = false;
    bool changeset_start_written_ = false;

    writer_state state_ = writer_state::start;
    pending_message_buffer pending_;

    content_id_table content_ids_;
    // Content-ID and URI of the last request operation, registered once the
    // next request operation is created
    std::optional<std::pair<std::string, std::string>> previous_content_id_;

    size_t batch_parts_ = 0;
    size_t changeset_operations_ = 0;
};

} // namespace co::batch

// Include implementation
#include "detail/multipart_writer_impl.hpp"
