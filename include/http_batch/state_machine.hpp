#pragma once

#include "core.hpp"
#include "error.hpp"
#include "operation_message.hpp"
#include <future>
#include <memory>

namespace co::batch {

// =============================================================================
// Writer States
// =============================================================================

enum class writer_state {
    start,
    batch_started,
    changeset_started,
    operation_created,
    operation_stream_requested,
    operation_stream_disposed,
    changeset_completed,
    batch_completed,
    error
};

inline std::string to_string(writer_state s);

// =============================================================================
// Transition Validation
// =============================================================================
//
// Shared by every batch encoding. validate_transition() checks the state
// graph; validate_changeset_scope() checks the transition against whether a
// changeset is currently open.

inline result<void> validate_transition(writer_state from, writer_state to) noexcept;
inline result<void> validate_changeset_scope(writer_state to, bool changeset_active) noexcept;

// Checks applied to a new request operation inside a changeset
inline result<void> validate_changeset_request(std::string_view method, std::string_view content_id,
                                               bool changeset_active) noexcept;

inline bool is_terminal(writer_state s) noexcept {
    return s == writer_state::batch_completed || s == writer_state::error;
}

// =============================================================================
// Batch Writer Capability
// =============================================================================
//
// The contract every batch payload encoding implements. Calls are strictly
// sequential; a writer is single-use.

class batch_writer {
public:
    virtual ~batch_writer() = default;

    virtual result<void> start_batch() = 0;
    virtual result<void> end_batch() = 0;
    virtual std::future<result<void>> end_batch_async() = 0;

    virtual result<void> start_changeset() = 0;
    virtual result<void> end_changeset() = 0;

    virtual result<std::shared_ptr<operation_request_message>> create_operation_request_message(
        std::string_view method, std::string_view uri, std::string_view content_id = {},
        uri_option option = uri_option::absolute_uri) = 0;

    virtual result<std::shared_ptr<operation_response_message>> create_operation_response_message(
        std::string_view content_id = {}) = 0;

    virtual result<void> flush() = 0;
    virtual std::future<result<void>> flush_async() = 0;

    // The payload cannot carry an error; always faults the writer
    virtual result<void> on_in_stream_error() = 0;

    virtual writer_state state() const noexcept = 0;
};

} // namespace co::batch

// Include implementation
#include "detail/state_machine_impl.hpp"
