#pragma once

#include "../state_machine.hpp"

namespace co::batch {

inline std::string to_string(writer_state s) {
    switch (s) {
        case writer_state::start: return "Start";
        case writer_state::batch_started: return "BatchStarted";
        case writer_state::changeset_started: return "ChangesetStarted";
        case writer_state::operation_created: return "OperationCreated";
        case writer_state::operation_stream_requested: return "OperationStreamRequested";
        case writer_state::operation_stream_disposed: return "OperationStreamDisposed";
        case writer_state::changeset_completed: return "ChangesetCompleted";
        case writer_state::batch_completed: return "BatchCompleted";
        case writer_state::error: return "Error";
    }
    return "Unknown";
}

// =============================================================================
// Transition Validation Implementation
// =============================================================================

inline result<void> validate_transition(writer_state from, writer_state to) noexcept {
    // Any state may fault
    if (to == writer_state::error) {
        return {};
    }

    bool allowed = false;
    switch (from) {
        case writer_state::start:
            allowed = to == writer_state::batch_started;
            break;

        case writer_state::batch_started:
            allowed = to == writer_state::changeset_started ||
                      to == writer_state::operation_created ||
                      to == writer_state::batch_completed;
            break;

        case writer_state::changeset_started:
            allowed = to == writer_state::operation_created ||
                      to == writer_state::changeset_completed;
            break;

        case writer_state::operation_created:
            allowed = to == writer_state::operation_created ||
                      to == writer_state::operation_stream_requested ||
                      to == writer_state::changeset_started ||
                      to == writer_state::changeset_completed ||
                      to == writer_state::batch_completed;
            break;

        case writer_state::operation_stream_requested:
            allowed = to == writer_state::operation_stream_disposed;
            break;

        case writer_state::operation_stream_disposed:
            allowed = to == writer_state::operation_created ||
                      to == writer_state::changeset_started ||
                      to == writer_state::changeset_completed ||
                      to == writer_state::batch_completed;
            break;

        case writer_state::changeset_completed:
            allowed = to == writer_state::operation_created ||
                      to == writer_state::changeset_started ||
                      to == writer_state::batch_completed;
            break;

        case writer_state::batch_completed:
        case writer_state::error:
            allowed = false;
            break;
    }

    if (!allowed) {
        return fail(error_code::invalid_state_transition);
    }
    return {};
}

inline result<void> validate_changeset_scope(writer_state to, bool changeset_active) noexcept {
    if (to == writer_state::changeset_started && changeset_active) {
        return fail(error_code::changeset_already_active);
    }
    if (to == writer_state::changeset_completed && !changeset_active) {
        return fail(error_code::no_active_changeset);
    }
    if (to == writer_state::batch_completed && changeset_active) {
        return fail(error_code::changeset_active_at_batch_end);
    }
    return {};
}

inline result<void> validate_changeset_request(std::string_view method, std::string_view content_id,
                                               bool changeset_active) noexcept {
    if (!changeset_active) {
        return {};
    }
    if (is_query_method(method)) {
        return fail(error_code::unsafe_method_in_changeset);
    }
    if (content_id.empty()) {
        return fail(error_code::missing_content_id);
    }
    return {};
}

} // namespace co::batch
