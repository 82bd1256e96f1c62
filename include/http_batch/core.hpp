#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <utility>

namespace co::batch {

// =============================================================================
// Core Types and Enums
// =============================================================================

// HTTP version written on the request/status line of every operation
enum class version {
    http_1_0,
    http_1_1,
    http_2_0
};

// Reason codes of an "invalid batch operation" (see error.hpp)
enum class error_code {
    success = 0,
    invalid_state_transition,
    changeset_already_active,
    no_active_changeset,
    changeset_active_at_batch_end,
    unsafe_method_in_changeset,
    missing_content_id,
    in_stream_error_not_supported,
    in_stream_error_in_operation_body,
    duplicate_content_id,
    unknown_content_id_reference,
    relative_uri_without_base,
    cannot_create_request_when_writing_response,
    cannot_create_response_when_writing_request,
    max_batch_size_exceeded,
    max_changeset_size_exceeded,
    operation_message_completed,
    flush_in_stream_requested_state,
    sync_call_on_async_writer,
    async_call_on_sync_writer,
    stream_already_disposed,
    invalid_settings
};

enum class method {
    get, post, put, delete_, head, options, trace, connect, patch, merge, unknown
};

// Format of the Request-URI written on the request line of an operation
enum class uri_option {
    absolute_uri,
    absolute_resource_path_and_host,
    relative_resource_path
};

// Header representation
struct header {
    std::string name;
    std::string value;

    header() = default;
    header(std::string n, std::string v)
        : name(std::move(n)), value(std::move(v)) {}
};

// Ordered header list; names are unique (case-insensitive) and insertion
// order is the order they reach the wire.
class header_list {
public:
    using const_iterator = std::vector<header>::const_iterator;

    std::optional<std::string_view> get(std::string_view name) const noexcept;
    bool contains(std::string_view name) const noexcept;

    // Replaces the value in place when the name exists, appends otherwise
    void set(std::string name, std::string value);
    bool remove(std::string_view name);
    void clear() noexcept { headers_.clear(); }

    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }
    const_iterator begin() const noexcept { return headers_.begin(); }
    const_iterator end() const noexcept { return headers_.end(); }

private:
    std::vector<header> headers_;
};

// =============================================================================
// Protocol Constants
// =============================================================================

namespace constants {
    inline constexpr std::string_view crlf = "\r\n";
    inline constexpr std::string_view boundary_delimiter = "--";
    inline constexpr std::string_view content_type_header = "Content-Type";
    inline constexpr std::string_view content_id_header = "Content-ID";
    inline constexpr std::string_view content_transfer_encoding_header = "Content-Transfer-Encoding";
    inline constexpr std::string_view host_header = "Host";
    inline constexpr std::string_view application_http = "application/http";
    inline constexpr std::string_view binary_encoding = "binary";
    inline constexpr std::string_view multipart_mixed = "multipart/mixed";
    inline constexpr std::string_view boundary_parameter = "boundary";
}

} // namespace co::batch

// Include implementation
#include "detail/core_impl.hpp"
