#pragma once

#include "../core.hpp"
#include <algorithm>
#include <cctype>

namespace co::batch {

// =============================================================================
// Utility Functions
// =============================================================================

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

// =============================================================================
// Header List Implementation
// =============================================================================

inline std::optional<std::string_view> header_list::get(std::string_view name) const noexcept {
    auto it = std::find_if(headers_.begin(), headers_.end(),
        [name](const header& h) { return iequals(h.name, name); });

    if (it != headers_.end()) {
        return std::string_view{it->value};
    }
    return std::nullopt;
}

inline bool header_list::contains(std::string_view name) const noexcept {
    return get(name).has_value();
}

inline void header_list::set(std::string name, std::string value) {
    auto it = std::find_if(headers_.begin(), headers_.end(),
        [&name](const header& h) { return iequals(h.name, name); });

    if (it != headers_.end()) {
        it->value = std::move(value);
    } else {
        headers_.emplace_back(std::move(name), std::move(value));
    }
}

inline bool header_list::remove(std::string_view name) {
    auto it = std::remove_if(headers_.begin(), headers_.end(),
        [name](const header& h) { return iequals(h.name, name); });
    bool removed = it != headers_.end();
    headers_.erase(it, headers_.end());
    return removed;
}

// =============================================================================
// Method Helpers
// =============================================================================

inline method method_from_string(std::string_view m) noexcept {
    if (m == "GET") return method::get;
    if (m == "POST") return method::post;
    if (m == "PUT") return method::put;
    if (m == "DELETE") return method::delete_;
    if (m == "HEAD") return method::head;
    if (m == "OPTIONS") return method::options;
    if (m == "TRACE") return method::trace;
    if (m == "CONNECT") return method::connect;
    if (m == "PATCH") return method::patch;
    if (m == "MERGE") return method::merge;
    return method::unknown;
}

inline bool is_query_method(std::string_view m) noexcept {
    switch (method_from_string(m)) {
        case method::get:
        case method::head:
        case method::options:
        case method::trace:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Status Reason Phrases
// =============================================================================

inline std::string_view reason_phrase(unsigned int status_code) noexcept {
    switch (status_code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Time-out";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Request Entity Too Large";
        case 414: return "Request-URI Too Large";
        case 415: return "Unsupported Media Type";
        case 416: return "Requested range not satisfiable";
        case 417: return "Expectation Failed";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Time-out";
        case 505: return "HTTP Version not supported";
        default: return "Unknown Status Code";
    }
}

// =============================================================================
// to_string
// =============================================================================

inline std::string to_string(version v) {
    switch (v) {
        case version::http_1_0: return "HTTP/1.0";
        case version::http_1_1: return "HTTP/1.1";
        case version::http_2_0: return "HTTP/2.0";
    }
    return "UNKNOWN";
}

inline std::string to_string(error_code e) {
    switch (e) {
        case error_code::success: return "Success";
        case error_code::invalid_state_transition: return "Invalid batch writer state transition";
        case error_code::changeset_already_active: return "Cannot start a changeset while another changeset is active";
        case error_code::no_active_changeset: return "Cannot complete a changeset without an active changeset";
        case error_code::changeset_active_at_batch_end: return "Cannot complete a batch while a changeset is still active";
        case error_code::unsafe_method_in_changeset: return "Query methods are not allowed inside a changeset";
        case error_code::missing_content_id: return "Operations inside a changeset require a Content-ID";
        case error_code::in_stream_error_not_supported: return "In-stream errors cannot be written to a batch payload";
        case error_code::in_stream_error_in_operation_body: return "In-stream error reported while an operation content stream is open";
        case error_code::duplicate_content_id: return "Duplicate Content-ID";
        case error_code::unknown_content_id_reference: return "URI references an unknown Content-ID";
        case error_code::relative_uri_without_base: return "Relative URI used without a base URI";
        case error_code::cannot_create_request_when_writing_response: return "Cannot create a request operation when writing a response";
        case error_code::cannot_create_response_when_writing_request: return "Cannot create a response operation when writing a request";
        case error_code::max_batch_size_exceeded: return "Maximum number of parts per batch exceeded";
        case error_code::max_changeset_size_exceeded: return "Maximum number of operations per changeset exceeded";
        case error_code::operation_message_completed: return "Operation message headers were already written";
        case error_code::flush_in_stream_requested_state: return "Cannot flush while an operation content stream is open";
        case error_code::sync_call_on_async_writer: return "Synchronous call on an asynchronous batch writer";
        case error_code::async_call_on_sync_writer: return "Asynchronous call on a synchronous batch writer";
        case error_code::stream_already_disposed: return "Operation content stream already disposed";
        case error_code::invalid_settings: return "Invalid batch writer settings";
    }
    return "Unknown error";
}

inline std::string to_string(method m) {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::delete_: return "DELETE";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        case method::trace: return "TRACE";
        case method::connect: return "CONNECT";
        case method::patch: return "PATCH";
        case method::merge: return "MERGE";
        case method::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::string to_string(uri_option o) {
    switch (o) {
        case uri_option::absolute_uri: return "AbsoluteUri";
        case uri_option::absolute_resource_path_and_host: return "AbsoluteResourcePathAndHost";
        case uri_option::relative_resource_path: return "RelativeResourcePath";
    }
    return "Unknown";
}

} // namespace co::batch
