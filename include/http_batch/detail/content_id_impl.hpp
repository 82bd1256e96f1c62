#pragma once

#include "../content_id.hpp"
#include <algorithm>
#include <cctype>

namespace co::batch {

// =============================================================================
// Content-ID Table Implementation
// =============================================================================

inline result<void> content_id_table::add(std::string content_id, std::string resolved_uri) {
    if (entries_.contains(content_id)) {
        return fail(error_code::duplicate_content_id);
    }
    entries_.emplace(std::move(content_id), std::move(resolved_uri));
    return {};
}

inline bool content_id_table::contains(std::string_view content_id) const noexcept {
    return entries_.find(content_id) != entries_.end();
}

inline std::optional<std::string_view> content_id_table::find(std::string_view content_id) const noexcept {
    auto it = entries_.find(content_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return std::string_view{it->second};
}

// =============================================================================
// URI Helpers
// =============================================================================

namespace detail {

inline bool is_scheme_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

inline std::string with_trailing_slash(std::string_view base_uri) {
    std::string base{base_uri};
    if (!base.empty() && base.back() != '/') {
        base += '/';
    }
    return base;
}

} // namespace detail

inline std::optional<uri_parts> split_absolute_uri(std::string_view uri) noexcept {
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    auto scheme = uri.substr(0, scheme_end);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
        !std::all_of(scheme.begin(), scheme.end(), detail::is_scheme_char)) {
        return std::nullopt;
    }

    auto rest = uri.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    if (authority_end == std::string_view::npos) {
        authority_end = rest.size();
    }

    uri_parts parts;
    parts.scheme = scheme;
    parts.authority = rest.substr(0, authority_end);
    parts.path_and_query = rest.substr(authority_end);
    if (parts.authority.empty()) {
        return std::nullopt;
    }
    return parts;
}

inline bool is_absolute_uri(std::string_view uri) noexcept {
    return split_absolute_uri(uri).has_value();
}

// =============================================================================
// Default Resolution
// =============================================================================

inline result<std::string> resolve_operation_uri(std::string_view uri, std::string_view base_uri,
                                                 const content_id_table& ids) {
    // "$<content-id>" or "$<content-id>/<rest>"
    if (!uri.empty() && uri.front() == '$') {
        auto id_end = uri.find_first_of("/?", 1);
        if (id_end == std::string_view::npos) {
            id_end = uri.size();
        }
        auto referenced = ids.find(uri.substr(1, id_end - 1));
        if (!referenced) {
            return fail(error_code::unknown_content_id_reference);
        }
        std::string resolved{*referenced};
        resolved.append(uri.substr(id_end));
        return resolved;
    }

    if (is_absolute_uri(uri) || base_uri.empty()) {
        return std::string{uri};
    }

    auto base = split_absolute_uri(base_uri);
    if (!base) {
        return fail(error_code::relative_uri_without_base);
    }

    // Absolute-path reference replaces the base path
    if (!uri.empty() && uri.front() == '/') {
        std::string resolved{base->scheme};
        resolved += "://";
        resolved.append(base->authority);
        resolved.append(uri);
        return resolved;
    }

    return detail::with_trailing_slash(base_uri) + std::string{uri};
}

inline result<request_target> format_request_uri(std::string_view resolved_uri, std::string_view base_uri,
                                                 uri_option option) {
    request_target out;

    switch (option) {
        case uri_option::absolute_uri:
            out.target = std::string{resolved_uri};
            break;

        case uri_option::relative_resource_path: {
            auto base = detail::with_trailing_slash(base_uri);
            if (!base.empty() && resolved_uri.starts_with(base)) {
                out.target = std::string{resolved_uri.substr(base.size())};
            } else {
                out.target = std::string{resolved_uri};
            }
            break;
        }

        case uri_option::absolute_resource_path_and_host: {
            auto parts = split_absolute_uri(resolved_uri);
            if (!parts) {
                return fail(error_code::relative_uri_without_base);
            }
            out.target = parts->path_and_query.empty() ? std::string{"/"}
                                                       : std::string{parts->path_and_query};
            out.host = std::string{parts->authority};
            break;
        }
    }

    return out;
}

} // namespace co::batch
