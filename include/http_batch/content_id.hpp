#pragma once

#include "core.hpp"
#include "error.hpp"
#include <functional>
#include <map>

namespace co::batch {

// =============================================================================
// Content-ID Table
// =============================================================================
//
// Batch-scoped mapping from a completed operation's Content-ID to the URI it
// was written with. Owned by the writer; the URI resolution hook only ever
// sees it by const reference.

class content_id_table {
public:
    content_id_table() = default;

    result<void> add(std::string content_id, std::string resolved_uri);

    bool contains(std::string_view content_id) const noexcept;
    std::optional<std::string_view> find(std::string_view content_id) const noexcept;

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

private:
    std::map<std::string, std::string, std::less<>> entries_;
};

// =============================================================================
// URI Resolution
// =============================================================================

// Maps an operation URI, possibly relative or "$<content-id>" prefixed, to
// the URI written for the operation.
using uri_resolver = std::function<result<std::string>(
    std::string_view uri, std::string_view base_uri, const content_id_table& ids)>;

// Request-URI and optional Host header as they appear on the wire
struct request_target {
    std::string target;
    std::optional<std::string> host;
};

struct uri_parts {
    std::string_view scheme;
    std::string_view authority;
    std::string_view path_and_query;
};

inline bool is_absolute_uri(std::string_view uri) noexcept;
inline std::optional<uri_parts> split_absolute_uri(std::string_view uri) noexcept;

// Default uri_resolver
inline result<std::string> resolve_operation_uri(std::string_view uri, std::string_view base_uri,
                                                 const content_id_table& ids);

inline result<request_target> format_request_uri(std::string_view resolved_uri, std::string_view base_uri,
                                                 uri_option option);

} // namespace co::batch

// Include implementation
#include "detail/content_id_impl.hpp"
