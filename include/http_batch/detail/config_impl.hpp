#pragma once

#include "../config.hpp"

namespace co::batch {

// =============================================================================
// Writer Settings Implementation
// =============================================================================

inline result<void> writer_settings::validate() const {
    if (max_parts_per_batch == 0 || max_operations_per_changeset == 0) {
        return fail(error_code::invalid_settings);
    }
    if (protocol_version == version::http_2_0) {
        return fail(error_code::invalid_settings);
    }
    if (!base_uri.empty() && !is_absolute_uri(base_uri)) {
        return fail(error_code::invalid_settings);
    }
    return {};
}

// =============================================================================
// Settings Builder Implementation
// =============================================================================

inline settings_builder& settings_builder::base_uri(std::string uri) {
    settings_.base_uri = std::move(uri);
    return *this;
}

inline settings_builder& settings_builder::writing_request() {
    settings_.writing_response = false;
    return *this;
}

inline settings_builder& settings_builder::writing_response() {
    settings_.writing_response = true;
    return *this;
}

inline settings_builder& settings_builder::synchronous() {
    settings_.mode = execution_mode::synchronous;
    return *this;
}

inline settings_builder& settings_builder::asynchronous() {
    settings_.mode = execution_mode::asynchronous;
    return *this;
}

inline settings_builder& settings_builder::version(enum version v) {
    settings_.protocol_version = v;
    return *this;
}

inline settings_builder& settings_builder::batch_boundary(std::string boundary) {
    settings_.batch_boundary = std::move(boundary);
    return *this;
}

inline settings_builder& settings_builder::max_parts_per_batch(size_t limit) {
    settings_.max_parts_per_batch = limit;
    return *this;
}

inline settings_builder& settings_builder::max_operations_per_changeset(size_t limit) {
    settings_.max_operations_per_changeset = limit;
    return *this;
}

inline settings_builder& settings_builder::resolver(uri_resolver r) {
    settings_.resolver = std::move(r);
    return *this;
}

inline settings_builder& settings_builder::boundary_id_source(boundary_allocator::id_source source) {
    settings_.boundary_id_source = std::move(source);
    return *this;
}

inline writer_settings settings_builder::build() const {
    return settings_;
}

} // namespace co::batch
