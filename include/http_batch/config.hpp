#pragma once

#include "boundary.hpp"
#include "content_id.hpp"
#include "error.hpp"

namespace co::batch {

// =============================================================================
// Writer Settings
// =============================================================================

// Selects which flush operations a writer accepts: blocking ones, or ones
// that return a future so only the transport flush suspends.
enum class execution_mode {
    synchronous,
    asynchronous
};

struct writer_settings {
    // Base for relative operation URIs; empty keeps relative URIs as given
    std::string base_uri;

    // Server side: operations are responses
    bool writing_response = false;

    execution_mode mode = execution_mode::synchronous;
    version protocol_version = version::http_1_1;

    // Empty means a fresh "batch_<uuid>" / "batchresponse_<uuid>" token
    std::string batch_boundary;

    // Message quotas
    size_t max_parts_per_batch = 100;
    size_t max_operations_per_changeset = 1000;

    // Hooks, empty means the library defaults
    uri_resolver resolver;
    boundary_allocator::id_source boundary_id_source;

    result<void> validate() const;
};

// =============================================================================
// Settings Builder
// =============================================================================

class settings_builder {
public:
    settings_builder() = default;

    settings_builder& base_uri(std::string uri);
    settings_builder& writing_request();
    settings_builder& writing_response();
    settings_builder& synchronous();
    settings_builder& asynchronous();
    settings_builder& version(enum version v);
    settings_builder& batch_boundary(std::string boundary);
    settings_builder& max_parts_per_batch(size_t limit);
    settings_builder& max_operations_per_changeset(size_t limit);
    settings_builder& resolver(uri_resolver r);
    settings_builder& boundary_id_source(boundary_allocator::id_source source);

    writer_settings build() const;
    operator writer_settings() const { return build(); }

private:
    writer_settings settings_;
};

} // namespace co::batch

// Include implementation
#include "detail/config_impl.hpp"
