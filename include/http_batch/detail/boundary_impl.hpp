#pragma once

#include "../boundary.hpp"
#include "../log.hpp"
#include <array>

#include <uuid/uuid.h>

namespace co::batch {

// =============================================================================
// Boundary Allocator Implementation
// =============================================================================

inline std::string_view boundary_allocator::prefix(boundary_scope scope, bool writing_response) noexcept {
    if (scope == boundary_scope::batch) {
        return writing_response ? "batchresponse" : "batch";
    }
    return writing_response ? "changesetresponse" : "changeset";
}

inline std::string boundary_allocator::random_id() {
    uuid_t id;
    uuid_generate_random(id);

    std::array<char, UUID_STR_LEN> text{};
    uuid_unparse_lower(id, text.data());
    return std::string{text.data()};
}

inline std::string boundary_allocator::allocate(boundary_scope scope, bool writing_response) const {
    std::string token{prefix(scope, writing_response)};
    token += '_';
    token += source_ ? source_() : random_id();

    log::debug("allocated {} boundary '{}'",
               scope == boundary_scope::batch ? "batch" : "changeset", token);
    return token;
}

// =============================================================================
// Delimiter Lines
// =============================================================================

inline void write_start_boundary(text_writer& writer, std::string_view boundary, bool first_boundary) {
    if (!first_boundary) {
        writer.write_line();
    }
    writer.write(constants::boundary_delimiter);
    writer.write_line(boundary);
}

// A scope whose start boundary was never written (empty changeset, empty
// batch) is closed with a lone end delimiter.
inline void write_end_boundary(text_writer& writer, std::string_view boundary, bool missing_start_boundary) {
    if (!missing_start_boundary) {
        writer.write_line();
    }
    writer.write(constants::boundary_delimiter);
    writer.write(boundary);
    writer.write_line(constants::boundary_delimiter);
}

inline void write_changeset_preamble(text_writer& writer, std::string_view changeset_boundary) {
    writer.write(constants::content_type_header);
    writer.write(": ");
    writer.write(constants::multipart_mixed);
    writer.write("; ");
    writer.write(constants::boundary_parameter);
    writer.write("=");
    writer.write_line(changeset_boundary);
    writer.write_line();
}

} // namespace co::batch
