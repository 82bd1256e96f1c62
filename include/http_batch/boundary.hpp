#pragma once

#include "core.hpp"
#include "sink.hpp"
#include <functional>
#include <string>

namespace co::batch {

// =============================================================================
// Boundary Allocator
// =============================================================================

enum class boundary_scope {
    batch,
    changeset
};

// Produces multipart delimiter tokens "<scope-prefix>_<random-id>". The
// random id comes from libuuid unless an id source is supplied.
class boundary_allocator {
public:
    using id_source = std::function<std::string()>;

    boundary_allocator() = default;
    explicit boundary_allocator(id_source source) : source_(std::move(source)) {}

    std::string allocate(boundary_scope scope, bool writing_response) const;

    std::string batch_boundary(bool writing_response) const {
        return allocate(boundary_scope::batch, writing_response);
    }

    std::string changeset_boundary(bool writing_response) const {
        return allocate(boundary_scope::changeset, writing_response);
    }

    static std::string_view prefix(boundary_scope scope, bool writing_response) noexcept;
    static std::string random_id();

private:
    id_source source_;
};

// Delimiter lines. A boundary that is not the first one of its scope starts
// with CRLF, which terminates the body of the preceding part.
inline void write_start_boundary(text_writer& writer, std::string_view boundary, bool first_boundary);
inline void write_end_boundary(text_writer& writer, std::string_view boundary, bool missing_start_boundary);
inline void write_changeset_preamble(text_writer& writer, std::string_view changeset_boundary);

} // namespace co::batch

// Include implementation
#include "detail/boundary_impl.hpp"
