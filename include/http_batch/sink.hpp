#pragma once

#include "buffer.hpp"
#include "error.hpp"
#include <future>

namespace co::batch {

// =============================================================================
// Output Sink Interface
// =============================================================================
//
// The transport the batch is written to. Writes are ordered and raw; flush()
// may block the caller, flush_async() hands back a future so only the
// transport flush itself suspends.

class output_sink {
public:
    virtual ~output_sink() = default;

    virtual result<void> write(std::string_view data) = 0;
    virtual result<void> flush() = 0;
    virtual std::future<result<void>> flush_async() = 0;
};

// In-memory sink, collects everything written to it
class memory_sink : public output_sink {
public:
    memory_sink() = default;
    explicit memory_sink(size_t initial_capacity) : buffer_(initial_capacity) {}

    result<void> write(std::string_view data) override;
    result<void> flush() override;
    std::future<result<void>> flush_async() override;

    std::string_view view() const noexcept { return buffer_.view(); }
    std::string to_string() const { return std::string{buffer_.view()}; }
    size_t flush_count() const noexcept { return flush_count_; }
    size_t write_count() const noexcept { return write_count_; }

private:
    output_buffer buffer_;
    size_t flush_count_ = 0;
    size_t write_count_ = 0;
};

// =============================================================================
// Text Writer
// =============================================================================
//
// The batch writer's text encoder. Buffers preamble text in front of the sink
// and is detached while the caller streams an operation body directly into
// the sink.

class text_writer {
public:
    explicit text_writer(output_sink& sink) : sink_(&sink) {}

    // Non-copyable, movable
    text_writer(const text_writer&) = delete;
    text_writer& operator=(const text_writer&) = delete;
    text_writer(text_writer&&) = default;
    text_writer& operator=(text_writer&&) = default;

    void write(std::string_view text);
    void write_line(std::string_view line);
    void write_line();

    // Moves buffered text into the sink (does not flush the sink)
    result<void> flush();

    void detach() noexcept { attached_ = false; }
    void attach() noexcept { attached_ = true; }
    bool attached() const noexcept { return attached_; }

    size_t buffered() const noexcept { return buffer_.size(); }

private:
    output_sink* sink_;
    output_buffer buffer_;
    bool attached_ = true;
};

} // namespace co::batch

// Include implementation
#include "detail/sink_impl.hpp"
