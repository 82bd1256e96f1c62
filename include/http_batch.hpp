#pragma once

// =============================================================================
// HTTP Batch Library - High-Level API
// HTTP批处理库 - 高级API
//
// A C++23 header-only writer for multipart/mixed batch payloads
// 一个C++23头文件multipart/mixed批处理负载写入库
//
// Features / 特性:
// - Batch requests and batch responses with atomic changesets
//   支持带原子变更集的批处理请求与响应
// - Content-ID bookkeeping and "$<id>" URI references
//   Content-ID登记与"$<id>"URI引用
// - Streaming operation bodies straight into the output sink
//   操作正文直接流式写入输出端
// - Blocking or future-based flushing, std::expected error handling
//   阻塞或基于future的刷新，使用std::expected错误处理
// =============================================================================

#include "http_batch/boundary.hpp"
#include "http_batch/buffer.hpp"
#include "http_batch/config.hpp"
#include "http_batch/content_id.hpp"
#include "http_batch/core.hpp"
#include "http_batch/error.hpp"
#include "http_batch/multipart_writer.hpp"
#include "http_batch/operation_message.hpp"
#include "http_batch/sink.hpp"
#include "http_batch/state_machine.hpp"
#include <variant>
#include <vector>

namespace co::batch {

// =============================================================================
// multipart/mixed Interface / multipart/mixed接口
// =============================================================================

namespace multipart {

/**
 * @brief Create a writer for a batch request
 * @brief 创建批处理请求写入器
 *
 * @param sink The output the payload is written to / 负载输出端
 * @param settings Writer settings; writing_response is forced off / 写入器设置
 * @return The writer, or invalid_settings / 写入器或错误
 *
 * @example
 * memory_sink sink;
 * auto writer = multipart::request_writer(sink);
 * (*writer)->start_batch();
 * auto op = (*writer)->create_operation_request_message("GET", "Customers");
 * (*writer)->end_batch();
 */
inline result<std::unique_ptr<multipart_mixed_writer>> request_writer(output_sink& sink,
                                                                      writer_settings settings = {}) {
    settings.writing_response = false;
    return multipart_mixed_writer::create(sink, std::move(settings));
}

/**
 * @brief Create a writer for a batch response
 * @brief 创建批处理响应写入器
 */
inline result<std::unique_ptr<multipart_mixed_writer>> response_writer(output_sink& sink,
                                                                       writer_settings settings = {}) {
    settings.writing_response = true;
    return multipart_mixed_writer::create(sink, std::move(settings));
}

/**
 * @brief Content-Type of the enclosing batch message
 * @brief 外层批处理消息的Content-Type
 *
 * @example
 * content_type("batch_36522ad7") == "multipart/mixed; boundary=batch_36522ad7"
 */
inline std::string content_type(std::string_view batch_boundary) {
    std::string value{constants::multipart_mixed};
    value += "; ";
    value += constants::boundary_parameter;
    value += "=";
    value.append(batch_boundary);
    return value;
}

} // namespace multipart

// =============================================================================
// One-shot Encoding / 一次性编码
// Whole batches described as values, written in one call
// 以值描述整个批处理并一次写出
// =============================================================================

struct request_operation {
    std::string method;
    std::string uri;
    std::string content_id;
    std::vector<header> headers;
    std::string body;
    uri_option option = uri_option::absolute_uri;
};

struct response_operation {
    unsigned int status_code = 200;
    std::string content_id;
    std::vector<header> headers;
    std::string body;
};

template<typename Operation>
struct changeset {
    std::vector<Operation> operations;
};

using request_part = std::variant<request_operation, changeset<request_operation>>;
using response_part = std::variant<response_operation, changeset<response_operation>>;

namespace detail {

inline result<void> write_body(operation_message& message, std::string_view body) {
    if (body.empty()) {
        return {};
    }
    auto stream = message.get_stream();
    if (!stream) {
        return std::unexpected(stream.error());
    }
    if (auto ok = stream->write(body); !ok) {
        return ok;
    }
    return stream->dispose();
}

inline result<void> write_headers(operation_message& message, const std::vector<header>& headers) {
    for (const auto& h : headers) {
        if (auto ok = message.set_header(h.name, h.value); !ok) {
            return ok;
        }
    }
    return {};
}

inline result<void> write_operation(multipart_mixed_writer& writer, const request_operation& op) {
    auto message = writer.create_operation_request_message(op.method, op.uri, op.content_id, op.option);
    if (!message) {
        return std::unexpected(message.error());
    }
    if (auto ok = write_headers(**message, op.headers); !ok) {
        return ok;
    }
    return write_body(**message, op.body);
}

inline result<void> write_operation(multipart_mixed_writer& writer, const response_operation& op) {
    auto message = writer.create_operation_response_message(op.content_id);
    if (!message) {
        return std::unexpected(message.error());
    }
    if (auto ok = (*message)->set_status_code(op.status_code); !ok) {
        return ok;
    }
    if (auto ok = write_headers(**message, op.headers); !ok) {
        return ok;
    }
    return write_body(**message, op.body);
}

template<typename Operation>
result<void> write_part(multipart_mixed_writer& writer, const Operation& op) {
    return write_operation(writer, op);
}

template<typename Operation>
result<void> write_part(multipart_mixed_writer& writer, const changeset<Operation>& cs) {
    if (auto ok = writer.start_changeset(); !ok) {
        return ok;
    }
    for (const auto& op : cs.operations) {
        if (auto ok = write_operation(writer, op); !ok) {
            return ok;
        }
    }
    return writer.end_changeset();
}

template<typename Part>
result<std::string> encode_batch(const std::vector<Part>& parts, writer_settings settings) {
    settings.mode = execution_mode::synchronous;

    memory_sink sink;
    auto writer = multipart_mixed_writer::create(sink, std::move(settings));
    if (!writer) {
        return std::unexpected(writer.error());
    }
    if (auto ok = (*writer)->start_batch(); !ok) {
        return std::unexpected(ok.error());
    }
    for (const auto& part : parts) {
        auto ok = std::visit([&](const auto& p) { return write_part(**writer, p); }, part);
        if (!ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = (*writer)->end_batch(); !ok) {
        return std::unexpected(ok.error());
    }
    return sink.to_string();
}

} // namespace detail

/**
 * @brief Encode a complete batch request
 * @brief 编码完整的批处理请求
 *
 * @param parts Top-level operations and changesets in wire order / 按线路顺序的操作与变更集
 * @param settings Writer settings (batch_boundary fixes the delimiter) / 写入器设置
 * @return The payload, or the first error / 负载或首个错误
 */
inline result<std::string> encode_batch_request(const std::vector<request_part>& parts,
                                                writer_settings settings = {}) {
    settings.writing_response = false;
    return detail::encode_batch(parts, std::move(settings));
}

/**
 * @brief Encode a complete batch response
 * @brief 编码完整的批处理响应
 */
inline result<std::string> encode_batch_response(const std::vector<response_part>& parts,
                                                 writer_settings settings = {}) {
    settings.writing_response = true;
    return detail::encode_batch(parts, std::move(settings));
}

} // namespace co::batch
