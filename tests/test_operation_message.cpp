#include <gtest/gtest.h>
#include "http_batch.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace co::batch;

namespace {

// Records what operation messages and streams report to their writer
class recording_listener : public stream_listener {
public:
    result<void> stream_requested(const operation_message& message) override {
        requested.push_back(&message);
        if (fail_requests) {
            return fail(error_code::invalid_state_transition);
        }
        return {};
    }

    std::future<result<void>> stream_requested_async(const operation_message& message) override {
        std::promise<result<void>> done;
        done.set_value(stream_requested(message));
        return done.get_future();
    }

    result<void> stream_disposed() override {
        ++disposed;
        return {};
    }

    std::vector<const operation_message*> requested;
    int disposed = 0;
    bool fail_requests = false;
};

} // namespace

class OperationMessageTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_unique<memory_sink>();
        writer_ = std::make_unique<text_writer>(*sink_);
    }

    void TearDown() override {
        writer_.reset();
        sink_.reset();
    }

    std::shared_ptr<operation_request_message> make_request(std::string content_id = {}) {
        return std::make_shared<operation_request_message>(
            *sink_, listener_, "POST", "http://host/service/Customers", std::move(content_id));
    }

    std::shared_ptr<operation_response_message> make_response(std::string content_id = {}) {
        return std::make_shared<operation_response_message>(*sink_, listener_, std::move(content_id));
    }

    std::string written() {
        EXPECT_TRUE(writer_->flush().has_value());
        return sink_->to_string();
    }

    std::unique_ptr<memory_sink> sink_;
    std::unique_ptr<text_writer> writer_;
    recording_listener listener_;
    pending_message_buffer pending_;
};

// =============================================================================
// 头部列表测试
// =============================================================================

TEST_F(OperationMessageTest, HeaderListCaseInsensitive) {
    header_list headers;
    headers.set("Content-Type", "application/json");

    ASSERT_TRUE(headers.get("content-type").has_value());
    EXPECT_EQ(*headers.get("CONTENT-TYPE"), "application/json");
    EXPECT_TRUE(headers.contains("Content-type"));
    EXPECT_FALSE(headers.get("Accept").has_value());
}

TEST_F(OperationMessageTest, HeaderListReplaceKeepsPosition) {
    header_list headers;
    headers.set("A", "1");
    headers.set("B", "2");
    headers.set("a", "3");

    ASSERT_EQ(headers.size(), 2);
    auto it = headers.begin();
    EXPECT_EQ(it->name, "A");
    EXPECT_EQ(it->value, "3");
    ++it;
    EXPECT_EQ(it->name, "B");
}

TEST_F(OperationMessageTest, HeaderListRemove) {
    header_list headers;
    headers.set("A", "1");
    headers.set("B", "2");

    EXPECT_TRUE(headers.remove("b"));
    EXPECT_FALSE(headers.remove("B"));
    EXPECT_EQ(headers.size(), 1);

    headers.clear();
    EXPECT_TRUE(headers.empty());
}

// =============================================================================
// 待写消息缓冲区测试
// =============================================================================

TEST_F(OperationMessageTest, EmptyBufferWritesNothing) {
    EXPECT_FALSE(pending_.has_message());
    EXPECT_EQ(pending_.flush(*writer_, version::http_1_1, true), 0);
    EXPECT_EQ(written(), "");
}

TEST_F(OperationMessageTest, RequestHeadersInInsertionOrder) {
    auto request = make_request("1");
    ASSERT_TRUE(request->set_header("Content-Type", "application/json").has_value());
    ASSERT_TRUE(request->set_header("Prefer", "return=minimal").has_value());
    ASSERT_TRUE(request->set_header("If-Match", "*").has_value());

    pending_.set(request);
    EXPECT_TRUE(pending_.has_message());
    EXPECT_TRUE(pending_.is_current(*request));
    EXPECT_EQ(pending_.request(), request);
    EXPECT_FALSE(pending_.response());

    auto bytes = pending_.flush(*writer_, version::http_1_1, true);

    std::string expected =
        "Content-Type: application/json\r\n"
        "Prefer: return=minimal\r\n"
        "If-Match: *\r\n"
        "Content-ID: 1\r\n"
        "\r\n";
    EXPECT_EQ(bytes, expected.size());
    EXPECT_EQ(written(), expected);
    EXPECT_FALSE(pending_.has_message());
}

TEST_F(OperationMessageTest, ResponseStatusLine) {
    auto response = make_response();
    ASSERT_TRUE(response->set_status_code(404).has_value());
    ASSERT_TRUE(response->set_header("Content-Type", "application/json").has_value());

    pending_.set(response);
    pending_.flush(*writer_, version::http_1_1, true);

    EXPECT_EQ(written(), "HTTP/1.1 404 Not Found\r\nContent-Type: application/json\r\n\r\n");
}

TEST_F(OperationMessageTest, ResponseDefaultsAndUnknownStatus) {
    auto ok = make_response("5");
    EXPECT_EQ(ok->status_code(), 200);
    pending_.set(ok);
    pending_.flush(*writer_, version::http_1_0, true);

    auto odd = make_response();
    ASSERT_TRUE(odd->set_status_code(799).has_value());
    pending_.set(odd);
    pending_.flush(*writer_, version::http_1_1, true);

    EXPECT_EQ(written(),
        "HTTP/1.0 200 OK\r\nContent-ID: 5\r\n\r\n"
        "HTTP/1.1 799 Unknown Status Code\r\n\r\n");
}

TEST_F(OperationMessageTest, CallerContentIdHeaderNotDuplicated) {
    auto request = make_request("1");
    ASSERT_TRUE(request->set_header("content-id", "custom").has_value());

    pending_.set(request);
    pending_.flush(*writer_, version::http_1_1, true);

    EXPECT_EQ(written(), "content-id: custom\r\n\r\n");
}

TEST_F(OperationMessageTest, FlushWithoutReportKeepsMessageCurrent) {
    auto request = make_request();
    ASSERT_TRUE(request->set_header("Content-Type", "text/plain").has_value());
    pending_.set(request);

    EXPECT_GT(pending_.flush(*writer_, version::http_1_1, false), 0);
    EXPECT_TRUE(request->is_completed());
    EXPECT_TRUE(pending_.is_current(*request));

    // 前导只写一次
    EXPECT_EQ(pending_.flush(*writer_, version::http_1_1, false), 0);
    EXPECT_EQ(pending_.flush(*writer_, version::http_1_1, true), 0);
    EXPECT_FALSE(pending_.has_message());

    EXPECT_EQ(written(), "Content-Type: text/plain\r\n\r\n");
}

TEST_F(OperationMessageTest, CompletionCallbackFiresOnce) {
    auto request = make_request("1");
    int fired = 0;
    request->on_completed([&](const operation_message& message) {
        ++fired;
        EXPECT_EQ(message.content_id(), "1");
    });

    pending_.set(request);
    pending_.flush(*writer_, version::http_1_1, false);
    pending_.flush(*writer_, version::http_1_1, true);

    EXPECT_EQ(fired, 1);
}

TEST_F(OperationMessageTest, ResetDropsWithoutWriting) {
    auto request = make_request("1");
    pending_.set(request);
    pending_.reset();

    EXPECT_EQ(pending_.flush(*writer_, version::http_1_1, true), 0);
    EXPECT_FALSE(request->is_completed());
}

// =============================================================================
// 消息修改测试
// =============================================================================

TEST_F(OperationMessageTest, MutationAfterCompletionFails) {
    auto response = make_response("1");
    ASSERT_TRUE(response->set_header("A", "1").has_value());

    pending_.set(response);
    pending_.flush(*writer_, version::http_1_1, true);

    auto header = response->set_header("B", "2");
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error(), make_error_code(error_code::operation_message_completed));

    auto removed = response->remove_header("A");
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error(), make_error_code(error_code::operation_message_completed));

    auto status = response->set_status_code(500);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(response->status_code(), 200);

    // 读取仍然可用
    EXPECT_EQ(*response->get_header("a"), "1");
}

TEST_F(OperationMessageTest, RequestAccessors) {
    auto request = make_request("7");
    EXPECT_EQ(request->method(), "POST");
    EXPECT_EQ(request->uri(), "http://host/service/Customers");
    EXPECT_EQ(request->content_id(), "7");
    EXPECT_FALSE(request->is_completed());

    ASSERT_TRUE(request->set_header("X", "1").has_value());
    ASSERT_TRUE(request->remove_header("x").has_value());
    EXPECT_TRUE(request->headers().empty());
}

// =============================================================================
// 操作正文流测试
// =============================================================================

TEST_F(OperationMessageTest, StreamWritesToSink) {
    auto request = make_request();
    auto stream = request->get_stream();
    ASSERT_TRUE(stream.has_value());
    ASSERT_EQ(listener_.requested.size(), 1);
    EXPECT_EQ(listener_.requested[0], request.get());

    std::vector<uint8_t> bytes = {'!', '?'};
    ASSERT_TRUE(stream->write("{\"a\":1}").has_value());
    ASSERT_TRUE(stream->write(std::span<const uint8_t>(bytes)).has_value());
    EXPECT_EQ(sink_->view(), "{\"a\":1}!?");

    ASSERT_TRUE(stream->dispose().has_value());
    EXPECT_TRUE(stream->disposed());
    EXPECT_EQ(listener_.disposed, 1);
}

TEST_F(OperationMessageTest, StreamUseAfterDispose) {
    auto stream = make_request()->get_stream();
    ASSERT_TRUE(stream.has_value());
    ASSERT_TRUE(stream->dispose().has_value());

    auto write = stream->write("late");
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error(), make_error_code(error_code::stream_already_disposed));

    auto again = stream->dispose();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), make_error_code(error_code::stream_already_disposed));
    EXPECT_EQ(listener_.disposed, 1);
}

TEST_F(OperationMessageTest, StreamDisposedOnDestruction) {
    auto request = make_request();
    {
        auto stream = request->get_stream();
        ASSERT_TRUE(stream.has_value());
    }
    EXPECT_EQ(listener_.disposed, 1);
}

TEST_F(OperationMessageTest, MovedStreamDisposedOnce) {
    auto request = make_request();
    {
        auto stream = request->get_stream();
        ASSERT_TRUE(stream.has_value());

        operation_stream moved = std::move(*stream);
        EXPECT_TRUE(stream->disposed());
        EXPECT_FALSE(moved.disposed());
    }
    EXPECT_EQ(listener_.disposed, 1);
}

TEST_F(OperationMessageTest, RejectedStreamRequest) {
    listener_.fail_requests = true;

    auto stream = make_request()->get_stream();
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error(), make_error_code(error_code::invalid_state_transition));
    EXPECT_EQ(listener_.disposed, 0);
}

TEST_F(OperationMessageTest, AsyncStreamRequest) {
    auto request = make_request();
    auto pending = request->get_stream_async();

    auto stream = pending.get();
    ASSERT_TRUE(stream.has_value());
    ASSERT_TRUE(stream->write("body").has_value());
    EXPECT_EQ(sink_->view(), "body");
}

TEST_F(OperationMessageTest, AsyncStreamOutlivesMessageHandle) {
    auto request = make_request();
    auto pending = request->get_stream_async();

    // 消息句柄释放后仍可取得正文流
    request.reset();

    auto stream = pending.get();
    ASSERT_TRUE(stream.has_value());
    ASSERT_TRUE(stream->write("body").has_value());
    ASSERT_TRUE(stream->dispose().has_value());
    EXPECT_EQ(sink_->view(), "body");
    EXPECT_EQ(listener_.disposed, 1);
}
