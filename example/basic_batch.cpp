#include "../include/http_batch.hpp"
#include <iostream>
#include <string>

int main() {
    using namespace co::batch;

    // 批处理请求：一个查询和一个带正文的创建操作
    memory_sink sink;
    auto writer = multipart::request_writer(sink, settings_builder().base_uri("https://example.com/service/"));
    if (!writer) {
        std::cout << "Failed to create writer: " << writer.error().message() << "\n";
        return 1;
    }
    auto& w = **writer;

    if (auto ok = w.start_batch(); !ok) {
        std::cout << "start_batch failed: " << ok.error().message() << "\n";
        return 1;
    }

    auto query = w.create_operation_request_message("GET", "Customers?$top=10");
    if (!query) {
        std::cout << "GET failed: " << query.error().message() << "\n";
        return 1;
    }
    if (auto ok = (*query)->set_header("Accept", "application/json"); !ok) {
        std::cout << "set_header failed: " << ok.error().message() << "\n";
        return 1;
    }

    auto create = w.create_operation_request_message("POST", "Customers", "1");
    if (!create) {
        std::cout << "POST failed: " << create.error().message() << "\n";
        return 1;
    }
    if (auto ok = (*create)->set_header("Content-Type", "application/json"); !ok) {
        std::cout << "set_header failed: " << ok.error().message() << "\n";
        return 1;
    }

    {
        auto stream = (*create)->get_stream();
        if (!stream) {
            std::cout << "get_stream failed: " << stream.error().message() << "\n";
            return 1;
        }
        if (auto ok = stream->write(R"({"Name": "Ada"})"); !ok) {
            std::cout << "body write failed: " << ok.error().message() << "\n";
            return 1;
        }
        // 离开作用域时自动释放正文流
    }

    if (auto ok = w.end_batch(); !ok) {
        std::cout << "end_batch failed: " << ok.error().message() << "\n";
        return 1;
    }

    std::cout << "Content-Type: " << multipart::content_type(w.batch_boundary()) << "\n\n";
    std::cout << sink.view();
    return 0;
}
