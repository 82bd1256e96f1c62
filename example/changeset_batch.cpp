#include "../include/http_batch.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace co::batch;

void demo_request_changeset() {
    std::cout << "\n=== 变更集请求示例 ===\n";

    // 第二个操作通过"$1"引用第一个操作创建的资源
    std::vector<request_part> parts;
    parts.push_back(changeset<request_operation>{{
        request_operation{"POST", "Customers", "1", {{"Content-Type", "application/json"}},
                          R"({"Name": "Ada"})", uri_option::absolute_uri},
        request_operation{"POST", "$1/Orders", "2", {{"Content-Type", "application/json"}},
                          R"({"Total": 42})", uri_option::relative_resource_path},
    }});
    parts.push_back(request_operation{"GET", "Customers/$count", "", {}, "",
                                      uri_option::absolute_resource_path_and_host});

    auto payload = encode_batch_request(parts, settings_builder()
        .base_uri("https://example.com/service/")
        .batch_boundary("batch_demo"));

    if (payload) {
        std::cout << "✓ 编码成功 (" << payload->size() << " bytes):\n" << *payload;
    } else {
        std::cout << "✗ 编码失败: " << payload.error().message() << "\n";
    }
}

void demo_response_changeset() {
    std::cout << "\n=== 变更集响应示例 ===\n";

    std::vector<response_part> parts;
    parts.push_back(changeset<response_operation>{{
        response_operation{201, "1", {{"Location", "https://example.com/service/Customers(7)"}}, ""},
        response_operation{204, "2", {}, ""},
    }});

    auto payload = encode_batch_response(parts);
    if (payload) {
        std::cout << "✓ 编码成功:\n" << *payload;
    } else {
        std::cout << "✗ 编码失败: " << payload.error().message() << "\n";
    }
}

void demo_rule_violation() {
    std::cout << "\n=== 规则校验示例 ===\n";

    memory_sink sink;
    multipart_mixed_writer writer(sink);

    if (!writer.start_batch() || !writer.start_changeset()) {
        std::cout << "✗ 无法开始变更集\n";
        return;
    }

    // 变更集内不允许查询操作
    auto op = writer.create_operation_request_message("GET", "Customers", "1");
    if (!op) {
        std::cout << "✓ 被拒绝: [" << op.error().category().name() << "] "
                  << op.error().message() << "\n";
        std::cout << "  写入器状态: " << to_string(writer.state()) << "\n";
    }
}

int main() {
    demo_request_changeset();
    demo_response_changeset();
    demo_rule_violation();
    return 0;
}
