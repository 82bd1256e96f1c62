#include <gtest/gtest.h>
#include "http_batch.hpp"
#include "batch_test_helpers.hpp"
#include <string>
#include <vector>

using namespace co::batch;
using co::batch::test_support::find_header;
using co::batch::test_support::read_batch;

class RoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = settings_builder()
            .base_uri("http://host/service/")
            .batch_boundary("batch_rt");
    }

    void TearDown() override {
        // 每个测试后的清理
    }

    writer_settings settings_;
};

// =============================================================================
// 一次性编码与读取往返测试
// =============================================================================

TEST_F(RoundTripTest, RequestBatchReadBack) {
    std::vector<request_part> parts;
    parts.push_back(request_operation{"GET", "Customers?$top=2", "", {{"Accept", "application/json"}}, "", {}});
    parts.push_back(changeset<request_operation>{{
        request_operation{"POST", "Customers", "1", {{"Content-Type", "application/json"}},
                          "{\"Name\":\"Ada\"}", {}},
        request_operation{"POST", "$1/Orders", "2", {{"Content-Type", "application/json"}},
                          "{\"Total\":3}", uri_option::relative_resource_path},
    }});
    parts.push_back(request_operation{"DELETE", "Orders(9)", "", {}, "", uri_option::absolute_resource_path_and_host});

    auto payload = encode_batch_request(parts, settings_);
    ASSERT_TRUE(payload.has_value()) << payload.error().message();

    auto batch = read_batch(*payload, "batch_rt");
    ASSERT_EQ(batch.operations.size(), 4);
    ASSERT_EQ(batch.changesets.size(), 1);
    EXPECT_EQ(batch.empty_changesets, 0);

    const auto& query = batch.operations[0];
    EXPECT_EQ(query.start_line, "GET http://host/service/Customers?$top=2 HTTP/1.1");
    EXPECT_EQ(find_header(query.part_headers, "Content-Type"), "application/http");
    EXPECT_EQ(find_header(query.part_headers, "Content-Transfer-Encoding"), "binary");
    EXPECT_EQ(find_header(query.headers, "Accept"), "application/json");
    EXPECT_TRUE(query.changeset.empty());

    const auto& customer = batch.operations[1];
    EXPECT_EQ(customer.changeset, batch.changesets[0]);
    EXPECT_EQ(customer.start_line, "POST http://host/service/Customers HTTP/1.1");
    EXPECT_EQ(find_header(customer.headers, "Content-ID"), "1");
    EXPECT_EQ(customer.body, "{\"Name\":\"Ada\"}");

    const auto& order = batch.operations[2];
    EXPECT_EQ(order.start_line, "POST Customers/Orders HTTP/1.1");
    EXPECT_EQ(find_header(order.headers, "Content-ID"), "2");
    EXPECT_EQ(order.body, "{\"Total\":3}");

    const auto& removal = batch.operations[3];
    EXPECT_EQ(removal.start_line, "DELETE /service/Orders(9) HTTP/1.1");
    EXPECT_EQ(find_header(removal.headers, "Host"), "host");
    EXPECT_TRUE(removal.changeset.empty());
}

TEST_F(RoundTripTest, ResponseBatchReadBack) {
    settings_.batch_boundary = "batchresponse_rt";

    std::vector<response_part> parts;
    parts.push_back(response_operation{200, "", {{"Content-Type", "application/json"}}, "{\"value\":[]}"});
    parts.push_back(changeset<response_operation>{{
        response_operation{201, "1", {{"Location", "http://host/service/Customers(3)"}}, "{\"Id\":3}"},
        response_operation{204, "2", {}, ""},
    }});

    auto payload = encode_batch_response(parts, settings_);
    ASSERT_TRUE(payload.has_value()) << payload.error().message();

    auto batch = read_batch(*payload, "batchresponse_rt");
    ASSERT_EQ(batch.operations.size(), 3);
    EXPECT_EQ(batch.operations[0].start_line, "HTTP/1.1 200 OK");
    EXPECT_EQ(batch.operations[0].body, "{\"value\":[]}");
    EXPECT_EQ(batch.operations[1].start_line, "HTTP/1.1 201 Created");
    EXPECT_EQ(find_header(batch.operations[1].headers, "Location"), "http://host/service/Customers(3)");
    EXPECT_EQ(batch.operations[2].start_line, "HTTP/1.1 204 No Content");
    EXPECT_EQ(find_header(batch.operations[2].headers, "Content-ID"), "2");
    EXPECT_TRUE(batch.changesets[0].starts_with("changesetresponse_"));
}

TEST_F(RoundTripTest, EmptyChangesetsSurvive) {
    std::vector<request_part> parts;
    parts.push_back(changeset<request_operation>{});
    parts.push_back(request_operation{"GET", "Customers", "", {}, "", {}});
    parts.push_back(changeset<request_operation>{});

    auto payload = encode_batch_request(parts, settings_);
    ASSERT_TRUE(payload.has_value());

    auto batch = read_batch(*payload, "batch_rt");
    EXPECT_EQ(batch.operations.size(), 1);
    EXPECT_EQ(batch.changesets.size(), 2);
    EXPECT_EQ(batch.empty_changesets, 2);
    EXPECT_TRUE(payload->ends_with("\r\n--batch_rt--\r\n\r\n"));
}

TEST_F(RoundTripTest, FirstErrorStopsEncoding) {
    std::vector<request_part> parts;
    parts.push_back(changeset<request_operation>{{
        request_operation{"GET", "Customers", "1", {}, "", {}},
    }});

    auto payload = encode_batch_request(parts, settings_);
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error(), make_error_code(error_code::unsafe_method_in_changeset));
}

TEST_F(RoundTripTest, InvalidSettingsReported) {
    settings_.max_parts_per_batch = 0;

    auto payload = encode_batch_request({}, settings_);
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error(), make_error_code(error_code::invalid_settings));
}
