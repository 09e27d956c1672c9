#include <gtest/gtest.h>
#include "api/api_types.hpp"
#include "crypto/cipher.hpp"
#include "test_utils.hpp"

using namespace histvault;
using namespace histvault::api;

class ApiTypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging();
    }
};

TEST_F(ApiTypesTest, AddHistoryRequestJson) {
    AddHistoryRequest item;
    item.id = "0123456789abcdef0123456789abcdef";
    item.timestamp = history::from_nanos(1619353000000000001LL);
    item.data = "{\"nonce\":\"x\"}";
    item.hostname = "laptop:alice";

    const auto j = nlohmann::json(item);
    EXPECT_EQ(j["timestamp"], "2021-04-25T12:16:40.000000001Z");
    EXPECT_EQ(j["data"], item.data);

    const auto parsed = parse_body<AddHistoryRequest>(j.dump());
    EXPECT_EQ(parsed.id, item.id);
    EXPECT_EQ(parsed.timestamp, item.timestamp);
    EXPECT_EQ(parsed.data, item.data);
    EXPECT_EQ(parsed.hostname, item.hostname);
    // uploads carry no sequence
    EXPECT_FALSE(j.contains("seq"));
    EXPECT_EQ(parsed.seq, 0);

    item.seq = 17;
    EXPECT_EQ(parse_body<AddHistoryRequest>(nlohmann::json(item).dump()).seq, 17);
}

TEST_F(ApiTypesTest, RejectsMalformedBodies) {
    EXPECT_THROW(parse_body<CountResponse>("not json"), ProtocolError);
    EXPECT_THROW(parse_body<CountResponse>("[]"), ProtocolError);
    EXPECT_THROW(parse_body<CountResponse>("{}"), ProtocolError);
    EXPECT_THROW(parse_body<CountResponse>("{\"count\":\"12\"}"), ProtocolError);
    EXPECT_THROW(parse_body<CountResponse>("{\"count\":-1}"), ProtocolError);
    EXPECT_EQ(parse_body<CountResponse>("{\"count\":12}").count, 12);

    EXPECT_THROW(parse_body<AddHistoryRequest>(
        R"({"id":"","timestamp":"2021-04-25T12:16:40Z","data":"","hostname":"h"})"), ProtocolError);
    EXPECT_THROW(parse_body<AddHistoryRequest>(
        R"({"id":"a","timestamp":"yesterday","data":"","hostname":"h"})"), ProtocolError);
    EXPECT_THROW(parse_body<AddHistoryRequest>(
        R"({"id":"a","timestamp":"2021-04-25T12:16:40Z","data":"","hostname":7})"), ProtocolError);
    EXPECT_THROW(parse_body<AddHistoryRequest>(
        R"({"id":"a","timestamp":"2021-04-25T12:16:40Z","data":"","hostname":"h","seq":-3})"), ProtocolError);
    EXPECT_THROW(parse_body<AddHistoryRequest>(
        R"({"id":"a","timestamp":"2021-04-25T12:16:40Z","data":"","hostname":"h","seq":"3"})"), ProtocolError);

    EXPECT_THROW(parse_body<SyncHistoryResponse>("{\"history\":{}}"), ProtocolError);
    EXPECT_THROW(parse_body<std::vector<AddHistoryRequest>>("{}"), ProtocolError);
    EXPECT_TRUE(parse_body<SyncHistoryResponse>("{\"history\":[]}").history.empty());
    EXPECT_EQ(parse_body<SyncHistoryResponse>("{\"history\":[]}").sync_ts, history::epoch());
    EXPECT_THROW(parse_body<SyncHistoryResponse>(R"({"history":[],"sync_ts":"soon"})"), ProtocolError);
}

TEST_F(ApiTypesTest, RegisterRequestRequiresAllFields) {
    EXPECT_THROW(parse_body<RegisterRequest>(R"({"username":"a","email":"b"})"), ProtocolError);
    const auto request = parse_body<RegisterRequest>(R"({"username":"a","email":"b","password":"c"})");
    EXPECT_EQ(request.password, "c");
}

TEST_F(ApiTypesTest, SyncQueryRoundTrip) {
    SyncHistoryRequest request;
    request.sync_ts = history::from_nanos(1700000000000000000LL);
    request.history_ts = history::from_nanos(1619353000500000000LL);
    request.host = "laptop:alice smith&co";
    request.page_size = 250;
    request.after_seq = 123456789012LL;

    const auto query = build_query_string(to_query(request));
    EXPECT_EQ(query.find(' '), std::string::npos);

    const auto parsed = sync_request_from_query(parse_query_string(query));
    EXPECT_EQ(parsed.sync_ts, request.sync_ts);
    EXPECT_EQ(parsed.history_ts, request.history_ts);
    EXPECT_EQ(parsed.host, request.host);
    EXPECT_EQ(parsed.page_size, request.page_size);
    EXPECT_EQ(parsed.after_seq, request.after_seq);
}

TEST_F(ApiTypesTest, SyncQueryValidation) {
    QueryParams params{{"sync_ts", "2021-04-25T12:16:40Z"},
                       {"history_ts", "1970-01-01T00:00:00Z"},
                       {"host", "laptop"},
                       {"page_size", "100"}};
    EXPECT_NO_THROW(sync_request_from_query(params));

    for (const std::string bad : {"0", "", "-5", "ten", "9999999999"}) {
        auto invalid = params;
        invalid["page_size"] = bad;
        EXPECT_THROW(sync_request_from_query(invalid), ProtocolError) << "page_size " << bad;
    }

    EXPECT_EQ(sync_request_from_query(params).after_seq, 0);
    for (const std::string bad : {"", "-1", "next", "9999999999999999999"}) {
        auto invalid = params;
        invalid["after_seq"] = bad;
        EXPECT_THROW(sync_request_from_query(invalid), ProtocolError) << "after_seq " << bad;
    }

    auto missing = params;
    missing.erase("host");
    EXPECT_THROW(sync_request_from_query(missing), ProtocolError);

    auto bad_time = params;
    bad_time["history_ts"] = "1970-01-01";
    EXPECT_THROW(sync_request_from_query(bad_time), ProtocolError);
}

TEST_F(ApiTypesTest, UrlEncoding) {
    EXPECT_EQ(url_encode("a b/c:d"), "a%20b%2Fc%3Ad");
    EXPECT_EQ(url_encode("safe-_.~"), "safe-_.~");
    EXPECT_EQ(url_decode("a%20b+c%2f"), "a b c/");
    EXPECT_THROW(url_decode("%4"), ProtocolError);
    EXPECT_THROW(url_decode("%zz"), ProtocolError);

    const auto params = parse_query_string("a=1&&b=&c");
    EXPECT_EQ(params.at("a"), "1");
    EXPECT_EQ(params.at("b"), "");
    EXPECT_EQ(params.at("c"), "");
}

TEST_F(ApiTypesTest, BlobWireMapping) {
    const auto key = crypto::generate_key();
    const auto record = test::make_record("laptop:alice", 1619353000);
    const auto blob = crypto::Cipher::encrypt(key, record);

    const auto wire = to_wire(blob);
    EXPECT_EQ(wire.id, blob.id);
    EXPECT_EQ(wire.hostname, blob.hostname);
    const auto data = nlohmann::json::parse(wire.data);
    EXPECT_TRUE(data.contains("nonce"));
    EXPECT_TRUE(data.contains("ciphertext"));

    EXPECT_EQ(from_wire(wire), blob);
}

TEST_F(ApiTypesTest, MalformedBlobData) {
    AddHistoryRequest wire;
    wire.id = "abc";
    wire.hostname = "h";

    wire.data = "not json";
    EXPECT_THROW(from_wire(wire), ProtocolError);
    wire.data = R"({"nonce":"AAAA"})";
    EXPECT_THROW(from_wire(wire), ProtocolError);
    wire.data = R"({"nonce":"AAA","ciphertext":"AAAA"})";
    EXPECT_THROW(from_wire(wire), ProtocolError);
    wire.data = R"({"nonce":1,"ciphertext":"AAAA"})";
    EXPECT_THROW(from_wire(wire), ProtocolError);
}
