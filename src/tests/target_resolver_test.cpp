#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <future>
#include <nlohmann/json.hpp>
#include "crypto/encoding.hpp"
#include "network/http_transport.hpp"
#include "network/network_error.hpp"
#include "network/target_resolver.hpp"
#include "loopback_server.hpp"
#include "mock_transport.hpp"
#include "test_utils.hpp"

using namespace cirrus::network;
using json = nlohmann::json;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::SaveArg;

class BridgeTargetResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    BridgeTargetResolver resolver{transport, "https://gateway.example.com/network", "user@example.com", "pass"};
    AbortHandle handle;

    void SetUp() override {
        init_logging();
    }

    CommitRequest commit_request() const {
        CommitRequest request;
        request.bucket_id = TEST_BUCKET;
        request.index = std::string(64, 'a');
        request.shard_id = "obj-123";
        request.content_hash = "bb1be98c142444d7a56aa3981c3942a978e4dc33";
        return request;
    }
};

// Test the start request and the descriptor built from the answer
TEST_F(BridgeTargetResolverTest, ResolvesUploadSlot) {
    HttpRequest sent;
    AbortHandle* passed = nullptr;
    EXPECT_CALL(*transport, send(_, _))
        .WillOnce(::testing::DoAll(SaveArg<0>(&sent), SaveArg<1>(&passed),
            Return(make_response(200, {},
                "{\"uploads\":[{\"index\":0,\"uuid\":\"obj-123\",\"url\":\"https://s3.example/put?sig=1\"}]}"))));

    auto descriptor = resolver.resolve(TEST_BUCKET, 1234, handle);

    EXPECT_EQ(descriptor.url, "https://s3.example/put?sig=1");
    EXPECT_EQ(descriptor.remote_object_id, "obj-123");
    EXPECT_EQ(descriptor.content_length, 1234u);
    EXPECT_EQ(passed, &handle);

    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://gateway.example.com/network/v2/buckets/" + TEST_BUCKET +
                        "/files/start?multiparts=1");
    EXPECT_EQ(sent.headers["Authorization"],
              "Basic dXNlckBleGFtcGxlLmNvbTpkNzRmZjBlZThkYTNiOTgwNmIxOGM4NzdkYmYyOWJiZGU1MGI1YmQ4ZTRkYWQ3YTNhNzI1MDAwZmViODJlOGYx");

    auto body = json::parse(sent.body);
    const auto& slot = body.at("uploads").at(0);
    EXPECT_EQ(slot.at("index").get<int>(), 0);
    ASSERT_TRUE(slot.at("size").is_number());
    EXPECT_EQ(slot.at("size").get<std::uint64_t>(), 1234u);
}

// Bridge errors become resolution errors
TEST_F(BridgeTargetResolverTest, RejectedByBridge) {
    EXPECT_CALL(*transport, send(_, _))
        .WillOnce(Return(make_response(401, {}, "{\"error\":\"Unauthorized\"}")));

    try {
        resolver.resolve(TEST_BUCKET, 10, handle);
        FAIL() << "Expected TargetResolutionError";
    } catch (const TargetResolutionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("401"));
    }
}

// Connection failures become resolution errors
TEST_F(BridgeTargetResolverTest, TransportFailure) {
    EXPECT_CALL(*transport, send(_, _)).WillOnce(::testing::Throw(TransferError("connection refused")));
    EXPECT_THROW(resolver.resolve(TEST_BUCKET, 10, handle), TargetResolutionError);
}

// Cancellation reported by the transport is not turned into a resolution error
TEST_F(BridgeTargetResolverTest, AbortPassesThrough) {
    EXPECT_CALL(*transport, send(_, _)).WillOnce(::testing::Throw(TransferAbortedError("stop")));
    EXPECT_THROW(resolver.resolve(TEST_BUCKET, 10, handle), TransferAbortedError);

    handle.abort("already");
    EXPECT_THROW(resolver.resolve(TEST_BUCKET, 10, handle), TransferAbortedError);
}

// Malformed or incomplete answers are rejected
TEST_F(BridgeTargetResolverTest, MalformedAnswers) {
    EXPECT_CALL(*transport, send(_, _))
        .WillOnce(Return(make_response(200, {}, "not json")))
        .WillOnce(Return(make_response(200, {}, "{\"uploads\":[]}")))
        .WillOnce(Return(make_response(200, {}, "{\"uploads\":[{\"uuid\":\"x\"}]}")))
        .WillOnce(Return(make_response(200, {}, "{\"uploads\":[{\"url\":\"https://s3/\"}]}")))
        .WillOnce(Return(make_response(200, {}, "{\"uploads\":[{\"url\":7,\"uuid\":\"x\"}]}")))
        .WillOnce(Return(make_response(200, {}, "[]")));

    for (int i = 0; i < 6; ++i) {
        EXPECT_THROW(resolver.resolve(TEST_BUCKET, 10, handle), TargetResolutionError) << "answer " << i;
    }
}

// Missing inputs fail without a request
TEST_F(BridgeTargetResolverTest, MissingInputs) {
    EXPECT_CALL(*transport, send(_, _)).Times(0);
    EXPECT_THROW(resolver.resolve("", 10, handle), TargetResolutionError);

    BridgeTargetResolver anonymous(transport, "https://gateway.example.com/network", "", "");
    EXPECT_THROW(anonymous.resolve(TEST_BUCKET, 10, handle), TargetResolutionError);
}

// Test the finish request and the returned file id
TEST_F(BridgeTargetResolverTest, CommitsShard) {
    HttpRequest sent;
    EXPECT_CALL(*transport, send(_, &handle))
        .WillOnce(::testing::DoAll(SaveArg<0>(&sent),
            Return(make_response(200, {}, "{\"id\":\"file-1\",\"bucket\":\"b\"}"))));

    EXPECT_EQ(resolver.commit(commit_request(), handle), "file-1");

    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://gateway.example.com/network/v2/buckets/" + TEST_BUCKET + "/files/finish");
    EXPECT_EQ(sent.headers["Authorization"], resolver.authorization());

    auto body = json::parse(sent.body);
    EXPECT_EQ(body.at("index").get<std::string>(), std::string(64, 'a'));
    const auto& shard = body.at("shards").at(0);
    EXPECT_EQ(shard.at("uuid").get<std::string>(), "obj-123");
    EXPECT_EQ(shard.at("hash").get<std::string>(), "bb1be98c142444d7a56aa3981c3942a978e4dc33");
    EXPECT_EQ(body.at("shards").size(), 1u);
}

// Commit failures are reported as CommitError, aborts pass through
TEST_F(BridgeTargetResolverTest, CommitFailures) {
    EXPECT_CALL(*transport, send(_, _))
        .WillOnce(Return(make_response(409, {}, "conflict")))
        .WillOnce(Return(make_response(200, {}, "{}")))
        .WillOnce(Return(make_response(200, {}, "garbage")))
        .WillOnce(::testing::Throw(TransferError("reset")))
        .WillOnce(::testing::Throw(TransferAbortedError("stop")));

    for (int i = 0; i < 4; ++i) {
        EXPECT_THROW(resolver.commit(commit_request(), handle), CommitError) << "attempt " << i;
    }
    EXPECT_THROW(resolver.commit(commit_request(), handle), TransferAbortedError);

    auto incomplete = commit_request();
    incomplete.content_hash.clear();
    EXPECT_THROW(resolver.commit(incomplete, handle), CommitError);
}

// An abort ends a start request the bridge never answers, well before the I/O timeout
TEST_F(BridgeTargetResolverTest, AbortStopsSilentBridge) {
    std::promise<void> release;
    auto released = release.get_future().share();
    loopback::TestServer server([released](const loopback::Request&) {
        released.wait();
        return loopback::reply(loopback::http::status::ok);
    });
    auto request_future = server.received();

    HttpTransport::Options options;
    options.timeout = std::chrono::seconds(3);
    auto http_transport = std::make_shared<HttpTransport>(options);
    BridgeTargetResolver bridge(http_transport, server.url("/network"), "user@example.com", "pass");

    auto call = std::async(std::launch::async, [&]() { return bridge.resolve(TEST_BUCKET, 10, handle); });

    request_future.wait();
    auto started = std::chrono::steady_clock::now();
    handle.abort("user cancelled");

    bool aborted = false;
    try {
        call.get();
    } catch (const TransferAbortedError& e) {
        aborted = true;
        EXPECT_EQ(e.reason(), "user cancelled");
    } catch (const NetworkError& e) {
        ADD_FAILURE() << "Unexpected error: " << e.what();
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    release.set_value();

    EXPECT_TRUE(aborted);
    EXPECT_LT(waited.count(), 1500);

    auto request = request_future.get();
    EXPECT_EQ(std::string(request.target()), "/network/v2/buckets/" + TEST_BUCKET + "/files/start?multiparts=1");
}
