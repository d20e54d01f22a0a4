#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <vector>
#include "io/byte_source.hpp"
#include "network/network_error.hpp"
#include "network/transfer_client.hpp"
#include "mock_transport.hpp"
#include "test_utils.hpp"

using namespace cirrus::network;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class TransferClientTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    std::istringstream input{std::string(100, 'a')};
    cirrus::io::IstreamSource body{input, 100};
    std::vector<unsigned> progress;
    TransferOptions options;

    void SetUp() override {
        init_logging();
        options.progress_callback = [this](unsigned p) { progress.push_back(p); };
    }
};

// Test the ETag is returned as fingerprint with the finalize bump to 100
TEST_F(TransferClientTest, ReturnsFingerprint) {
    EXPECT_CALL(*transport, put_stream("https://upload.example/obj", _, _, _))
        .WillOnce(Invoke([](const std::string&, cirrus::io::ByteSource&,
                            const TransportProgress& on_progress, AbortHandle&) {
            on_progress(50, 100);
            on_progress(100, 100);
            return make_response(200, {{"etag", "test-etag"}});
        }));

    TransferClient client(transport);
    auto receipt = client.put("https://upload.example/obj", body, options);

    EXPECT_EQ(receipt.fingerprint, "test-etag");
    EXPECT_EQ(receipt.status, 200u);
    EXPECT_EQ(progress, (std::vector<unsigned>{45, 90, 100}));
}

// Test a 2xx response without ETag
TEST_F(TransferClientTest, MissingEtagFails) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(Invoke([](const std::string&, cirrus::io::ByteSource&,
                            const TransportProgress& on_progress, AbortHandle&) {
            on_progress(100, 100);
            return make_response(200, {});
        }));

    TransferClient client(transport);
    try {
        client.put("https://upload.example/obj", body, options);
        FAIL() << "Expected MissingFingerprintError";
    } catch (const MissingFingerprintError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("Missing ETag"));
    }
    EXPECT_EQ(progress, (std::vector<unsigned>{90}));
}

// An empty ETag value is no fingerprint either
TEST_F(TransferClientTest, EmptyEtagFails) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(Return(make_response(200, {{"etag", ""}})));

    TransferClient client(transport);
    EXPECT_THROW(client.put("https://upload.example/obj", body, options), MissingFingerprintError);
}

// Non-2xx responses fail with their status
TEST_F(TransferClientTest, RejectedUploadCarriesStatus) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(Return(make_response(403, {{"etag", "ignored"}}, "denied")));

    TransferClient client(transport);
    try {
        client.put("https://upload.example/obj", body, options);
        FAIL() << "Expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.status(), 403u);
    }
    EXPECT_TRUE(progress.empty());
}

// An abort during the transfer wins over the response
TEST_F(TransferClientTest, AbortDuringTransfer) {
    options.abort_handle = std::make_shared<AbortHandle>();
    auto handle = options.abort_handle;

    EXPECT_CALL(*transport, put_stream("https://upload.example/obj", _, _, _))
        .WillOnce(Invoke([handle](const std::string&, cirrus::io::ByteSource&,
                                  const TransportProgress& on_progress, AbortHandle& passed) {
            EXPECT_EQ(&passed, handle.get());
            on_progress(50, 100);
            handle->abort("user cancelled");
            on_progress(100, 100);
            return make_response(200, {{"etag", "late"}});
        }));

    TransferClient client(transport);
    try {
        client.put("https://upload.example/obj", body, options);
        FAIL() << "Expected TransferAbortedError";
    } catch (const TransferAbortedError& e) {
        EXPECT_EQ(e.reason(), "user cancelled");
    }
    EXPECT_EQ(progress, (std::vector<unsigned>{45}));
}

// An already aborted handle never reaches the transport
TEST_F(TransferClientTest, AbortBeforeStart) {
    options.abort_handle = std::make_shared<AbortHandle>();
    options.abort_handle->abort();

    EXPECT_CALL(*transport, put_stream(_, _, _, _)).Times(0);
    TransferClient client(transport);
    EXPECT_THROW(client.put("https://upload.example/obj", body, options), TransferAbortedError);
}

// Transport errors pass through unchanged
TEST_F(TransferClientTest, TransportErrorPropagates) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(::testing::Throw(TransferError("connection reset")));

    TransferClient client(transport);
    EXPECT_THROW(client.put("https://upload.example/obj", body, options), TransferError);
}

// The finalize step runs after the ETag and gates the final 100
TEST_F(TransferClientTest, FinalizeRunsBeforeCompletion) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .Times(2)
        .WillRepeatedly(Invoke([](const std::string&, cirrus::io::ByteSource&,
                                  const TransportProgress& on_progress, AbortHandle&) {
            on_progress(100, 100);
            return make_response(200, {{"etag", "tag"}});
        }));

    std::vector<std::string> seen;
    options.finalize = [this, &seen](const TransferReceipt& receipt) {
        EXPECT_EQ(progress, (std::vector<unsigned>{90}));
        seen.push_back(receipt.fingerprint);
    };

    TransferClient client(transport);
    EXPECT_EQ(client.put("https://upload.example/obj", body, options).fingerprint, "tag");
    EXPECT_EQ(seen, (std::vector<std::string>{"tag"}));
    EXPECT_EQ(progress, (std::vector<unsigned>{90, 100}));

    progress.clear();
    options.finalize = [](const TransferReceipt&) { throw CommitError("bridge refused"); };
    EXPECT_THROW(client.put("https://upload.example/obj", body, options), CommitError);
    EXPECT_EQ(progress, (std::vector<unsigned>{90}));
}

// An abort raised while finalizing is still an abort
TEST_F(TransferClientTest, AbortDuringFinalize) {
    options.abort_handle = std::make_shared<AbortHandle>();
    auto handle = options.abort_handle;
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(Return(make_response(200, {{"etag", "tag"}})));

    options.finalize = [handle](const TransferReceipt&) { handle->abort("late cancel"); };

    TransferClient client(transport);
    EXPECT_THROW(client.put("https://upload.example/obj", body, options), TransferAbortedError);
    EXPECT_TRUE(progress.empty());
}

// Custom weighting and no callback
TEST_F(TransferClientTest, CustomWeightWithoutCallback) {
    EXPECT_CALL(*transport, put_stream(_, _, _, _))
        .WillOnce(Invoke([](const std::string&, cirrus::io::ByteSource& b,
                            const TransportProgress& on_progress, AbortHandle&) {
            drain_body(b, on_progress, 10);
            return make_response(201, {{"etag", "\"abc\""}});
        }));

    TransferClient client(transport, ProgressWeighting(50));
    TransferOptions silent;
    EXPECT_EQ(client.put("https://upload.example/obj", body, silent).fingerprint, "\"abc\"");
    EXPECT_THROW(TransferClient(nullptr), std::invalid_argument);
}
