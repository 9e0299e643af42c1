#include <gtest/gtest.h>

#include "call_correlator.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "retry_policy.hpp"
#include "test_helpers.hpp"

#include <mutex>

using namespace bridge;
namespace helpers = bridge::testing;

namespace {
class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

class RetryPolicyTest : public ::testing::Test {
protected:
    RetryPolicyTest()
        : state(std::make_shared<helpers::ScriptedState>()),
          connection(helpers::make_scripted_factory(state)),
          correlator(connection),
          retry(connection, correlator, std::chrono::milliseconds(10)) {
        state->responder = helpers::echo_responder;
    }

    std::shared_ptr<helpers::ScriptedState> state;
    Connection connection;
    CallCorrelator correlator;
    RetryPolicy retry;
};
}

TEST_F(RetryPolicyTest, FirstSuccessReturnsImmediately) {
    Response response = retry.call_with_retry("ping", json::object(), 3);
    EXPECT_EQ(response.result["echo"], "ping");
    EXPECT_EQ(state->request_writes.load(), 1);
    EXPECT_EQ(state->connects.load(), 1);
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxRetriesWithLastError) {
    state->on_write = [](const json& message) {
        if (message.contains("method")) {
            throw ConnectionError("write failed");
        }
    };

    try {
        retry.call_with_retry("ping", json::object(), 3);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& exc) {
        EXPECT_NE(std::string(exc.what()).find("write failed"), std::string::npos);
    }
    EXPECT_EQ(state->request_writes.load(), 3);
    EXPECT_FALSE(connection.is_connected());
}

TEST_F(RetryPolicyTest, RecoversAfterTransientFailure) {
    int failures = 2;
    state->on_write = [&failures](const json& message) {
        if (message.contains("method") && failures > 0) {
            --failures;
            throw ConnectionError("connection reset");
        }
    };

    Response response = retry.call_with_retry("get_player", {{"name", "Alex"}}, 3);

    EXPECT_EQ(response.result["echo"], "get_player");
    EXPECT_EQ(state->request_writes.load(), 3);
    EXPECT_EQ(state->connects.load(), 3);
    EXPECT_TRUE(connection.is_connected());
}

TEST_F(RetryPolicyTest, ReconnectFailureIsRetriedOnNextAttempt) {
    state->on_write = [this](const json& message) {
        if (message.contains("method") && state->request_writes.load() == 1) {
            state->failing_connects = 1;
            throw ConnectionError("connection reset");
        }
    };

    // Attempt 1 fails on write, the reconnect after it fails, attempt 2
    // reconnects on demand and succeeds.
    Response response = retry.call_with_retry("ping", json::object(), 3);
    EXPECT_EQ(response.result["echo"], "ping");
    EXPECT_EQ(state->request_writes.load(), 2);
}

TEST_F(RetryPolicyTest, ProtocolErrorIsNotRetried) {
    state->responder = [](const json&) { return std::vector<std::string>{codec::frame_payload("{broken")}; };
    EXPECT_THROW(retry.call_with_retry("ping", json::object(), 3), ProtocolError);
    EXPECT_EQ(state->request_writes.load(), 1);
}

TEST_F(RetryPolicyTest, ApplicationErrorIsNotRetried) {
    state->responder = [](const json& request) {
        return std::vector<std::string>{
            helpers::response_frame(request["id"].get<int64_t>(), nullptr, {{"code", -32000}, {"message", "busy"}})};
    };

    Response response = retry.call_with_retry("ping", json::object(), 3);
    ASSERT_TRUE(response.has_error());
    EXPECT_EQ(response.error->message, "busy");
    EXPECT_EQ(state->request_writes.load(), 1);
}

TEST_F(RetryPolicyTest, ZeroRetriesFailsWithUnknownError) {
    try {
        retry.call_with_retry("ping", json::object(), 0);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& exc) {
        EXPECT_STREQ(exc.what(), "Call failed with unknown error");
    }
    EXPECT_EQ(state->request_writes.load(), 0);
}

TEST_F(RetryPolicyTest, WaitsBetweenAttempts) {
    RetryPolicy slow(connection, correlator, std::chrono::milliseconds(100));
    state->on_write = [](const json& message) {
        if (message.contains("method")) {
            throw ConnectionError("down");
        }
    };

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(slow.call_with_retry("ping", json::object(), 3), ConnectionError);
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Two delays: none after the final attempt.
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}
