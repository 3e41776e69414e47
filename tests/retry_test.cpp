#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <string>
#include <vector>
#include "ethstorage/chain/retry.hpp"
#include "fakes.hpp"

using namespace ethstorage;
using namespace ethstorage::chain;

class RetryTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::quiet_logging();
    RetryOptions options;
    options.sleep = [this](std::chrono::milliseconds delay) { delays.push_back(delay); };
    policy = std::make_unique<RetryPolicy>(options);
  }

  // Runs a call that always throws the given error, counting invocations
  template <typename Error>
  int run_failing(const Error& error) {
    int calls = 0;
    try {
      policy->run([&]() -> int {
        ++calls;
        throw error;
      }, "test");
    } catch (const RetryExhaustedError&) {
    } catch (const NonRetryableError&) {
    }
    return calls;
  }

  std::unique_ptr<RetryPolicy> policy;
  std::vector<std::chrono::milliseconds> delays;
};

//==============================================
// CLASSIFICATION
//==============================================

TEST_F(RetryTest, ClassifiesByCodeStatusAndMessage) {
  EXPECT_EQ(RpcError("reset", "ECONNRESET").type(), ErrorType::Socket);
  EXPECT_EQ(RpcError("no host", "ENOTFOUND").type(), ErrorType::Network);
  EXPECT_EQ(RpcError("request Timed Out").type(), ErrorType::Timeout);
  EXPECT_EQ(RpcError("slow down", "", std::nullopt, 429).type(), ErrorType::RateLimit);
  EXPECT_EQ(RpcError("exceeded Rate Limit").type(), ErrorType::RateLimit);
  EXPECT_EQ(RpcError("internal", "", -32603).type(), ErrorType::RpcServer);
  EXPECT_EQ(RpcError("bad gateway", "", std::nullopt, 502).type(), ErrorType::Server);
  EXPECT_EQ(RpcError("forbidden", "", std::nullopt, 403).type(), ErrorType::Client);
  EXPECT_EQ(RpcError("something odd").type(), ErrorType::Unknown);
}

TEST_F(RetryTest, SymbolicCodeTakesPrecedenceOverMessage) {
  EXPECT_EQ(RpcError("timeout while reading", "EPIPE").type(), ErrorType::Socket);
  EXPECT_EQ(classify("", -32000, 404, "x"), ErrorType::RpcServer);
}

TEST_F(RetryTest, MapsAsioErrors) {
  RpcError refused(make_error_code(boost::asio::error::connection_refused));
  EXPECT_EQ(refused.code(), "ECONNREFUSED");
  EXPECT_EQ(refused.type(), ErrorType::Socket);
  RpcError unreachable(make_error_code(boost::asio::error::host_unreachable));
  EXPECT_EQ(unreachable.type(), ErrorType::Network);
}

TEST_F(RetryTest, OnlyClientErrorsAreNotRetryable) {
  EXPECT_FALSE(RpcError("x", "", std::nullopt, 400).retryable());
  EXPECT_TRUE(RpcError("x").retryable());
}

//==============================================
// RETRY LOOP
//==============================================

TEST_F(RetryTest, ReturnsFirstSuccess) {
  int calls = 0;
  int value = policy->run([&]() {
    if (++calls < 3) {
      throw RpcError("reset", "ECONNRESET");
    }
    return 42;
  }, "flaky");
  EXPECT_EQ(value, 42);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(delays.size(), 2u);
}

TEST_F(RetryTest, UnknownErrorsGetOneRetry) {
  EXPECT_EQ(run_failing(RpcError("odd")), 2);
  EXPECT_EQ(run_failing(std::runtime_error("plain failure")), 2);
}

TEST_F(RetryTest, PerTypeBudgets) {
  EXPECT_EQ(run_failing(RpcError("t", "ETIMEDOUT")), 4);
  EXPECT_EQ(run_failing(RpcError("bad gateway", "", std::nullopt, 503)), 3);
  EXPECT_EQ(run_failing(RpcError("internal", "", -32000)), 3);
}

TEST_F(RetryTest, GlobalBudgetCapsGenerousTypes) {
  EXPECT_EQ(run_failing(RpcError("reset", "ECONNRESET")), 6);
  EXPECT_EQ(run_failing(RpcError("slow", "", std::nullopt, 429)), 6);
}

TEST_F(RetryTest, ExhaustionReportsAttemptsAndLastType) {
  try {
    policy->run([]() -> int { throw RpcError("connection reset", "ECONNRESET"); }, "reset");
    FAIL() << "expected RetryExhaustedError";
  } catch (const RetryExhaustedError& e) {
    EXPECT_EQ(e.attempts(), 6u);
    EXPECT_EQ(e.last_type(), ErrorType::Socket);
    EXPECT_STREQ(e.what(), "Retry failed after 6 attempts (last error type: SOCKET): connection reset");
    ASSERT_TRUE(e.cause());
    EXPECT_THROW(std::rethrow_exception(e.cause()), RpcError);
  }
}

TEST_F(RetryTest, ClientErrorsFailImmediately) {
  int calls = 0;
  try {
    policy->run([&]() -> int {
      ++calls;
      throw RpcError("bad request", "", std::nullopt, 400);
    }, "client");
    FAIL() << "expected NonRetryableError";
  } catch (const NonRetryableError& e) {
    EXPECT_EQ(e.type(), ErrorType::Client);
    EXPECT_STREQ(e.what(), "Non-retryable error: bad request (type: CLIENT)");
  }
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(delays.empty());
}

TEST_F(RetryTest, LibraryErrorsAreNotRetried) {
  int calls = 0;
  EXPECT_THROW(policy->run([&]() -> int {
    ++calls;
    throw ValidationError("bad input");
  }, "validation"), ValidationError);
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, MixedErrorsShareGlobalBudget) {
  int calls = 0;
  EXPECT_THROW(policy->run([&]() -> int {
    ++calls;
    if (calls % 2 == 0) {
      throw RpcError("reset", "ECONNRESET");
    }
    throw RpcError("slow", "", std::nullopt, 429);
  }, "mixed"), RetryExhaustedError);
  EXPECT_EQ(calls, 6);
}

//==============================================
// BACKOFF
//==============================================

TEST_F(RetryTest, DelayGrowsPerTypeCount) {
  run_failing(RpcError("t", "ETIMEDOUT"));
  ASSERT_EQ(delays.size(), 3u);
  // 100, 200, 400 ms with up to 20% jitter either way
  EXPECT_GE(delays[0].count(), 79);
  EXPECT_LE(delays[0].count(), 120);
  EXPECT_GE(delays[1].count(), 159);
  EXPECT_LE(delays[1].count(), 240);
  EXPECT_GE(delays[2].count(), 319);
  EXPECT_LE(delays[2].count(), 480);
}

TEST_F(RetryTest, DelayIsCapped) {
  for (int i = 0; i < 20; ++i) {
    auto delay = policy->compute_delay(30);
    EXPECT_LE(delay.count(), 6000);
    EXPECT_GE(delay.count(), 3999);
  }
}
