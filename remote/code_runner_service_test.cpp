#include "remote/code_runner_service.hpp"

#include <stdexcept>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

using remote::ClientAddress;
using remote::CodeRunnerService;

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD(std::string, Id, (), (const, override));
  MOCK_METHOD(proto::ExecutionResponse, Execute,
              (const proto::ExecutionRequest& request), (override));
};

class MockRateLimiter : public remote::RateLimiter {
 public:
  MOCK_METHOD(bool, Allow, (const std::string& client), (override));
};

proto::ExecutionRequest MakeRequest(const std::string& client_id) {
  proto::ExecutionRequest request;
  request.set_code("print(1)");
  request.set_language("python");
  request.set_client_id(client_id);
  return request;
}

// NOLINTNEXTLINE
TEST(ClientAddress, Ipv4) {
  EXPECT_EQ(ClientAddress("ipv4:127.0.0.1:5000"), "127.0.0.1");
}

// NOLINTNEXTLINE
TEST(ClientAddress, Ipv6) {
  EXPECT_EQ(ClientAddress("ipv6:[::1]:5000"), "::1");
  EXPECT_EQ(ClientAddress("ipv6:[2001:db8::7]:443"), "2001:db8::7");
}

// NOLINTNEXTLINE
TEST(ClientAddress, Other) {
  EXPECT_EQ(ClientAddress("unix:/tmp/socket"), "unix:/tmp/socket");
  EXPECT_EQ(ClientAddress(""), "");
}

// NOLINTNEXTLINE
TEST(CodeRunnerService, ExecutesAllowedRequest) {
  MockExecutor executor;
  MockRateLimiter limiter;
  CodeRunnerService service(&executor, &limiter);

  proto::ExecutionResponse expected;
  expected.mutable_result()->set_stdout_text("1\n");
  expected.mutable_result()->set_success(true);
  EXPECT_CALL(limiter, Allow("alice")).WillOnce(Return(true));
  EXPECT_CALL(executor, Execute(_)).WillOnce(Return(expected));

  proto::ExecutionResponse response;
  grpc::Status status = service.HandleExecute("ipv4:10.0.0.1:1234",
                                              MakeRequest("alice"), &response);
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.result().stdout_text(), "1\n");
  EXPECT_TRUE(response.result().success());
}

// NOLINTNEXTLINE
TEST(CodeRunnerService, PeerAddressIdentifiesAnonymousClients) {
  MockExecutor executor;
  MockRateLimiter limiter;
  CodeRunnerService service(&executor, &limiter);

  EXPECT_CALL(limiter, Allow("10.0.0.1")).WillOnce(Return(true));
  EXPECT_CALL(executor, Execute(_))
      .WillOnce(Return(proto::ExecutionResponse()));

  proto::ExecutionResponse response;
  EXPECT_TRUE(service
                  .HandleExecute("ipv4:10.0.0.1:1234", MakeRequest(""),
                                 &response)
                  .ok());
}

// NOLINTNEXTLINE
TEST(CodeRunnerService, RateLimited) {
  MockExecutor executor;
  MockRateLimiter limiter;
  CodeRunnerService service(&executor, &limiter);

  EXPECT_CALL(limiter, Allow("alice")).WillOnce(Return(false));
  EXPECT_CALL(executor, Execute(_)).Times(0);

  proto::ExecutionResponse response;
  grpc::Status status = service.HandleExecute("ipv4:10.0.0.1:1234",
                                              MakeRequest("alice"), &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
  EXPECT_EQ(status.error_message(),
            "Rate limit exceeded. Please try again later.");
}

// NOLINTNEXTLINE
TEST(CodeRunnerService, InternalError) {
  MockExecutor executor;
  MockRateLimiter limiter;
  CodeRunnerService service(&executor, &limiter);

  EXPECT_CALL(limiter, Allow(_)).WillOnce(Return(true));
  EXPECT_CALL(executor, Execute(_))
      .WillOnce(Throw(std::runtime_error("boom")));

  proto::ExecutionResponse response;
  grpc::Status status = service.HandleExecute("ipv4:10.0.0.1:1234",
                                              MakeRequest("alice"), &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
  EXPECT_EQ(status.error_message(), "Internal server error");
}

// NOLINTNEXTLINE
TEST(CodeRunnerService, Languages) {
  MockExecutor executor;
  MockRateLimiter limiter;
  CodeRunnerService service(&executor, &limiter);
  EXPECT_CALL(limiter, Allow(_)).Times(0);

  proto::LanguagesRequest request;
  proto::LanguagesResponse response;
  EXPECT_TRUE(service.Languages(nullptr, &request, &response).ok());
  ASSERT_EQ(response.language_size(), 4);
  EXPECT_EQ(response.language(0).id(), "python");
  EXPECT_EQ(response.language(1).id(), "c");
}

}  // namespace
