#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "FakeGraphServer.hpp"
#include "core/media/MediaResolver.hpp"
#include "core/media/ResumableUpload.hpp"
#include "core/transport/ApiErrors.hpp"
#include "core/transport/HttpRequestExecutor.hpp"

namespace {

class HttpRequestExecutorTest : public ::testing::Test {
protected:
  mtc::ClientConfig configFor(int port, const std::string& token = "tok") const {
    mtc::ClientConfig c;
    c.scheme = "http";
    c.host = "127.0.0.1:" + std::to_string(port);
    c.apiVersion = "v21.0";
    c.accessToken = token;
    c.timeoutSec = 5;
    return c;
  }

  mtc::test::FakeGraphServer server_{"tok"};
};

} // namespace

TEST(SplitUrlTest, SeparatesOriginAndPath) {
  EXPECT_EQ(mtc::split_url("https://graph.example.com/v21.0/sess_1").first, "https://graph.example.com");
  EXPECT_EQ(mtc::split_url("https://graph.example.com/v21.0/sess_1").second, "/v21.0/sess_1");
  EXPECT_EQ(mtc::split_url("http://127.0.0.1:8080").second, "/");
  EXPECT_THROW(mtc::split_url("graph.example.com/x"), std::invalid_argument);
}

TEST_F(HttpRequestExecutorTest, ExecuteInjectsVersionAndBearerCredential) {
  mtc::HttpRequestExecutor executor(configFor(server_.port()));

  const std::string body = executor.execute("A1/uploads", "POST", std::string(R"({"file_length":3})"));

  EXPECT_EQ(body, R"({"id":"sess_123"})");
  const auto seen = server_.last();
  EXPECT_EQ(seen.path, "/v21.0/A1/uploads");
  EXPECT_EQ(seen.authorization, "Bearer tok");
  EXPECT_EQ(seen.body, R"({"file_length":3})");
}

TEST_F(HttpRequestExecutorTest, NonSuccessStatusThrowsWithStatusAndBody) {
  mtc::HttpRequestExecutor executor(configFor(server_.port(), "wrong"));
  try {
    executor.execute("m1", "GET");
    FAIL() << "expected TransportError";
  } catch (const mtc::TransportError& e) {
    EXPECT_EQ(e.status(), 401);
    EXPECT_NE(e.body().find("unauthorized"), std::string::npos);
  }
}

TEST_F(HttpRequestExecutorTest, SendRawUsesOnlyCallerHeadersAndReturnsStatus) {
  mtc::HttpRequestExecutor executor(configFor(server_.port()));

  mtc::RawRequest req;
  req.url = "http://127.0.0.1:" + std::to_string(server_.port()) + "/v21.0/sess_123";
  req.headers = {{"Authorization", "OAuth tok"}, {"file_offset", "7"}};
  req.body = "payload";

  const mtc::RawResponse res = executor.sendRaw(req);

  EXPECT_EQ(res.status, 400);
  EXPECT_FALSE(res.ok());
  const auto seen = server_.last();
  EXPECT_EQ(seen.authorization, "OAuth tok");
  EXPECT_EQ(seen.fileOffset, "7");
  EXPECT_EQ(seen.body, "payload");
  EXPECT_EQ(seen.contentType, "application/octet-stream");
}

TEST_F(HttpRequestExecutorTest, ResumableUploadEndToEnd) {
  const mtc::ClientConfig config = configFor(server_.port());
  mtc::HttpRequestExecutor executor(config);
  mtc::ResumableUpload resumable(executor, config);

  const std::string payload(1024, 'p');
  EXPECT_EQ(resumable.upload("A1", payload, "image/png"), "4::abc");

  const auto seen = server_.last();
  EXPECT_EQ(seen.path, "/v21.0/sess_123");
  EXPECT_EQ(seen.authorization, "OAuth tok");
  EXPECT_EQ(seen.fileOffset, "0");
  EXPECT_EQ(seen.body, payload);
}

TEST_F(HttpRequestExecutorTest, ResolverRequestsFixedFieldSet) {
  mtc::HttpRequestExecutor executor(configFor(server_.port()));
  mtc::MediaResolver resolver(executor);

  EXPECT_EQ(resolver.resolve("m1"), "https://cdn.example/m1");
  EXPECT_EQ(server_.last().fields, "url,mime_type,sha256,file_size,id,messaging_product");
}

TEST_F(HttpRequestExecutorTest, DeletingUnknownMediaIsRejected) {
  mtc::HttpRequestExecutor executor(configFor(server_.port()));
  mtc::MediaResolver resolver(executor);

  EXPECT_THROW(resolver.remove("gone"), mtc::RejectedResult);
  EXPECT_EQ(server_.last().method, "DELETE");
}

TEST(HttpRequestExecutorNetworkTest, UnreachableHostIsTransportError) {
  mtc::ClientConfig c;
  c.scheme = "http";
  c.host = "127.0.0.1:1";
  c.timeoutSec = 2;
  mtc::HttpRequestExecutor executor(c);
  try {
    executor.execute("m1", "GET");
    FAIL() << "expected TransportError";
  } catch (const mtc::TransportError& e) {
    EXPECT_EQ(e.status(), 0);
  }
}
