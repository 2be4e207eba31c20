#include "../Client.h"
#include <gtest/gtest.h>
#include <httplib.h>

#include <thread>

using namespace cl;

TEST(ClientTest, BaseUrlIsNormalized) {
  Client client;
  ASSERT_TRUE(client.setBaseUrl("  http://127.0.0.1:5000/ ").isOk());
  EXPECT_EQ(client.getBaseUrl(), "http://127.0.0.1:5000");
}

TEST(ClientTest, RejectsUnsupportedUrls) {
  Client client;
  EXPECT_EQ(client.setBaseUrl("127.0.0.1:5000").error().code,
            Client::E_INVALID_URL);
  EXPECT_EQ(client.setBaseUrl("https://example.org").error().code,
            Client::E_INVALID_URL);
  EXPECT_EQ(client.setBaseUrl("http://").error().code, Client::E_INVALID_URL);
  EXPECT_TRUE(client.getBaseUrl().empty());
}

TEST(ClientTest, RequestsWithoutUrlFail) {
  Client client;
  auto result = client.ping();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_NOT_CONNECTED);
}

TEST(ClientTest, UnreachableNodeReportsRequestFailure) {
  Client client;
  // Port 1 on loopback is not expected to accept connections
  ASSERT_TRUE(client.setBaseUrl("http://127.0.0.1:1").isOk());
  client.setTimeout(std::chrono::milliseconds(500));

  auto ping = client.ping();
  ASSERT_TRUE(ping.isError());
  EXPECT_EQ(ping.error().code, Client::E_REQUEST_FAILED);

  auto chain = client.fetchChain();
  ASSERT_TRUE(chain.isError());
  EXPECT_EQ(chain.error().code, Client::E_REQUEST_FAILED);
}

TEST(ClientTest, DefaultTimeout) {
  Client client;
  EXPECT_EQ(client.getTimeout(), Client::DEFAULT_TIMEOUT);
  client.setTimeout(std::chrono::milliseconds(250));
  EXPECT_EQ(client.getTimeout().count(), 250);
}

class ClientResponseTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_.Get("/ping", [](const httplib::Request &, httplib::Response &res) {
      res.set_content("online", "text/plain");
    });
    server_.Post("/sync", [](const httplib::Request &, httplib::Response &res) {
      res.status = 503;
      res.set_content("busy", "text/plain");
    });
    int port = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 100 && !server_.is_running(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(client_.setBaseUrl("http://127.0.0.1:" + std::to_string(port)).isOk());
    client_.setTimeout(std::chrono::milliseconds(2000));
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  httplib::Server server_;
  std::thread thread_;
  Client client_;
};

TEST_F(ClientResponseTest, NonJsonSuccessIsParseError) {
  auto ping = client_.ping();
  ASSERT_TRUE(ping.isError());
  EXPECT_EQ(ping.error().code, Client::E_PARSE_ERROR);
}

TEST_F(ClientResponseTest, EmptyNotFoundIsServerError) {
  auto chain = client_.fetchChain();
  ASSERT_TRUE(chain.isError());
  EXPECT_EQ(chain.error().code, Client::E_SERVER_ERROR);
  EXPECT_NE(chain.error().message.find("404"), std::string::npos);
}

TEST_F(ClientResponseTest, PlainTextFailureIsServerError) {
  auto result = client_.requestSync();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Client::E_SERVER_ERROR);
  EXPECT_NE(result.error().message.find("503: busy"), std::string::npos);
}
