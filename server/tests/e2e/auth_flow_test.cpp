#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

// 실행 중인 jts_server를 대상으로 한다. 로그인 횟수가 많으므로
// 서버는 LOGIN_RATE_LIMIT_MAX를 충분히 크게(예: 100) 설정해 띄운다.

namespace {

std::string GetEnvOr(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"]["timestamp"].is_string());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
  ASSERT_TRUE(body.contains("meta"));
}

class ServerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    host_ = GetEnvOr("E2E_HOST", "127.0.0.1");
    port_ = static_cast<unsigned short>(std::stoi(GetEnvOr("E2E_PORT", "3000")));
    email_ = GetEnvOr("DEMO_USER_EMAIL", "test@example.com");
    password_ = GetEnvOr("DEMO_USER_PASSWORD", "password123");
    grace_seconds_ = std::stoi(GetEnvOr("GRACE_WINDOW_SECONDS", "10"));
    WaitForReady();
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const nlohmann::json* body,
                          const std::string& token) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, user_agent_);
    if (body) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body->dump();
    }
    if (!token.empty()) {
      req.set(boost::beast::http::field::authorization, "Bearer " + token);
    }
    req.prepare_payload();

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse PostJson(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, &body, "");
  }

  SimpleHttpResponse Get(const std::string& target, const std::string& token = "") {
    return Send(boost::beast::http::verb::get, target, nullptr, token);
  }

  nlohmann::json Login() {
    auto res = PostJson("/auth/login", {{"email", email_}, {"password", password_}});
    EXPECT_EQ(res.status, boost::beast::http::status::ok);
    ExpectSuccessEnvelope(res.body);
    return res.body["data"];
  }

  void WaitForReady() {
    for (int i = 0; i < 10; ++i) {
      try {
        auto res = Get("/health");
        if (res.status == boost::beast::http::status::ok) {
          return;
        }
      } catch (const std::exception& ex) {
        last_error_ = ex.what();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }

  std::string host_{};
  unsigned short port_{3000};
  std::string email_;
  std::string password_;
  int grace_seconds_{10};
  std::string last_error_;
  std::string user_agent_{BOOST_BEAST_VERSION_STRING};
};

}  // namespace

TEST_F(ServerFixture, HealthEndpoint) {
  auto res = Get("/health");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_EQ(res.body["data"]["status"], "ok");
  EXPECT_EQ(res.body["data"]["database"], "connected");
}

TEST_F(ServerFixture, LoginReturnsBearerAndStateProof) {
  auto data = Login();
  EXPECT_TRUE(data["bearerPass"].is_string());
  EXPECT_EQ(data["stateProof"].get<std::string>().rfind("sp_", 0), 0u);
  EXPECT_EQ(data["version"], 1);

  auto me = Get("/auth/me", data["bearerPass"].get<std::string>());
  EXPECT_EQ(me.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(me.body);
  EXPECT_EQ(me.body["data"]["principal"], email_);
  EXPECT_EQ(me.body["data"]["sessionId"], data["sessionId"]);
}

TEST_F(ServerFixture, LoginRejectsWrongPassword) {
  auto res = PostJson("/auth/login", {{"email", email_}, {"password", "wrong"}});
  EXPECT_EQ(res.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(res.body, "invalid_credentials");
}

TEST_F(ServerFixture, MeRejectsMissingOrBrokenBearer) {
  auto missing = Get("/auth/me");
  EXPECT_EQ(missing.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto broken = Get("/auth/me", "not.a.token");
  EXPECT_EQ(broken.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(broken.body, "token_malformed");
}

TEST_F(ServerFixture, RenewRejectsMissingBody) {
  auto res = PostJson("/auth/renew", nlohmann::json::object());
  EXPECT_EQ(res.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(res.body, "bad_request");
}

TEST_F(ServerFixture, RenewGraceThenReplayRevokesEverySession) {
  auto first = Login();
  auto other_device = Login();
  std::string original = first["stateProof"].get<std::string>();

  auto renewed = PostJson("/auth/renew", {{"stateProof", original}});
  ASSERT_EQ(renewed.status, boost::beast::http::status::ok);
  EXPECT_EQ(renewed.body["data"]["version"], 2);
  std::string rotated = renewed.body["data"]["stateProof"].get<std::string>();
  EXPECT_NE(rotated, original);

  std::this_thread::sleep_for(std::chrono::seconds(2));
  auto grace = PostJson("/auth/renew", {{"stateProof", original}});
  ASSERT_EQ(grace.status, boost::beast::http::status::ok);
  EXPECT_EQ(grace.body["data"]["stateProof"], rotated);
  EXPECT_TRUE(grace.body["data"]["gracePath"].get<bool>());

  std::this_thread::sleep_for(std::chrono::seconds(grace_seconds_ + 1));
  auto replay = PostJson("/auth/renew", {{"stateProof", original}});
  EXPECT_EQ(replay.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(replay.body, "session_compromised");

  auto after = PostJson("/auth/renew", {{"stateProof", other_device["stateProof"]}});
  EXPECT_EQ(after.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(after.body, "invalid_state_proof");
}

TEST_F(ServerFixture, SessionsListMarksCurrent) {
  auto first = Login();
  auto second = Login();
  auto res = PostJson("/auth/sessions", {{"stateProof", second["stateProof"]}});
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  int current_count = 0;
  bool found_first = false;
  for (const auto& entry : res.body["data"]["sessions"]) {
    EXPECT_FALSE(entry.contains("stateProof"));
    if (entry["isCurrent"].get<bool>()) {
      ++current_count;
      EXPECT_EQ(entry["sessionId"], second["sessionId"]);
    }
    if (entry["sessionId"] == first["sessionId"]) {
      found_first = true;
    }
  }
  EXPECT_EQ(current_count, 1);
  EXPECT_TRUE(found_first);
}

TEST_F(ServerFixture, LogoutIsIdempotent) {
  auto data = Login();
  nlohmann::json body{{"stateProof", data["stateProof"]}};
  auto first = PostJson("/auth/logout", body);
  EXPECT_EQ(first.status, boost::beast::http::status::ok);
  EXPECT_TRUE(first.body["data"]["loggedOut"].get<bool>());
  auto second = PostJson("/auth/logout", body);
  EXPECT_EQ(second.status, boost::beast::http::status::ok);

  auto renew = PostJson("/auth/renew", body);
  EXPECT_EQ(renew.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(renew.body, "invalid_state_proof");
}

TEST_F(ServerFixture, LogoutAllReportsDeletedCount) {
  Login();
  auto data = Login();
  auto res = PostJson("/auth/logout-all", {{"stateProof", data["stateProof"]}});
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_GE(res.body["data"]["deletedCount"].get<int>(), 2);

  auto sessions = PostJson("/auth/sessions", {{"stateProof", data["stateProof"]}});
  EXPECT_EQ(sessions.status, boost::beast::http::status::unauthorized);
}

TEST_F(ServerFixture, MetricsCountRequests) {
  auto res = Get("/metrics");
  EXPECT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  EXPECT_GT(res.body["data"]["requests"]["total"].get<int>(), 0);
  EXPECT_TRUE(res.body["data"]["rotations"].contains("grace"));
}

TEST_F(ServerFixture, NonUtf8BytesInRequestKeepServerAlive) {
  auto missing = Get("/\xff");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");

  user_agent_ = "agent\xff";
  auto creds = Login();
  user_agent_ = BOOST_BEAST_VERSION_STRING;

  auto listed = PostJson("/auth/sessions", {{"stateProof", creds["stateProof"]}});
  ASSERT_EQ(listed.status, boost::beast::http::status::ok);
  bool found = false;
  for (const auto& entry : listed.body["data"]["sessions"]) {
    if (entry["isCurrent"].get<bool>()) {
      EXPECT_EQ(entry["userAgent"], "agent\xEF\xBF\xBD");
      found = true;
    }
  }
  EXPECT_TRUE(found);
  EXPECT_EQ(Get("/health").status, boost::beast::http::status::ok);
}
