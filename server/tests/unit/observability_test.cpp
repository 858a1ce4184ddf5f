#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "jts/observability.hpp"

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

TEST(ObservabilityTest, LogLineIsSingleJsonObject) {
  jts::Observability obs(jts::LogLevel::kDebug);
  jts::LogContext ctx;
  ctx.trace_id = obs.NextTraceId();
  ctx.name = "POST /auth/renew";
  ctx.principal = "user-1";
  ctx.error_code = "session_compromised";

  testing::internal::CaptureStdout();
  obs.Log(ctx);
  auto out = testing::internal::GetCapturedStdout();

  auto line = nlohmann::json::parse(out);
  EXPECT_EQ(line["eventName"], "POST /auth/renew");
  EXPECT_EQ(line["principal"], "user-1");
  EXPECT_EQ(line["errorCode"], "session_compromised");
  EXPECT_FALSE(line.contains("sessionId"));
}

TEST(ObservabilityTest, NonUtf8RequestTargetIsReplacedNotThrown) {
  jts::Observability obs;
  jts::LogContext ctx;
  ctx.name = "GET /\xff";

  testing::internal::CaptureStdout();
  EXPECT_NO_THROW(obs.Log(ctx));
  auto out = testing::internal::GetCapturedStdout();

  auto line = nlohmann::json::parse(out);
  EXPECT_EQ(line["eventName"], "GET /" + kReplacement);
}

TEST(ObservabilityTest, BelowMinimumLevelIsDropped) {
  jts::Observability obs(jts::LogLevel::kWarn);
  jts::LogContext ctx;
  ctx.name = "auth.rotate";
  ctx.level = jts::LogLevel::kInfo;

  testing::internal::CaptureStdout();
  obs.Log(ctx);
  EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}

}  // namespace
