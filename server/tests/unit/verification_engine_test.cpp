#include <chrono>
#include <memory>

#include <gtest/gtest.h>

#include "jts/observability.hpp"
#include "jts/token_codec.hpp"
#include "jts/verification_engine.hpp"

namespace {

using std::chrono::seconds;

class VerificationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    now_ = std::make_shared<jts::TimePoint>(seconds(1700000000));
    key_ = jts::GenerateSigningKey("sig-1", jts::SigningAlgorithm::kES256);
    observability_ = std::make_shared<jts::Observability>(jts::LogLevel::kError);

    config_.accepted_keys.Add(jts::PublicOnly(key_));
    config_.expected_audience = "resource-api";
    config_.clock_skew = seconds(30);
    auto now = now_;
    config_.clock = [now]() { return *now; };
  }

  std::string Issue(std::set<std::string> permissions, std::int64_t ttl = 300) {
    jts::BearerPassClaims claims;
    claims.principal = "user-1";
    claims.audience = "resource-api";
    claims.permissions = std::move(permissions);
    claims.issued_at = std::chrono::duration_cast<seconds>(now_->time_since_epoch()).count();
    claims.expires_at = claims.issued_at + ttl;
    return jts::IssueToken(claims, key_);
  }

  std::shared_ptr<jts::TimePoint> now_;
  jts::SigningKey key_;
  jts::VerifierConfig config_;
  std::shared_ptr<jts::Observability> observability_;
};

TEST_F(VerificationEngineTest, AuthorizesValidToken) {
  jts::VerificationEngine engine(config_, observability_);
  jts::AuthError error;
  auto claims = engine.Authorize(Issue({"profile:read"}), error);
  ASSERT_TRUE(claims.has_value()) << error.message;
  EXPECT_EQ(claims->principal, "user-1");
  EXPECT_EQ(observability_->Snapshot().verification_failures, 0u);
}

TEST_F(VerificationEngineTest, MapsExpiryToTokenExpired) {
  jts::VerificationEngine engine(config_, observability_);
  auto token = Issue({}, 60);
  *now_ += seconds(60 + 31);
  jts::AuthError error;
  EXPECT_FALSE(engine.Authorize(token, error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kTokenExpired);
  EXPECT_EQ(jts::ToHttpStatus(error.code), 401u);
  EXPECT_EQ(observability_->Snapshot().verification_failures, 1u);
}

TEST_F(VerificationEngineTest, MapsWrongAudienceToForbidden) {
  config_.expected_audience = "another-api";
  jts::VerificationEngine engine(config_, observability_);
  jts::AuthError error;
  EXPECT_FALSE(engine.Authorize(Issue({}), error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kAudienceMismatch);
  EXPECT_EQ(jts::ToHttpStatus(error.code), 403u);
}

TEST_F(VerificationEngineTest, RotatedOutKeyIsUnknown) {
  auto token = Issue({});
  config_.accepted_keys.Remove("sig-1");
  config_.accepted_keys.Add(jts::PublicOnly(jts::GenerateSigningKey("sig-2", jts::SigningAlgorithm::kES256)));
  jts::VerificationEngine engine(config_);
  jts::AuthError error;
  EXPECT_FALSE(engine.Authorize(token, error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kUnknownKey);
}

TEST_F(VerificationEngineTest, MalformedTokenIsBadRequest) {
  jts::VerificationEngine engine(config_);
  jts::AuthError error;
  EXPECT_FALSE(engine.Authorize("garbage", error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kTokenMalformed);
  EXPECT_EQ(jts::ToHttpStatus(error.code), 400u);
}

TEST_F(VerificationEngineTest, PermissionCheckReportsMissing) {
  jts::VerificationEngine engine(config_);
  jts::AuthError error;
  auto token = Issue({"profile:read"});
  EXPECT_TRUE(engine.AuthorizeWithPermissions(token, {"profile:read"}, error).has_value());

  EXPECT_FALSE(engine.AuthorizeWithPermissions(token, {"profile:read", "orders:write"}, error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kPermissionDenied);
  ASSERT_EQ(error.missing_permissions.size(), 1u);
  EXPECT_EQ(error.missing_permissions[0], "orders:write");
}

}  // namespace
