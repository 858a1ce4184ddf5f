#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "jts/credential_validator.hpp"
#include "jts/encoding.hpp"
#include "jts/issuance_engine.hpp"
#include "jts/mariadb_session_store.hpp"

namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

const jts::SessionStore::Timeout kTimeout{milliseconds(2000)};

jts::DbConfig TestDbConfig() {
  jts::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

jts::Session MakeSession(const std::string& id, const std::string& principal, const std::string& proof) {
  auto now = std::chrono::system_clock::now();
  jts::Session session;
  session.session_id = id;
  session.principal = principal;
  session.current_proof = proof;
  session.created_at = now;
  session.last_active_at = now;
  session.expires_at = now + seconds(3600);
  session.permissions = {"profile:read", "orders:write"};
  session.user_agent = "it-test";
  session.metadata = {{"device", "laptop"}};
  return session;
}

class MariaDbSessionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<jts::MariaDbClient>(TestDbConfig());
    store_ = std::make_shared<jts::MariaDbSessionStore>(db_client_);
    store_->EnsureSchema(kTimeout);
    store_->ClearAll(kTimeout);
  }

  std::shared_ptr<jts::MariaDbClient> db_client_;
  std::shared_ptr<jts::MariaDbSessionStore> store_;
};

TEST_F(MariaDbSessionStoreTest, CreateAndLookupPreservesFields) {
  auto session = MakeSession("aid_it_1", "user-it", "proof-a");
  store_->Create(session, kTimeout);
  auto loaded = store_->GetByCurrentOrPreviousProof("proof-a", kTimeout);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->session_id, "aid_it_1");
  EXPECT_EQ(loaded->version, 1u);
  EXPECT_FALSE(loaded->previous_proof.has_value());
  EXPECT_EQ(loaded->permissions, session.permissions);
  EXPECT_EQ(loaded->metadata["device"], "laptop");
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::microseconds>(loaded->expires_at.time_since_epoch()),
            std::chrono::duration_cast<std::chrono::microseconds>(session.expires_at.time_since_epoch()));
}

TEST_F(MariaDbSessionStoreTest, ConditionalUpdateAppliesOnceAndRetires) {
  store_->Create(MakeSession("aid_it_2", "user-it", "proof-a"), kTimeout);
  jts::RotationUpdate update{"aid_it_2", 1, "proof-a", "proof-b", std::chrono::system_clock::now()};
  EXPECT_EQ(store_->ConditionalUpdate(update, kTimeout), jts::UpdateOutcome::kApplied);
  EXPECT_EQ(store_->ConditionalUpdate(update, kTimeout), jts::UpdateOutcome::kConflict);

  jts::RotationUpdate second{"aid_it_2", 2, "proof-b", "proof-c", std::chrono::system_clock::now()};
  EXPECT_EQ(store_->ConditionalUpdate(second, kTimeout), jts::UpdateOutcome::kApplied);
  auto retired = store_->FindRetiredProof("proof-a", kTimeout);
  ASSERT_TRUE(retired.has_value());
  EXPECT_EQ(retired->proof_digest, jts::Sha256Hex("proof-a"));

  auto by_previous = store_->GetByCurrentOrPreviousProof("proof-b", kTimeout);
  ASSERT_TRUE(by_previous.has_value());
  EXPECT_EQ(by_previous->version, 3u);
  EXPECT_EQ(by_previous->current_proof, "proof-c");

  jts::RotationUpdate missing{"aid_none", 1, "x", "y", std::chrono::system_clock::now()};
  EXPECT_EQ(store_->ConditionalUpdate(missing, kTimeout), jts::UpdateOutcome::kNotFound);
}

TEST_F(MariaDbSessionStoreTest, ConcurrentUpdatesHaveSingleWinner) {
  store_->Create(MakeSession("aid_it_3", "user-it", "proof-a"), kTimeout);
  std::vector<std::thread> threads;
  std::vector<jts::UpdateOutcome> outcomes(4, jts::UpdateOutcome::kNotFound);
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&, i]() {
      jts::RotationUpdate update{"aid_it_3", 1, "proof-a", "proof-next-" + std::to_string(i),
                                 std::chrono::system_clock::now()};
      outcomes[i] = store_->ConditionalUpdate(update, kTimeout);
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  int applied = 0;
  for (auto outcome : outcomes) {
    if (outcome == jts::UpdateOutcome::kApplied) {
      ++applied;
    } else {
      EXPECT_EQ(outcome, jts::UpdateOutcome::kConflict);
    }
  }
  EXPECT_EQ(applied, 1);
}

TEST_F(MariaDbSessionStoreTest, DeleteAllForPrincipalIsScoped) {
  store_->Create(MakeSession("aid_it_4", "user-a", "proof-a"), kTimeout);
  store_->Create(MakeSession("aid_it_5", "user-a", "proof-b"), kTimeout);
  store_->Create(MakeSession("aid_it_6", "user-b", "proof-c"), kTimeout);
  EXPECT_EQ(store_->DeleteAllForPrincipal("user-a", kTimeout), 2u);
  EXPECT_TRUE(store_->ListForPrincipal("user-a", kTimeout).empty());
  EXPECT_EQ(store_->ListForPrincipal("user-b", kTimeout).size(), 1u);
}

TEST_F(MariaDbSessionStoreTest, TouchDeleteAndExpire) {
  auto session = MakeSession("aid_it_7", "user-it", "proof-a");
  session.expires_at = std::chrono::system_clock::now() - seconds(1);
  store_->Create(session, kTimeout);
  store_->Create(MakeSession("aid_it_8", "user-it", "proof-b"), kTimeout);

  EXPECT_TRUE(store_->Touch("aid_it_8", std::chrono::system_clock::now(), kTimeout));
  EXPECT_FALSE(store_->Touch("aid_missing", std::chrono::system_clock::now(), kTimeout));
  EXPECT_EQ(store_->DeleteExpired(std::chrono::system_clock::now(), kTimeout), 1u);
  EXPECT_TRUE(store_->DeleteSession("aid_it_8", kTimeout));
  EXPECT_FALSE(store_->DeleteSession("aid_it_8", kTimeout));
  EXPECT_TRUE(store_->HealthCheck(kTimeout));
}

TEST_F(MariaDbSessionStoreTest, TransientErrorsAreRetried) {
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  store_->Create(MakeSession("aid_it_9", "user-it", "proof-a"), kTimeout);
  EXPECT_TRUE(store_->GetByCurrentOrPreviousProof("proof-a", kTimeout).has_value());
}

TEST_F(MariaDbSessionStoreTest, PersistentErrorsSurfaceAsUnavailable) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(store_->Create(MakeSession("aid_it_10", "user-it", "proof-a"), kTimeout), jts::StoreUnavailableError);
  EXPECT_FALSE(store_->HealthCheck(kTimeout));
}

TEST_F(MariaDbSessionStoreTest, RetriesStopWhenCallerTimeoutIsSpent) {
  std::atomic<std::size_t> attempts{0};
  db_client_->SetTransientInjector([&attempts](std::size_t) {
    ++attempts;
    std::this_thread::sleep_for(milliseconds(200));
    return true;
  });
  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(store_->Create(MakeSession("aid_it_11", "user-it", "proof-a"), milliseconds(300)),
               jts::StoreUnavailableError);
  auto elapsed = std::chrono::steady_clock::now() - started;
  db_client_->SetTransientInjector(nullptr);

  EXPECT_LT(attempts.load(), 3u);
  EXPECT_LT(elapsed, milliseconds(800));
}

TEST_F(MariaDbSessionStoreTest, EngineReplayDetectionOverMariaDb) {
  jts::DirectoryConfig directory;
  directory.pbkdf2_iterations = 1000;
  auto validator = std::make_shared<jts::DirectoryCredentialValidator>(directory);
  validator->AddUser("it@example.com", "password123", "user-engine", {"profile:read"});
  jts::IssuanceConfig config;
  config.signing_key = jts::GenerateSigningKey("sig-it", jts::SigningAlgorithm::kES256);
  config.audience = "resource-api";
  config.grace_window = seconds(0);
  jts::IssuanceEngine engine(config, store_, validator);

  jts::AuthError error;
  auto creds = engine.Login({"it@example.com", "password123", "127.0.0.1"}, jts::LoginContext{}, error);
  ASSERT_TRUE(creds.has_value());
  auto rotated = engine.Rotate(creds->state_proof, error);
  ASSERT_TRUE(rotated.has_value());
  std::this_thread::sleep_for(milliseconds(1100));
  EXPECT_FALSE(engine.Rotate(creds->state_proof, error).has_value());
  EXPECT_EQ(error.code, jts::ErrorCode::kSessionCompromised);
  EXPECT_TRUE(store_->ListForPrincipal("user-engine", kTimeout).empty());
}

}  // namespace
