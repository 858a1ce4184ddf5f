#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "jts/encoding.hpp"
#include "jts/in_memory_session_store.hpp"

namespace {

using std::chrono::milliseconds;
using std::chrono::seconds;

const jts::SessionStore::Timeout kTimeout{milliseconds(500)};
const jts::TimePoint kEpoch{seconds(1700000000)};

jts::Session MakeSession(const std::string& id, const std::string& principal, const std::string& proof,
                         jts::TimePoint created = kEpoch) {
  jts::Session session;
  session.session_id = id;
  session.principal = principal;
  session.current_proof = proof;
  session.created_at = created;
  session.last_active_at = created;
  session.expires_at = created + seconds(3600);
  return session;
}

jts::RotationUpdate MakeUpdate(const std::string& id, std::uint64_t version, const std::string& expected,
                               const std::string& next) {
  jts::RotationUpdate update;
  update.session_id = id;
  update.expected_version = version;
  update.expected_current_proof = expected;
  update.new_current_proof = next;
  update.rotated_at = kEpoch + seconds(1);
  return update;
}

TEST(InMemorySessionStoreTest, LookupByCurrentAndPreviousProof) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  ASSERT_EQ(store.ConditionalUpdate(MakeUpdate("s1", 1, "proof-a", "proof-b"), kTimeout),
            jts::UpdateOutcome::kApplied);

  auto by_current = store.GetByCurrentOrPreviousProof("proof-b", kTimeout);
  ASSERT_TRUE(by_current.has_value());
  EXPECT_EQ(by_current->version, 2u);
  EXPECT_EQ(by_current->previous_proof, std::optional<std::string>("proof-a"));

  auto by_previous = store.GetByCurrentOrPreviousProof("proof-a", kTimeout);
  ASSERT_TRUE(by_previous.has_value());
  EXPECT_EQ(by_previous->session_id, "s1");
  EXPECT_FALSE(store.GetByCurrentOrPreviousProof("proof-z", kTimeout).has_value());
}

TEST(InMemorySessionStoreTest, ConditionalUpdateRejectsStaleVersionOrProof) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  EXPECT_EQ(store.ConditionalUpdate(MakeUpdate("s1", 2, "proof-a", "proof-b"), kTimeout),
            jts::UpdateOutcome::kConflict);
  EXPECT_EQ(store.ConditionalUpdate(MakeUpdate("s1", 1, "proof-x", "proof-b"), kTimeout),
            jts::UpdateOutcome::kConflict);
  EXPECT_EQ(store.ConditionalUpdate(MakeUpdate("missing", 1, "proof-a", "proof-b"), kTimeout),
            jts::UpdateOutcome::kNotFound);

  auto unchanged = store.GetByCurrentOrPreviousProof("proof-a", kTimeout);
  ASSERT_TRUE(unchanged.has_value());
  EXPECT_EQ(unchanged->version, 1u);
}

TEST(InMemorySessionStoreTest, SecondRotationRetiresOldestProof) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  store.ConditionalUpdate(MakeUpdate("s1", 1, "proof-a", "proof-b"), kTimeout);
  EXPECT_FALSE(store.FindRetiredProof("proof-a", kTimeout).has_value());
  store.ConditionalUpdate(MakeUpdate("s1", 2, "proof-b", "proof-c"), kTimeout);

  EXPECT_FALSE(store.GetByCurrentOrPreviousProof("proof-a", kTimeout).has_value());
  auto retired = store.FindRetiredProof("proof-a", kTimeout);
  ASSERT_TRUE(retired.has_value());
  EXPECT_EQ(retired->session_id, "s1");
  EXPECT_EQ(retired->principal, "p1");
  EXPECT_EQ(retired->proof_digest, jts::Sha256Hex("proof-a"));
}

TEST(InMemorySessionStoreTest, DeleteAllForPrincipalClearsSessionsAndLedger) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  store.Create(MakeSession("s2", "p1", "proof-b"), kTimeout);
  store.Create(MakeSession("s3", "p2", "proof-c"), kTimeout);
  store.ConditionalUpdate(MakeUpdate("s1", 1, "proof-a", "proof-a2"), kTimeout);
  store.ConditionalUpdate(MakeUpdate("s1", 2, "proof-a2", "proof-a3"), kTimeout);

  EXPECT_EQ(store.DeleteAllForPrincipal("p1", kTimeout), 2u);
  EXPECT_EQ(store.Count(), 1u);
  EXPECT_FALSE(store.FindRetiredProof("proof-a", kTimeout).has_value());
  EXPECT_TRUE(store.ListForPrincipal("p1", kTimeout).empty());
  EXPECT_EQ(store.DeleteAllForPrincipal("p1", kTimeout), 0u);
}

TEST(InMemorySessionStoreTest, SlotsAreReusedAfterDelete) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  EXPECT_TRUE(store.DeleteSession("s1", kTimeout));
  EXPECT_FALSE(store.DeleteSession("s1", kTimeout));
  store.Create(MakeSession("s2", "p1", "proof-b"), kTimeout);
  EXPECT_FALSE(store.GetByCurrentOrPreviousProof("proof-a", kTimeout).has_value());
  EXPECT_TRUE(store.GetByCurrentOrPreviousProof("proof-b", kTimeout).has_value());
  EXPECT_EQ(store.Count(), 1u);
}

TEST(InMemorySessionStoreTest, DuplicateSessionIdIsRejected) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  EXPECT_THROW(store.Create(MakeSession("s1", "p1", "proof-b"), kTimeout), jts::StoreUnavailableError);
}

TEST(InMemorySessionStoreTest, ListIsOrderedByCreation) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("late", "p1", "proof-a", kEpoch + seconds(10)), kTimeout);
  store.Create(MakeSession("early", "p1", "proof-b", kEpoch), kTimeout);
  auto sessions = store.ListForPrincipal("p1", kTimeout);
  ASSERT_EQ(sessions.size(), 2u);
  EXPECT_EQ(sessions[0].session_id, "early");
  EXPECT_EQ(sessions[1].session_id, "late");
}

TEST(InMemorySessionStoreTest, DeleteExpiredKeepsLiveSessions) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("old", "p1", "proof-a", kEpoch), kTimeout);
  store.Create(MakeSession("new", "p1", "proof-b", kEpoch + seconds(7200)), kTimeout);
  EXPECT_EQ(store.DeleteExpired(kEpoch + seconds(3601), kTimeout), 1u);
  EXPECT_TRUE(store.GetByCurrentOrPreviousProof("proof-b", kTimeout).has_value());
  EXPECT_TRUE(store.Touch("new", kEpoch + seconds(7300), kTimeout));
  EXPECT_FALSE(store.Touch("old", kEpoch + seconds(7300), kTimeout));
}

TEST(InMemorySessionStoreTest, LockTimeoutSurfacesAsUnavailable) {
  jts::InMemorySessionStore store;
  store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout);
  store.SetFailureInjector([](const std::string& op) {
    if (op == "list_for_principal") {
      std::this_thread::sleep_for(milliseconds(300));
    }
    return false;
  });

  std::thread holder([&]() { store.ListForPrincipal("p1", kTimeout); });
  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_THROW(store.GetByCurrentOrPreviousProof("proof-a", milliseconds(10)), jts::StoreUnavailableError);
  EXPECT_FALSE(store.HealthCheck(milliseconds(10)));
  holder.join();
  EXPECT_TRUE(store.HealthCheck(kTimeout));
}

TEST(InMemorySessionStoreTest, InjectedFailureNamesOperation) {
  jts::InMemorySessionStore store;
  store.SetFailureInjector([](const std::string& op) { return op == "create"; });
  EXPECT_THROW(store.Create(MakeSession("s1", "p1", "proof-a"), kTimeout), jts::StoreUnavailableError);
  EXPECT_EQ(store.Count(), 0u);
}

}  // namespace
