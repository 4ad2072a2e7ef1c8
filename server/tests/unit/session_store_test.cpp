#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "sessionproxy/session_store.hpp"

namespace {

std::string TempPath(const std::string& name) {
  static std::atomic<int> counter{0};
  auto path = std::filesystem::temp_directory_path() /
              ("sessionproxy-" + name + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".json");
  std::filesystem::remove(path);
  return path.string();
}

nlohmann::json ReadJson(const std::string& path) {
  std::ifstream in(path);
  return nlohmann::json::parse(in);
}

TEST(SessionStoreTest, CheckAfterRecordReturnsProfile) {
  sessionproxy::SessionStore store(TempPath("record"));
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);

  auto hit = store.CheckJoin("alice", "server-1", 1030);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "uuid-a");
  EXPECT_FALSE(store.CheckJoin("alice", "server-2", 1030).has_value());
  EXPECT_FALSE(store.CheckJoin("bob", "server-1", 1030).has_value());
}

TEST(SessionStoreTest, UsernameIsCaseInsensitive) {
  sessionproxy::SessionStore store(TempPath("case"));
  store.RecordJoin("Alice", "uuid-a", "server-1", 1000);

  EXPECT_EQ(store.CheckJoin("alice", "server-1", 1000).value_or(""), "uuid-a");
  EXPECT_EQ(store.CheckJoin("ALICE", "server-1", 1000).value_or(""), "uuid-a");
  EXPECT_EQ(store.SessionCount(), 1u);
}

TEST(SessionStoreTest, WindowIsSixtySecondsInclusive) {
  sessionproxy::SessionStore store(TempPath("window"));
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);

  EXPECT_TRUE(store.CheckJoin("alice", "server-1", 1060).has_value());
  EXPECT_FALSE(store.CheckJoin("alice", "server-1", 1061).has_value());
}

TEST(SessionStoreTest, RecordPrunesExpiredEntriesOfEverySession) {
  auto path = TempPath("prune");
  sessionproxy::SessionStore store(path);
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);
  store.RecordJoin("alice", "uuid-a", "server-2", 1050);
  store.RecordJoin("bob", "uuid-b", "server-3", 1061);

  auto doc = ReadJson(path);
  ASSERT_TRUE(doc.contains("alice"));
  EXPECT_FALSE(doc["alice"]["servers"].contains("server-1"));
  EXPECT_EQ(doc["alice"]["servers"]["server-2"], 1050);
  EXPECT_EQ(doc["bob"]["servers"]["server-3"], 1061);
  EXPECT_FALSE(store.CheckJoin("alice", "server-1", 1061).has_value());
  EXPECT_TRUE(store.CheckJoin("alice", "server-2", 1061).has_value());
}

TEST(SessionStoreTest, ExistingSessionKeepsFirstProfileId) {
  sessionproxy::SessionStore store(TempPath("reuse"));
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);
  store.RecordJoin("ALICE", "uuid-other", "server-2", 1001);

  EXPECT_EQ(store.CheckJoin("alice", "server-2", 1001).value_or(""), "uuid-a");
  EXPECT_EQ(store.SessionCount(), 1u);
}

TEST(SessionStoreTest, RejoinOverwritesTimestamp) {
  sessionproxy::SessionStore store(TempPath("rejoin"));
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);
  store.RecordJoin("alice", "uuid-a", "server-1", 1050);

  EXPECT_TRUE(store.CheckJoin("alice", "server-1", 1100).has_value());
}

TEST(SessionStoreTest, PersistedDocumentReloads) {
  auto path = TempPath("reload");
  {
    sessionproxy::SessionStore store(path);
    store.RecordJoin("Alice", "uuid-a", "server-1", 1000);
  }
  auto doc = ReadJson(path);
  EXPECT_EQ(doc["alice"]["uuid"], "uuid-a");
  EXPECT_EQ(doc["alice"]["servers"]["server-1"], 1000);

  sessionproxy::SessionStore reloaded(path);
  EXPECT_EQ(reloaded.Load(), 1u);
  EXPECT_EQ(reloaded.CheckJoin("alice", "server-1", 1010).value_or(""), "uuid-a");
}

TEST(SessionStoreTest, MissingOrCorruptFileStartsEmpty) {
  auto missing = TempPath("missing");
  sessionproxy::SessionStore empty_store(missing);
  EXPECT_EQ(empty_store.Load(), 0u);

  auto corrupt = TempPath("corrupt");
  {
    std::ofstream out(corrupt);
    out << "{not json";
  }
  sessionproxy::SessionStore corrupt_store(corrupt);
  EXPECT_EQ(corrupt_store.Load(), 0u);
  EXPECT_EQ(corrupt_store.SessionCount(), 0u);

  corrupt_store.RecordJoin("alice", "uuid-a", "server-1", 1000);
  EXPECT_EQ(ReadJson(corrupt)["alice"]["uuid"], "uuid-a");
}

TEST(SessionStoreTest, LoadWarningsAreSingleJsonLines) {
  auto corrupt = TempPath("corrupt-log");
  {
    std::ofstream out(corrupt);
    out << "{\"alice\": {\"uuid\": 5}}";
  }
  testing::internal::CaptureStdout();
  sessionproxy::SessionStore missing_store(TempPath("missing-log"));
  missing_store.Load();
  sessionproxy::SessionStore corrupt_store(corrupt);
  corrupt_store.Load();
  auto output = testing::internal::GetCapturedStdout();

  std::istringstream lines(output);
  std::vector<std::string> events;
  std::string line;
  while (std::getline(lines, line)) {
    auto entry = nlohmann::json::parse(line);
    events.push_back(entry["eventName"].get<std::string>());
    EXPECT_TRUE(entry.contains("detail"));
  }
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], "session_file_missing");
  EXPECT_EQ(events[1], "session_file_corrupt");
}

TEST(SessionStoreTest, PersistFailureIsReported) {
  auto dir = std::filesystem::temp_directory_path() / "sessionproxy-no-such-dir" / "nested";
  sessionproxy::SessionStore store((dir / "sessions.json").string());
  EXPECT_THROW(store.RecordJoin("alice", "uuid-a", "server-1", 1000), std::runtime_error);
  EXPECT_FALSE(store.CheckJoin("alice", "server-1", 1000).has_value());
  EXPECT_EQ(store.SessionCount(), 0u);
}

TEST(SessionStoreTest, FailedWriteKeepsPreviousState) {
  auto path = TempPath("failed-write");
  sessionproxy::SessionStore store(path);
  store.RecordJoin("alice", "uuid-a", "server-1", 1000);

  // 임시 파일 자리에 디렉터리가 있으면 쓰기가 실패한다.
  std::filesystem::create_directory(path + ".tmp");
  EXPECT_THROW(store.RecordJoin("bob", "uuid-b", "server-2", 1010), std::runtime_error);
  EXPECT_THROW(store.RecordJoin("alice", "uuid-a", "server-3", 1010), std::runtime_error);
  std::filesystem::remove(path + ".tmp");

  EXPECT_FALSE(store.CheckJoin("bob", "server-2", 1010).has_value());
  EXPECT_FALSE(store.CheckJoin("alice", "server-3", 1010).has_value());
  EXPECT_EQ(store.CheckJoin("alice", "server-1", 1010).value_or(""), "uuid-a");
  EXPECT_EQ(store.SessionCount(), 1u);

  sessionproxy::SessionStore reloaded(path);
  EXPECT_EQ(reloaded.Load(), 1u);
  EXPECT_FALSE(reloaded.CheckJoin("bob", "server-2", 1010).has_value());
}

TEST(SessionStoreTest, ConcurrentJoinsKeepEveryEntry) {
  auto path = TempPath("concurrent");
  sessionproxy::SessionStore store(path);
  constexpr int kJoinsPerUser = 50;

  auto worker = [&store](const std::string& username, const std::string& profile) {
    for (int i = 0; i < kJoinsPerUser; ++i) {
      store.RecordJoin(username, profile, "server-" + std::to_string(i), 2000);
    }
  };
  std::thread first(worker, "alice", "uuid-a");
  std::thread second(worker, "bob", "uuid-b");
  first.join();
  second.join();

  auto doc = ReadJson(path);
  ASSERT_TRUE(doc.contains("alice"));
  ASSERT_TRUE(doc.contains("bob"));
  EXPECT_EQ(doc["alice"]["uuid"], "uuid-a");
  EXPECT_EQ(doc["bob"]["uuid"], "uuid-b");
  EXPECT_EQ(doc["alice"]["servers"].size(), static_cast<std::size_t>(kJoinsPerUser));
  EXPECT_EQ(doc["bob"]["servers"].size(), static_cast<std::size_t>(kJoinsPerUser));
}

}  // namespace
