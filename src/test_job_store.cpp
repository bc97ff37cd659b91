#include "geomap/JobStore.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

using geomap::InMemoryJobStore;
using geomap::JobMetadata;
using geomap::JobState;
using geomap::ProcessingResultData;

class DamageableJobStore : public InMemoryJobStore {
public:
  void damageResult(const std::string &jobId, const std::string &json) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs.at(jobId).resultJson = json;
  }
};

ProcessingResultData smallResult() {
  ProcessingResultData data;
  data.detectedObjects.push_back({{0, 0, 10, 10}, "text", 0.9f});
  geomap::Coordinate coord;
  coord.lat = 12.5;
  coord.lon = -3.25;
  coord.confidence = 0.8f;
  coord.text = "12.5 N, 3.25 W";
  data.coordinates.push_back(coord);
  data.regions.push_back({{coord}, "segment_j2_deadbeef.jpg", {0, 0, 100, 100}});
  return data;
}

TEST(JobStoreTest, CreateStartsProcessing) {
  InMemoryJobStore store;
  auto status = store.create("j1", "maps/a.png", JobMetadata{"a.png", 42});

  EXPECT_EQ(status.jobId, "j1");
  EXPECT_EQ(status.state, JobState::Processing);
  EXPECT_EQ(status.message, "Map analysis started");
  EXPECT_EQ(status.imagePath, "maps/a.png");
  EXPECT_EQ(status.originalFilename, "a.png");
  EXPECT_EQ(status.fileSize, 42u);
  EXPECT_FALSE(status.result.has_value());
  EXPECT_FALSE(status.errorInfo.has_value());
  EXPECT_TRUE(std::regex_match(
      status.createdAt,
      std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));

  auto stored = store.get("j1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->state, JobState::Processing);
}

TEST(JobStoreTest, FailAndComplete) {
  InMemoryJobStore store;
  store.create("j1", "a.png", JobMetadata{});
  store.create("j2", "b.png", JobMetadata{});

  EXPECT_TRUE(store.fail("j1", "boom"));
  auto failed = store.get("j1");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->state, JobState::Failed);
  ASSERT_TRUE(failed->errorInfo.has_value());
  EXPECT_EQ(*failed->errorInfo, "boom");
  EXPECT_FALSE(failed->result.has_value());

  ProcessingResultData data = smallResult();
  EXPECT_TRUE(store.complete("j2", data));
  auto completed = store.get("j2");
  ASSERT_TRUE(completed.has_value());
  EXPECT_EQ(completed->state, JobState::Completed);
  EXPECT_EQ(completed->message, "Map analysis completed");
  ASSERT_TRUE(completed->result.has_value());
  EXPECT_EQ(*completed->result, data);
  EXPECT_FALSE(completed->errorInfo.has_value());
}

TEST(JobStoreTest, TerminalStatesNeverChange) {
  InMemoryJobStore store;
  store.create("j1", "a.png", JobMetadata{});
  ASSERT_TRUE(store.fail("j1", "boom"));

  EXPECT_FALSE(store.complete("j1", smallResult()));
  EXPECT_FALSE(store.fail("j1", "again"));

  auto status = store.get("j1");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, JobState::Failed);
  EXPECT_EQ(*status->errorInfo, "boom");
  EXPECT_FALSE(status->result.has_value());

  store.create("j2", "b.png", JobMetadata{});
  ASSERT_TRUE(store.complete("j2", smallResult()));
  EXPECT_FALSE(store.fail("j2", "late"));
  EXPECT_EQ(store.get("j2")->state, JobState::Completed);
}

TEST(JobStoreTest, DuplicateCreateKeepsFinishedJob) {
  InMemoryJobStore store;
  store.create("j1", "a.png", JobMetadata{"a.png", 7});
  ASSERT_TRUE(store.complete("j1", smallResult()));

  EXPECT_THROW(store.create("j1", "other.png", JobMetadata{}),
               std::invalid_argument);

  auto status = store.get("j1");
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, JobState::Completed);
  EXPECT_EQ(status->imagePath, "a.png");
  ASSERT_TRUE(status->result.has_value());
  EXPECT_EQ(*status->result, smallResult());
}

TEST(JobStoreTest, UnencodableResultLeavesJobProcessing) {
  InMemoryJobStore store;
  store.create("j1", "a.png", JobMetadata{});
  ProcessingResultData data = smallResult();
  data.coordinates[0].lat = std::numeric_limits<double>::quiet_NaN();

  EXPECT_THROW(store.complete("j1", data), std::runtime_error);
  EXPECT_EQ(store.get("j1")->state, JobState::Processing);
  EXPECT_TRUE(store.fail("j1", "encoding failed"));
}

TEST(JobStoreTest, UnknownJob) {
  InMemoryJobStore store;
  EXPECT_FALSE(store.get("nope").has_value());
  EXPECT_FALSE(store.complete("nope", ProcessingResultData()));
  EXPECT_FALSE(store.fail("nope", "boom"));
}

TEST(JobStoreTest, DamagedResultReadsAsNoResult) {
  DamageableJobStore store;
  store.create("j1", "a.png", JobMetadata{});
  ASSERT_TRUE(store.complete("j1", smallResult()));
  store.damageResult("j1", "{\"regions\": [");

  std::optional<geomap::JobStatus> status;
  ASSERT_NO_THROW(status = store.get("j1"));
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, JobState::Completed);
  EXPECT_FALSE(status->result.has_value());
}

} // namespace
