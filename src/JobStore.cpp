#include "geomap/JobStore.hpp"

#include "geomap/ResultSerializer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geomap {

std::string InMemoryJobStore::currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis.count() << 'Z';
  return out.str();
}

JobStatus InMemoryJobStore::create(const std::string &jobId,
                                   const std::string &imageRef,
                                   const JobMetadata &metadata) {
  JobStatus status;
  status.jobId = jobId;
  status.state = JobState::Processing;
  status.message = "Map analysis started";
  status.imagePath = imageRef;
  status.originalFilename = metadata.originalFilename;
  status.fileSize = metadata.fileSize;
  status.createdAt = currentTimestamp();
  status.updatedAt = status.createdAt;

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_jobs.emplace(jobId, Record{status, std::nullopt}).second) {
    throw std::invalid_argument("job '" + jobId + "' already exists");
  }
  return status;
}

bool InMemoryJobStore::complete(const std::string &jobId,
                                const ProcessingResultData &result) {
  std::string json = ResultSerializer::toJson(result);

  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_jobs.find(jobId);
  if (it == m_jobs.end() || it->second.status.isTerminal()) {
    return false;
  }

  it->second.status.state = JobState::Completed;
  it->second.status.message = "Map analysis completed";
  it->second.status.updatedAt = currentTimestamp();
  it->second.resultJson = std::move(json);
  return true;
}

bool InMemoryJobStore::fail(const std::string &jobId,
                            const std::string &error) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_jobs.find(jobId);
  if (it == m_jobs.end() || it->second.status.isTerminal()) {
    return false;
  }

  it->second.status.state = JobState::Failed;
  it->second.status.message = "Map analysis failed";
  it->second.status.errorInfo = error;
  it->second.status.updatedAt = currentTimestamp();
  return true;
}

std::optional<JobStatus> InMemoryJobStore::get(const std::string &jobId) const {
  Record record;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
      return std::nullopt;
    }
    record = it->second;
  }

  JobStatus status = record.status;
  if (record.resultJson) {
    std::string error;
    status.result = ResultSerializer::fromJson(*record.resultJson, &error);
    if (!status.result) {
      std::cerr << "[job " << jobId << "] stored result is unreadable: "
                << error << std::endl;
    }
  }
  return status;
}

} // namespace geomap
