#ifndef GEOMAP_JOB_STORE_HPP
#define GEOMAP_JOB_STORE_HPP

#include "geomap/GeoTypes.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace geomap {

/**
 * @brief Persistence of job status
 *
 * A job is created in the processing state and moves exactly once to
 * completed or failed. complete() and fail() return false when the job is
 * unknown or already terminal; a terminal job is never modified.
 * create() throws std::invalid_argument for an id that already exists.
 */
class JobStore {
public:
  virtual ~JobStore() = default;

  virtual JobStatus create(const std::string &jobId,
                           const std::string &imageRef,
                           const JobMetadata &metadata) = 0;
  virtual bool complete(const std::string &jobId,
                        const ProcessingResultData &result) = 0;
  virtual bool fail(const std::string &jobId, const std::string &error) = 0;
  virtual std::optional<JobStatus> get(const std::string &jobId) const = 0;
};

/**
 * @brief Process-local job store
 *
 * Results are kept in their serialized form, like a database column would
 * hold them. A stored result that no longer decodes is reported as absent.
 */
class InMemoryJobStore : public JobStore {
public:
  JobStatus create(const std::string &jobId, const std::string &imageRef,
                   const JobMetadata &metadata) override;
  bool complete(const std::string &jobId,
                const ProcessingResultData &result) override;
  bool fail(const std::string &jobId, const std::string &error) override;
  std::optional<JobStatus> get(const std::string &jobId) const override;

  /// Current UTC time as ISO-8601 with a trailing 'Z'
  static std::string currentTimestamp();

protected:
  struct Record {
    JobStatus status; ///< Status without result
    std::optional<std::string> resultJson;
  };

  std::map<std::string, Record> m_jobs;
  mutable std::mutex m_mutex;
};

} // namespace geomap

#endif // GEOMAP_JOB_STORE_HPP
