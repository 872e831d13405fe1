#pragma once

#include "cluster/cluster_engine.hpp"
#include "core/time_utils.hpp"
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace sem {

enum class JobStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
        default: return "pending";
    }
}

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
}

/**
 * @brief Snapshot of a clustering job record
 */
struct ClusteringJob {
    std::string id;
    JobStatus status = JobStatus::PENDING;
    ClusteringAlgorithm algorithm = ClusteringAlgorithm::KMEANS;
    int num_clusters = 0;
    int documents_processed = 0;
    double progress_percent = 0.0;
    Timestamp created_at{};
    std::optional<Timestamp> completed_at;
    std::optional<std::string> error_message;   // Set only when FAILED

    nlohmann::json to_json() const;
};

/**
 * @brief Keyed store of clustering jobs with one background worker per job
 *
 * Lifecycle: PENDING -> RUNNING -> {COMPLETED | FAILED}. Each worker owns
 * its copy of the input documents and is the only writer of its job record;
 * readers get copies taken under the registry lock. Terminal records never
 * change again. Errors raised while clustering are stored on the record
 * instead of escaping the worker thread. Workers of finished jobs are joined
 * on the next submit, so at most the running jobs plus the latest one hold
 * a thread.
 */
class ClusteringJobRegistry {
public:
    explicit ClusteringJobRegistry(const ClusterEngineConfig& config = ClusterEngineConfig(),
                                   bool verbose = false);

    // Joins all workers
    ~ClusteringJobRegistry();

    ClusteringJobRegistry(const ClusteringJobRegistry&) = delete;
    ClusteringJobRegistry& operator=(const ClusteringJobRegistry&) = delete;

    /**
     * @brief Create a job and start its worker; returns the PENDING record
     */
    ClusteringJob submit(std::vector<ClusterInput> documents,
                         int num_clusters,
                         ClusteringAlgorithm algorithm);

    /**
     * @throws NotFoundError for unknown ids
     */
    ClusteringJob get_job(const std::string& job_id) const;

    /**
     * @brief All jobs in submission order
     */
    std::vector<ClusteringJob> list_jobs() const;

    /**
     * @brief Result of a COMPLETED job, std::nullopt while pending, running or failed
     * @throws NotFoundError for unknown ids
     */
    std::optional<ClusteringResult> get_result(const std::string& job_id) const;

    /**
     * @brief Block until the job reaches a terminal state
     * @throws NotFoundError for unknown ids
     */
    ClusteringJob wait(const std::string& job_id) const;

    size_t size() const;

    /**
     * @brief Worker threads not yet joined
     */
    size_t active_workers() const;

private:
    struct JobEntry {
        ClusteringJob job;
        std::optional<ClusteringResult> result;
    };

    void run_job(std::shared_ptr<JobEntry> entry,
                 std::vector<ClusterInput> documents,
                 int num_clusters,
                 ClusteringAlgorithm algorithm);

    void update_progress(JobEntry& entry, int current, int total, int document_count);

    // Caller holds mutex_
    void finish_job(JobEntry& entry, std::optional<ClusteringResult> result, const std::string& error);

    // Caller holds mutex_; moves out the threads of terminal jobs
    std::vector<std::thread> take_finished_workers();

    std::shared_ptr<JobEntry> find_entry(const std::string& job_id) const;

    std::string generate_job_id();

    void log(const std::string& message) const;

    ClusterEngineConfig config_;
    bool verbose_ = false;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::vector<std::string> order_;
    std::map<std::string, std::thread> workers_;     // job id -> worker
    std::mt19937_64 id_rng_;
};

} // namespace sem
