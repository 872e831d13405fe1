#include "cluster/clustering_jobs.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace sem {

nlohmann::json ClusteringJob::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["status"] = job_status_to_string(status);
    j["algorithm"] = clustering_algorithm_to_string(algorithm);
    j["num_clusters"] = num_clusters;
    j["documents_processed"] = documents_processed;
    j["progress_percent"] = progress_percent;
    j["created_at"] = format_iso8601(created_at);
    if (completed_at) {
        j["completed_at"] = format_iso8601(*completed_at);
    }
    if (error_message) {
        j["error_message"] = *error_message;
    }
    return j;
}

// ==========================================
// ClusteringJobRegistry
// ==========================================

ClusteringJobRegistry::ClusteringJobRegistry(const ClusterEngineConfig& config, bool verbose)
    : config_(config), verbose_(verbose), id_rng_(std::random_device{}()) {}

ClusteringJobRegistry::~ClusteringJobRegistry() {
    for (auto& [id, worker] : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::vector<std::thread> ClusteringJobRegistry::take_finished_workers() {
    std::vector<std::thread> finished;
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (is_terminal(jobs_.at(it->first)->job.status)) {
            finished.push_back(std::move(it->second));
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

void ClusteringJobRegistry::finish_job(JobEntry& entry,
                                       std::optional<ClusteringResult> result,
                                       const std::string& error) {
    entry.job.completed_at = Clock::now();
    if (result) {
        entry.job.status = JobStatus::COMPLETED;
        entry.job.progress_percent = 100.0;
        entry.job.documents_processed = static_cast<int>(result->assignments.size());
        entry.result = std::move(result);
    } else {
        entry.job.status = JobStatus::FAILED;
        entry.job.error_message = error;
    }
}

std::string ClusteringJobRegistry::generate_job_id() {
    // Caller holds mutex_
    std::string id;
    do {
        std::ostringstream ss;
        ss << "job-" << std::hex << std::setw(16) << std::setfill('0') << id_rng_();
        id = ss.str();
    } while (jobs_.count(id) > 0);
    return id;
}

void ClusteringJobRegistry::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[cluster] " << message << std::endl;
    }
}

ClusteringJob ClusteringJobRegistry::submit(std::vector<ClusterInput> documents,
                                            int num_clusters,
                                            ClusteringAlgorithm algorithm) {
    auto entry = std::make_shared<JobEntry>();
    entry->job.status = JobStatus::PENDING;
    entry->job.algorithm = algorithm;
    entry->job.num_clusters = num_clusters;
    entry->job.created_at = Clock::now();

    ClusteringJob snapshot;
    std::vector<std::thread> finished;
    std::string start_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = take_finished_workers();

        entry->job.id = generate_job_id();
        jobs_[entry->job.id] = entry;
        order_.push_back(entry->job.id);
        snapshot = entry->job;

        try {
            workers_.emplace(entry->job.id, std::thread(&ClusteringJobRegistry::run_job, this, entry,
                                                        std::move(documents), num_clusters, algorithm));
        } catch (const std::system_error& e) {
            start_error = std::string("internal: could not start clustering worker: ") + e.what();
            finish_job(*entry, std::nullopt, start_error);
        }
    }

    for (auto& worker : finished) {
        worker.join();
    }

    if (!start_error.empty()) {
        cv_.notify_all();
        log("job " + snapshot.id + " failed: " + start_error);
        return get_job(snapshot.id);
    }

    log("job " + snapshot.id + " pending (" + clustering_algorithm_to_string(algorithm) +
        ", k=" + std::to_string(num_clusters) + ")");
    return snapshot;
}

void ClusteringJobRegistry::update_progress(JobEntry& entry, int current, int total, int document_count) {
    if (total <= 0) return;

    double percent = std::min(100.0, 100.0 * current / total);
    int processed = static_cast<int>(static_cast<long long>(document_count) * std::min(current, total) / total);

    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.job.status != JobStatus::RUNNING) return;

    // Both counters only move forward
    entry.job.progress_percent = std::max(entry.job.progress_percent, percent);
    entry.job.documents_processed = std::max(entry.job.documents_processed, processed);
}

void ClusteringJobRegistry::run_job(std::shared_ptr<JobEntry> entry,
                                    std::vector<ClusterInput> documents,
                                    int num_clusters,
                                    ClusteringAlgorithm algorithm) {
    std::string job_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry->job.status = JobStatus::RUNNING;
        job_id = entry->job.id;
    }
    cv_.notify_all();
    log("job " + job_id + " running");

    const int document_count = static_cast<int>(documents.size());

    ClusterEngine engine(config_);
    engine.set_progress_callback([this, &entry, document_count](const std::string&, int current, int total) {
        update_progress(*entry, current, total, document_count);
    });

    std::optional<ClusteringResult> result;
    std::string error;
    try {
        result = engine.run(documents, num_clusters, algorithm);
    } catch (const EngineError& e) {
        error = std::string(error_kind_to_string(e.kind())) + ": " + e.what();
    } catch (const std::exception& e) {
        error = std::string("internal: ") + e.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        finish_job(*entry, std::move(result), error);
    }
    cv_.notify_all();

    if (error.empty()) {
        log("job " + job_id + " completed");
    } else {
        log("job " + job_id + " failed: " + error);
    }
}

std::shared_ptr<ClusteringJobRegistry::JobEntry> ClusteringJobRegistry::find_entry(
    const std::string& job_id) const {
    // Caller holds mutex_
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw NotFoundError("Clustering job not found: " + job_id);
    }
    return it->second;
}

ClusteringJob ClusteringJobRegistry::get_job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_entry(job_id)->job;
}

std::vector<ClusteringJob> ClusteringJobRegistry::list_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClusteringJob> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(jobs_.at(id)->job);
    }
    return out;
}

std::optional<ClusteringResult> ClusteringJobRegistry::get_result(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = find_entry(job_id);
    if (entry->job.status != JobStatus::COMPLETED) {
        return std::nullopt;
    }
    return entry->result;
}

ClusteringJob ClusteringJobRegistry::wait(const std::string& job_id) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto entry = find_entry(job_id);
    cv_.wait(lock, [&entry] { return is_terminal(entry->job.status); });
    return entry->job;
}

size_t ClusteringJobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

size_t ClusteringJobRegistry::active_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

} // namespace sem
