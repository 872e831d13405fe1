#include <gtest/gtest.h>
#include "cluster/clustering_jobs.hpp"
#include "core/errors.hpp"

using namespace sem;

class ClusteringJobsTest : public ::testing::Test {
protected:
    std::vector<ClusterInput> docs;

    void SetUp() override {
        const std::vector<std::vector<float>> vectors = {
            {1.0f, 0.0f}, {0.95f, 0.1f}, {0.9f, 0.2f},
            {0.0f, 1.0f}, {0.1f, 0.95f}, {0.2f, 0.9f}
        };
        for (size_t i = 0; i < vectors.size(); ++i) {
            ClusterInput in;
            in.document_id = "doc" + std::to_string(i);
            in.vector = vectors[i];
            docs.push_back(in);
        }
    }
};

// ==========================================
// Lifecycle Tests
// ==========================================

TEST_F(ClusteringJobsTest, SubmitReturnsPending) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);

    EXPECT_EQ(job.status, JobStatus::PENDING);
    EXPECT_EQ(job.id.rfind("job-", 0), 0);
    EXPECT_EQ(job.num_clusters, 2);
    EXPECT_EQ(job.progress_percent, 0.0);

    registry.wait(job.id);
}

TEST_F(ClusteringJobsTest, CompletesWithResult) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);

    auto done = registry.wait(job.id);
    EXPECT_EQ(done.status, JobStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(done.progress_percent, 100.0);
    EXPECT_EQ(done.documents_processed, 6);
    EXPECT_TRUE(done.completed_at.has_value());
    EXPECT_FALSE(done.error_message.has_value());

    auto result = registry.get_result(job.id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->clusters.size(), 2);
    EXPECT_EQ(result->assignments.size(), 6);
}

TEST_F(ClusteringJobsTest, TerminalStateIsIdempotent) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);
    registry.wait(job.id);

    auto first = registry.get_result(job.id);
    auto second = registry.get_result(job.id);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->to_json(), second->to_json());
    EXPECT_EQ(registry.get_job(job.id).to_json(), registry.get_job(job.id).to_json());
}

TEST_F(ClusteringJobsTest, InvalidInputFailsJob) {
    ClusteringJobRegistry registry;
    std::vector<ClusterInput> two(docs.begin(), docs.begin() + 2);
    auto job = registry.submit(two, 1, ClusteringAlgorithm::KMEANS);

    auto done = registry.wait(job.id);
    EXPECT_EQ(done.status, JobStatus::FAILED);
    ASSERT_TRUE(done.error_message.has_value());
    EXPECT_NE(done.error_message->find("insufficient documents to cluster"), std::string::npos);
    EXPECT_EQ(done.error_message->rfind("validation: ", 0), 0);

    EXPECT_FALSE(registry.get_result(job.id).has_value());
}

TEST_F(ClusteringJobsTest, BadKFailsJob) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 7, ClusteringAlgorithm::KMEANS);
    EXPECT_EQ(registry.wait(job.id).status, JobStatus::FAILED);
}

TEST_F(ClusteringJobsTest, UnimplementedAlgorithmFailsJob) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 2, ClusteringAlgorithm::DBSCAN);

    auto done = registry.wait(job.id);
    EXPECT_EQ(done.status, JobStatus::FAILED);
    ASSERT_TRUE(done.error_message.has_value());
    EXPECT_NE(done.error_message->find("not implemented"), std::string::npos);
}

// ==========================================
// Registry Tests
// ==========================================

TEST_F(ClusteringJobsTest, UnknownJobIsNotFound) {
    ClusteringJobRegistry registry;
    EXPECT_THROW(registry.get_job("job-missing"), NotFoundError);
    EXPECT_THROW(registry.get_result("job-missing"), NotFoundError);
    EXPECT_THROW(registry.wait("job-missing"), NotFoundError);
}

TEST_F(ClusteringJobsTest, ConcurrentJobsListedInSubmissionOrder) {
    ClusteringJobRegistry registry;
    std::vector<std::string> ids;
    for (int k = 1; k <= 4; ++k) {
        ids.push_back(registry.submit(docs, k, ClusteringAlgorithm::KMEANS).id);
    }

    for (const auto& id : ids) {
        EXPECT_EQ(registry.wait(id).status, JobStatus::COMPLETED);
    }

    auto jobs = registry.list_jobs();
    ASSERT_EQ(jobs.size(), 4);
    EXPECT_EQ(registry.size(), 4);
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(jobs[i].id, ids[i]);
        EXPECT_EQ(jobs[i].num_clusters, static_cast<int>(i) + 1);
    }
}

TEST_F(ClusteringJobsTest, FinishedWorkersJoinedOnSubmit) {
    ClusteringJobRegistry registry;
    for (int i = 0; i < 50; ++i) {
        auto job = registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);
        EXPECT_EQ(registry.wait(job.id).status, JobStatus::COMPLETED);
        // Only the newest job's worker may still be unjoined
        EXPECT_LE(registry.active_workers(), 1);
    }
    EXPECT_EQ(registry.size(), 50);
    EXPECT_EQ(registry.active_workers(), 1);

    // Failed jobs are reaped too
    std::vector<ClusterInput> two(docs.begin(), docs.begin() + 2);
    auto failed = registry.submit(two, 1, ClusteringAlgorithm::KMEANS);
    EXPECT_EQ(registry.wait(failed.id).status, JobStatus::FAILED);
    registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);
    EXPECT_EQ(registry.active_workers(), 1);
}

TEST_F(ClusteringJobsTest, JobJsonOmitsUnsetFields) {
    ClusteringJobRegistry registry;
    auto job = registry.submit(docs, 2, ClusteringAlgorithm::KMEANS);
    auto pending = job.to_json();
    EXPECT_EQ(pending["status"], "pending");
    EXPECT_FALSE(pending.contains("completed_at"));
    EXPECT_FALSE(pending.contains("error_message"));

    auto done = registry.wait(job.id).to_json();
    EXPECT_EQ(done["status"], "completed");
    EXPECT_TRUE(done.contains("completed_at"));
}
