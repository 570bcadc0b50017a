#pragma once

#include "feature_vector.hpp"
#include "game_record.hpp"
#include "metrics.hpp"
#include "predictive_model.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

enum class JobState {
    Idle,
    Queued,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

std::string job_state_string(JobState state);

struct TrainingStatus {
    JobState state = JobState::Idle;
    int64_t job_id = 0;
    size_t game_count = 0;
    std::optional<TrainingMetrics> last_metrics;
    std::string last_error;
    std::string updated_at;
    
    nlohmann::json to_json() const;
};

// Runs training jobs on a dedicated thread, one at a time.
class TrainingWorker {
public:
    using SuccessCallback = std::function<void(const TrainingMetrics&)>;
    
    TrainingWorker(PredictiveModel& model, const FeatureVectorBuilder& builder);
    ~TrainingWorker();
    
    TrainingWorker(const TrainingWorker&) = delete;
    TrainingWorker& operator=(const TrainingWorker&) = delete;
    
    void start();
    void stop();
    
    // Throws TrainingError if a job is already queued or running
    int64_t submit(std::vector<GameRecord> games);
    
    // true if a queued or running job was asked to stop
    bool cancel();
    
    TrainingStatus status() const;
    bool busy() const;
    
    // Blocks until no job is queued or running, or the timeout passes
    bool wait_idle(std::chrono::milliseconds timeout);
    
    void on_success(SuccessCallback cb);
    
private:
    struct Job {
        int64_t id;
        std::vector<GameRecord> games;
    };
    
    PredictiveModel& model_;
    FeatureVectorBuilder builder_;
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::optional<Job> pending_;
    bool running_job_ = false;
    bool stopping_ = false;
    int64_t next_id_ = 1;
    TrainingStatus status_;
    SuccessCallback on_success_;
    
    std::atomic<bool> cancel_flag_{false};
    std::thread thread_;
    
    void run();
    void execute(Job job);
    void finish(JobState state, std::optional<TrainingMetrics> metrics, const std::string& error);
};
