#include "training_worker.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string job_state_string(JobState state) {
    switch (state) {
        case JobState::Queued: return "queued";
        case JobState::Running: return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
        default: return "idle";
    }
}

nlohmann::json TrainingStatus::to_json() const {
    nlohmann::json out = {
        {"state", job_state_string(state)},
        {"job_id", job_id},
        {"game_count", game_count},
        {"updated_at", updated_at}
    };
    out["metrics"] = last_metrics ? last_metrics->to_json() : nlohmann::json(nullptr);
    if (!last_error.empty()) {
        out["error"] = last_error;
    }
    return out;
}

TrainingWorker::TrainingWorker(PredictiveModel& model, const FeatureVectorBuilder& builder)
    : model_(model), builder_(builder) {}

TrainingWorker::~TrainingWorker() {
    stop();
}

void TrainingWorker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread(&TrainingWorker::run, this);
    spdlog::info("Training worker started");
}

void TrainingWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) return;
        stopping_ = true;
        cancel_flag_ = true;
    }
    cv_.notify_all();
    thread_.join();
    spdlog::info("Training worker stopped");
}

int64_t TrainingWorker::submit(std::vector<GameRecord> games) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ || running_job_) {
        throw JobConflictError("A training job is already in progress");
    }
    if (stopping_) {
        throw TrainingError("Training worker is shutting down");
    }
    
    int64_t id = next_id_++;
    status_.state = JobState::Queued;
    status_.job_id = id;
    status_.game_count = games.size();
    status_.last_error.clear();
    status_.updated_at = util::current_iso8601();
    pending_ = Job{id, std::move(games)};
    cancel_flag_ = false;
    
    cv_.notify_all();
    spdlog::info("Training job {} queued ({} games)", id, status_.game_count);
    return id;
}

bool TrainingWorker::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ && !running_job_) {
        spdlog::info("Training job {} cancelled before start", pending_->id);
        pending_.reset();
        status_.state = JobState::Cancelled;
        status_.updated_at = util::current_iso8601();
        idle_cv_.notify_all();
        return true;
    }
    if (running_job_) {
        cancel_flag_ = true;
        spdlog::info("Cancellation requested for training job {}", status_.job_id);
        return true;
    }
    return false;
}

TrainingStatus TrainingWorker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool TrainingWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value() || running_job_;
}

bool TrainingWorker::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return !pending_ && !running_job_;
    });
}

void TrainingWorker::on_success(SuccessCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_success_ = std::move(cb);
}

void TrainingWorker::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
            if (stopping_) {
                if (pending_) {
                    pending_.reset();
                    status_.state = JobState::Cancelled;
                    idle_cv_.notify_all();
                }
                return;
            }
            job = std::move(*pending_);
            pending_.reset();
            running_job_ = true;
            status_.state = JobState::Running;
            status_.updated_at = util::current_iso8601();
        }
        
        execute(std::move(job));
    }
}

void TrainingWorker::execute(Job job) {
    spdlog::info("Training job {} started", job.id);
    try {
        TrainingDataset dataset = builder_.build_training_dataset(job.games);
        TrainingMetrics metrics = model_.train(dataset, &cancel_flag_);
        
        SuccessCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cb = on_success_;
        }
        if (cb) {
            try {
                cb(metrics);
            } catch (const std::exception& e) {
                spdlog::error("Training success callback failed: {}", e.what());
            }
        }
        
        finish(JobState::Succeeded, metrics, "");
        spdlog::info("Training job {} succeeded", job.id);
    } catch (const TrainingCancelled& e) {
        finish(JobState::Cancelled, std::nullopt, e.what());
        spdlog::info("Training job {} cancelled", job.id);
    } catch (const std::exception& e) {
        finish(JobState::Failed, std::nullopt, e.what());
        spdlog::error("Training job {} failed: {}", job.id, e.what());
    }
}

void TrainingWorker::finish(JobState state, std::optional<TrainingMetrics> metrics,
                            const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_job_ = false;
    status_.state = state;
    if (metrics) {
        status_.last_metrics = std::move(metrics);
    }
    status_.last_error = error;
    status_.updated_at = util::current_iso8601();
    idle_cv_.notify_all();
}
