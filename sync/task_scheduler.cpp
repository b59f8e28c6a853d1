// ============================================================
// task_scheduler.cpp -- Bounded pool for leaf copy jobs
// ============================================================

#include "task_scheduler.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <memory>

TaskScheduler::TaskScheduler(size_t width, Runner runner)
    : runner_(std::move(runner))
    , pool_(width)
{}

void TaskScheduler::submit(SyncTask task) {
    auto shared = std::make_shared<SyncTask>(std::move(task));
    pool_.enqueue([this, shared] { run_job(*shared); });
}

void TaskScheduler::run_job(SyncTask& task) {
    JobOutcome outcome;
    try {
        outcome = runner_(task);
    } catch (const LockContention& e) {
        LOG_WARN(e.what());
        outcome = JobOutcome::Skipped;
    } catch (const std::exception& e) {
        Logger::get().job_error(task.source.path(), e.what());
        record(JobOutcome::Failed, task.source.path(), e.what());
        return;
    } catch (...) {
        Logger::get().job_error(task.source.path(), "unknown exception");
        record(JobOutcome::Failed, task.source.path(), "unknown exception");
        return;
    }
    record(outcome);
}

void TaskScheduler::record(JobOutcome outcome, const std::string& path,
                           const std::string& message) {
    std::lock_guard<std::mutex> lk(summary_mutex_);
    switch (outcome) {
        case JobOutcome::Copied:  ++summary_.copied;  break;
        case JobOutcome::Skipped: ++summary_.skipped; break;
        case JobOutcome::Failed:
            ++summary_.failed;
            summary_.failures.push_back({ path, message });
            break;
    }
}

RunSummary TaskScheduler::drain() {
    pool_.wait_idle();
    std::lock_guard<std::mutex> lk(summary_mutex_);
    return summary_;
}
