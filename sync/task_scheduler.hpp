#pragma once

// ============================================================
// task_scheduler.hpp -- Bounded pool for leaf copy jobs
//
// The coordinating thread submits jobs; workers run them. Each
// job's outcome is recorded; an exception escaping a job is
// logged with the job's path and counted as a failure without
// touching any other job. drain() blocks until every submitted
// job finished and returns the totals.
// ============================================================

#include "../common/platform.hpp"
#include "../common/thread_pool.hpp"
#include "file_entry.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct SyncTask {
    FileEntry source;
    FileEntry destination;
};

enum class JobOutcome {
    Copied,
    Skipped,
    Failed,
};

struct JobFailure {
    std::string path;
    std::string message;
};

struct RunSummary {
    u64 copied{0};
    u64 skipped{0};
    u64 failed{0};
    std::vector<JobFailure> failures;

    bool ok() const { return failed == 0; }
};

class TaskScheduler {
public:
    using Runner = std::function<JobOutcome(SyncTask&)>;

    TaskScheduler(size_t width, Runner runner);

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void submit(SyncTask task);

    // Outcomes produced on the coordinating thread (walk-level skips
    // and failures) go into the same summary
    void record(JobOutcome outcome, const std::string& path = "",
                const std::string& message = "");

    // Wait for all submitted jobs; returns the summary so far
    RunSummary drain();

    size_t width() const { return pool_.size(); }

private:
    void run_job(SyncTask& task);

    Runner     runner_;
    std::mutex summary_mutex_;
    RunSummary summary_;
    ThreadPool pool_;
};
