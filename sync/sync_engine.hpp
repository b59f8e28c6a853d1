#pragma once

// ============================================================
// sync_engine.hpp -- Source tree -> destination walk
//
// The walk runs on the calling thread. Directories are created
// (and their children visited) synchronously; every other entry
// becomes a SyncTask for the scheduler. A directory's timestamps
// are applied after all of its children were visited.
// ============================================================

#include "../common/platform.hpp"
#include "file_entry.hpp"
#include "task_scheduler.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

struct SyncOptions {
    bool skip_identical{false};     // -S: leave equal destinations alone
    bool compare_mtime{true};       // -M clears it
    std::vector<std::string> include{"*/", "*"};
    std::vector<std::string> exclude;
};

class SyncEngine {
public:
    SyncEngine(SyncOptions options, TaskScheduler& scheduler);

    // Synchronize one top-level source. If destination is an existing
    // directory the source lands inside it under its own base name.
    // Failures are recorded in the scheduler's summary, never thrown.
    void run(FileEntry source, FileEntry destination);

    // A match string is selected if it matches some include pattern
    // and no exclude pattern
    bool selected(const std::string& match) const;

    // Body of one leaf job: open both sides, skip if identical (when
    // enabled), otherwise truncate and copy. LockContention propagates.
    static JobOutcome copy_file(SyncTask& task, const SyncOptions& options);

    static TaskScheduler::Runner job_runner(SyncOptions options);

private:
    // rel: path relative to the top-level source used for matching
    void walk(FileEntry source, FileEntry destination,
              const std::string& rel, bool top);

    SyncOptions    options_;
    TaskScheduler& scheduler_;
    // (st_dev, st_ino) of the directories on the current walk path
    std::set<std::pair<u64, u64>> ancestors_;
};
