#pragma once

// ============================================================
// sync_app.hpp -- lesync: copy files and trees, re-encoding names
// ============================================================

#include "../common/platform.hpp"
#include "sync_engine.hpp"
#include "task_scheduler.hpp"
#include <optional>
#include <string>
#include <vector>

struct SyncConfig {
    std::vector<std::string>   paths;           // sources..., destination
    std::string                algorithm{"md5"};
    std::optional<std::string> key;
    size_t                     threads{platform::cpu_count()};
    bool                       dry_run{false};
    SyncOptions                options;
    std::string                src_encoding;    // empty: locale charset
    std::string                dst_encoding{"UTF-8"};
    std::string                arg_encoding;    // charset of the command line; empty: locale
};

class SyncApp {
public:
    explicit SyncApp(SyncConfig config);

    // 0 on success, 1 on a usage error or if any entry failed.
    // ConfigurationError / KernelResourceError escape to the caller.
    int run();

    const RunSummary& summary() const { return summary_; }

private:
    SyncConfig config_;
    RunSummary summary_;
};
