// ============================================================
// sync_engine.cpp -- Source tree -> destination walk
// ============================================================

#include "sync_engine.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

SyncEngine::SyncEngine(SyncOptions options, TaskScheduler& scheduler)
    : options_(std::move(options))
    , scheduler_(scheduler)
{}

bool SyncEngine::selected(const std::string& match) const {
    return utils::match_any(match, options_.include) &&
           !utils::match_any(match, options_.exclude);
}

void SyncEngine::run(FileEntry source, FileEntry destination) {
    std::string rel = source.basename();
    walk(std::move(source), std::move(destination), rel, true);
}

void SyncEngine::walk(FileEntry source, FileEntry destination,
                      const std::string& rel, bool top) {
    const std::string path = source.path();
    const FileKind    kind = source.kind();

    std::string match = kind == FileKind::Directory ? rel + "/" : rel;
    if (!selected(match)) {
        LOG_DEBUG("skip: " + path);
        return;
    }

    try {
        if (!top || destination.is_dir()) {
            destination = destination.join(source.basename());
        }

        if (kind == FileKind::Other) {
            LOG_WARN("not a regular file, skipped: " + path);
            scheduler_.record(JobOutcome::Skipped);
            return;
        }

        if (kind != FileKind::Directory) {
            scheduler_.submit({ std::move(source), std::move(destination) });
            return;
        }

        auto scope = source.open();
        const std::pair<u64, u64> id{ source.stat().dev, source.stat().ino };
        if (!ancestors_.insert(id).second) {
            LOG_WARN("directory loop, skipped: " + path);
            scheduler_.record(JobOutcome::Skipped);
            return;
        }

        try {
            destination.mkdir(source, [&] {
                auto children = source.children();
                while (auto child = children.next()) {
                    std::string child_rel = rel + "/" + child->basename();
                    walk(std::move(*child), destination.clone(), child_rel, false);
                }
            });
        } catch (...) {
            ancestors_.erase(id);
            throw;
        }
        ancestors_.erase(id);
    } catch (const LockContention& e) {
        LOG_WARN(e.what());
        scheduler_.record(JobOutcome::Skipped);
    } catch (const std::exception& e) {
        Logger::get().job_error(path, e.what());
        scheduler_.record(JobOutcome::Failed, path, e.what());
    }
}

JobOutcome SyncEngine::copy_file(SyncTask& task, const SyncOptions& options) {
    FileEntry& src = task.source;
    FileEntry& dst = task.destination;

    auto src_scope = src.open();
    auto dst_scope = dst.open((mode_t)(src.stat().mode & 0777));

    if (options.skip_identical && src.equals(dst, options.compare_mtime)) {
        LOG_DEBUG("skip: " + src.path());
        return JobOutcome::Skipped;
    }

    dst.truncate();
    dst.copy_from(src);

    LOG_INFO("copy: " + src.path() + " -> " + dst.path() +
             " (" + utils::format_bytes((u64)src.stat().size) + ")");
    return JobOutcome::Copied;
}

TaskScheduler::Runner SyncEngine::job_runner(SyncOptions options) {
    return [options](SyncTask& task) { return copy_file(task, options); };
}
