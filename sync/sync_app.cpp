// ============================================================
// sync_app.cpp -- lesync: copy files and trees, re-encoding names
// ============================================================

#include "sync_app.hpp"
#include "file_entry.hpp"
#include "../common/encoding.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../digest/digester.hpp"
#include <memory>

SyncApp::SyncApp(SyncConfig config)
    : config_(std::move(config))
{}

int SyncApp::run() {
    if (config_.paths.size() < 2) {
        LOG_ERROR("two files required at least");
        return 1;
    }

    const std::string locale = encoding::locale_charset();
    auto arg_codec = std::make_shared<const encoding::Codec>(
        config_.arg_encoding.empty() ? locale : config_.arg_encoding);
    auto src_codec = std::make_shared<const encoding::Codec>(
        config_.src_encoding.empty() ? locale : config_.src_encoding);
    auto dst_codec = std::make_shared<const encoding::Codec>(config_.dst_encoding);

    std::unique_ptr<digest::Digester> digester =
        digest::make_digester(config_.algorithm, config_.key);
    const Access writer = config_.dry_run ? Access::StatProbe : Access::ReadWriteCreate;

    std::vector<std::string> sources;
    for (const auto& p : config_.paths) sources.push_back(arg_codec->decode(p));
    const std::string dst_text = sources.back();
    sources.pop_back();

    try {
        FileEntry dst = FileEntry::resolve(dst_text, dst_codec, Access::StatProbe, digester.get());
        if (sources.size() == 1) {
            FileEntry src = FileEntry::resolve(sources[0], src_codec, Access::ReadOnly, digester.get());
            if (src.is_dir() && !dst.is_dir()) {
                LOG_ERROR("last file must be a directory");
                return 1;
            }
        } else if (!dst.is_dir()) {
            LOG_ERROR("last file must be a directory");
            return 1;
        }
    } catch (const PathError& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    LOG_DEBUG("digest: " + digester->algorithm().name +
              ", workers: " + std::to_string(config_.threads) +
              ", names: " + src_codec->name() + " -> " + dst_codec->name());

    platform::UmaskGuard umask_guard(0);
    const u64 started = utils::now_ms();

    TaskScheduler scheduler(config_.threads, SyncEngine::job_runner(config_.options));
    SyncEngine engine(config_.options, scheduler);

    for (const auto& src_text : sources) {
        try {
            engine.run(FileEntry::resolve(src_text, src_codec, Access::ReadOnly, digester.get()),
                       FileEntry::resolve(dst_text, dst_codec, writer, digester.get()));
        } catch (const PathError& e) {
            Logger::get().job_error(src_text, e.what());
            scheduler.record(JobOutcome::Failed, src_text, e.what());
        }
    }

    summary_ = scheduler.drain();

    LOG_INFO(std::string(config_.dry_run ? "dry run: " : "done: ") +
             std::to_string(summary_.copied) + " copied, " +
             std::to_string(summary_.skipped) + " skipped, " +
             std::to_string(summary_.failed) + " failed in " +
             utils::format_duration_s((utils::now_ms() - started) / 1000));

    return summary_.ok() ? 0 : 1;
}
