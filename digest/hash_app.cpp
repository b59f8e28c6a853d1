// ============================================================
// hash_app.cpp -- lehash: print kernel digests of files
// ============================================================

#include "hash_app.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include <future>
#include <memory>

#include <sys/file.h>
#include <sys/stat.h>

digest::Digest digest_file(const digest::Digester& digester, const std::string& path) {
    int fd = ::open(path.c_str(), O_LARGEFILE | O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw PathError(path, errno);
    }
    file_io::UniqueFd file(fd);

    if (::flock(file.get(), LOCK_SH | LOCK_NB) != 0) {
        int err = errno;
        if (err == EWOULDBLOCK) throw LockContention(path);
        throw KernelResourceError("flock", err);
    }

    struct ::stat st{};
    if (::fstat(file.get(), &st) != 0) {
        throw KernelResourceError("fstat", errno);
    }
    if (S_ISDIR(st.st_mode)) {
        throw PathError(path, EISDIR);
    }
    return digester.digest(file.get(), (u64)st.st_size);
}

// ============================================================
// HashApp
// ============================================================

HashApp::HashApp(HashConfig config, std::ostream& out)
    : config_(std::move(config))
    , out_(out)
{}

int HashApp::run() {
    std::unique_ptr<digest::Digester> digester =
        digest::make_digester(config_.algorithm, config_.key);

    ThreadPool pool(config_.threads);
    std::vector<std::future<digest::Digest>> results;
    results.reserve(config_.files.size());

    for (const auto& path : config_.files) {
        results.push_back(pool.enqueue([&digester, path] {
            return digest_file(*digester, path);
        }));
    }

    int rc = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        const std::string& path = config_.files[i];
        try {
            out_ << utils::to_hex(results[i].get()) << "  " << path << "\n";
        } catch (const LockContention& e) {
            LOG_WARN(e.what());
            rc = 1;
        } catch (const std::exception& e) {
            LOG_ERROR(path + ": " + e.what());
            rc = 1;
        }
    }
    out_.flush();
    return rc;
}
