// ============================================================
// file_entry.cpp -- One filesystem path with scoped open/lock
// ============================================================

#include "file_entry.hpp"
#include "../common/logger.hpp"
#include <stdexcept>
#include <system_error>

#include <sys/file.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

static std::string join_path(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

// ============================================================
// FileEntry
// ============================================================

FileEntry::Traits FileEntry::traits(Access access) {
    switch (access) {
        case Access::ReadOnly:
            return { O_LARGEFILE | O_RDONLY,          LOCK_SH, false, false };
        case Access::ReadWriteCreate:
            return { O_LARGEFILE | O_RDWR | O_CREAT,  LOCK_EX, false, true  };
        case Access::StatProbe:
            return { O_LARGEFILE | O_RDONLY,          LOCK_SH, true,  false };
    }
    throw std::logic_error("unknown access variant");
}

FileEntry::FileEntry(std::string text, std::string native,
                     std::shared_ptr<const encoding::Codec> codec,
                     Access access, const digest::Digester* digester)
    : text_(std::move(text))
    , native_(std::move(native))
    , codec_(std::move(codec))
    , access_(access)
    , digester_(digester)
{}

FileEntry FileEntry::resolve(const std::string& path_text,
                             std::shared_ptr<const encoding::Codec> codec,
                             Access access,
                             const digest::Digester* digester) {
    std::string raw = codec->encode(path_text);

    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(raw), ec);
    if (!ec) abs = fs::weakly_canonical(abs, ec);
    if (ec) {
        throw PathError(path_text, ec.value());
    }

    std::string native = abs.native();
    while (native.size() > 1 && native.back() == '/') native.pop_back();

    std::string text = codec->decode(native);
    return FileEntry(std::move(text), std::move(native), std::move(codec), access, digester);
}

std::string FileEntry::basename() const {
    size_t slash = text_.find_last_of('/');
    return slash == std::string::npos ? text_ : text_.substr(slash + 1);
}

FileKind FileEntry::kind() const {
    struct ::stat st{};
    if (::stat(native_.c_str(), &st) != 0) return FileKind::Missing;
    if (S_ISDIR(st.st_mode)) return FileKind::Directory;
    if (S_ISREG(st.st_mode)) return FileKind::Regular;
    return FileKind::Other;
}

FileEntry::OpenScope FileEntry::open(mode_t mode) {
    if (opened()) {
        throw std::logic_error("already open: " + text_);
    }

    const Traits t = traits(access_);
    int fd = ::open(native_.c_str(), t.open_flags | O_CLOEXEC, mode);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT && t.tolerate_missing) {
            LOG_DEBUG("not found, continuing unopened: " + text_);
            return OpenScope(*this);
        }
        throw PathError(text_, err);
    }
    fd_.reset(fd);

    // From here on the scope owns the descriptor, including on throw
    OpenScope scope(*this);
    if (::flock(fd, t.lock_op | LOCK_NB) != 0) {
        int err = errno;
        if (err == EWOULDBLOCK) throw LockContention(text_);
        throw KernelResourceError("flock", err);
    }
    return scope;
}

void FileEntry::close() {
    fd_.reset();
    stat_        = FileStat{};
    stat_cached_ = false;
}

const FileStat& FileEntry::stat() {
    if (opened() && !stat_cached_) {
        struct ::stat st{};
        if (::fstat(fd_.get(), &st) != 0) {
            throw KernelResourceError("fstat", errno);
        }
        stat_.size  = (i64)st.st_size;
        stat_.atime = st.st_atim;
        stat_.mtime = st.st_mtim;
        stat_.mode  = (u32)st.st_mode;
        stat_.dev   = (u64)st.st_dev;
        stat_.ino   = (u64)st.st_ino;
        stat_cached_ = true;
    }
    return stat_;
}

digest::Digest FileEntry::digest() {
    if (!opened() || !digester_) return {};
    return digester_->digest(fd_.get(), (u64)stat().size);
}

bool FileEntry::equals(FileEntry& other, bool compare_mtime) {
    const FileStat& a = stat();
    const FileStat& b = other.stat();

    if (a.size != b.size) return false;
    if (compare_mtime && a.mtime.tv_sec != b.mtime.tv_sec) return false;
    if (basename() != other.basename()) return false;
    return digest() == other.digest();
}

FileEntry FileEntry::join(const std::string& name) const {
    return FileEntry(join_path(text_, name),
                     join_path(native_, codec_->encode(name)),
                     codec_, access_, digester_);
}

FileEntry FileEntry::clone() const {
    return FileEntry(text_, native_, codec_, access_, digester_);
}

FileEntry FileEntry::child_raw(const std::string& raw_name) const {
    return FileEntry(join_path(text_, codec_->decode(raw_name)),
                     join_path(native_, raw_name),
                     codec_, access_, digester_);
}

void FileEntry::truncate() {
    if (!traits(access_).writable || !opened()) return;

    file_io::rewind(fd_.get());
    if (::ftruncate(fd_.get(), 0) != 0) {
        throw KernelResourceError("ftruncate", errno);
    }
    stat_cached_ = false;
}

void FileEntry::copy_from(FileEntry& source) {
    if (!traits(access_).writable || !opened() || !source.opened()) return;

    const FileStat& st = source.stat();
    file_io::copy_range(fd_.get(), source.fd(), (u64)st.size);
    file_io::set_times(fd_.get(), st.atime, st.mtime);
    stat_cached_ = false;
}

void FileEntry::make_directory(mode_t mode) {
    if (::mkdir(native_.c_str(), mode) != 0 && errno != EEXIST) {
        throw PathError(text_, errno);
    }
}

// ============================================================
// ChildIterator
// ============================================================

FileEntry::ChildIterator::ChildIterator(const FileEntry& dir)
    : dir_(std::make_unique<FileEntry>(dir.clone()))
{
    std::error_code ec;
    it_ = fs::directory_iterator(fs::path(dir_->native_), ec);
    if (ec) {
        throw PathError(dir_->text_, ec.value());
    }
}

std::optional<FileEntry> FileEntry::ChildIterator::next() {
    if (it_ == fs::directory_iterator()) return std::nullopt;

    std::string raw = it_->path().filename().native();

    std::error_code ec;
    it_.increment(ec);
    if (ec) {
        throw PathError(dir_->text_, ec.value());
    }
    return dir_->child_raw(raw);
}
