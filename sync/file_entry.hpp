#pragma once

// ============================================================
// file_entry.hpp -- One filesystem path with scoped open/lock
//
// Access variants (see FileEntry::traits):
//   ReadOnly         O_RDONLY,         LOCK_SH, missing file is an error
//   ReadWriteCreate  O_RDWR|O_CREAT,   LOCK_EX, created on demand
//   StatProbe        O_RDONLY,         LOCK_SH, missing file tolerated
//
// Only ReadWriteCreate modifies anything: truncate(), copy_from()
// and mkdir() are no-ops on the other variants, which is what
// makes StatProbe usable as a dry-run destination.
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "../common/encoding.hpp"
#include "../common/errors.hpp"
#include "../digest/digester.hpp"
#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <time.h>

enum class Access {
    ReadOnly,
    ReadWriteCreate,
    StatProbe,
};

enum class FileKind {
    Missing,
    Regular,
    Directory,
    Other,
};

// fstat snapshot; size -1 means "not opened"
struct FileStat {
    i64      size{-1};
    timespec atime{-1, 0};
    timespec mtime{-1, 0};
    u32      mode{0};
    u64      dev{0};
    u64      ino{0};

    bool valid() const { return size >= 0; }
};

class FileEntry {
public:
    // Closes the descriptor and drops the stat cache on scope exit
    class OpenScope {
    public:
        explicit OpenScope(FileEntry& entry) : entry_(&entry) {}
        ~OpenScope() { if (entry_) entry_->close(); }

        OpenScope(OpenScope&& o) noexcept : entry_(o.entry_) { o.entry_ = nullptr; }
        OpenScope(const OpenScope&) = delete;
        OpenScope& operator=(const OpenScope&) = delete;
        OpenScope& operator=(OpenScope&&) = delete;

    private:
        FileEntry* entry_;
    };

    // Lazily walks a directory in the order the OS reports entries
    class ChildIterator {
    public:
        // Next child, or nullopt at the end. Throws PathError.
        std::optional<FileEntry> next();

    private:
        friend class FileEntry;
        explicit ChildIterator(const FileEntry& dir);

        std::unique_ptr<FileEntry>            dir_;
        std::filesystem::directory_iterator   it_;
    };

    // Absolute, symlink-resolved entry for path_text (UTF-8). The codec
    // gives the charset of the on-disk name; digester may be null.
    static FileEntry resolve(const std::string& path_text,
                             std::shared_ptr<const encoding::Codec> codec,
                             Access access,
                             const digest::Digester* digester);

    FileEntry(FileEntry&&) = default;
    FileEntry& operator=(FileEntry&&) = default;
    FileEntry(const FileEntry&) = delete;
    FileEntry& operator=(const FileEntry&) = delete;

    const std::string& path() const   { return text_; }
    const std::string& native() const { return native_; }
    std::string basename() const;
    Access access() const { return access_; }
    bool opened() const   { return fd_.valid(); }
    int  fd() const       { return fd_.get(); }

    // stat(2) on the path, following symlinks; independent of open()
    FileKind kind() const;
    bool is_dir() const { return kind() == FileKind::Directory; }

    // Open with the variant's flags and take its lock without blocking.
    // mode applies only when the file is created.
    // Throws PathError, LockContention, KernelResourceError.
    [[nodiscard]] OpenScope open(mode_t mode = 0644);

    // Cached fstat of the open descriptor; invalid when not opened
    const FileStat& stat();

    // Content digest of the open descriptor; empty when not opened
    digest::Digest digest();

    // size, mtime (whole seconds, unless compare_mtime is false),
    // base name, then digest; each check runs only if the previous matched
    bool equals(FileEntry& other, bool compare_mtime = true);

    // Child named by UTF-8 text, re-encoded with this entry's codec
    FileEntry join(const std::string& name) const;

    // Unopened entry for the same path
    FileEntry clone() const;

    ChildIterator children() const { return ChildIterator(*this); }

    // ReadWriteCreate only: rewind and cut to zero length
    void truncate();

    // ReadWriteCreate only: in-kernel copy of source's content, then
    // source's atime/mtime applied to this descriptor
    void copy_from(FileEntry& source);

    // ReadWriteCreate only: create the directory (existing is fine),
    // run body, then apply source's atime/mtime. Timestamps go last so
    // that children created by body do not leave the mtime bumped.
    template<typename Body>
    void mkdir(FileEntry& source, Body&& body);

private:
    struct Traits {
        int  open_flags;
        int  lock_op;
        bool tolerate_missing;
        bool writable;
    };

    static Traits traits(Access access);

    FileEntry(std::string text, std::string native,
              std::shared_ptr<const encoding::Codec> codec,
              Access access, const digest::Digester* digester);

    FileEntry child_raw(const std::string& raw_name) const;
    void make_directory(mode_t mode);
    void close();

    std::string                            text_;
    std::string                            native_;
    std::shared_ptr<const encoding::Codec> codec_;
    Access                                 access_;
    const digest::Digester*                digester_;
    file_io::UniqueFd                      fd_;
    FileStat                               stat_;
    bool                                   stat_cached_{false};
};

template<typename Body>
void FileEntry::mkdir(FileEntry& source, Body&& body) {
    if (!traits(access_).writable) {
        body();
        return;
    }

    const FileStat& st = source.stat();
    make_directory(st.valid() ? (mode_t)(st.mode & 0777) : 0755);
    body();

    if (st.valid()) {
        file_io::set_times(native_, st.atime, st.mtime);
    }
}
