// ============================================================
// test_hash_app.cpp -- lehash file digests and output format
// ============================================================

#include "test_support.hpp"
#include "../common/file_io.hpp"
#include "../digest/hash_app.hpp"
#include <sstream>

#include <sys/file.h>

using namespace test_support;

TEST(DigestFile, ReturnsDigesterOutput) {
    TempDir tmp;
    write_file(tmp / "f", "hello");
    CountingDigester digester;

    digest::Digest d = digest_file(digester, tmp / "f");
    EXPECT_EQ(std::string(d.begin(), d.end()), "hello");
    EXPECT_EQ(digester.calls(), 1);
}

TEST(DigestFile, MissingFileIsPathError) {
    TempDir tmp;
    CountingDigester digester;
    try {
        digest_file(digester, tmp / "missing");
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_EQ(e.code(), ENOENT);
    }
}

TEST(DigestFile, DirectoryIsPathError) {
    TempDir tmp;
    CountingDigester digester;
    try {
        digest_file(digester, tmp.path());
        FAIL() << "expected PathError";
    } catch (const PathError& e) {
        EXPECT_EQ(e.code(), EISDIR);
    }
    EXPECT_EQ(digester.calls(), 0);
}

TEST(DigestFile, ExclusivelyLockedFileContends) {
    TempDir tmp;
    write_file(tmp / "f", "x");
    file_io::UniqueFd holder(::open((tmp / "f").c_str(), O_RDONLY | O_CLOEXEC));
    ASSERT_EQ(::flock(holder.get(), LOCK_EX), 0);

    CountingDigester digester;
    EXPECT_THROW(digest_file(digester, tmp / "f"), LockContention);
}

TEST(HashApp, PrintsLinesInArgumentOrder) {
    TempDir tmp;
    write_file(tmp / "a", "1");
    write_file(tmp / "b", "22");

    HashConfig cfg;
    cfg.files     = { tmp / "b", tmp / "a" };
    cfg.algorithm = "dummy";
    cfg.threads   = 2;

    std::ostringstream out;
    HashApp app(cfg, out);
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(out.str(), "  " + tmp / "b" + "\n" + "  " + tmp / "a" + "\n");
}

TEST(HashApp, FailedFileSetsExitCodeButOthersPrint) {
    TempDir tmp;
    write_file(tmp / "a", "1");

    HashConfig cfg;
    cfg.files     = { tmp / "missing", tmp / "a" };
    cfg.algorithm = "xxh3_128";
    cfg.threads   = 1;

    std::ostringstream out;
    HashApp app(cfg, out);
    EXPECT_EQ(app.run(), 1);

    const std::string text = out.str();
    EXPECT_EQ(text.find("missing"), std::string::npos);
    EXPECT_EQ(text.size(), 32 + 2 + (tmp / "a").size() + 1);
}

TEST(HashApp, UnknownAlgorithmIsConfigurationError) {
    HashConfig cfg;
    cfg.files     = { "/dev/null" };
    cfg.algorithm = "no_such_hash";

    std::ostringstream out;
    HashApp app(cfg, out);
    EXPECT_THROW(app.run(), ConfigurationError);
}

TEST(HashApp, KernelMd5OfEmptyFile) {
    if (!kernel_hash_available("md5")) GTEST_SKIP() << "AF_ALG unavailable";

    TempDir tmp;
    write_file(tmp / "empty", "");

    HashConfig cfg;
    cfg.files = { tmp / "empty" };

    std::ostringstream out;
    HashApp app(cfg, out);
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(out.str(), "d41d8cd98f00b204e9800998ecf8427e  " + tmp / "empty" + "\n");
}
