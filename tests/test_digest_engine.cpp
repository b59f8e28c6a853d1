// ============================================================
// test_digest_engine.cpp -- bind record, pump, sessions, digesters
// ============================================================

#include "test_support.hpp"
#include "../common/file_io.hpp"
#include "../common/utils.hpp"
#include "../digest/digest_socket.hpp"
#include "../digest/digester.hpp"
#include "../digest/zero_copy_pump.hpp"
#include <chrono>
#include <cstddef>
#include <thread>
#include <vector>

#include <sys/socket.h>

using namespace test_support;
using digest::AlgorithmRegistry;

namespace {

file_io::UniqueFd open_read(const std::string& path) {
    return file_io::UniqueFd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
}

std::string kernel_hex(const std::string& algo, const std::string& path) {
    digest::DigestSocket sock(AlgorithmRegistry::instance().at(algo));
    auto fd = open_read(path);
    auto session = sock.open();
    struct ::stat st = stat_of(path);
    return utils::to_hex(session.digest(fd.get(), (u64)st.st_size));
}

} // namespace

// ---- Bind record ----

TEST(BindRecord, LayoutMatchesKernelStruct) {
    EXPECT_EQ(sizeof(digest::BindRecord), 88u);
    EXPECT_EQ(offsetof(digest::BindRecord, family), 0u);
    EXPECT_EQ(offsetof(digest::BindRecord, type), 2u);
    EXPECT_EQ(offsetof(digest::BindRecord, feat), 16u);
    EXPECT_EQ(offsetof(digest::BindRecord, mask), 20u);
    EXPECT_EQ(offsetof(digest::BindRecord, name), 24u);
}

TEST(BindRecord, CarriesFamilyTypeAndName) {
    digest::BindRecord rec = digest::make_bind_record("sha256");
    EXPECT_EQ(rec.family, (u16)AF_ALG);
    EXPECT_STREQ(reinterpret_cast<const char*>(rec.type), "hash");
    EXPECT_EQ(rec.feat, 0u);
    EXPECT_EQ(rec.mask, 0u);
    EXPECT_STREQ(reinterpret_cast<const char*>(rec.name), "sha256");
    EXPECT_EQ(rec.name[63], 0);
}

TEST(BindRecord, NameMustLeaveRoomForTerminator) {
    EXPECT_NO_THROW(digest::make_bind_record(std::string(63, 'a')));
    EXPECT_THROW(digest::make_bind_record(std::string(64, 'a')), ConfigurationError);
    EXPECT_THROW(digest::make_bind_record(""), ConfigurationError);
}

// ---- Pump (no AF_ALG needed: a regular file is a valid splice sink) ----

TEST(ZeroCopyPump, ChunkLimitIsSixteenPages) {
    EXPECT_EQ(digest::splice_chunk_limit(), platform::page_size() * 16);
}

TEST(ZeroCopyPump, MovesEveryByteAcrossManyChunks) {
    TempDir tmp;
    const std::string content = pattern_content(digest::splice_chunk_limit() * 5 + 123);
    write_file(tmp / "src", content);

    auto src = open_read(tmp / "src");
    file_io::UniqueFd dst(::open((tmp / "dst").c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    ASSERT_TRUE(src.valid());
    ASSERT_TRUE(dst.valid());

    digest::pump(src.get(), dst.get(), content.size());
    dst.reset();

    EXPECT_EQ(read_file(tmp / "dst"), content);
}

TEST(ZeroCopyPump, SourceShorterThanAnnouncedIsShortTransfer) {
    TempDir tmp;
    write_file(tmp / "src", "12345");

    auto src = open_read(tmp / "src");
    file_io::UniqueFd dst(::open((tmp / "dst").c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));

    EXPECT_THROW(digest::pump(src.get(), dst.get(), 100), ShortTransferAssertion);
}

TEST(ZeroCopyPump, ReadExactAssemblesPartialReads) {
    file_io::Pipe pipe;
    ASSERT_EQ(::write(pipe.write_end(), "abc", 3), 3);

    std::thread writer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ASSERT_EQ(::write(pipe.write_end(), "defgh", 5), 5);
    });
    digest::Digest d = digest::read_exact(pipe.read_end(), 8);
    writer.join();

    EXPECT_EQ(std::string(d.begin(), d.end()), "abcdefgh");
}

TEST(ZeroCopyPump, ReadExactFailsOnEarlyEof) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    file_io::UniqueFd r(fds[0]);
    file_io::UniqueFd w(fds[1]);
    ASSERT_EQ(::write(w.get(), "abc", 3), 3);
    w.reset();

    EXPECT_THROW(digest::read_exact(r.get(), 8), ShortTransferAssertion);
}

// ---- In-kernel file copy ----

TEST(FileIo, CopyRangeMovesWholeFile) {
    TempDir tmp;
    const std::string content = pattern_content(3 * 1024 * 1024 + 7, 9);
    write_file(tmp / "src", content);

    auto src = open_read(tmp / "src");
    file_io::UniqueFd dst(::open((tmp / "dst").c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    file_io::copy_range(dst.get(), src.get(), content.size());
    dst.reset();

    EXPECT_EQ(read_file(tmp / "dst"), content);
}

TEST(FileIo, CopyRangePastEndOfSourceIsShortTransfer) {
    TempDir tmp;
    write_file(tmp / "src", "xyz");

    auto src = open_read(tmp / "src");
    file_io::UniqueFd dst(::open((tmp / "dst").c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    EXPECT_THROW(file_io::copy_range(dst.get(), src.get(), 10), ShortTransferAssertion);
}

// ---- Kernel sessions ----

class KernelDigest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!kernel_hash_available("md5") || !kernel_hash_available("sha256")) {
            GTEST_SKIP() << "AF_ALG hash sockets unavailable";
        }
    }

    TempDir tmp_;
};

TEST_F(KernelDigest, EmptyInputGivesKnownConstants) {
    write_file(tmp_ / "empty", "");
    EXPECT_EQ(kernel_hex("md5", tmp_ / "empty"), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(kernel_hex("sha256", tmp_ / "empty"),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(KernelDigest, KnownVectors) {
    write_file(tmp_ / "abc", "abc");
    EXPECT_EQ(kernel_hex("md5", tmp_ / "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(kernel_hex("sha256", tmp_ / "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(KernelDigest, KeyedDigestUsesKey) {
    try {
        digest::DigestSocket probe(AlgorithmRegistry::instance().at("hmac_sha256"),
                                   std::string("key"));
    } catch (const std::exception&) {
        GTEST_SKIP() << "hmac(sha256) unavailable";
    }
    write_file(tmp_ / "fox", "The quick brown fox jumps over the lazy dog");

    digest::DigestSocket sock(AlgorithmRegistry::instance().at("hmac_sha256"), std::string("key"));
    auto fd = open_read(tmp_ / "fox");
    auto session = sock.open();
    EXPECT_EQ(utils::to_hex(session.digest(fd.get(), 43)),
              "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST_F(KernelDigest, LargeFileIsDeterministicAcrossDescriptors) {
    const std::string content = pattern_content(1024 * 1024 + 123, 3);
    write_file(tmp_ / "big", content);

    auto d = digest::make_digester("sha256");
    auto fd1 = open_read(tmp_ / "big");
    auto fd2 = open_read(tmp_ / "big");

    digest::Digest a = d->digest(fd1.get(), content.size());
    digest::Digest b = d->digest(fd2.get(), content.size());
    digest::Digest c = d->digest(fd1.get(), content.size());

    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(::lseek(fd1.get(), 0, SEEK_CUR), 0);
}

TEST_F(KernelDigest, DigestLengthMatchesDescriptor) {
    write_file(tmp_ / "f", pattern_content(5000));
    for (const char* name : { "md5", "sha1", "sha256", "sha512" }) {
        if (!kernel_hash_available(name)) continue;
        auto d = digest::make_digester(name);
        auto fd = open_read(tmp_ / "f");
        EXPECT_EQ(d->digest(fd.get(), 5000).size(), d->algorithm().digest_size) << name;
    }
}

TEST_F(KernelDigest, SessionIsSingleShot) {
    write_file(tmp_ / "f", "data");
    digest::DigestSocket sock(AlgorithmRegistry::instance().at("md5"));
    auto fd = open_read(tmp_ / "f");
    auto session = sock.open();
    session.digest(fd.get(), 4);
    EXPECT_THROW(session.digest(fd.get(), 4), std::logic_error);
}

TEST_F(KernelDigest, SourceIsRewoundWhenPumpFails) {
    write_file(tmp_ / "short", "12345");
    digest::DigestSocket sock(AlgorithmRegistry::instance().at("md5"));
    auto fd = open_read(tmp_ / "short");
    auto session = sock.open();

    EXPECT_THROW(session.digest(fd.get(), 100), ShortTransferAssertion);
    EXPECT_EQ(::lseek(fd.get(), 0, SEEK_CUR), 0);
}

TEST_F(KernelDigest, SessionsFromOneSocketAreIndependent) {
    write_file(tmp_ / "a", "abc");
    write_file(tmp_ / "b", "");
    digest::DigestSocket sock(AlgorithmRegistry::instance().at("md5"));

    auto s1 = sock.open();
    auto s2 = sock.open();
    auto fa = open_read(tmp_ / "a");
    auto fb = open_read(tmp_ / "b");

    EXPECT_EQ(utils::to_hex(s2.digest(fb.get(), 0)), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(utils::to_hex(s1.digest(fa.get(), 3)), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(KernelDigest, ConcurrentCallersGetEqualDigests) {
    const std::string content = pattern_content(300 * 1024, 5);
    write_file(tmp_ / "f", content);
    auto d = digest::make_digester("sha256");

    std::vector<digest::Digest> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            auto fd = open_read(tmp_ / "f");
            results[i] = d->digest(fd.get(), content.size());
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) EXPECT_EQ(r, results[0]);
}

TEST_F(KernelDigest, UnknownKernelTransformIsConfigurationError) {
    digest::AlgorithmDescriptor bogus;
    bogus.name        = "bogus";
    bogus.kernel_name = "no-such-transform-xyz";
    bogus.digest_size = 16;
    EXPECT_THROW(digest::DigestSocket sock(bogus), ConfigurationError);
}

// ---- Digester construction ----

TEST(Digester, KeyedAlgorithmWithoutKeyIsConfigurationError) {
    EXPECT_THROW(digest::make_digester("hmac_sha256"), ConfigurationError);
}

TEST(Digester, UnknownAlgorithmIsConfigurationError) {
    EXPECT_THROW(digest::make_digester("no_such_hash"), ConfigurationError);
}

TEST(Digester, NullDigesterReturnsEmpty) {
    auto d = digest::make_digester("dummy");
    EXPECT_EQ(d->algorithm().name, "dummy");
    EXPECT_TRUE(d->digest(-1, 100).empty());
    EXPECT_THROW(digest::make_digester("dummy", std::string("k")), ConfigurationError);
}

TEST(Digester, Xxh3IsSixteenBytesAndRewinds) {
    TempDir tmp;
    write_file(tmp / "a", pattern_content(70000, 1));
    write_file(tmp / "b", pattern_content(70000, 2));
    write_file(tmp / "empty", "");

    auto d = digest::make_digester("xxh3_128");
    auto fa = open_read(tmp / "a");
    auto fb = open_read(tmp / "b");
    auto fe = open_read(tmp / "empty");

    digest::Digest a1 = d->digest(fa.get(), 70000);
    digest::Digest a2 = d->digest(fa.get(), 70000);
    digest::Digest b  = d->digest(fb.get(), 70000);

    EXPECT_EQ(a1.size(), 16u);
    EXPECT_EQ(a1, a2);
    EXPECT_NE(a1, b);
    EXPECT_EQ(d->digest(fe.get(), 0).size(), 16u);
    EXPECT_EQ(::lseek(fa.get(), 0, SEEK_CUR), 0);
}
