// ============================================================
// test_utils.cpp
// ============================================================

#include "test_support.hpp"
#include "../common/logger.hpp"
#include "../common/thread_pool.hpp"
#include "../common/utils.hpp"
#include <atomic>

TEST(Utils, ToHexIsLowercase) {
    EXPECT_EQ(utils::to_hex({}), "");
    EXPECT_EQ(utils::to_hex({ 0x00, 0x0f, 0xa5, 0xff }), "000fa5ff");
}

TEST(Utils, MatchAnyStarCrossesSlashes) {
    EXPECT_TRUE(utils::match_any("tmp/readme.txt", { "tmp*" }));
    EXPECT_TRUE(utils::match_any("a/b/c.txt", { "*.txt" }));
    EXPECT_TRUE(utils::match_any("sub/", { "*/" }));
    EXPECT_FALSE(utils::match_any("sub", { "*/" }));
    EXPECT_FALSE(utils::match_any("notes.md", { "*.txt", "tmp*" }));
    EXPECT_FALSE(utils::match_any("anything", {}));
}

TEST(Utils, FormatBytes) {
    EXPECT_EQ(utils::format_bytes(512), "512 B");
    EXPECT_EQ(utils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(utils::format_bytes(3ULL * 1024 * 1024), "3.00 MB");
}

TEST(Utils, FormatDuration) {
    EXPECT_EQ(utils::format_duration_s(42), "42s");
    EXPECT_EQ(utils::format_duration_s(125), "2m 5s");
    EXPECT_EQ(utils::format_duration_s(3725), "1h 2m 5s");
}

TEST(Logger, VerbosityMapsToLevel) {
    Logger& log = Logger::get();
    LogLevel saved = log.level();

    log.set_verbosity(0);
    EXPECT_EQ(log.level(), LogLevel::WARN);
    log.set_verbosity(0, true);
    EXPECT_EQ(log.level(), LogLevel::INFO);
    log.set_verbosity(1);
    EXPECT_EQ(log.level(), LogLevel::INFO);
    log.set_verbosity(2);
    EXPECT_EQ(log.level(), LogLevel::DEBUG);

    log.set_level(saved);
}

TEST(ThreadPool, WaitIdleSeesEveryTask) {
    ThreadPool pool(4);
    std::atomic<int> done{0};
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPool, FutureCarriesResultAndException) {
    ThreadPool pool(2);
    auto ok  = pool.enqueue([] { return 7; });
    auto bad = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_EQ(ok.get(), 7);
    EXPECT_THROW(bad.get(), std::runtime_error);
}
