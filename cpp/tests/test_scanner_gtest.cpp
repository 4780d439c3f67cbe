// ==============================================================================
// test_scanner_gtest.cpp - Тесты конвейера сканирования (GoogleTest)
// ==============================================================================
//
// scan::run_scan: Discovery -> Inspector -> Normalizer -> ScanReport
// на реальных временных деревьях
//
// ==============================================================================

#include "repoguard/scanner.hpp"

#include "repoguard/channel.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace repoguard::scan::test {

namespace fs = std::filesystem;

// ==============================================================================
// Test Fixture
// ==============================================================================

class ScannerTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    config::ScanConfig cfg_ = config::default_config();

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
                    (std::string("repoguard_scanner_") + test_info->name() + "_" +
                     std::to_string(
#ifdef _WIN32
                         GetCurrentProcessId()
#else
                         getpid()
#endif
                             ));
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    fs::path write_file(const std::string& relative, const std::string& content) {
        fs::path p = test_dir_ / relative;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ==============================================================================
// Пример: a.py с табуляцией, b.py со смешанными окончаниями
// ==============================================================================

TEST_F(ScannerTest, TabsAndMixedEndings_NoTarget) {
    // Arrange
    write_file("a.py", "x = 1\n\ty = 2\n");
    write_file("b.py", "x\r\ny\n");

    // Act
    report::ScanReport result = run_scan(test_dir_, cfg_);

    // Assert
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].path.filename(), "a.py");
    EXPECT_EQ(result.records[0].tab_lines, (std::vector<std::size_t>{2}));
    EXPECT_EQ(result.records[1].line_ending, check::LineEndingKind::Mixed);
    EXPECT_EQ(result.summary.scanned, 2u);
    EXPECT_EQ(result.summary.flagged, 2u);
    EXPECT_EQ(report::exit_status(result), report::EXIT_VIOLATIONS);

    // Без target файлы не переписываются
    EXPECT_EQ(read_file(test_dir_ / "b.py"), "x\r\ny\n");
}

TEST_F(ScannerTest, TabsAndMixedEndings_UnixTarget) {
    // Arrange
    write_file("a.py", "x = 1\n\ty = 2\n");
    write_file("b.py", "x\r\ny\n");
    cfg_.line_ending_target = config::LineEndingTarget::Unix;

    // Act
    report::ScanReport result = run_scan(test_dir_, cfg_);

    // Assert: b.py переписан и чист, a.py остаётся помеченным (табуляция)
    EXPECT_EQ(read_file(test_dir_ / "b.py"), "x\ny\n");
    EXPECT_EQ(result.summary.rewritten, 1u);
    EXPECT_EQ(result.summary.flagged, 1u);
    EXPECT_EQ(result.records[1].rewrite, check::RewriteStatus::Rewritten);
    EXPECT_FALSE(check::is_flagged(result.records[1], cfg_));
    EXPECT_EQ(report::exit_status(result), report::EXIT_VIOLATIONS);
}

TEST_F(ScannerTest, SecondRunIsFixedPoint) {
    write_file("a.md", "one\r\ntwo\n");
    write_file("sub/b.txt", "three\n");
    cfg_.line_ending_target = config::LineEndingTarget::Windows;

    report::ScanReport first = run_scan(test_dir_, cfg_);
    report::ScanReport second = run_scan(test_dir_, cfg_);

    EXPECT_EQ(first.summary.rewritten, 2u);
    EXPECT_EQ(second.summary.rewritten, 0u);
    EXPECT_EQ(second.summary.flagged, 0u);
    EXPECT_EQ(report::exit_status(second), report::EXIT_CLEAN);
}

// ==============================================================================
// Skip, бинарные файлы, отсутствующий корень
// ==============================================================================

TEST_F(ScannerTest, SkippedDirectoryIsNeverInspected) {
    write_file("build/bad.py", "\tx \r\ny\n");
    write_file("src/good.py", "x\n");
    cfg_.skip = {"build"};

    report::ScanReport result = run_scan(test_dir_, cfg_);

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].path.filename(), "good.py");
    EXPECT_EQ(report::exit_status(result), report::EXIT_CLEAN);
}

TEST_F(ScannerTest, BinaryFileIsUnreadableNotFlagged) {
    write_file("data.txt", std::string("\x89PNG\r\n\x1a\n\0\0", 10));
    write_file("ok.txt", "fine\n");

    report::ScanReport result = run_scan(test_dir_, cfg_);

    EXPECT_EQ(result.summary.scanned, 2u);
    EXPECT_EQ(result.summary.unreadable, 1u);
    EXPECT_EQ(result.summary.flagged, 0u);
    EXPECT_EQ(report::exit_status(result), report::EXIT_CLEAN);
}

TEST_F(ScannerTest, MissingRoot_IsNotFoundError) {
    try {
        run_scan(test_dir_ / "missing", cfg_);
        FAIL() << "expected repoguard::Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(ScannerTest, EmptyTreeIsClean) {
    report::ScanReport result = run_scan(test_dir_, cfg_);

    EXPECT_EQ(result.summary.scanned, 0u);
    EXPECT_EQ(report::exit_status(result), report::EXIT_CLEAN);
}

// ==============================================================================
// Параллелизм и отмена
// ==============================================================================

TEST_F(ScannerTest, ManyFiles_SortedRegardlessOfWorkers) {
    for (int i = 0; i < 50; ++i) {
        write_file("d" + std::to_string(i % 5) + "/f" + std::to_string(i) + ".txt",
                   i % 2 == 0 ? "x\n" : "x \n");
    }
    cfg_.num_threads = 4;

    report::ScanReport result = run_scan(test_dir_, cfg_);

    ASSERT_EQ(result.records.size(), 50u);
    for (std::size_t i = 1; i < result.records.size(); ++i) {
        EXPECT_LT(result.records[i - 1].path, result.records[i].path);
    }
    EXPECT_EQ(result.summary.flagged, 25u);
}

TEST_F(ScannerTest, CancelledBeforeStart_ReportsInterrupted) {
    write_file("a.py", "x\n");
    std::atomic<bool> cancel{true};

    report::ScanReport result = run_scan(test_dir_, cfg_, &cancel);

    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.summary.scanned, 0u);
    EXPECT_EQ(report::exit_status(result), report::EXIT_INTERRUPTED);
}

TEST(WorkerCountTest, ExplicitAndDefault) {
    config::ScanConfig cfg = config::default_config();
    cfg.num_threads = 3;
    EXPECT_EQ(worker_count(cfg), 3u);

    cfg.num_threads = 0;
    EXPECT_GE(worker_count(cfg), 1u);
}

TEST(ProcessFileTest, MissingFileBecomesUnreadableRecord) {
    config::ScanConfig cfg = config::default_config();

    check::FileRecord r = process_file("/nonexistent/repoguard/file.py", cfg);

    EXPECT_FALSE(r.readable);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Read);
}

// ==============================================================================
// Channel
// ==============================================================================

TEST(ChannelTest, DeliversAllValuesThenCloses) {
    Channel<int> channel(2);
    std::thread producer([&channel] {
        for (int i = 0; i < 100; ++i) {
            channel.send(i);
        }
        channel.close();
    });

    int sum = 0;
    int count = 0;
    while (auto value = channel.receive()) {
        sum += *value;
        ++count;
    }
    producer.join();

    EXPECT_EQ(count, 100);
    EXPECT_EQ(sum, 4950);
}

TEST(ChannelTest, SendAfterCloseIsRejected) {
    Channel<int> channel;
    channel.close();

    EXPECT_FALSE(channel.send(1));
    EXPECT_FALSE(channel.receive().has_value());
}

}  // namespace repoguard::scan::test
