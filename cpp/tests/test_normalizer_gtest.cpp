// ==============================================================================
// test_normalizer_gtest.cpp - Тесты нормализации окончаний строк (GoogleTest)
// ==============================================================================
//
// check::normalize_line_endings / normalize_file / apply_normalization
//
// ==============================================================================

#include "repoguard/normalizer.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace repoguard::check::test {

namespace fs = std::filesystem;
using config::LineEndingTarget;

// ==============================================================================
// Преобразование байтов
// ==============================================================================

TEST(NormalizeBytesTest, ToUnix) {
    EXPECT_EQ(normalize_line_endings("a\r\nb\r\n", LineEndingTarget::Unix), "a\nb\n");
    EXPECT_EQ(normalize_line_endings("a\r\nb\n", LineEndingTarget::Unix), "a\nb\n");
}

TEST(NormalizeBytesTest, ToWindows) {
    EXPECT_EQ(normalize_line_endings("a\nb\n", LineEndingTarget::Windows), "a\r\nb\r\n");
    EXPECT_EQ(normalize_line_endings("a\r\nb\n", LineEndingTarget::Windows), "a\r\nb\r\n");
    EXPECT_EQ(normalize_line_endings("\n", LineEndingTarget::Windows), "\r\n");
}

TEST(NormalizeBytesTest, PreservesOtherBytes) {
    const std::string input = "\tx = 1  \r\n\ty\rz\n";

    EXPECT_EQ(normalize_line_endings(input, LineEndingTarget::Unix), "\tx = 1  \n\ty\rz\n");
    EXPECT_EQ(normalize_line_endings(input, LineEndingTarget::Windows),
              "\tx = 1  \r\n\ty\rz\r\n");
}

TEST(NormalizeBytesTest, NoneIsIdentity) {
    EXPECT_EQ(normalize_line_endings("a\r\nb\n", LineEndingTarget::None), "a\r\nb\n");
}

TEST(NormalizeBytesTest, Idempotent) {
    const std::string input = "one\r\ntwo\nthree\r\n\n";
    for (auto target : {LineEndingTarget::Unix, LineEndingTarget::Windows}) {
        std::string once = normalize_line_endings(input, target);
        EXPECT_EQ(normalize_line_endings(once, target), once);
    }
}

TEST(NormalizeBytesTest, CarriageReturnRunBeforeNewline) {
    const std::string input = "a\r\r\nb\n";

    std::string unix_once = normalize_line_endings(input, LineEndingTarget::Unix);
    EXPECT_EQ(unix_once, "a\nb\n");
    EXPECT_EQ(normalize_line_endings(unix_once, LineEndingTarget::Unix), unix_once);
    EXPECT_EQ(classify_line_endings(unix_once), LineEndingKind::LF);

    std::string windows_once = normalize_line_endings(input, LineEndingTarget::Windows);
    EXPECT_EQ(windows_once, "a\r\r\nb\r\n");
    EXPECT_EQ(normalize_line_endings(windows_once, LineEndingTarget::Windows), windows_once);
    EXPECT_EQ(classify_line_endings(windows_once), LineEndingKind::CRLF);

    // '\r' без '\n' следом не трогается
    EXPECT_EQ(normalize_line_endings("a\r\rb\r\n", LineEndingTarget::Unix), "a\r\rb\n");
}

// ==============================================================================
// needs_rewrite
// ==============================================================================

TEST(NeedsRewriteTest, ByKindAndTarget) {
    FileRecord r;

    r.line_ending = LineEndingKind::Mixed;
    EXPECT_TRUE(needs_rewrite(r, LineEndingTarget::Unix));
    EXPECT_TRUE(needs_rewrite(r, LineEndingTarget::Windows));
    EXPECT_FALSE(needs_rewrite(r, LineEndingTarget::None));

    r.line_ending = LineEndingKind::LF;
    EXPECT_FALSE(needs_rewrite(r, LineEndingTarget::Unix));
    EXPECT_TRUE(needs_rewrite(r, LineEndingTarget::Windows));

    r.line_ending = LineEndingKind::CRLF;
    EXPECT_TRUE(needs_rewrite(r, LineEndingTarget::Unix));
    EXPECT_FALSE(needs_rewrite(r, LineEndingTarget::Windows));

    r.line_ending = LineEndingKind::NoNewlines;
    EXPECT_FALSE(needs_rewrite(r, LineEndingTarget::Unix));

    r.line_ending = LineEndingKind::NotText;
    r.readable = false;
    EXPECT_FALSE(needs_rewrite(r, LineEndingTarget::Windows));
}

// ==============================================================================
// Файлы на диске
// ==============================================================================

class NormalizeFileTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() /
                    (std::string("repoguard_normalizer_") + test_info->name() + "_" +
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
        fs::permissions(test_dir_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir_, ec);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path p = test_dir_ / name;
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

    static config::ScanConfig target(LineEndingTarget t) {
        config::ScanConfig cfg = config::default_config();
        cfg.line_ending_target = t;
        return cfg;
    }
};

TEST_F(NormalizeFileTest, RewritesAndReinspects) {
    // Arrange
    fs::path p = write_file("b.py", "x\r\ny\n");
    auto cfg = target(LineEndingTarget::Unix);
    FileRecord before = inspect_file(p, cfg);
    ASSERT_EQ(before.line_ending, LineEndingKind::Mixed);

    // Act
    FileRecord after = apply_normalization(before, cfg);

    // Assert
    EXPECT_EQ(read_file(p), "x\ny\n");
    EXPECT_EQ(after.rewrite, RewriteStatus::Rewritten);
    EXPECT_EQ(after.line_ending, LineEndingKind::LF);
    EXPECT_FALSE(is_flagged(after, cfg));
}

TEST_F(NormalizeFileTest, FixedPoint_SecondRunDoesNothing) {
    fs::path p = write_file("a.txt", "one\ntwo\n");
    auto cfg = target(LineEndingTarget::Windows);

    FileRecord first = apply_normalization(inspect_file(p, cfg), cfg);
    std::string after_first = read_file(p);
    FileRecord second = apply_normalization(inspect_file(p, cfg), cfg);

    EXPECT_EQ(first.rewrite, RewriteStatus::Rewritten);
    EXPECT_EQ(after_first, "one\r\ntwo\r\n");
    EXPECT_EQ(second.rewrite, RewriteStatus::NotAttempted);
    EXPECT_EQ(read_file(p), after_first);
}

TEST_F(NormalizeFileTest, CarriageReturnRun_CleanAfterOnePass) {
    // Arrange
    fs::path p = write_file("c.py", "a\r\r\nb\n");
    auto cfg = target(LineEndingTarget::Unix);

    // Act
    FileRecord first = apply_normalization(inspect_file(p, cfg), cfg);
    std::string after_first = read_file(p);
    FileRecord second = apply_normalization(inspect_file(p, cfg), cfg);

    // Assert
    EXPECT_EQ(first.rewrite, RewriteStatus::Rewritten);
    EXPECT_EQ(first.line_ending, LineEndingKind::LF);
    EXPECT_FALSE(is_flagged(first, cfg));
    EXPECT_EQ(after_first, "a\nb\n");
    EXPECT_EQ(second.rewrite, RewriteStatus::NotAttempted);
    EXPECT_EQ(read_file(p), after_first);
}

TEST_F(NormalizeFileTest, MatchingFileIsUntouched) {
    fs::path p = write_file("a.py", "x\n");
    auto cfg = target(LineEndingTarget::Unix);

    NormalizeResult result = normalize_file(inspect_file(p, cfg), cfg);

    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.rewritten);
}

TEST_F(NormalizeFileTest, DryRunDoesNotWrite) {
    fs::path p = write_file("a.py", "x\r\n");
    auto cfg = target(LineEndingTarget::Unix);
    cfg.dry_run = true;

    FileRecord r = apply_normalization(inspect_file(p, cfg), cfg);

    EXPECT_EQ(read_file(p), "x\r\n");
    EXPECT_EQ(r.rewrite, RewriteStatus::NotAttempted);
    EXPECT_TRUE(is_flagged(r, cfg));
}

#ifndef _WIN32

TEST_F(NormalizeFileTest, PreservesExecutableBit) {
    fs::path p = write_file("tool.sh", "#!/bin/sh\r\necho\r\n");
    fs::permissions(p, fs::perms::owner_exec, fs::perm_options::add);
    auto perms_before = fs::status(p).permissions();
    auto cfg = target(LineEndingTarget::Unix);

    FileRecord r = apply_normalization(inspect_file(p, cfg), cfg);

    EXPECT_EQ(r.rewrite, RewriteStatus::Rewritten);
    EXPECT_EQ(fs::status(p).permissions(), perms_before);
}

TEST_F(NormalizeFileTest, ReadOnlyFile_IsWriteError) {
    // Arrange
    fs::path p = write_file("locked.py", "x\r\ny\n");
    fs::permissions(p, fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read);
    auto cfg = target(LineEndingTarget::Unix);

    // Act
    FileRecord r = apply_normalization(inspect_file(p, cfg), cfg);

    // Assert: файл не тронут, запись помечена
    EXPECT_EQ(read_file(p), "x\r\ny\n");
    EXPECT_EQ(r.rewrite, RewriteStatus::Failed);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(r.error->kind, ErrorKind::Write);
    EXPECT_TRUE(is_flagged(r, cfg));

    fs::permissions(p, fs::perms::owner_write, fs::perm_options::add);
}

#endif

}  // namespace repoguard::check::test
