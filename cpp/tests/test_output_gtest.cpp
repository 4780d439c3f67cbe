// ==============================================================================
// test_output_gtest.cpp - Тесты слоя вывода (GoogleTest)
// ==============================================================================
//
// output::Writer: префиксы, quiet/verbose, цвета, вывод отчёта
//
// ==============================================================================

#include "repoguard/output.hpp"
#include "repoguard/report.hpp"

#include <gtest/gtest.h>
#include <string>

namespace repoguard::output::test {

using ::testing::internal::CaptureStderr;
using ::testing::internal::CaptureStdout;
using ::testing::internal::GetCapturedStderr;
using ::testing::internal::GetCapturedStdout;

namespace {

OutputConfig plain(bool quiet = false, int verbose = 0) {
    OutputConfig cfg;
    cfg.quiet = quiet;
    cfg.verbose = verbose;
    cfg.color = false;
    return cfg;
}

}  // namespace

// ==============================================================================
// Префиксы сообщений
// ==============================================================================

TEST(OutputTest, Prefixes) {
    Writer writer(plain(false, 2));

    CaptureStderr();
    writer.info("info");
    writer.warn("warn");
    writer.error("error");
    writer.debug("debug");
    writer.trace("trace");
    writer.flush();
    std::string err = GetCapturedStderr();

    EXPECT_EQ(err, "[+] info\n[!] warn\n[x] error\n[*] debug\n[~] trace\n");
}

// ==============================================================================
// quiet / verbose
// ==============================================================================

TEST(OutputTest, QuietMode_OnlyErrors) {
    Writer writer(plain(true));

    CaptureStderr();
    writer.info("info");
    writer.warn("warn");
    writer.error("error");
    writer.flush();
    std::string err = GetCapturedStderr();

    EXPECT_EQ(err, "[x] error\n");
}

TEST(OutputTest, Verbose0_DebugAndTraceSuppressed) {
    Writer writer(plain());

    CaptureStderr();
    writer.debug("debug");
    writer.trace("trace");
    writer.flush();

    EXPECT_TRUE(GetCapturedStderr().empty());
}

TEST(OutputTest, Verbose1_TraceSuppressed) {
    Writer writer(plain(false, 1));

    CaptureStderr();
    writer.debug("debug");
    writer.trace("trace");
    writer.flush();

    EXPECT_EQ(GetCapturedStderr(), "[*] debug\n");
}

// ==============================================================================
// Базовый вывод
// ==============================================================================

TEST(OutputTest, WriteAndColoredLine_WithoutColor) {
    Writer writer(plain());

    CaptureStdout();
    writer.write(Stream::Stdout, "a");
    writer.write_line(Stream::Stdout, "b");
    writer.colored_line(Stream::Stdout, "summary", Color::Green);
    writer.flush();

    EXPECT_EQ(GetCapturedStdout(), "ab\nsummary\n");
}

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Green), "\x1b[32m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
    EXPECT_EQ(ansi_reset_code(), "\x1b[0m");
}

// ==============================================================================
// Вывод отчёта через Writer
// ==============================================================================

TEST(OutputTest, PrintReport_Text) {
    // Arrange
    config::ScanConfig cfg = config::default_config();
    report::ScanReport scan;
    check::FileRecord r;
    r.path = "a.py";
    r.line_ending = check::LineEndingKind::Mixed;
    scan.add(r);
    scan.finalize(cfg);
    Writer writer(plain());

    // Act
    CaptureStdout();
    report::print(scan, cfg, writer, false);
    std::string out = GetCapturedStdout();

    // Assert
    EXPECT_EQ(out,
              "File: \"a.py\" - mixed line endings\n"
              "Scanned: 1, flagged: 1, rewritten: 0, unreadable: 0\n");
}

TEST(OutputTest, PrintReport_Json) {
    config::ScanConfig cfg = config::default_config();
    report::ScanReport scan;
    scan.finalize(cfg);
    Writer writer(plain());

    CaptureStdout();
    report::print(scan, cfg, writer, true);
    std::string out = GetCapturedStdout();

    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), '{');
    EXPECT_EQ(out.back(), '\n');
    EXPECT_NE(out.find("\"clean\": true"), std::string::npos);
}

}  // namespace repoguard::output::test
