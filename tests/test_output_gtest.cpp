// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Захват stdout/stderr через testing::internal::CaptureStdout/CaptureStderr.
// Под ctest потоки не терминал, поэтому вывод без ANSI-кодов.
//
// ==============================================================================

#include "logveil/output.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

namespace logveil::output::test {

namespace {

std::string capture_stderr(const OutputConfig& config, void (*emit)(Writer&)) {
    Writer writer(config);
    testing::internal::CaptureStderr();
    emit(writer);
    writer.flush();
    return testing::internal::GetCapturedStderr();
}

void emit_all_levels(Writer& w) {
    w.info("info");
    w.warn("warn");
    w.error("error");
    w.debug("debug");
    w.trace("trace");
}

}  // namespace

// ============================================================================
// Writer
// ============================================================================

TEST(OutputTest, Writer_DefaultLevels) {
    if (supports_color(Stream::Stderr)) {
        GTEST_SKIP() << "stderr is a terminal";
    }

    std::string out = capture_stderr(OutputConfig{}, emit_all_levels);

    EXPECT_EQ(out, "[+] info\n[!] warn\n[x] error\n");
}

TEST(OutputTest, Writer_QuietKeepsErrors) {
    if (supports_color(Stream::Stderr)) {
        GTEST_SKIP() << "stderr is a terminal";
    }
    OutputConfig config;
    config.quiet = true;

    std::string out = capture_stderr(config, emit_all_levels);

    EXPECT_EQ(out, "[x] error\n");
}

TEST(OutputTest, Writer_VerbosityLevels) {
    if (supports_color(Stream::Stderr)) {
        GTEST_SKIP() << "stderr is a terminal";
    }
    OutputConfig v1;
    v1.verbose = 1;
    OutputConfig v2;
    v2.verbose = 2;

    std::string out1 = capture_stderr(v1, emit_all_levels);
    std::string out2 = capture_stderr(v2, emit_all_levels);

    EXPECT_NE(out1.find("[*] debug\n"), std::string::npos);
    EXPECT_EQ(out1.find("[~] trace"), std::string::npos);
    EXPECT_NE(out2.find("[~] trace\n"), std::string::npos);
}

TEST(OutputTest, Writer_PreviewPairToStdout) {
    if (supports_color(Stream::Stdout)) {
        GTEST_SKIP() << "stdout is a terminal";
    }
    Writer writer(OutputConfig{});

    testing::internal::CaptureStdout();
    writer.preview_pair("mail a@b.io", "mail [REDACTED_EMAIL]");
    writer.flush();
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "- mail a@b.io\n+ mail [REDACTED_EMAIL]\n");
}

TEST(OutputTest, Writer_WriteIsByteExact) {
    Writer writer(OutputConfig{});

    testing::internal::CaptureStdout();
    writer.write(Stream::Stdout, std::string("a\r\nb\0c", 6));
    writer.flush();
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, std::string("a\r\nb\0c", 6));
}

// ============================================================================
// Table
// ============================================================================

TEST(OutputTest, Table_BoxDrawing) {
    Table table;
    table.set_headers({"Rule", "Redactions"});
    table.add_row({"email", "12"});
    table.add_row({"ip_address", "3"});

    std::string expected =
        "\xe2\x94\x8c"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\xac"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80"
        "\xe2\x94\x90\n";
    std::string text = table.to_string();

    EXPECT_EQ(table.row_count(), 2u);
    EXPECT_EQ(text.substr(0, expected.size()), expected);
    EXPECT_NE(text.find("\xe2\x94\x82 Rule       \xe2\x94\x82 Redactions \xe2\x94\x82\n"),
              std::string::npos);
    EXPECT_NE(text.find("\xe2\x94\x82 email      \xe2\x94\x82 12         \xe2\x94\x82\n"),
              std::string::npos);
    // 2 строки + заголовок + 3 линии
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 6);
}

TEST(OutputTest, Table_WithoutHeaders) {
    Table table;
    table.add_row({"a"});

    std::string text = table.to_string();

    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 3);
}

TEST(OutputTest, Table_AlignsUtf8ByCharacters) {
    Table table;
    table.set_headers({"Name"});
    table.add_row({"\xd0\xbf\xd1\x80\xd0\xbe\xd1\x84"});  // "проф"

    std::string text = table.to_string();

    EXPECT_NE(text.find("\xe2\x94\x82 \xd0\xbf\xd1\x80\xd0\xbe\xd1\x84 \xe2\x94\x82"),
              std::string::npos);
}

// ============================================================================
// Вспомогательные функции
// ============================================================================

TEST(OutputTest, DisplayWidth_CountsCodePoints) {
    EXPECT_EQ(display_width(""), 0u);
    EXPECT_EQ(display_width("abc"), 3u);
    EXPECT_EQ(display_width("\xd0\xbf\xd0\xb0"), 2u);
    EXPECT_EQ(display_width("\xe2\x94\x82"), 1u);
}

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
    EXPECT_EQ(ansi_reset_code(), "\x1b[0m");
}

}  // namespace logveil::output::test
