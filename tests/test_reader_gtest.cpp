// ==============================================================================
// test_reader_gtest.cpp - Тесты Reader Framework (GoogleTest)
// ==============================================================================

#include "logveil/reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace logveil::io::test {

namespace fs = std::filesystem;

// ============================================================================
// Test Fixtures
// ============================================================================

/// Временная директория на тест
class ReaderTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        // Имя теста + PID для параллельного запуска
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("logveil_reader_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;

        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path create_temp_file(const std::string& name, const std::string& content) {
        fs::path file_path = temp_dir_ / name;
        std::ofstream file(file_path, std::ios::binary);
        file << content;
        file.close();
        return file_path;
    }

    std::vector<Record> read_all(const fs::path& path, DocumentKind kind) {
        std::vector<Record> records;
        auto result = Reader::open(path, kind);
        EXPECT_TRUE(result.ok) << result.error.format();
        if (!result.ok) {
            return records;
        }
        Record rec;
        while (result.reader->next(rec)) {
            records.push_back(rec);
        }
        EXPECT_EQ(result.reader->last_error(), nullptr);
        return records;
    }

    fs::path temp_dir_;
};

// ============================================================================
// DocumentKind
// ============================================================================

TEST(DocumentKindTest, ParseAndName) {
    EXPECT_EQ(parse_document_kind("text"), DocumentKind::Text);
    EXPECT_EQ(parse_document_kind("plaintext"), DocumentKind::Text);
    EXPECT_EQ(parse_document_kind("jsonl"), DocumentKind::Jsonl);
    EXPECT_STREQ(document_kind_to_string(DocumentKind::Yaml), "yaml");
    EXPECT_THROW(parse_document_kind("xml"), std::invalid_argument);
}

TEST(DocumentKindTest, FromExtension) {
    EXPECT_EQ(document_kind_from_extension("json"), DocumentKind::Json);
    EXPECT_EQ(document_kind_from_extension("ndjson"), DocumentKind::Jsonl);
    EXPECT_EQ(document_kind_from_extension("yml"), DocumentKind::Yaml);
    EXPECT_EQ(document_kind_from_extension("log"), DocumentKind::Text);
    EXPECT_FALSE(document_kind_from_extension("gz").has_value());
}

TEST(DocumentKindTest, FromPath_UsesProfileHint) {
    using profile::FormatHint;

    EXPECT_EQ(document_kind_from_path("a/events.json"), DocumentKind::Json);
    EXPECT_EQ(document_kind_from_path("app.log"), DocumentKind::Text);
    // .log у JSON-профиля читается как JSON Lines
    EXPECT_EQ(document_kind_from_path("container-1.log", FormatHint::Json), DocumentKind::Jsonl);
    // явное структурное расширение важнее подсказки
    EXPECT_EQ(document_kind_from_path("config.yaml", FormatHint::Json), DocumentKind::Yaml);
    EXPECT_EQ(document_kind_from_path("noext", FormatHint::Yaml), DocumentKind::Yaml);
    EXPECT_EQ(document_kind_from_path("noext"), DocumentKind::Text);
}

// ============================================================================
// split_lines
// ============================================================================

TEST(SplitLinesTest, KeepsEndings) {
    auto lines = split_lines("a\r\nb\nc");

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "a");
    EXPECT_EQ(lines[0].ending, "\r\n");
    EXPECT_EQ(lines[1].ending, "\n");
    EXPECT_EQ(lines[2].text, "c");
    EXPECT_TRUE(lines[2].ending.empty());
}

TEST(SplitLinesTest, NoTrailingEmptyLine) {
    auto lines = split_lines("x\n");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "x");
    EXPECT_TRUE(split_lines("").empty());
}

// ============================================================================
// Reader::open
// ============================================================================

TEST_F(ReaderTestFixture, Text_LinesWithNumbersAndEndings) {
    auto path = create_temp_file("app.log", "first\r\nsecond\nthird");

    auto records = read_all(path, DocumentKind::Text);

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].text, "first");
    EXPECT_EQ(records[0].ending, "\r\n");
    EXPECT_EQ(*records[0].line, 1u);
    EXPECT_EQ(records[1].ending, "\n");
    EXPECT_EQ(records[2].text, "third");
    EXPECT_EQ(records[2].ending, "");
    EXPECT_EQ(*records[2].line, 3u);
}

TEST_F(ReaderTestFixture, Text_TrailingNewlinePreserved) {
    auto path = create_temp_file("app.log", "only\n");

    auto records = read_all(path, DocumentKind::Text);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].ending, "\n");
}

TEST_F(ReaderTestFixture, Text_EmptyFile) {
    auto path = create_temp_file("empty.log", "");

    EXPECT_TRUE(read_all(path, DocumentKind::Text).empty());
}

TEST_F(ReaderTestFixture, Jsonl_ReadLineByLine) {
    auto path = create_temp_file("events.jsonl", "{\"a\":1}\n{\"a\":2}\n");

    auto result = Reader::open(path, DocumentKind::Jsonl);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.reader->kind(), DocumentKind::Jsonl);

    Record rec;
    std::size_t count = 0;
    while (result.reader->next(rec)) {
        ++count;
    }
    EXPECT_EQ(count, 2u);
}

TEST_F(ReaderTestFixture, Json_WholeDocumentSingleRecord) {
    std::string content = "{\n  \"user\": \"alice\"\n}\n";
    auto path = create_temp_file("doc.json", content);

    auto records = read_all(path, DocumentKind::Json);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].text, content);
    EXPECT_FALSE(records[0].line.has_value());
    EXPECT_TRUE(records[0].ending.empty());
}

TEST_F(ReaderTestFixture, Yaml_WholeDocumentSingleRecord) {
    auto path = create_temp_file("conf.yml", "db:\n  password: x\n");

    auto records = read_all(path, DocumentKind::Yaml);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].text, "db:\n  password: x\n");
}

TEST_F(ReaderTestFixture, Open_MissingFile) {
    auto result = Reader::open(temp_dir_ / "missing.log", DocumentKind::Text);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ReaderErrorKind::FileNotFound);
    EXPECT_NE(result.error.format().find("failed to read file '"), std::string::npos);
    EXPECT_NE(result.error.format().find("missing.log"), std::string::npos);
}

TEST_F(ReaderTestFixture, Open_Directory) {
    auto result = Reader::open(temp_dir_, DocumentKind::Text);

    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "is a directory");
}

TEST_F(ReaderTestFixture, ReadFile) {
    auto path = create_temp_file("raw.bin", std::string("a\0b\n", 4));

    EXPECT_EQ(read_file(path), std::string("a\0b\n", 4));
    EXPECT_THROW(read_file(temp_dir_ / "nope"), std::runtime_error);
}

// ============================================================================
// Reader::from_stream
// ============================================================================

TEST(ReaderStreamTest, FromStream) {
    std::istringstream in("one\ntwo\r\n");

    auto reader = Reader::from_stream(in, "<stdin>");
    Record rec;

    ASSERT_TRUE(reader->next(rec));
    EXPECT_EQ(rec.text, "one");
    EXPECT_EQ(*rec.line, 1u);
    ASSERT_TRUE(reader->next(rec));
    EXPECT_EQ(rec.text, "two");
    EXPECT_EQ(rec.ending, "\r\n");
    EXPECT_FALSE(reader->next(rec));
    EXPECT_EQ(reader->last_error(), nullptr);
    EXPECT_EQ(reader->kind(), DocumentKind::Text);
}

}  // namespace logveil::io::test
