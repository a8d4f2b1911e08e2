// ==============================================================================
// test_discovery_gtest.cpp - Тесты File Discovery (GoogleTest)
// ==============================================================================

#include "logveil/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace logveil::io::test {

namespace fs = std::filesystem;

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("logveil_discovery_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        root_ = fs::temp_directory_path() / unique_name;

        std::error_code ec;
        fs::remove_all(root_, ec);
        fs::create_directories(root_ / "nested" / "deep");

        touch("b.log");
        touch("a.log");
        touch("notes.txt");
        touch("nested/c.jsonl");
        touch("nested/deep/d.log");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void touch(const std::string& rel) {
        std::ofstream(root_ / rel) << "line\n";
    }

    fs::path root_;
};

TEST_F(DiscoveryTest, RecursiveAndSorted) {
    // Arrange
    DiscoveryOptions opt;

    // Act
    auto files = discover_files({root_}, opt);

    // Assert
    ASSERT_EQ(files.size(), 5u);
    EXPECT_EQ(files[0], root_ / "a.log");
    EXPECT_EQ(files[1], root_ / "b.log");
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(DiscoveryTest, ExtensionFilter) {
    DiscoveryOptions opt;
    opt.extensions = std::unordered_set<std::string>{"log"};

    auto files = discover_files({root_}, opt);

    ASSERT_EQ(files.size(), 3u);
    for (const auto& f : files) {
        EXPECT_EQ(f.extension(), ".log");
    }
}

TEST_F(DiscoveryTest, ExplicitFileAndDuplicates) {
    DiscoveryOptions opt;

    auto files = discover_files({root_ / "a.log", root_ / "a.log", root_ / "nested"}, opt);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], root_ / "a.log");
}

TEST_F(DiscoveryTest, MissingPath_Throws) {
    DiscoveryOptions opt;

    EXPECT_THROW(discover_files({root_ / "missing"}, opt), std::runtime_error);
}

TEST_F(DiscoveryTest, MissingPath_SkipErrorsWarns) {
    std::vector<std::string> warnings;
    DiscoveryOptions opt;
    opt.skip_errors = true;
    opt.on_warning = [&](const std::string& msg) { warnings.push_back(msg); };

    auto files = discover_files({root_ / "missing", root_ / "a.log"}, opt);

    ASSERT_EQ(files.size(), 1u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("specified path does not exist"), std::string::npos);
}

TEST_F(DiscoveryTest, EmptyDirectory_NoError) {
    fs::create_directories(root_ / "empty");
    DiscoveryOptions opt;

    EXPECT_TRUE(discover_files({root_ / "empty"}, opt).empty());
}

TEST(DiscoveryHelpersTest, NormalizeExtension) {
    EXPECT_EQ(normalize_extension(".log"), "log");
    EXPECT_EQ(normalize_extension("json"), "json");
    EXPECT_EQ(normalize_extension(""), "");
}

}  // namespace logveil::io::test
