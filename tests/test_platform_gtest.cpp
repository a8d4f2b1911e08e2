// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "logveil/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace logveil::platform::test {

namespace fs = std::filesystem;

// ==============================================================================
// Идентификация платформы
// ==============================================================================

TEST(PlatformTest, OsName_ReturnsKnownValue) {
    // Arrange & Act
    std::string name = os_name();

    // Assert
    EXPECT_FALSE(name.empty());
    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS" || name == "Unknown");
}

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathToUtf8_BasicPath) {
    fs::path p = "logs/app/access.log";

    std::string utf8 = path_to_utf8(p);

    EXPECT_NE(utf8.find("logs"), std::string::npos);
    EXPECT_NE(utf8.find("access.log"), std::string::npos);
}

TEST(PlatformTest, PathRoundtrip_Cyrillic) {
    // "журнал.log" в UTF-8
    std::string original = "\xd0\xb6\xd1\x83\xd1\x80\xd0\xbd\xd0\xb0\xd0\xbb.log";

    fs::path p = path_from_utf8(original);

    EXPECT_EQ(path_to_utf8(p), original);
}

TEST(PlatformTest, PathFromUtf8_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
}

// ==============================================================================
// Временный файл рядом с целью
// ==============================================================================

class SiblingTempTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("logveil_platform_") + info->name() + "_" +
                std::to_string(
#ifdef _WIN32
                    GetCurrentProcessId()
#else
                    getpid()
#endif
                        ));
        std::error_code ec;
        fs::remove_all(dir_, ec);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(SiblingTempTest, CreatesFileInTargetDirectory) {
    // Arrange
    fs::path target = dir_ / "out.log";

    // Act
    fs::path temp = make_sibling_temp_file(target);

    // Assert
    EXPECT_TRUE(fs::exists(temp));
    EXPECT_EQ(temp.parent_path(), target.parent_path());
    EXPECT_NE(temp, target);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(SiblingTempTest, TwoCallsGiveDistinctFiles) {
    fs::path target = dir_ / "out.log";

    fs::path a = make_sibling_temp_file(target);
    fs::path b = make_sibling_temp_file(target);

    EXPECT_NE(a, b);
}

TEST_F(SiblingTempTest, MissingDirectory_Throws) {
    fs::path target = dir_ / "missing" / "out.log";

    EXPECT_THROW(make_sibling_temp_file(target), std::runtime_error);
}

// ==============================================================================
// Запрос перезагрузки
// ==============================================================================

TEST(PlatformTest, ReloadRequest_IsConsumedOnce) {
    // Сбросить возможный флаг от предыдущих тестов
    take_reload_request();

    request_reload();

    EXPECT_TRUE(take_reload_request());
    EXPECT_FALSE(take_reload_request());
}

TEST(PlatformTest, InterruptNotRequestedByDefault) {
    install_interrupt_signal();
    EXPECT_FALSE(interrupt_requested());
}

}  // namespace logveil::platform::test
