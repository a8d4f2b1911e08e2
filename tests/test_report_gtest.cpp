// ==============================================================================
// test_report_gtest.cpp - Тесты HTML-отчёта (GoogleTest)
// ==============================================================================

#include "logveil/report.hpp"

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

namespace logveil::report::test {

namespace fs = std::filesystem;

TEST(ReportTest, HtmlEscape) {
    EXPECT_EQ(html_escape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&#39;");
    EXPECT_EQ(html_escape("plain"), "plain");
}

TEST(ReportTest, Render_SideBySideRows) {
    // Arrange
    std::vector<DiffSection> sections{
        {"app.log",
         {{7, "User john.doe@company.com from 192.168.1.100",
           "User [REDACTED_EMAIL] from [REDACTED_IP]"}}},
    };

    // Act
    std::string html = render_html(sections);

    // Assert
    EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
    EXPECT_NE(html.find("<h2>app.log</h2>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"line\">7</td>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"before\">User john.doe@company.com from 192.168.1.100</td>"),
              std::string::npos);
    EXPECT_NE(html.find("<td class=\"after\">User [REDACTED_EMAIL] from [REDACTED_IP]</td>"),
              std::string::npos);
    EXPECT_NE(html.find("</html>\n"), std::string::npos);
}

TEST(ReportTest, Render_EscapesLogText) {
    std::vector<DiffSection> sections{
        {"<x>.log", {{std::nullopt, "<script>a@b.io</script>", "<script>[REDACTED_EMAIL]</script>"}}},
    };

    std::string html = render_html(sections);

    EXPECT_EQ(html.find("<script>"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;[REDACTED_EMAIL]&lt;/script&gt;"), std::string::npos);
    EXPECT_NE(html.find("<h2>&lt;x&gt;.log</h2>"), std::string::npos);
    EXPECT_NE(html.find("<td class=\"line\"></td>"), std::string::npos);
}

TEST(ReportTest, Render_EmptySectionsSkipped) {
    std::vector<DiffSection> sections{{"clean.log", {}}};

    std::string html = render_html(sections);

    EXPECT_EQ(html.find("clean.log"), std::string::npos);
    EXPECT_NE(html.find("No lines were changed."), std::string::npos);
}

TEST(ReportTest, WriteHtml) {
    fs::path path = fs::temp_directory_path() /
                    ("logveil_report_" +
                     std::to_string(
#ifdef _WIN32
                         GetCurrentProcessId()
#else
                         getpid()
#endif
                             ) +
                     ".html");
    std::vector<DiffSection> sections{{"a.log", {{1, "a@b.io", "[REDACTED_EMAIL]"}}}};
    std::string error;

    ASSERT_TRUE(write_html(path, sections, &error)) << error;

    std::ifstream in(path, std::ios::binary);
    std::stringstream body;
    body << in.rdbuf();
    EXPECT_EQ(body.str(), render_html(sections));
    in.close();
    std::error_code ec;
    fs::remove(path, ec);
}

TEST(ReportTest, WriteHtml_MissingDirectoryFails) {
    std::string error;

    EXPECT_FALSE(write_html(fs::temp_directory_path() / "logveil_missing_dir" / "r.html", {},
                            &error));
    EXPECT_NE(error.find("failed to open report file"), std::string::npos);
}

}  // namespace logveil::report::test
