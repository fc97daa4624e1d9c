// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Журнал с префиксами, файл вывода, JSON через RapidJSON, таблицы,
// прогресс-индикатор, форматирование полей.
//
// ==============================================================================

#include "evidex/output.hpp"
#include "evidex/platform.hpp"

#include "test_fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace evidex::output::test {

namespace {

std::string read_all(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

class OutputFileTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_output_test_"; }
};

// ==============================================================================
// TST-OUTPUT-001: уровни журнала
// ==============================================================================

TEST(OutputTest, Writer_QuietMode_LoggingDoesNotThrow) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    EXPECT_NO_THROW({
        writer.info("suppressed");
        writer.warn("suppressed");
        writer.error("always printed");
    });
}

TEST(OutputTest, Writer_Verbose2_TraceDoesNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    EXPECT_NO_THROW({
        writer.debug("debug line");
        writer.trace("trace line");
    });
}

// ==============================================================================
// TST-OUTPUT-002: файл вывода (--output)
// ==============================================================================

TEST(OutputTest, Writer_HasOutputFile_FalseByDefault) {
    OutputConfig config;
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

TEST_F(OutputFileTest, Writer_OutputFile_ReceivesStdout) {
    // Arrange
    std::filesystem::path out = test_dir_ / "results.json";
    OutputConfig config;
    config.output_path = out;

    // Act
    {
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_line(Stream::Stdout, "evidence line");
        writer.write_line(Stream::Stdout, "done");
    }

    // Assert: без ANSI-кодов
    std::string content = read_all(out);
    EXPECT_EQ(content, "evidence line\ndone\n");
}

TEST_F(OutputFileTest, Writer_OutputFile_UnwritablePath) {
    OutputConfig config;
    config.output_path = test_dir_ / "missing_dir" / "out.txt";

    Writer writer(config);

    EXPECT_FALSE(writer.has_output_file());
}

TEST_F(OutputFileTest, WriteJsonPretty_ToFile) {
    // Arrange
    std::filesystem::path out = test_dir_ / "doc.json";
    OutputConfig config;
    config.output_path = out;

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("case_id", 1, doc.GetAllocator());
    doc.AddMember("name", "Operation Nightfall", doc.GetAllocator());

    // Act
    {
        Writer writer(config);
        writer.write_json_pretty(doc);
    }

    // Assert
    rapidjson::Document parsed;
    parsed.Parse(read_all(out).c_str());
    ASSERT_FALSE(parsed.HasParseError());
    EXPECT_EQ(parsed["case_id"].GetInt(), 1);
    EXPECT_STREQ(parsed["name"].GetString(), "Operation Nightfall");
}

TEST_F(OutputFileTest, Writer_ConcurrentWrites_LinesNotInterleaved) {
    // Arrange
    std::filesystem::path out = test_dir_ / "threads.txt";
    OutputConfig config;
    config.output_path = out;
    constexpr int kThreads = 4;
    constexpr int kLines = 200;

    // Act
    {
        Writer writer(config);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&writer, t]() {
                for (int i = 0; i < kLines; ++i) {
                    writer.write_line(Stream::Stdout, "worker-" + std::to_string(t));
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    // Assert
    std::istringstream in(read_all(out));
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        EXPECT_EQ(line.rfind("worker-", 0), 0u) << line;
        EXPECT_EQ(line.size(), 8u) << line;
        ++count;
    }
    EXPECT_EQ(count, kThreads * kLines);
}

// ==============================================================================
// TST-OUTPUT-003: Table
// ==============================================================================

TEST(OutputTest, Table_ToString_ContainsUnicode) {
    Table table;
    table.set_headers({"ID", "Name"});
    table.add_row({"1", "IMG_0001.jpg"});

    std::string result = table.to_string();

    // ┌ │ └
    EXPECT_NE(result.find("\xe2\x94\x8c"), std::string::npos);
    EXPECT_NE(result.find("\xe2\x94\x82"), std::string::npos);
    EXPECT_NE(result.find("\xe2\x94\x94"), std::string::npos);
    EXPECT_NE(result.find("IMG_0001.jpg"), std::string::npos);
}

TEST(OutputTest, Table_ColumnsPaddedToWidest) {
    Table table;
    table.set_headers({"A"});
    table.add_row({"long value"});
    table.add_row({"x"});

    std::string result = table.to_string();

    EXPECT_NE(result.find(" x          "), std::string::npos);
    EXPECT_EQ(table.row_count(), 2u);
}

TEST(OutputTest, Table_ToString_Deterministic) {
    Table t1;
    t1.set_headers({"A", "B"});
    t1.add_row({"1", "2"});

    Table t2;
    t2.set_headers({"A", "B"});
    t2.add_row({"1", "2"});

    EXPECT_EQ(t1.to_string(), t2.to_string());
}

// ==============================================================================
// TST-OUTPUT-004: прогресс
// ==============================================================================

TEST(OutputTest, Progress_TracksCurrent) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);

    writer.progress_begin("Indexing", 10);
    EXPECT_TRUE(writer.progress_active());
    writer.progress_update(4, 10, "Indexing: a.jpg");
    EXPECT_EQ(writer.progress_current(), 4u);

    writer.progress_end();
    EXPECT_FALSE(writer.progress_active());
}

TEST(OutputTest, Progress_UnknownTotal) {
    OutputConfig config;
    Writer writer(config);

    writer.progress_begin("Indexing", 0);
    EXPECT_NO_THROW(writer.progress_update(17, 0, "Indexing: backup/data.db"));
    EXPECT_EQ(writer.progress_current(), 17u);
    writer.progress_end();
}

TEST(OutputTest, Progress_UpdateWithoutBeginIgnored) {
    OutputConfig config;
    Writer writer(config);

    writer.progress_update(5, 10, "ignored");

    EXPECT_EQ(writer.progress_current(), 0u);
    EXPECT_FALSE(writer.progress_active());
}

// ==============================================================================
// TST-OUTPUT-005: format_field / format_size
// ==============================================================================

TEST(OutputTest, FormatField_CollapsesWhitespace) {
    EXPECT_EQ(format_field("line1\r\nline2\tcol  end", 0, true), "line1 line2 col end");
}

TEST(OutputTest, FormatField_TruncatesWithEllipsis) {
    std::string input(100, 'x');

    std::string result = format_field(input, 20, false);

    EXPECT_EQ(result.size(), 20u);
    EXPECT_EQ(result.substr(17), "...");
}

TEST(OutputTest, FormatField_FullOutputKeepsLength) {
    std::string input(100, 'y');
    EXPECT_EQ(format_field(input, 20, true).size(), 100u);
}

TEST(OutputTest, FormatSize_Units) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.5 KB");
    EXPECT_EQ(format_size(5ull * 1024 * 1024), "5.0 MB");
}

TEST(OutputTest, AnsiColorCode_DefaultEmpty) {
    EXPECT_TRUE(ansi_color_code(Color::Default).empty());
    EXPECT_FALSE(ansi_color_code(Color::Red).empty());
    EXPECT_EQ(ansi_reset_code(), "\x1b[0m");
}

}  // namespace evidex::output::test
