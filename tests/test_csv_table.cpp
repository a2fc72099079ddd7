#include <gtest/gtest.h>
#include "ingest/csv_table.hpp"

#include <cstdio>
#include <fstream>
#include <string>

class CsvTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_path = ::testing::TempDir() + "fdr_csv_table_test.csv";
    }

    void TearDown() override {
        std::remove(tmp_path.c_str());
    }

    std::string tmp_path;
};

TEST_F(CsvTableTest, ParsesHeaderAndRows) {
    auto result = fdr::parse_csv("a,b,c\n1,2,3\n4,5,6\n");
    ASSERT_TRUE(result.is_ok());
    const auto& table = result.unwrap();
    ASSERT_EQ(table.header.size(), 3u);
    EXPECT_EQ(table.header[1], "b");
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1][2], "6");
}

TEST_F(CsvTableTest, QuotedCellsKeepCommasNewlinesAndQuotes) {
    auto result = fdr::parse_csv("name,note\n\"x,y\",\"line1\nline2\"\n\"say \"\"hi\"\"\",z\n");
    ASSERT_TRUE(result.is_ok());
    const auto& rows = result.unwrap().rows;
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "x,y");
    EXPECT_EQ(rows[0][1], "line1\nline2");
    EXPECT_EQ(rows[1][0], "say \"hi\"");
}

TEST_F(CsvTableTest, HandlesCrlfBomAndBlankLines) {
    auto result = fdr::parse_csv("\xEF\xBB\xBF" "a, b \r\n1,2\r\n\r\n3,4");
    ASSERT_TRUE(result.is_ok());
    const auto& table = result.unwrap();
    EXPECT_EQ(table.header[0], "a");
    EXPECT_EQ(table.header[1], "b");
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1][1], "4");
}

TEST_F(CsvTableTest, RaggedRowsArePreserved) {
    auto result = fdr::parse_csv("a,b,c\n1\n1,2,3,4\n");
    ASSERT_TRUE(result.is_ok());
    const auto& rows = result.unwrap().rows;
    EXPECT_EQ(rows[0].size(), 1u);
    EXPECT_EQ(rows[1].size(), 4u);
}

TEST_F(CsvTableTest, EmptyInputHasNoHeader) {
    auto result = fdr::parse_csv("\n\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err().error, fdr::Error::TERM_EmptyHeader);
    EXPECT_TRUE(fdr::is_fatal(result.unwrap_err().error));
}

TEST_F(CsvTableTest, WriteThenReadFile) {
    fdr::RawTable table;
    table.header = {"Timestamp", "note"};
    table.rows = {{"2025-09-19T09:00:00Z", "a,\"b\""}};
    {
        std::ofstream out(tmp_path, std::ios::binary);
        out << fdr::write_csv(table);
    }

    auto result = fdr::read_csv_file(tmp_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.unwrap().header, table.header);
    EXPECT_EQ(result.unwrap().rows, table.rows);
}

TEST_F(CsvTableTest, MissingFileIsIoError) {
    auto result = fdr::read_csv_file(tmp_path + ".does_not_exist");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err().error, fdr::Error::TERM_IOError);
    EXPECT_STREQ(result.unwrap_err().code(), "io_error");
}
