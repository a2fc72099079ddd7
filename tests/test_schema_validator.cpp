#include <gtest/gtest.h>
#include "ingest/schema_validator.hpp"
#include "telemetry_fixtures.hpp"

#include <stdexcept>

using fdr_test::CORE_HEADER;
using fdr_test::row;
using fdr_test::table;
using fdr_test::ts_line_with;

class SchemaValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        validator = std::make_unique<fdr::SchemaValidator>();
    }

    void TearDown() override {
        validator.reset();
    }

    fdr::ValidatedDataset validate_ok(const std::string& csv) {
        auto result = validator->validate(table(csv));
        EXPECT_TRUE(result.is_ok());
        return result.unwrap();
    }

    std::unique_ptr<fdr::SchemaValidator> validator;
};

TEST_F(SchemaValidatorTest, OneBadTimestampIsRejectedOthersKept) {
    std::string csv = std::string(CORE_HEADER) + ",GNC_Roll_deg\n" +
        row(0, "1.0") + "\n" +
        "yesterday-ish,34.05,-118.25,12000,2.0\n" +
        row(2, "3.0") + "\n" +
        row(3, "4.0") + "\n";

    auto dataset = validate_ok(csv);
    const auto& report = dataset.report;
    EXPECT_EQ(report.total_rows, 4u);
    EXPECT_EQ(report.accepted_rows, 3u);
    EXPECT_EQ(report.rejected_rows, 1u);
    ASSERT_EQ(report.rejections.size(), 1u);
    EXPECT_EQ(report.rejections[0].row, 2u);
    EXPECT_EQ(report.rejections[0].error, fdr::Error::BadTimestamp);

    const auto& store = *dataset.store;
    ASSERT_EQ(store.size(), 3u);
    EXPECT_EQ(store.record_at(0).timestamp, fdr_test::at(0));
    EXPECT_EQ(store.record_at(1).timestamp, fdr_test::at(2));
    EXPECT_EQ(store.record_at(2).timestamp, fdr_test::at(3));
}

TEST_F(SchemaValidatorTest, OutOfOrderInputIsSorted) {
    std::string csv = std::string(CORE_HEADER) + "\n" +
        row(30) + "\n" + row(10) + "\n" + row(20) + "\n" + row(0) + "\n";

    auto dataset = validate_ok(csv);
    const auto& records = dataset.store->records();
    ASSERT_EQ(records.size(), 4u);
    for (size_t i = 1; i < records.size(); ++i) {
        EXPECT_LT(records[i - 1].timestamp, records[i].timestamp);
    }
}

TEST_F(SchemaValidatorTest, DuplicateTimestampFirstOccurrenceWins) {
    std::string csv = std::string(CORE_HEADER) + ",GNC_Roll_deg\n" +
        row(0, "1.0") + "\n" +
        row(5, "2.0") + "\n" +
        row(0, "9.0") + "\n";

    auto dataset = validate_ok(csv);
    EXPECT_EQ(dataset.report.accepted_rows, 2u);
    EXPECT_EQ(dataset.report.rejected_rows, 1u);
    EXPECT_EQ(dataset.report.duplicate_rows, 1u);
    ASSERT_EQ(dataset.report.rejections.size(), 1u);
    EXPECT_EQ(dataset.report.rejections[0].row, 3u);
    EXPECT_EQ(dataset.report.rejections[0].error, fdr::Error::DuplicateTimestamp);

    auto roll = dataset.store->value(0, "GNC_Roll_deg");
    ASSERT_TRUE(roll.is_ok());
    EXPECT_DOUBLE_EQ(roll.unwrap().value(), 1.0);
}

TEST_F(SchemaValidatorTest, RowCountsAlwaysAddUp) {
    std::string csv = std::string(CORE_HEADER) + ",EPS_Bus_V\n" +
        row(0, "28") + "\n" +
        ts_line_with(1, "abc,-118.25,12000,28") +
        ts_line_with(2, "91.0,-118.25,12000,28") +
        ts_line_with(3, "34.05,,12000,28") +
        ts_line_with(4, "34.05,-118.25,-999.0,28") +
        row(5, "28,extra") + "\n" +
        row(0, "27") + "\n";

    auto dataset = validate_ok(csv);
    const auto& report = dataset.report;
    EXPECT_EQ(report.total_rows, 7u);
    EXPECT_EQ(report.accepted_rows, 1u);
    EXPECT_EQ(report.rejected_rows, 6u);
    EXPECT_EQ(report.accepted_rows + report.rejected_rows, report.total_rows);

    ASSERT_EQ(report.rejections.size(), 6u);
    EXPECT_EQ(report.rejections[0].error, fdr::Error::NonNumericRequiredValue);
    EXPECT_EQ(report.rejections[1].error, fdr::Error::OutOfRangeValue);
    EXPECT_EQ(report.rejections[2].error, fdr::Error::MissingRequiredValue);
    EXPECT_EQ(report.rejections[3].error, fdr::Error::MissingRequiredValue);
    EXPECT_EQ(report.rejections[4].error, fdr::Error::TooManyCells);
    EXPECT_EQ(report.rejections[5].error, fdr::Error::DuplicateTimestamp);
}

TEST_F(SchemaValidatorTest, OptionalCellsBecomeRedacted) {
    std::string csv = std::string(CORE_HEADER) + ",EPS_Bus_V,PL_Camera_Temp_C\n" +
        row(0, "28.1,-999.0") + "\n" +
        row(1, ",15.5") + "\n" +
        row(2, "n/a,-999") + "\n" +
        row(3) + "\n";

    auto dataset = validate_ok(csv);
    const auto& report = dataset.report;
    EXPECT_EQ(report.accepted_rows, 4u);
    EXPECT_EQ(report.redacted_cell_count, 6u);
    EXPECT_EQ(report.unparseable_cell_count, 1u);
    EXPECT_EQ(report.redacted_fields, (std::vector<std::string>{"EPS_Bus_V", "PL_Camera_Temp_C"}));

    const auto& store = *dataset.store;
    EXPECT_TRUE(store.value(0, "PL_Camera_Temp_C").unwrap().is_redacted());
    EXPECT_TRUE(store.value(1, "EPS_Bus_V").unwrap().is_redacted());
    EXPECT_TRUE(store.value(2, "EPS_Bus_V").unwrap().is_redacted());
    EXPECT_DOUBLE_EQ(store.value(1, "PL_Camera_Temp_C").unwrap().value(), 15.5);
}

TEST_F(SchemaValidatorTest, MissingRequiredColumnAbortsLoad) {
    auto result = validator->validate(table("Timestamp,POS_Latitude_deg,POS_Altitude_ft\n" +
                                            fdr_test::ts(0) + ",34.0,1000\n"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err().error, fdr::Error::TERM_MissingRequiredField);
    EXPECT_EQ(result.unwrap_err().field, "POS_Longitude_deg");
    EXPECT_STREQ(result.unwrap_err().code(), "missing_required_field");
}

TEST_F(SchemaValidatorTest, DuplicateColumnAbortsLoad) {
    auto result = validator->validate(table(std::string(CORE_HEADER) + ",EPS_Bus_V,EPS_Bus_V\n"));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err().error, fdr::Error::TERM_DuplicateColumn);
    EXPECT_EQ(result.unwrap_err().field, "EPS_Bus_V");
}

TEST_F(SchemaValidatorTest, EmptyHeaderAbortsLoad) {
    auto result = validator->validate(fdr::RawTable{});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err().error, fdr::Error::TERM_EmptyHeader);
}

TEST_F(SchemaValidatorTest, NoSurvivingRowsIsEmptyDatasetNotError) {
    std::string csv = std::string(CORE_HEADER) + "\nbad,1,2,3\n";
    auto dataset = validate_ok(csv);
    EXPECT_TRUE(dataset.report.empty_dataset);
    EXPECT_TRUE(dataset.store->empty());
    EXPECT_TRUE(dataset.store->time_range().is_err());
}

TEST_F(SchemaValidatorTest, RevalidatingAcceptedOutputRejectsNothing) {
    std::string csv = std::string(CORE_HEADER) + ",COMM_LEO_dB,GNC_Roll_deg\n" +
        row(20, "4.5,0.1") + "\n" +
        row(0, "-999.0,") + "\n" +
        row(10, "x,0.3") + "\n" +
        row(10, "1.0,0.4") + "\n" +
        "garbage,1,2,3,4,5\n";

    auto first = validate_ok(csv);
    ASSERT_GT(first.report.rejected_rows, 0u);

    auto second = validator->validate(first.store->to_table());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.unwrap().report.rejected_rows, 0u);
    EXPECT_EQ(second.unwrap().report.accepted_rows, first.report.accepted_rows);
    EXPECT_EQ(second.unwrap().store->records().size(), first.store->records().size());
    for (size_t i = 0; i < first.store->size(); ++i) {
        EXPECT_EQ(second.unwrap().store->record_at(i).timestamp, first.store->record_at(i).timestamp);
        EXPECT_EQ(second.unwrap().store->record_at(i).subsystem_fields, first.store->record_at(i).subsystem_fields);
    }
}

TEST_F(SchemaValidatorTest, ReportsDetectedGroups) {
    std::string csv = std::string(CORE_HEADER) + ",GNC_Roll_deg,PL_Camera_dB,COMM_LEO_dB,COMM_GEO_dB\n" +
        row(0, "0,1,2,3") + "\n";

    auto dataset = validate_ok(csv);
    EXPECT_EQ(dataset.report.detected_subsystems, (std::vector<std::string>{"GNC"}));
    EXPECT_EQ(dataset.report.detected_payloads, (std::vector<std::string>{"PL"}));
    EXPECT_EQ(dataset.report.detected_links, (std::vector<std::string>{"COMM_GEO", "COMM_LEO"}));
}

TEST_F(SchemaValidatorTest, RejectionDetailIsCappedCountsAreNot) {
    fdr::ValidatorConfig config;
    config.max_recorded_rejections = 2;
    fdr::SchemaValidator capped(config);

    std::string csv = std::string(CORE_HEADER) + "\nx,1,1,1\ny,1,1,1\nz,1,1,1\n" + row(0) + "\n";
    auto result = capped.validate(table(csv));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.unwrap().report.rejected_rows, 3u);
    EXPECT_EQ(result.unwrap().report.rejections.size(), 2u);
}

TEST_F(SchemaValidatorTest, InvertedBoundsThrow) {
    fdr::ValidatorConfig config;
    config.min_latitude_deg = 10.0;
    config.max_latitude_deg = -10.0;
    EXPECT_THROW(fdr::SchemaValidator{config}, std::invalid_argument);
}
