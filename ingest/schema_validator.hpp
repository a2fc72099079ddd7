#pragma once

#include "fdr.hpp"
#include "fdr_config.hpp"
#include "ingest/csv_table.hpp"
#include "store/time_series_store.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace fdr {

// Row-level problem. The row is dropped, the load goes on.
struct RowRejection {
    size_t row = 0;                 // 1-based data row, header excluded
    Error error = Error::Unknown;
    std::string detail;
};

struct ValidationReport {
    size_t total_rows = 0;
    size_t accepted_rows = 0;
    size_t rejected_rows = 0;       // includes duplicate_rows
    size_t duplicate_rows = 0;
    size_t redacted_cell_count = 0;     // empty, sentinel or unparseable optional cells
    size_t unparseable_cell_count = 0;  // non-numeric text coerced to redacted
    bool empty_dataset = false;

    std::vector<std::string> redacted_fields;
    std::vector<std::string> detected_subsystems;
    std::vector<std::string> detected_payloads;
    std::vector<std::string> detected_links;

    std::vector<RowRejection> rejections;   // ordered by row, capped by ValidatorConfig
};

struct ValidatedDataset {
    std::shared_ptr<const TimeSeriesStore> store;
    ValidationReport report;
};

class SchemaValidator {
public:
    explicit SchemaValidator(ValidatorConfig config = {});

    // Column-level problems abort with a SchemaError and produce nothing.
    // Row-level problems are counted in the report and never abort.
    Result<ValidatedDataset, SchemaError> validate(const RawTable& table) const;

    const ValidatorConfig& config() const { return _config; }

private:
    ValidatorConfig _config;
};

} // namespace fdr
