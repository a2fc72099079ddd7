#include "schema_validator.hpp"
#include "zf_log.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>

namespace fdr {

namespace {

struct Candidate {
    size_t row;
    TelemetryRecord record;
    size_t unparseable_cells;
};

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Whole-cell numeric parse; nan/inf are not measurements
bool parse_number(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return false;
    if (!std::isfinite(value)) return false;
    out = value;
    return true;
}

} // namespace

SchemaValidator::SchemaValidator(ValidatorConfig config)
    : _config(std::move(config))
{
    if (_config.min_latitude_deg > _config.max_latitude_deg) {
        throw std::invalid_argument("Latitude bounds are inverted.");
    }
    if (_config.min_longitude_deg > _config.max_longitude_deg) {
        throw std::invalid_argument("Longitude bounds are inverted.");
    }
}

Result<ValidatedDataset, SchemaError> SchemaValidator::validate(const RawTable& table) const {
    const CoreColumns& columns = _config.columns;
    const std::vector<std::string>& header = table.header;

    if (header.empty()) {
        return SchemaError{Error::TERM_EmptyHeader, ""};
    }

    std::map<std::string, size_t> positions;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].empty()) continue;
        if (!positions.emplace(header[i], i).second) {
            ZF_LOGE("Duplicate column in header: %s", header[i].c_str());
            return SchemaError{Error::TERM_DuplicateColumn, header[i]};
        }
    }

    for (const std::string* required : {&columns.timestamp, &columns.latitude, &columns.longitude, &columns.altitude}) {
        if (positions.find(*required) == positions.end()) {
            ZF_LOGE("Missing required column: %s", required->c_str());
            return SchemaError{Error::TERM_MissingRequiredField, *required};
        }
    }

    const size_t ts_col = positions[columns.timestamp];
    const size_t lat_col = positions[columns.latitude];
    const size_t lon_col = positions[columns.longitude];
    const size_t alt_col = positions[columns.altitude];

    std::vector<size_t> field_columns;
    std::vector<std::string> field_names;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i].empty()) {
            ZF_LOGW("Ignoring unnamed column %zu", i + 1);
            continue;
        }
        if (columns.contains(header[i])) continue;
        field_columns.push_back(i);
        field_names.push_back(header[i]);
    }

    SubsystemRegistry registry = SubsystemRegistry::classify(field_names);

    ValidationReport report;
    report.total_rows = table.rows.size();

    std::vector<RowRejection> rejections;
    std::vector<Candidate> candidates;
    candidates.reserve(table.rows.size());

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const std::vector<std::string>& row = table.rows[r];
        const size_t row_number = r + 1;

        auto reject = [&](Error error, std::string detail) {
            ZF_LOGD("Row %zu rejected: %s (%s)", row_number, to_str(error), detail.c_str());
            rejections.push_back(RowRejection{row_number, error, std::move(detail)});
        };

        if (row.size() > header.size()) {
            reject(Error::TooManyCells,
                std::to_string(row.size()) + " cells, header has " + std::to_string(header.size()));
            continue;
        }

        auto cell = [&](size_t col) -> std::string {
            return col < row.size() ? trim(row[col]) : std::string();
        };

        const std::string ts_text = cell(ts_col);
        std::optional<Timestamp> timestamp = parse_timestamp(ts_text);
        if (!timestamp) {
            reject(Error::BadTimestamp, "'" + ts_text + "'");
            continue;
        }

        // lat, lon, alt: a row without a usable position is not a record
        auto coerce_required = [&](size_t col, double& out) -> std::optional<Error> {
            const std::string text = cell(col);
            if (text.empty()) return Error::MissingRequiredValue;
            if (!parse_number(text, out)) return Error::NonNumericRequiredValue;
            if (out == _config.redacted_sentinel) return Error::MissingRequiredValue;
            return std::nullopt;
        };

        TelemetryRecord record;
        record.timestamp = *timestamp;

        std::optional<Error> failure;
        const std::string* failed_field = nullptr;
        if ((failure = coerce_required(lat_col, record.latitude_deg))) {
            failed_field = &columns.latitude;
        } else if ((failure = coerce_required(lon_col, record.longitude_deg))) {
            failed_field = &columns.longitude;
        } else if ((failure = coerce_required(alt_col, record.altitude_ft))) {
            failed_field = &columns.altitude;
        } else if (record.latitude_deg < _config.min_latitude_deg || record.latitude_deg > _config.max_latitude_deg) {
            failure = Error::OutOfRangeValue;
            failed_field = &columns.latitude;
        } else if (record.longitude_deg < _config.min_longitude_deg || record.longitude_deg > _config.max_longitude_deg) {
            failure = Error::OutOfRangeValue;
            failed_field = &columns.longitude;
        }
        if (failure) {
            reject(*failure, *failed_field);
            continue;
        }

        size_t unparseable = 0;
        record.subsystem_fields.reserve(field_columns.size());
        for (size_t col : field_columns) {
            const std::string text = cell(col);
            double value = 0.0;
            if (text.empty()) {
                record.subsystem_fields.push_back(Sample::redacted());
            } else if (!parse_number(text, value)) {
                record.subsystem_fields.push_back(Sample::redacted());
                ++unparseable;
            } else if (value == _config.redacted_sentinel) {
                record.subsystem_fields.push_back(Sample::redacted());
            } else {
                record.subsystem_fields.push_back(Sample::measured(value));
            }
        }

        candidates.push_back(Candidate{row_number, std::move(record), unparseable});
    }

    // Stable sort keeps input order among equal timestamps, so the first occurrence wins
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) { return a.record.timestamp < b.record.timestamp; });

    std::vector<TelemetryRecord> records;
    records.reserve(candidates.size());
    for (auto& candidate : candidates) {
        if (!records.empty() && records.back().timestamp == candidate.record.timestamp) {
            ZF_LOGD("Row %zu rejected: duplicate timestamp", candidate.row);
            rejections.push_back(RowRejection{candidate.row, Error::DuplicateTimestamp,
                format_timestamp(candidate.record.timestamp)});
            ++report.duplicate_rows;
            continue;
        }
        report.unparseable_cell_count += candidate.unparseable_cells;
        records.push_back(std::move(candidate.record));
    }

    std::vector<bool> field_redacted(field_names.size(), false);
    for (const auto& record : records) {
        for (size_t k = 0; k < record.subsystem_fields.size(); ++k) {
            if (record.subsystem_fields[k].is_redacted()) {
                ++report.redacted_cell_count;
                field_redacted[k] = true;
            }
        }
    }
    for (size_t k = 0; k < field_names.size(); ++k) {
        if (field_redacted[k]) report.redacted_fields.push_back(field_names[k]);
    }

    std::sort(rejections.begin(), rejections.end(),
        [](const RowRejection& a, const RowRejection& b) { return a.row < b.row; });
    report.rejected_rows = rejections.size();
    if (rejections.size() > _config.max_recorded_rejections) {
        rejections.resize(_config.max_recorded_rejections);
    }
    report.rejections = std::move(rejections);

    report.accepted_rows = records.size();
    report.empty_dataset = records.empty();
    report.detected_subsystems = registry.subsystem_ids();
    report.detected_payloads = registry.payload_ids();
    report.detected_links = registry.link_ids();

    ZF_LOGI("Validated %zu rows: %zu accepted, %zu rejected (%zu duplicates), %zu redacted cells",
        report.total_rows, report.accepted_rows, report.rejected_rows,
        report.duplicate_rows, report.redacted_cell_count);
    if (report.empty_dataset) {
        ZF_LOGW("No rows accepted, mission is empty");
    }

    ValidatedDataset dataset;
    dataset.store = std::make_shared<const TimeSeriesStore>(
        columns, std::move(field_names), std::move(registry), std::move(records));
    dataset.report = std::move(report);
    return dataset;
}

} // namespace fdr
