#include "time_series_store.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace fdr {

// Shortest of %.15g / %.17g that parses back to the same double
static std::string format_number(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    if (std::strtod(buf, nullptr) != value) {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
    }
    return std::string(buf);
}

static SeriesPoint make_point(const TelemetryRecord& record, ValueSeries::Source source, size_t column) {
    switch (source) {
        case ValueSeries::Source::Latitude:
            return SeriesPoint{record.timestamp, Sample::measured(record.latitude_deg)};
        case ValueSeries::Source::Longitude:
            return SeriesPoint{record.timestamp, Sample::measured(record.longitude_deg)};
        case ValueSeries::Source::Altitude:
            return SeriesPoint{record.timestamp, Sample::measured(record.altitude_ft)};
        case ValueSeries::Source::Field:
        default:
            return SeriesPoint{record.timestamp, record.subsystem_fields[column]};
    }
}

SeriesPoint ValueSeries::iterator::operator*() const {
    return make_point(_store->record_at(_index), _source, _column);
}

ValueSeries::iterator& ValueSeries::iterator::operator++() {
    _index = std::min(_index + _stride, _store->size());
    return *this;
}

ValueSeries::iterator ValueSeries::end() const {
    return iterator(_store, _source, _column, _stride, _store->size());
}

size_t ValueSeries::size() const {
    return (_store->size() + _stride - 1) / _stride;
}

std::vector<SeriesPoint> ValueSeries::collect() const {
    std::vector<SeriesPoint> points;
    points.reserve(size());
    for (const SeriesPoint& point : *this) {
        points.push_back(point);
    }
    return points;
}

TimeSeriesStore::TimeSeriesStore(CoreColumns columns,
                                 std::vector<std::string> field_names,
                                 SubsystemRegistry registry,
                                 std::vector<TelemetryRecord> records)
    : _columns(std::move(columns)),
      _field_names(std::move(field_names)),
      _registry(std::move(registry)),
      _records(std::move(records))
{
    _timestamps.reserve(_records.size());
    for (size_t i = 0; i < _records.size(); ++i) {
        const TelemetryRecord& record = _records[i];
        if (record.subsystem_fields.size() != _field_names.size()) {
            throw std::invalid_argument("Record " + std::to_string(i) + " does not match the store schema.");
        }
        if (i > 0 && !(_timestamps.back() < record.timestamp)) {
            throw std::invalid_argument("Record timestamps must be strictly increasing.");
        }
        _timestamps.push_back(record.timestamp);
    }
}

Result<TimeRange, Error> TimeSeriesStore::time_range() const {
    if (_records.empty()) {
        return Error::EmptyDataset;
    }
    return TimeRange{_timestamps.front(), _timestamps.back()};
}

size_t TimeSeriesStore::nearest_index_for_time(Timestamp t) const {
    if (_timestamps.empty()) {
        return 0;
    }
    auto it = std::upper_bound(_timestamps.begin(), _timestamps.end(), t);
    if (it == _timestamps.begin()) {
        return 0;
    }
    return static_cast<size_t>(std::distance(_timestamps.begin(), it)) - 1;
}

std::optional<size_t> TimeSeriesStore::field_index(std::string_view field) const {
    auto it = std::find(_field_names.begin(), _field_names.end(), field);
    if (it == _field_names.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(_field_names.begin(), it));
}

Result<ValueSeries, Error> TimeSeriesStore::value_series(std::string_view field, size_t stride) const {
    if (stride == 0) {
        return Error::InvalidParameter;
    }
    if (field == _columns.latitude) {
        return ValueSeries(this, std::string(field), ValueSeries::Source::Latitude, 0, stride);
    }
    if (field == _columns.longitude) {
        return ValueSeries(this, std::string(field), ValueSeries::Source::Longitude, 0, stride);
    }
    if (field == _columns.altitude) {
        return ValueSeries(this, std::string(field), ValueSeries::Source::Altitude, 0, stride);
    }
    auto column = field_index(field);
    if (!column) {
        return Error::UnknownField;
    }
    return ValueSeries(this, std::string(field), ValueSeries::Source::Field, *column, stride);
}

Result<Sample, Error> TimeSeriesStore::value(size_t index, std::string_view field) const {
    if (index >= _records.size()) {
        return Error::InvalidParameter;
    }
    const TelemetryRecord& record = _records[index];
    if (field == _columns.latitude) return Sample::measured(record.latitude_deg);
    if (field == _columns.longitude) return Sample::measured(record.longitude_deg);
    if (field == _columns.altitude) return Sample::measured(record.altitude_ft);

    auto column = field_index(field);
    if (!column) {
        return Error::UnknownField;
    }
    return record.subsystem_fields[*column];
}

RawTable TimeSeriesStore::to_table() const {
    RawTable table;
    table.header.reserve(4 + _field_names.size());
    table.header.push_back(_columns.timestamp);
    table.header.push_back(_columns.latitude);
    table.header.push_back(_columns.longitude);
    table.header.push_back(_columns.altitude);
    table.header.insert(table.header.end(), _field_names.begin(), _field_names.end());

    table.rows.reserve(_records.size());
    for (const auto& record : _records) {
        std::vector<std::string> row;
        row.reserve(table.header.size());
        row.push_back(format_timestamp(record.timestamp));
        row.push_back(format_number(record.latitude_deg));
        row.push_back(format_number(record.longitude_deg));
        row.push_back(format_number(record.altitude_ft));
        for (const Sample& sample : record.subsystem_fields) {
            row.push_back(format_number(sample.to_wire()));
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

} // namespace fdr
