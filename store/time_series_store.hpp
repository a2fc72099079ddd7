#pragma once

#include "fdr.hpp"
#include "fdr_config.hpp"
#include "ingest/csv_table.hpp"
#include "registry/subsystem_registry.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fdr {

// One sample row. subsystem_fields follows TimeSeriesStore::field_names() and
// always has one entry per field; gaps are redacted Samples.
struct TelemetryRecord {
    Timestamp timestamp;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double altitude_ft = 0.0;
    std::vector<Sample> subsystem_fields;
};

struct SeriesPoint {
    Timestamp timestamp;
    Sample value;
};

class TimeSeriesStore;

// Lazy view of one field over time. Iterating does not copy the store and can be
// repeated any number of times. Redacted samples are yielded as they are.
// The view and its iterators refer to the store and must not outlive it.
class ValueSeries {
public:
    enum class Source {
        Latitude,
        Longitude,
        Altitude,
        Field
    };

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = SeriesPoint;
        using difference_type = std::ptrdiff_t;
        using pointer = const SeriesPoint*;
        using reference = SeriesPoint;

        iterator() = default;

        SeriesPoint operator*() const;
        iterator& operator++();
        iterator operator++(int) {
            iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const iterator& other) const {
            return _index == other._index && _store == other._store;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ValueSeries;
        iterator(const TimeSeriesStore* store, Source source, size_t column, size_t stride, size_t index)
            : _store(store), _source(source), _column(column), _stride(stride), _index(index) {}

        const TimeSeriesStore* _store = nullptr;
        Source _source = Source::Field;
        size_t _column = 0;
        size_t _stride = 1;
        size_t _index = 0;
    };

    iterator begin() const { return iterator(_store, _source, _column, _stride, 0); }
    iterator end() const;

    size_t size() const;
    bool empty() const { return size() == 0; }
    const std::string& field() const { return _field; }
    size_t stride() const { return _stride; }

    std::vector<SeriesPoint> collect() const;

private:
    friend class TimeSeriesStore;
    ValueSeries(const TimeSeriesStore* store, std::string field, Source source, size_t column, size_t stride)
        : _store(store), _field(std::move(field)), _source(source), _column(column), _stride(stride) {}

    const TimeSeriesStore* _store;
    std::string _field;
    Source _source;
    size_t _column;
    size_t _stride;
};

// Validated telemetry of one mission. Immutable after construction, so it can be
// shared read-only between the analyzer, the playback engine and any renderer.
class TimeSeriesStore {
public:
    // Zero-length mission
    TimeSeriesStore() = default;

    // Throws std::invalid_argument unless timestamps are strictly increasing and
    // every record carries exactly one Sample per field.
    TimeSeriesStore(CoreColumns columns,
                    std::vector<std::string> field_names,
                    SubsystemRegistry registry,
                    std::vector<TelemetryRecord> records);

    size_t size() const { return _records.size(); }
    bool empty() const { return _records.empty(); }

    // Throws std::out_of_range past the end
    const TelemetryRecord& record_at(size_t index) const { return _records.at(index); }
    const std::vector<TelemetryRecord>& records() const { return _records; }

    Result<TimeRange, Error> time_range() const;

    // Index of the latest record at or before t, clamped to [0, size-1].
    // Returns 0 on an empty store, callers check empty() before record_at().
    size_t nearest_index_for_time(Timestamp t) const;

    // Core columns (POS_*) and subsystem fields alike. stride > 1 keeps every n-th record.
    Result<ValueSeries, Error> value_series(std::string_view field, size_t stride = 1) const;

    Result<Sample, Error> value(size_t index, std::string_view field) const;

    const std::vector<std::string>& field_names() const { return _field_names; }
    std::optional<size_t> field_index(std::string_view field) const;

    const SubsystemRegistry& registry() const { return _registry; }
    const CoreColumns& core_columns() const { return _columns; }

    // Renders back to the file contract; redacted cells become the sentinel
    RawTable to_table() const;

private:
    CoreColumns _columns;
    std::vector<std::string> _field_names;
    SubsystemRegistry _registry;
    std::vector<TelemetryRecord> _records;
    std::vector<Timestamp> _timestamps;     // lookup index, parallel to _records
};

} // namespace fdr
